#include "core/types/ArgumentBatch.hpp"

namespace trremote::core {

nlohmann::json ArgumentBatch::toJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& path : paths) {
        j.push_back(path);
    }
    return j;
}

std::optional<ArgumentBatch> ArgumentBatch::fromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        return std::nullopt;
    }

    ArgumentBatch batch;
    batch.paths.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        batch.paths.push_back(item.get<std::string>());
    }
    return batch;
}

std::string ArgumentBatch::serialize() const {
    return toJson().dump();
}

std::optional<ArgumentBatch> ArgumentBatch::deserialize(const std::string& payload) {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return fromJson(j);
}

} // namespace trremote::core
