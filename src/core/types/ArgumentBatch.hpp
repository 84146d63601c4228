/**
 * @file ArgumentBatch.hpp
 * @brief Invocation arguments forwarded between application instances.
 *
 * An ArgumentBatch is built once from the command line of a process and is
 * either handled locally (primary instance) or sent to the primary instance
 * over the single-instance channel.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace trremote::core {

/**
 * @brief Ordered list of torrent paths or links passed on the command line.
 */
struct ArgumentBatch {
    std::vector<std::string> paths; ///< File paths or URLs, in invocation order

    /**
     * @brief Checks whether the batch carries any argument.
     * @return True if no path is present.
     */
    [[nodiscard]] bool empty() const { return paths.empty(); }

    /**
     * @brief Returns the number of arguments in the batch.
     */
    [[nodiscard]] size_t size() const { return paths.size(); }

    /**
     * @brief Serializes the batch as a JSON array of strings.
     * @return JSON array in the same order as paths.
     */
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Parses a batch from its JSON form.
     * @param j JSON value to parse.
     * @return The batch, or nullopt if j is not an array of strings.
     */
    static std::optional<ArgumentBatch> fromJson(const nlohmann::json& j);

    /**
     * @brief Encodes the batch as the byte payload sent between instances.
     * @return Compact JSON text.
     */
    [[nodiscard]] std::string serialize() const;

    /**
     * @brief Decodes a payload produced by serialize().
     * @param payload Raw payload bytes.
     * @return The batch, or nullopt if the payload is not valid.
     */
    static std::optional<ArgumentBatch> deserialize(const std::string& payload);

    bool operator==(const ArgumentBatch& other) const = default;
};

} // namespace trremote::core
