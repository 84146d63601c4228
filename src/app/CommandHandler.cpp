#include "app/CommandHandler.hpp"

#include <QDesktopServices>
#include <QFile>
#include <QFileInfo>
#include <spdlog/spdlog.h>

namespace trremote::app {

CommandHandler::CommandHandler(infra::PollerSupervisor& poller, Opener opener)
    : poller_(poller), opener_(std::move(opener)) {
    if (!opener_) {
        opener_ = [](const QUrl& url) { return QDesktopServices::openUrl(url); };
    }
}

CommandResult CommandHandler::readFile(const std::string& path) const {
    if (path.empty()) {
        return CommandResult::failure("No file path given");
    }

    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        spdlog::warn("Failed to read {}: {}", path, file.errorString().toStdString());
        return CommandResult::failure(file.errorString().toStdString());
    }

    const QByteArray contents = file.readAll();

    nlohmann::json data;
    data["path"] = path;
    data["size"] = contents.size();
    data["contents"] = contents.toBase64().toStdString();
    return CommandResult::ok(std::move(data));
}

CommandResult CommandHandler::shellOpen(const std::string& target) const {
    const QUrl url = toUrl(target);
    if (!url.isValid() || url.isEmpty()) {
        return CommandResult::failure("Invalid target: " + target);
    }

    if (!opener_(url)) {
        spdlog::warn("No handler could open {}", url.toString().toStdString());
        return CommandResult::failure("Could not open " + target);
    }

    spdlog::debug("Opened {}", url.toString().toStdString());
    return CommandResult::ok();
}

CommandResult CommandHandler::setPollerConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        return CommandResult::failure("Poller configuration must be a JSON object");
    }

    core::PollerConfig config;
    try {
        config = core::PollerConfig::fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        return CommandResult::failure(std::string("Invalid poller configuration: ") + e.what());
    }

    if (auto error = poller_.configure(config)) {
        spdlog::warn("Poller configuration rejected: {}", *error);
        return CommandResult::failure(*error);
    }

    auto data = config.toJson();
    data.erase("password");
    return CommandResult::ok(std::move(data));
}

QUrl CommandHandler::toUrl(const std::string& target) {
    const QString text = QString::fromStdString(target).trimmed();
    if (text.isEmpty()) {
        return {};
    }

    const QUrl url(text, QUrl::StrictMode);
    // Single letters are drive names, not schemes
    if (url.isValid() && url.scheme().size() > 1) {
        return url;
    }

    return QUrl::fromLocalFile(QFileInfo(text).absoluteFilePath());
}

} // namespace trremote::app
