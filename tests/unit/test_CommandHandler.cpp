#include <catch2/catch_test_macros.hpp>

#include "app/CommandHandler.hpp"
#include "core/services/IRemoteService.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <memory>
#include <vector>

using namespace trremote::app;
using namespace trremote::core;
using namespace trremote::infra;

namespace {

class AcceptingService : public IRemoteService {
public:
    std::optional<std::string> apply(const PollerConfig&) override { return std::nullopt; }
    void pollAsync(const PollerConfig&, PollCallback callback) override {
        callback(PollSnapshot{});
    }
};

} // namespace

TEST_CASE("CommandHandler readFile", "[CommandHandler]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    AsioContext context(1);
    PollerSupervisor poller(context, std::make_shared<AcceptingService>());
    CommandHandler handler(poller, [](const QUrl&) { return true; });

    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION("Returns size and base64 contents") {
        const QString path = dir.filePath("sample.torrent");
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write("d4:infoe");
        file.close();

        auto result = handler.readFile(path.toStdString());
        REQUIRE(result.success);
        REQUIRE(result.data["path"] == path.toStdString());
        REQUIRE(result.data["size"] == 8);
        REQUIRE(result.data["contents"] == QByteArray("d4:infoe").toBase64().toStdString());
    }

    SECTION("Missing files fail without throwing") {
        auto result = handler.readFile(dir.filePath("missing.torrent").toStdString());
        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.errorMessage.empty());
    }

    SECTION("Empty path fails") {
        auto result = handler.readFile("");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == "No file path given");
    }
}

TEST_CASE("CommandHandler shellOpen", "[CommandHandler]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    AsioContext context(1);
    PollerSupervisor poller(context, std::make_shared<AcceptingService>());

    std::vector<QUrl> opened;
    bool openerResult = true;
    CommandHandler handler(poller, [&](const QUrl& url) {
        opened.push_back(url);
        return openerResult;
    });

    SECTION("URLs are passed through") {
        auto result = handler.shellOpen("https://transmissionbt.com");
        REQUIRE(result.success);
        REQUIRE(opened.size() == 1);
        REQUIRE(opened[0] == QUrl("https://transmissionbt.com"));
    }

    SECTION("Local paths become file URLs") {
        auto result = handler.shellOpen("/tmp/downloads");
        REQUIRE(result.success);
        REQUIRE(opened.size() == 1);
        REQUIRE(opened[0].isLocalFile());
        REQUIRE(opened[0].toLocalFile() == "/tmp/downloads");
    }

    SECTION("Blank targets are rejected before reaching the desktop") {
        auto result = handler.shellOpen("   ");
        REQUIRE_FALSE(result.success);
        REQUIRE(opened.empty());
    }

    SECTION("Opener failure is reported") {
        openerResult = false;
        auto result = handler.shellOpen("magnet:?xt=urn:btih:abc");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == "Could not open magnet:?xt=urn:btih:abc");
    }
}

TEST_CASE("CommandHandler setPollerConfig", "[CommandHandler]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    AsioContext context(1);
    PollerSupervisor poller(context, std::make_shared<AcceptingService>());
    CommandHandler handler(poller, [](const QUrl&) { return true; });

    SECTION("Valid configuration is applied and echoed without the password") {
        nlohmann::json j = {{"host", "nas.local"}, {"port", 9092}, {"password", "secret"}};

        auto result = handler.setPollerConfig(j);
        REQUIRE(result.success);
        REQUIRE(result.data["host"] == "nas.local");
        REQUIRE(result.data["port"] == 9092);
        REQUIRE_FALSE(result.data.contains("password"));

        auto applied = poller.config();
        REQUIRE(applied != nullptr);
        REQUIRE(applied->host == "nas.local");
        REQUIRE(applied->password == "secret");
    }

    SECTION("Non-object input is rejected") {
        auto result = handler.setPollerConfig(nlohmann::json::array({1, 2}));
        REQUIRE_FALSE(result.success);
        REQUIRE(poller.config() == nullptr);
    }

    SECTION("Wrongly typed values are rejected") {
        auto result = handler.setPollerConfig({{"port", "not a number"}});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage.find("Invalid poller configuration") == 0);
    }

    SECTION("Invalid values are rejected and the previous config kept") {
        REQUIRE(handler.setPollerConfig({{"host", "first"}}).success);

        auto result = handler.setPollerConfig({{"interval_seconds", 0}});
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == "interval must be at least one second");
        REQUIRE(poller.config()->host == "first");
    }
}

TEST_CASE("CommandHandler toUrl", "[CommandHandler]") {
    int argc = 0;
    char* argv[] = {nullptr};
    QCoreApplication app(argc, argv);

    REQUIRE(CommandHandler::toUrl("magnet:?xt=urn:btih:abc").scheme() == "magnet");
    REQUIRE(CommandHandler::toUrl("http://example.com/a.torrent").scheme() == "http");
    REQUIRE(CommandHandler::toUrl("").isEmpty());

    const QUrl relative = CommandHandler::toUrl("a.torrent");
    REQUIRE(relative.isLocalFile());
    REQUIRE(relative.toLocalFile() == QDir::current().absoluteFilePath("a.torrent"));
}
