#include "app/CommandLine.hpp"

#include <QCommandLineParser>
#include <QFileInfo>
#include <QUrl>

namespace trremote::app {

CommandLineOptions parseCommandLine(const QStringList& arguments) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Remote GUI for the Transmission torrent daemon");

    const QCommandLineOption helpOption({"h", "help"}, "Print this help and exit.");
    const QCommandLineOption versionOption({"v", "version"}, "Print the version and exit.");
    const QCommandLineOption configDirOption("config-dir", "Read configuration from <dir>.",
                                             "dir");
    parser.addOption(helpOption);
    parser.addOption(versionOption);
    parser.addOption(configDirOption);
    parser.addPositionalArgument("torrent", "Torrent files or links to open.", "[torrent...]");

    CommandLineOptions options;
    options.helpText = parser.helpText().toStdString();

    if (!parser.parse(arguments)) {
        options.errorText = parser.errorText().toStdString();
        return options;
    }

    options.helpRequested = parser.isSet(helpOption);
    options.versionRequested = parser.isSet(versionOption);

    if (parser.isSet(configDirOption)) {
        options.configDir = QFileInfo(parser.value(configDirOption)).absoluteFilePath().toStdString();
    }

    for (const auto& target : parser.positionalArguments()) {
        if (!target.isEmpty()) {
            options.batch.paths.push_back(normalizeTarget(target));
        }
    }

    return options;
}

std::string normalizeTarget(const QString& target) {
    const QUrl url(target, QUrl::StrictMode);
    // Single letters are drive names, not schemes
    if (url.isValid() && url.scheme().size() > 1) {
        return target.toStdString();
    }
    return QFileInfo(target).absoluteFilePath().toStdString();
}

} // namespace trremote::app
