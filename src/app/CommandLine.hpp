#pragma once

#include "core/types/ArgumentBatch.hpp"

#include <QStringList>
#include <optional>
#include <string>

namespace trremote::app {

/**
 * @brief Result of parsing the process command line.
 */
struct CommandLineOptions {
    core::ArgumentBatch batch;             ///< Torrent paths and links, paths made absolute
    std::optional<std::string> configDir;  ///< --config-dir override
    bool helpRequested{false};
    bool versionRequested{false};
    std::string helpText;                  ///< Usage text, always filled
    std::string errorText;                 ///< Parse error, empty on success

    [[nodiscard]] bool ok() const { return errorText.empty(); }
};

/**
 * @brief Parses the arguments of a launch.
 * @param arguments Full argument list, program name first.
 * @return Parsed options; never exits the process.
 */
CommandLineOptions parseCommandLine(const QStringList& arguments);

/**
 * @brief Makes a local path absolute; URLs with a scheme are returned as-is.
 */
std::string normalizeTarget(const QString& target);

} // namespace trremote::app
