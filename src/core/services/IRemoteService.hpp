/**
 * @file IRemoteService.hpp
 * @brief Interface for the remote daemon polled in the background.
 */

#pragma once

#include "core/types/PollerTypes.hpp"

#include <functional>
#include <optional>
#include <string>

namespace trremote::core {

/**
 * @brief Remote service queried by the poller supervisor.
 *
 * What is requested and how the reply is interpreted belongs to the
 * implementation; the supervisor only schedules the calls and caches the
 * resulting snapshots.
 */
class IRemoteService {
public:
    /**
     * @brief Completion callback of a poll. May run on any thread.
     */
    using PollCallback = std::function<void(PollSnapshot)>;

    virtual ~IRemoteService() = default;

    /**
     * @brief Prepares the service for a new configuration.
     * @param config Already validated configuration.
     * @return Error description if the service cannot use it.
     *
     * Called before the supervisor swaps its configuration; a failure leaves
     * the supervisor on its previous configuration.
     */
    virtual std::optional<std::string> apply(const PollerConfig& config) = 0;

    /**
     * @brief Performs one poll.
     * @param config Configuration to use for the whole call.
     * @param callback Invoked exactly once with the result.
     */
    virtual void pollAsync(const PollerConfig& config, PollCallback callback) = 0;
};

} // namespace trremote::core
