/**
 * @file Lifecycle.hpp
 * @brief State vocabulary shared by the lifecycle components.
 *
 * Roles, listener states, window visibility, handshake states and the
 * orchestrator's own state machine, with string conversions for logging.
 */

#pragma once

#include <cstdint>
#include <string>

namespace trremote::core {

/**
 * @brief Identifier handed out to each main window instance.
 *
 * A recreated window gets a new identifier; 0 never names a window.
 */
using WindowId = uint64_t;

/**
 * @brief Outcome of the single-instance bind attempt.
 */
enum class InstanceRole : int {
    Primary = 0,  ///< This process owns the instance lock and hosts the UI
    Secondary = 1 ///< Another process owns the lock; forward arguments and exit
};

/**
 * @brief Whether the primary instance accepts forwarded arguments.
 */
enum class ListenerState : int {
    Unbound = 0,   ///< No listen attempt yet
    Listening = 1, ///< Accepting connections from secondary instances
    Stopped = 2    ///< Listener torn down (shutdown or failed listen)
};

/**
 * @brief Lifecycle of the main window slot.
 */
enum class WindowVisibility : int {
    Created = 0, ///< Window object constructed, not shown yet
    Visible = 1, ///< Window object exists and is shown
    Hidden = 2,  ///< No window object exists
    Closed = 3   ///< Host sealed during shutdown, no window can be created
};

/**
 * @brief Progress of one exit handshake with a window.
 */
enum class HandshakeState : int {
    Idle = 0,        ///< No close attempt in flight
    Requested = 1,   ///< Exit request sent, waiting for acknowledgement
    Acknowledged = 2 ///< Window confirmed it flushed its state
};

/**
 * @brief States of the lifecycle orchestrator.
 */
enum class LifecycleState : int {
    Starting = 0,     ///< Role not resolved yet
    Degraded = 1,     ///< Primary that could not start listening
    Active = 2,       ///< Primary with listener, window and poller running
    ShuttingDown = 3, ///< Shutdown handshake in progress
    Exited = 4        ///< Terminal, process may exit
};

[[nodiscard]] std::string toString(InstanceRole role);
[[nodiscard]] std::string toString(ListenerState state);
[[nodiscard]] std::string toString(WindowVisibility visibility);
[[nodiscard]] std::string toString(HandshakeState state);
[[nodiscard]] std::string toString(LifecycleState state);

} // namespace trremote::core
