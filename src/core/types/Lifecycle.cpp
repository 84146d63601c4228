#include "core/types/Lifecycle.hpp"

namespace trremote::core {

std::string toString(InstanceRole role) {
    switch (role) {
    case InstanceRole::Primary:
        return "Primary";
    case InstanceRole::Secondary:
        return "Secondary";
    }
    return "Unknown";
}

std::string toString(ListenerState state) {
    switch (state) {
    case ListenerState::Unbound:
        return "Unbound";
    case ListenerState::Listening:
        return "Listening";
    case ListenerState::Stopped:
        return "Stopped";
    }
    return "Unknown";
}

std::string toString(WindowVisibility visibility) {
    switch (visibility) {
    case WindowVisibility::Created:
        return "Created";
    case WindowVisibility::Visible:
        return "Visible";
    case WindowVisibility::Hidden:
        return "Hidden";
    case WindowVisibility::Closed:
        return "Closed";
    }
    return "Unknown";
}

std::string toString(HandshakeState state) {
    switch (state) {
    case HandshakeState::Idle:
        return "Idle";
    case HandshakeState::Requested:
        return "Requested";
    case HandshakeState::Acknowledged:
        return "Acknowledged";
    }
    return "Unknown";
}

std::string toString(LifecycleState state) {
    switch (state) {
    case LifecycleState::Starting:
        return "Starting";
    case LifecycleState::Degraded:
        return "Degraded";
    case LifecycleState::Active:
        return "Active";
    case LifecycleState::ShuttingDown:
        return "ShuttingDown";
    case LifecycleState::Exited:
        return "Exited";
    }
    return "Unknown";
}

} // namespace trremote::core
