/**
 * @file IAppWindow.hpp
 * @brief Interface of the main window as seen by the lifecycle core.
 */

#pragma once

#include "core/types/ArgumentBatch.hpp"
#include "core/types/Lifecycle.hpp"

#include <functional>

namespace trremote::core {

/**
 * @brief Main window of the presentation layer.
 *
 * A window answers every ExitRequested event published for its id on the
 * event bus with exactly one FrontendDone event once its state is flushed.
 * Windows are destroyed by deleting the object, never hidden.
 */
class IAppWindow {
public:
    virtual ~IAppWindow() = default;

    [[nodiscard]] virtual WindowId id() const = 0;

    /**
     * @brief Shows the window on screen.
     */
    virtual void showWindow() = 0;

    /**
     * @brief Raises and focuses the window.
     */
    virtual void focusWindow() = 0;

    /**
     * @brief Hands torrent arguments received from the command line or a
     *        secondary instance to the window.
     */
    virtual void openArguments(const ArgumentBatch& batch) = 0;

    /**
     * @brief Sets the callback run when the user asks to close the window.
     *
     * The window does not close itself; the owner decides what happens.
     */
    virtual void setCloseRequestHandler(std::function<void()> handler) = 0;
};

} // namespace trremote::core
