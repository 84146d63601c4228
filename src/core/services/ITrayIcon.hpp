#pragma once

#include <functional>
#include <string>

namespace trremote::core {

/**
 * @brief Persistent status icon with a two-item menu (toggle, quit).
 */
class ITrayIcon {
public:
    /**
     * @brief User gestures on the icon.
     */
    enum class Action : int {
        Toggle = 0,      ///< Show/hide menu item
        Quit = 1,        ///< Quit menu item
        PrimaryClick = 2 ///< Single click on the icon itself
    };

    using ActionHandler = std::function<void(Action)>;

    virtual ~ITrayIcon() = default;

    virtual void setActionHandler(ActionHandler handler) = 0;

    /**
     * @brief Sets the text of the show/hide menu item.
     */
    virtual void setToggleLabel(const std::string& label) = 0;

    virtual void setToolTip(const std::string& text) = 0;

    virtual void show() = 0;
};

} // namespace trremote::core
