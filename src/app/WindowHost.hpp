#pragma once

#include "core/services/IAppWindow.hpp"
#include "core/types/Lifecycle.hpp"

#include <QMetaObject>
#include <QObject>
#include <functional>
#include <memory>

namespace trremote::app {

/**
 * @brief Owns the single main window slot.
 *
 * Hiding the window destroys it and showing it builds a new one from the
 * factory; the presentation layer is heavy, so nothing is kept alive while
 * hidden. Every visibility change is announced synchronously through
 * visibilityChanged().
 */
class WindowHost : public QObject {
    Q_OBJECT

public:
    using Factory = std::function<std::unique_ptr<core::IAppWindow>(core::WindowId)>;

    explicit WindowHost(Factory factory, QObject* parent = nullptr);
    ~WindowHost() override;

    /**
     * @brief Creates and shows a window if none exists.
     * @return The current window, or nullptr if the host is sealed or the
     *         factory failed.
     */
    core::IAppWindow* createWindow();

    /**
     * @brief Destroys the current window, if any.
     */
    void destroyWindow();

    /**
     * @brief Destroys the current window and refuses to create new ones.
     */
    void seal();

    [[nodiscard]] core::IAppWindow* current() const { return window_.get(); }
    [[nodiscard]] bool hasWindow() const { return window_ != nullptr; }
    [[nodiscard]] core::WindowId currentId() const { return window_ ? windowId_ : 0; }
    [[nodiscard]] core::WindowVisibility visibility() const { return visibility_; }
    [[nodiscard]] bool isSealed() const { return sealed_; }

    /**
     * @brief Sets the handler run when the user asks to close the window.
     */
    void setCloseRequestHandler(std::function<void()> handler);

signals:
    void visibilityChanged(core::WindowVisibility visibility);

    /**
     * @brief Emitted after a window object is gone, whoever destroyed it.
     */
    void windowDestroyed(core::WindowId id);

private:
    void setVisibility(core::WindowVisibility visibility);
    void onWindowObjectDestroyed(core::WindowId id);

    Factory factory_;
    std::unique_ptr<core::IAppWindow> window_;
    core::WindowId windowId_{0};
    QMetaObject::Connection destroyedConnection_;
    core::WindowVisibility visibility_{core::WindowVisibility::Hidden};
    core::WindowId nextId_{1};
    bool sealed_{false};
    std::function<void()> closeRequestHandler_;
};

} // namespace trremote::app
