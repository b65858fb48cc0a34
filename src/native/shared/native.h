// native.h - Capability interfaces implemented by a windowing toolkit backend
// Every object behind these interfaces lives on the event loop thread, except
// EventLoopProxy, which is the only piece client threads may touch.

#ifndef WEBSHELL_NATIVE_H
#define WEBSHELL_NATIVE_H

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geometry.h"
#include "menu.h"
#include "messages.h"
#include "webview.h"
#include "window.h"
#include "window_event.h"

namespace webshell {

class AbstractWindow {
public:
    virtual ~AbstractWindow() = default;

    virtual WindowId id() const = 0;

    virtual double scaleFactor() = 0;
    virtual PhysicalPosition<int32_t> innerPosition() = 0;
    virtual PhysicalPosition<int32_t> outerPosition() = 0;
    virtual PhysicalSize<uint32_t> innerSize() = 0;
    virtual PhysicalSize<uint32_t> outerSize() = 0;
    virtual bool isFullscreen() = 0;
    virtual bool isMaximized() = 0;
    virtual bool isDecorated() = 0;
    virtual bool isResizable() = 0;
    virtual bool isVisible() = 0;
    virtual std::optional<Monitor> currentMonitor() = 0;
    virtual std::optional<Monitor> primaryMonitor() = 0;
    virtual std::vector<Monitor> availableMonitors() = 0;

    virtual void setResizable(bool resizable) = 0;
    virtual void setTitle(const std::string& title) = 0;
    virtual void setMaximized(bool maximized) = 0;
    virtual void setMinimized(bool minimized) = 0;
    virtual void setVisible(bool visible) = 0;
    virtual void setDecorations(bool decorations) = 0;
    virtual void setAlwaysOnTop(bool alwaysOnTop) = 0;
    virtual void setInnerSize(const Size& size) = 0;
    virtual void setMinInnerSize(const std::optional<Size>& size) = 0;
    virtual void setMaxInnerSize(const std::optional<Size>& size) = 0;
    virtual void setOuterPosition(const Position& position) = 0;
    virtual void setFullscreen(bool fullscreen) = 0;
    virtual void setFocus() = 0;
    virtual void setWindowIcon(const WindowIcon& icon) = 0;
    virtual void setSkipTaskbar(bool skip) = 0;
    // Throws when no pointer button is held
    virtual void dragWindow() = 0;
};

// A webview and the window it fills; destroying it destroys the window
class AbstractWebview {
public:
    virtual ~AbstractWebview() = default;

    virtual AbstractWindow& window() = 0;

    // Queue a script; it runs at the next evaluatePendingScripts()
    void dispatchScript(const std::string& script) {
        pendingScripts_.push_back(script);
    }

    // Runs every queued script in order. All scripts are attempted; the first failure is rethrown.
    void evaluatePendingScripts() {
        std::vector<std::string> scripts;
        scripts.swap(pendingScripts_);
        std::exception_ptr firstError;
        for (const auto& script : scripts) {
            try {
                evaluateJavaScript(script);
            } catch (const std::exception&) {
                if (!firstError) {
                    firstError = std::current_exception();
                }
            }
        }
        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }

    size_t pendingScriptCount() const { return pendingScripts_.size(); }

    virtual void print() = 0;

    // Fit the webview to the window's new inner size
    virtual void resize() = 0;

protected:
    virtual void evaluateJavaScript(const std::string& script) = 0;

private:
    std::vector<std::string> pendingScripts_;
};

// Everything the toolkit needs to build a window with its webview
struct NativeWebviewOptions {
    WindowAttributes window;
    std::string url;
    bool transparent = false;
    bool fileDropEnabled = true;
    std::function<std::optional<RpcResponse>(WindowId, const RpcRequest&)> rpcHandler;
    std::function<bool(WindowId, const FileDropEvent&)> fileDropHandler;
    std::map<std::string, UriSchemeProtocol> customProtocols;
    std::vector<std::string> initializationScripts;
    std::optional<std::string> dataDirectory;
};

enum class ControlFlow { WAIT, EXIT };

enum class MenuType { MENUBAR, SYSTEM_TRAY };

struct Event {
    enum class Type {
        NEW_EVENTS,
        WINDOW_EVENT,
        MENU_EVENT,
        USER_EVENT,
        MAIN_EVENTS_CLEARED,
        LOOP_DESTROYED
    };

    Type type = Type::NEW_EVENTS;
    WindowId windowId = 0;
    NativeWindowEvent windowEvent;
    std::string menuItemId;
    MenuType menuType = MenuType::MENUBAR;
    std::optional<Message> message;

    static Event of(Type type) {
        Event event;
        event.type = type;
        return event;
    }

    static Event window(WindowId id, const NativeWindowEvent& windowEvent) {
        Event event;
        event.type = Type::WINDOW_EVENT;
        event.windowId = id;
        event.windowEvent = windowEvent;
        return event;
    }

    static Event menu(const std::string& menuItemId, MenuType menuType) {
        Event event;
        event.type = Type::MENU_EVENT;
        event.menuItemId = menuItemId;
        event.menuType = menuType;
        return event;
    }

    static Event user(Message message) {
        Event event;
        event.type = Type::USER_EVENT;
        event.message = std::move(message);
        return event;
    }
};

// Handle to the running loop given to event handlers and construction closures
class EventLoopTarget {
public:
    virtual ~EventLoopTarget() = default;

    // Throws Error(CREATE_WINDOW) or Error(CREATE_WEBVIEW)
    virtual std::unique_ptr<AbstractWebview> buildWebview(NativeWebviewOptions options) = 0;

    // Replaces any existing tray. Throws Error(INVALID_ICON) when the icon cannot be loaded.
    virtual void buildSystemTray(const Icon& icon, const std::vector<MenuItem>& menu) = 0;
};

// Thread-safe sender into the event loop
class EventLoopProxy {
public:
    virtual ~EventLoopProxy() = default;

    // Returns false once the loop has shut down; the message is dropped
    virtual bool sendEvent(Message message) = 0;

    // Makes the loop run one tick even if nothing is queued
    virtual void wakeUp() = 0;

    // Decodes an icon into the toolkit's format. Safe off the loop thread.
    // Throws Error(INVALID_ICON)
    virtual WindowIcon loadIcon(const Icon& icon) const = 0;
};

typedef std::function<void(Event& event, EventLoopTarget& target, ControlFlow& controlFlow)> EventHandler;

class EventLoop {
public:
    virtual ~EventLoop() = default;

    virtual EventLoopTarget& target() = 0;
    virtual std::shared_ptr<EventLoopProxy> createProxy() = 0;

    // Dispatches events until the handler sets ControlFlow::EXIT,
    // then delivers LOOP_DESTROYED and returns
    virtual void run(EventHandler handler) = 0;

    // Dispatches whatever is pending once and returns
    virtual void runReturn(EventHandler handler) = 0;
};

} // namespace webshell

#endif // WEBSHELL_NATIVE_H
