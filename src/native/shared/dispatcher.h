// dispatcher.h - Per-window handle usable from any thread
//
// Every call is turned into a message for the event loop thread.
// Getters and createWindow block until the loop answers: calling them from the
// event loop thread itself (a listener, a main thread task, an RPC handler)
// deadlocks. Setters return as soon as the message is queued.

#ifndef WEBSHELL_DISPATCHER_H
#define WEBSHELL_DISPATCHER_H

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel.h"
#include "error.h"
#include "geometry.h"
#include "listeners.h"
#include "messages.h"
#include "native.h"
#include "pending_window.h"

namespace webshell {

typedef std::function<void()> MainThreadTask;

// Shared by every dispatcher cloned from the same runtime
struct DispatcherContext {
    std::shared_ptr<EventLoopProxy> proxy;
    std::shared_ptr<MessageChannel<MainThreadTask>> mainThreadTasks;
    std::shared_ptr<WindowEventListeners> windowEventListeners;
    std::shared_ptr<MenuEventListeners> menuEventListeners;

    // Throws Error(FAILED_TO_SEND_MESSAGE) once the loop has shut down
    void send(Message message) const;
    void runOnMainThread(MainThreadTask task) const;
};

// Waits for a reply from the event loop thread
// Throws Error(FAILED_TO_RECEIVE_MESSAGE) if the request was dropped unanswered
template<typename T>
T receiveReply(std::future<T>& rx) {
    try {
        return rx.get();
    } catch (const std::future_error& e) {
        throw Error(ErrorKind::FAILED_TO_RECEIVE_MESSAGE, e.what());
    }
}

class Dispatcher {
public:
    Dispatcher(WindowId windowId, DispatcherContext context);

    WindowId windowId() const { return windowId_; }

    void runOnMainThread(MainThreadTask task) const;

    // The listener only receives events of this dispatcher's window
    ListenerId onWindowEvent(std::function<void(const WindowEvent&)> handler) const;
    bool removeWindowEventListener(ListenerId id) const;

    // Menubar selections of every window
    ListenerId onMenuEvent(std::function<void(const MenuEvent&)> handler) const;
    bool removeMenuEventListener(ListenerId id) const;

    // Getters
    double scaleFactor() const;
    PhysicalPosition<int32_t> innerPosition() const;
    PhysicalPosition<int32_t> outerPosition() const;
    PhysicalSize<uint32_t> innerSize() const;
    PhysicalSize<uint32_t> outerSize() const;
    bool isFullscreen() const;
    bool isMaximized() const;
    bool isDecorated() const;
    bool isResizable() const;
    bool isVisible() const;
    std::optional<Monitor> currentMonitor() const;
    std::optional<Monitor> primaryMonitor() const;
    std::vector<Monitor> availableMonitors() const;

    // Blocks until the new window exists
    DetachedWindow createWindow(PendingWindow pending) const;

    // Setters
    void setResizable(bool resizable) const;
    void setTitle(const std::string& title) const;
    void maximize() const;
    void unmaximize() const;
    void minimize() const;
    void unminimize() const;
    void show() const;
    void hide() const;
    void close() const;
    void setDecorations(bool decorations) const;
    void setAlwaysOnTop(bool alwaysOnTop) const;
    void setSize(const Size& size) const;
    void setMinSize(const std::optional<Size>& size) const;
    void setMaxSize(const std::optional<Size>& size) const;
    void setPosition(const Position& position) const;
    void setFullscreen(bool fullscreen) const;
    void setFocus() const;
    // The icon is decoded on the calling thread; throws Error(INVALID_ICON)
    void setIcon(const Icon& icon) const;
    void setSkipTaskbar(bool skip) const;
    void startDragging() const;

    void evalScript(const std::string& script) const;
    void print() const;

    const DispatcherContext& context() const { return context_; }

private:
    template<typename T, typename Getter>
    T request() const;

    void sendWindowMessage(WindowMessage message) const;

    WindowId windowId_;
    DispatcherContext context_;
};

struct DetachedWindow {
    std::string label;
    Dispatcher dispatcher;
};

// Queues construction of pending on the event loop and waits for the new window
DetachedWindow createWindow(const DispatcherContext& context, PendingWindow pending);

} // namespace webshell

#endif // WEBSHELL_DISPATCHER_H
