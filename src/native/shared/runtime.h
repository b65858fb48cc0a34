// runtime.h - Owner of the event loop and of every live window/webview
//
// The thread that calls run() (or runIteration()) is the event loop thread. Native
// objects are created, mutated and destroyed only there; other threads reach them
// through a Dispatcher or a RuntimeHandle.

#ifndef WEBSHELL_RUNTIME_H
#define WEBSHELL_RUNTIME_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "dispatcher.h"
#include "listeners.h"
#include "native.h"
#include "pending_window.h"

namespace webshell {

struct RunIteration {
    size_t webviewCount = 0;
};

// Cloneable, thread-safe. Lets any thread create windows without a reference to the runtime.
class RuntimeHandle {
public:
    explicit RuntimeHandle(DispatcherContext context) : context_(std::move(context)) {}

    // Blocks until the window exists; must not be called from the event loop thread
    DetachedWindow createWindow(PendingWindow pending) const;

    void runOnMainThread(MainThreadTask task) const;

private:
    DispatcherContext context_;
};

class Runtime {
public:
    explicit Runtime(std::unique_ptr<EventLoop> eventLoop);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    RuntimeHandle handle() const { return RuntimeHandle(context_); }

    // Builds the window on the calling thread, which must own the event loop.
    // Construction errors propagate to the caller.
    DetachedWindow createWindow(PendingWindow pending);

    // Event loop thread only
    void systemTray(const Icon& icon, const std::vector<MenuItem>& menu);

    ListenerId onSystemTrayEvent(std::function<void(const SystemTrayEvent&)> handler);
    bool removeSystemTrayEventListener(ListenerId id);

    // Dispatches whatever is pending once and reports the live window count
    RunIteration runIteration();

    // Dispatches events until the last window is closed. On return every window has been
    // destroyed and further commands fail with FAILED_TO_SEND_MESSAGE.
    void run();

    size_t webviewCount() const;

private:
    void handleEvent(Event& event, EventLoopTarget& target, ControlFlow& controlFlow);
    void handleWindowEvent(WindowId windowId, const NativeWindowEvent& nativeEvent, ControlFlow& controlFlow);
    void handleMessage(Message& message, EventLoopTarget& target, ControlFlow& controlFlow);
    void handleWindowMessage(WindowCommand& command, ControlFlow& controlFlow);
    void handleWebviewMessage(WebviewCommand& command);
    void handleCreateWebview(CreateWebviewCommand& command, EventLoopTarget& target);
    void flushPendingScripts();
    void runMainThreadTasks();

    // Removes the window from the live table and destroys it; EXIT when none remain
    void removeWebview(WindowId windowId, ControlFlow& controlFlow);

    std::unique_ptr<EventLoop> eventLoop_;
    DispatcherContext context_;
    std::shared_ptr<SystemTrayEventListeners> trayEventListeners_;

    mutable std::mutex webviewsMutex_;
    std::map<WindowId, std::unique_ptr<AbstractWebview>> webviews_;
};

} // namespace webshell

#endif // WEBSHELL_RUNTIME_H
