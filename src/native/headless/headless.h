// headless.h - Windowing toolkit without a display
//
// Windows and webviews are plain state records. Everything a real toolkit would report
// (close requests, resizes, menu clicks, RPC calls, file drops, protocol fetches) can be
// simulated from any thread through HeadlessController; simulated input shares one FIFO
// queue with the commands sent through the proxy.

#ifndef WEBSHELL_HEADLESS_H
#define WEBSHELL_HEADLESS_H

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../shared/channel.h"
#include "../shared/native.h"

namespace webshell {

// Snapshot of one headless window
struct HeadlessWindowState {
    WindowId id = 0;
    std::string url;
    std::string title;
    PhysicalSize<uint32_t> innerSize;
    PhysicalPosition<int32_t> position;   // outer position
    std::optional<PhysicalSize<uint32_t>> minInnerSize;
    std::optional<PhysicalSize<uint32_t>> maxInnerSize;
    double scaleFactor = 1.0;
    bool resizable = true;
    bool maximized = false;
    bool minimized = false;
    bool visible = true;
    bool decorated = true;
    bool alwaysOnTop = false;
    bool fullscreen = false;
    bool focused = false;
    bool skipTaskbar = false;
    bool transparent = false;
    std::optional<WindowIcon> icon;
    std::vector<MenuItem> menu;
    std::vector<std::string> initializationScripts;
    std::optional<std::string> dataDirectory;
    std::vector<std::string> customProtocols;
    std::vector<std::string> evaluatedScripts;
    std::vector<std::string> history;   // applied setters, in order, e.g. "setTitle A"
    size_t resizeCount = 0;
    size_t printCount = 0;
    size_t dragCount = 0;
    bool destroyed = false;
};

// Height added by decorations to the outer size
const uint32_t HEADLESS_TITLE_BAR_HEIGHT = 28;

// Decodes an icon without a toolkit: only PNG headers are understood, pixels are blank.
// Throws Error(INVALID_ICON)
WindowIcon decodeHeadlessIcon(const Icon& icon);

struct HeadlessQueueItem {
    std::optional<Event> event;
    std::function<void()> callback;   // native work run on the loop thread
};

class HeadlessWebview;

struct HeadlessState {
    std::mutex mutex;
    MessageChannel<HeadlessQueueItem> queue;
    std::map<WindowId, HeadlessWindowState> windows;
    std::map<WindowId, HeadlessWebview*> webviews;   // loop thread
    std::vector<Monitor> monitors;
    WindowId nextWindowId = 1;
    std::optional<std::string> nextWindowFailure;
    std::optional<std::vector<MenuItem>> trayMenu;
    std::function<void(WindowId)> printDialog;   // runs while a print dialog is open
    bool terminateRequested = false;

    void push(Event event);
    void pushCallback(std::function<void()> callback);
};

class HeadlessWindow : public AbstractWindow {
public:
    HeadlessWindow(std::shared_ptr<HeadlessState> state, WindowId id);

    WindowId id() const override { return id_; }

    double scaleFactor() override;
    PhysicalPosition<int32_t> innerPosition() override;
    PhysicalPosition<int32_t> outerPosition() override;
    PhysicalSize<uint32_t> innerSize() override;
    PhysicalSize<uint32_t> outerSize() override;
    bool isFullscreen() override;
    bool isMaximized() override;
    bool isDecorated() override;
    bool isResizable() override;
    bool isVisible() override;
    std::optional<Monitor> currentMonitor() override;
    std::optional<Monitor> primaryMonitor() override;
    std::vector<Monitor> availableMonitors() override;

    void setResizable(bool resizable) override;
    void setTitle(const std::string& title) override;
    void setMaximized(bool maximized) override;
    void setMinimized(bool minimized) override;
    void setVisible(bool visible) override;
    void setDecorations(bool decorations) override;
    void setAlwaysOnTop(bool alwaysOnTop) override;
    void setInnerSize(const Size& size) override;
    void setMinInnerSize(const std::optional<Size>& size) override;
    void setMaxInnerSize(const std::optional<Size>& size) override;
    void setOuterPosition(const Position& position) override;
    void setFullscreen(bool fullscreen) override;
    void setFocus() override;
    void setWindowIcon(const WindowIcon& icon) override;
    void setSkipTaskbar(bool skip) override;
    void dragWindow() override;

private:
    // Runs fn on this window's record under the state lock
    template<typename Fn>
    auto withState(Fn fn) -> decltype(fn(std::declval<HeadlessWindowState&>()));

    std::shared_ptr<HeadlessState> state_;
    WindowId id_;
};

class HeadlessWebview : public AbstractWebview {
public:
    HeadlessWebview(std::shared_ptr<HeadlessState> state, WindowId id, NativeWebviewOptions options);
    ~HeadlessWebview() override;

    AbstractWindow& window() override { return window_; }

    void print() override;
    void resize() override;

    const NativeWebviewOptions& options() const { return options_; }

protected:
    // Empty scripts fail, like a script with a syntax error would
    void evaluateJavaScript(const std::string& script) override;

private:
    std::shared_ptr<HeadlessState> state_;
    HeadlessWindow window_;
    NativeWebviewOptions options_;
};

class HeadlessProxy : public EventLoopProxy {
public:
    explicit HeadlessProxy(std::shared_ptr<HeadlessState> state) : state_(std::move(state)) {}

    bool sendEvent(Message message) override;
    void wakeUp() override;
    WindowIcon loadIcon(const Icon& icon) const override;

private:
    std::shared_ptr<HeadlessState> state_;
};

// Drives a headless event loop from other threads. Safe to use from any thread.
class HeadlessController {
public:
    explicit HeadlessController(std::shared_ptr<HeadlessState> state) : state_(std::move(state)) {}

    std::optional<HeadlessWindowState> windowState(WindowId id) const;
    std::vector<WindowId> liveWindowIds() const;
    std::optional<std::vector<MenuItem>> trayMenu() const;

    void setMonitors(std::vector<Monitor> monitors);

    // The next window construction fails with Error(CREATE_WEBVIEW, reason)
    void failNextWindow(const std::string& reason);
    // Called on the loop thread from inside print(), as a modal dialog's nested loop would run code
    void onPrintDialog(std::function<void(WindowId)> hook);

    void simulateCloseRequested(WindowId id);
    void simulateResize(WindowId id, uint32_t width, uint32_t height);
    void simulateMove(WindowId id, int32_t x, int32_t y);
    void simulateFocus(WindowId id, bool focused);
    void simulateScaleFactorChange(WindowId id, double scaleFactor);
    void simulateNativeEvent(WindowId id, const NativeWindowEvent& event);
    void simulateMenuClick(const std::string& menuItemId, MenuType menuType);

    std::future<std::optional<RpcResponse>> simulateRpc(WindowId id, const RpcRequest& request);
    std::future<bool> simulateFileDrop(WindowId id, const FileDropEvent& event);
    std::future<std::vector<uint8_t>> fetchCustomProtocol(WindowId id, const std::string& url);

    // Makes run() return after the items queued before this call
    void terminate();

private:
    std::shared_ptr<HeadlessState> state_;
};

class HeadlessEventLoop : public EventLoop, public EventLoopTarget {
public:
    HeadlessEventLoop();
    ~HeadlessEventLoop() override;

    std::shared_ptr<HeadlessController> controller() const;

    EventLoopTarget& target() override { return *this; }
    std::shared_ptr<EventLoopProxy> createProxy() override;
    void run(EventHandler handler) override;
    void runReturn(EventHandler handler) override;

    std::unique_ptr<AbstractWebview> buildWebview(NativeWebviewOptions options) override;
    void buildSystemTray(const Icon& icon, const std::vector<MenuItem>& menu) override;

private:
    // Returns false once the loop should stop
    bool dispatch(Event& event, EventHandler& handler);
    bool drainQueue(EventHandler& handler);

    std::shared_ptr<HeadlessState> state_;
};

} // namespace webshell

#endif // WEBSHELL_HEADLESS_H
