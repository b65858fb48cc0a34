// gtk_backend.h - GTK 3 + WebKit2GTK implementation of the toolkit interfaces
//
// The thread that constructs GtkEventLoop owns GTK from then on: every window, webview,
// menu and tray object is created, used and destroyed there. Native signal handlers
// translate toolkit callbacks into Events pushed onto the loop's queue.

#ifndef WEBSHELL_GTK_BACKEND_H
#define WEBSHELL_GTK_BACKEND_H

#include <gtk/gtk.h>
#include <webkit2/webkit2.h>
#include <jsc/jsc.h>
#ifndef NO_APPINDICATOR
#include <libayatana-appindicator/app-indicator.h>
#endif

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../shared/channel.h"
#include "../shared/native.h"

namespace webshell {

// Calls gtk_init once per process. Throws std::runtime_error when no display can be opened.
void initializeGTK();

// Decodes PNG/JPEG/ICO/... bytes or files with GdkPixbuf. Safe off the GTK thread.
// Throws Error(INVALID_ICON)
WindowIcon decodeGtkIcon(const Icon& icon);

Monitor monitorFromGdk(GdkMonitor* monitor);
std::vector<Monitor> gtkMonitors();

// State shared by the loop, its proxies and the native signal handlers
struct GtkLoopState {
    MessageChannel<Event> queue;
    WindowId nextWindowId = 1;   // GTK thread only

    void push(Event event);
};

// Appends the items to a GtkMenu or GtkMenuBar. Selections are pushed as MENU_EVENTs of menuType.
// Accelerators are installed in accelGroup when one is given.
void appendMenuItems(GtkWidget* menuShell,
                     const std::vector<MenuItem>& items,
                     MenuType menuType,
                     std::shared_ptr<GtkLoopState> state,
                     GtkAccelGroup* accelGroup);

class GtkWindowImpl : public AbstractWindow {
public:
    // Creates a hidden toplevel with its content box; the webview is packed by WebKitWebviewImpl
    GtkWindowImpl(std::shared_ptr<GtkLoopState> state, WindowId id,
                  const WindowAttributes& attributes, bool transparent);
    ~GtkWindowImpl() override;

    GtkWindowImpl(const GtkWindowImpl&) = delete;
    GtkWindowImpl& operator=(const GtkWindowImpl&) = delete;

    WindowId id() const override { return id_; }
    GtkWidget* widget() const { return window_; }
    GtkWidget* contentBox() const { return box_; }

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
    void applyGeometryHints();

    static gboolean onDeleteEvent(GtkWidget* widget, GdkEvent* event, gpointer userData);
    static gboolean onConfigureEvent(GtkWidget* widget, GdkEventConfigure* event, gpointer userData);
    static gboolean onFocusIn(GtkWidget* widget, GdkEventFocus* event, gpointer userData);
    static gboolean onFocusOut(GtkWidget* widget, GdkEventFocus* event, gpointer userData);
    static gboolean onWindowStateEvent(GtkWidget* widget, GdkEventWindowState* event, gpointer userData);
    static void onScaleFactorChanged(GObject* object, GParamSpec* pspec, gpointer userData);
    static void onDestroy(GtkWidget* widget, gpointer userData);

    std::shared_ptr<GtkLoopState> state_;
    WindowId id_;
    GtkWidget* window_ = nullptr;
    GtkWidget* box_ = nullptr;
    GtkWidget* menuBar_ = nullptr;
    GtkAccelGroup* accelGroup_ = nullptr;

    // logical units, as GTK takes them
    std::optional<LogicalSize<double>> minSize_;
    std::optional<LogicalSize<double>> maxSize_;

    bool fullscreen_ = false;
    int lastWidth_ = 0;
    int lastHeight_ = 0;
    int lastX_ = 0;
    int lastY_ = 0;
};

class WebKitWebviewImpl : public AbstractWebview {
public:
    // Throws Error(CREATE_WINDOW) or Error(CREATE_WEBVIEW)
    WebKitWebviewImpl(std::shared_ptr<GtkLoopState> state, WindowId id, NativeWebviewOptions options);
    ~WebKitWebviewImpl() override;

    AbstractWindow& window() override { return window_; }

    void print() override;
    void resize() override;

protected:
    void evaluateJavaScript(const std::string& script) override;

private:
    void registerCustomProtocols();
    void installUserScripts();

    static void onScriptMessage(WebKitUserContentManager* manager, WebKitJavascriptResult* jsResult, gpointer userData);
    static gboolean onDragDrop(GtkWidget* widget, GdkDragContext* context, gint x, gint y, guint time, gpointer userData);
    static void onDragDataReceived(GtkWidget* widget, GdkDragContext* context, gint x, gint y,
                                   GtkSelectionData* data, guint info, guint time, gpointer userData);
    static void onDragLeave(GtkWidget* widget, GdkDragContext* context, guint time, gpointer userData);
    static gboolean onDragLeaveIdle(gpointer userData);

    std::shared_ptr<GtkLoopState> state_;
    GtkWindowImpl window_;
    NativeWebviewOptions options_;

    WebKitWebContext* context_ = nullptr;
    WebKitUserContentManager* manager_ = nullptr;
    GtkWidget* webview_ = nullptr;

    bool dropPending_ = false;
    bool dragHovering_ = false;
    guint leaveIdleId_ = 0;
};

class GtkSystemTray {
public:
    // Throws Error(INVALID_ICON)
    GtkSystemTray(std::shared_ptr<GtkLoopState> state, const Icon& icon, const std::vector<MenuItem>& menu);
    ~GtkSystemTray();

    GtkSystemTray(const GtkSystemTray&) = delete;
    GtkSystemTray& operator=(const GtkSystemTray&) = delete;

private:
#ifndef NO_APPINDICATOR
    AppIndicator* indicator_ = nullptr;
#endif
    GtkWidget* menu_ = nullptr;
    std::string iconPath_;
    bool ownsIconFile_ = false;
};

class GtkProxy : public EventLoopProxy {
public:
    GtkProxy(std::shared_ptr<GtkLoopState> state, GMainContext* context);
    ~GtkProxy() override;

    bool sendEvent(Message message) override;
    void wakeUp() override;
    WindowIcon loadIcon(const Icon& icon) const override;

private:
    std::shared_ptr<GtkLoopState> state_;
    GMainContext* context_;
};

class GtkEventLoop : public EventLoop, public EventLoopTarget {
public:
    // Initializes GTK on the calling thread, which becomes the event loop thread
    GtkEventLoop();
    ~GtkEventLoop() override;

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
    void pumpPending();

    std::shared_ptr<GtkLoopState> state_;
    GMainContext* context_;
    std::unique_ptr<GtkSystemTray> tray_;
};

} // namespace webshell

#endif // WEBSHELL_GTK_BACKEND_H
