#include "gtk_backend.h"

#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <mutex>
#include <stdexcept>

#include "../shared/error.h"

namespace webshell {

// Initialization

void initializeGTK() {
    static std::mutex initMutex;
    static bool initialized = false;

    std::lock_guard<std::mutex> lock(initMutex);
    if (initialized) {
        return;
    }
    if (!gtk_init_check(nullptr, nullptr)) {
        fprintf(stderr, "ERROR: Failed to initialize GTK\n");
        throw std::runtime_error("Failed to initialize GTK: cannot open display");
    }
    initialized = true;
    printf("GTK: initialized\n");
}

// Icons

WindowIcon decodeGtkIcon(const Icon& icon) {
    GError* error = nullptr;
    GdkPixbuf* pixbuf = nullptr;

    if (icon.source == Icon::Source::FILE) {
        pixbuf = gdk_pixbuf_new_from_file(icon.path.c_str(), &error);
    } else {
        GdkPixbufLoader* loader = gdk_pixbuf_loader_new();
        if (gdk_pixbuf_loader_write(loader, icon.bytes.data(), icon.bytes.size(), &error)) {
            if (gdk_pixbuf_loader_close(loader, &error)) {
                pixbuf = gdk_pixbuf_loader_get_pixbuf(loader);
                if (pixbuf) {
                    g_object_ref(pixbuf);
                }
            }
        } else {
            // the loader must be closed even after a failed write; the write error is the one reported
            GError* closeError = nullptr;
            if (!gdk_pixbuf_loader_close(loader, &closeError) && closeError) {
                g_error_free(closeError);
            }
        }
        g_object_unref(loader);
    }

    if (!pixbuf) {
        std::string message = error ? error->message : "unsupported image data";
        if (error) {
            g_error_free(error);
        }
        throw Error(ErrorKind::INVALID_ICON, message);
    }

    GdkPixbuf* rgba = gdk_pixbuf_get_has_alpha(pixbuf)
        ? GDK_PIXBUF(g_object_ref(pixbuf))
        : gdk_pixbuf_add_alpha(pixbuf, FALSE, 0, 0, 0);
    g_object_unref(pixbuf);

    WindowIcon decoded;
    decoded.width = static_cast<uint32_t>(gdk_pixbuf_get_width(rgba));
    decoded.height = static_cast<uint32_t>(gdk_pixbuf_get_height(rgba));
    int rowstride = gdk_pixbuf_get_rowstride(rgba);
    const guchar* pixels = gdk_pixbuf_read_pixels(rgba);

    size_t rowBytes = static_cast<size_t>(decoded.width) * 4;
    decoded.rgba.reserve(rowBytes * decoded.height);
    for (uint32_t row = 0; row < decoded.height; row++) {
        const guchar* start = pixels + static_cast<size_t>(row) * rowstride;
        decoded.rgba.insert(decoded.rgba.end(), start, start + rowBytes);
    }
    g_object_unref(rgba);
    return decoded;
}

// Monitors

Monitor monitorFromGdk(GdkMonitor* monitor) {
    GdkRectangle geometry;
    gdk_monitor_get_geometry(monitor, &geometry);
    int scale = gdk_monitor_get_scale_factor(monitor);

    Monitor result;
    const char* model = gdk_monitor_get_model(monitor);
    if (model) {
        result.name = model;
    }
    result.position = PhysicalPosition<int32_t>(geometry.x * scale, geometry.y * scale);
    result.size = PhysicalSize<uint32_t>(static_cast<uint32_t>(geometry.width * scale),
                                         static_cast<uint32_t>(geometry.height * scale));
    result.scaleFactor = scale;
    return result;
}

std::vector<Monitor> gtkMonitors() {
    std::vector<Monitor> monitors;
    GdkDisplay* display = gdk_display_get_default();
    if (!display) {
        return monitors;
    }
    int count = gdk_display_get_n_monitors(display);
    for (int i = 0; i < count; i++) {
        GdkMonitor* monitor = gdk_display_get_monitor(display, i);
        if (monitor) {
            monitors.push_back(monitorFromGdk(monitor));
        }
    }
    return monitors;
}

// GtkLoopState

void GtkLoopState::push(Event event) {
    if (!queue.send(std::move(event))) {
        printf("DEBUG: event dropped, event loop already closed\n");
    }
}

// GtkSystemTray

GtkSystemTray::GtkSystemTray(std::shared_ptr<GtkLoopState> state, const Icon& icon, const std::vector<MenuItem>& menu) {
    // validates the image before handing it to the indicator
    WindowIcon decoded = decodeGtkIcon(icon);

    if (icon.source == Icon::Source::FILE) {
        iconPath_ = icon.path;
    } else {
        // AppIndicator only takes icon names or paths
        iconPath_ = std::string(g_get_user_runtime_dir()) + "/webshell-tray-" + std::to_string(getpid()) + ".png";
        GError* error = nullptr;
        if (!g_file_set_contents(iconPath_.c_str(), reinterpret_cast<const gchar*>(icon.bytes.data()),
                                 static_cast<gssize>(icon.bytes.size()), &error)) {
            std::string message = error ? error->message : "cannot write tray icon";
            if (error) {
                g_error_free(error);
            }
            throw Error(ErrorKind::INVALID_ICON, message);
        }
        ownsIconFile_ = true;
    }

    menu_ = gtk_menu_new();
    appendMenuItems(menu_, menu, MenuType::SYSTEM_TRAY, state, nullptr);
    gtk_widget_show_all(menu_);

#ifndef NO_APPINDICATOR
    indicator_ = app_indicator_new("webshell-tray", iconPath_.c_str(), APP_INDICATOR_CATEGORY_APPLICATION_STATUS);
    app_indicator_set_status(indicator_, APP_INDICATOR_STATUS_ACTIVE);
    app_indicator_set_menu(indicator_, GTK_MENU(menu_));
    printf("GTK: tray created with %ux%u icon\n", decoded.width, decoded.height);
#else
    printf("GTK WARNING: tray support not compiled in; %ux%u icon ignored\n", decoded.width, decoded.height);
#endif
}

GtkSystemTray::~GtkSystemTray() {
#ifndef NO_APPINDICATOR
    if (indicator_) {
        app_indicator_set_status(indicator_, APP_INDICATOR_STATUS_PASSIVE);
        g_object_unref(indicator_);
    }
#endif
    if (menu_) {
        gtk_widget_destroy(menu_);
    }
    if (ownsIconFile_ && std::remove(iconPath_.c_str()) != 0) {
        fprintf(stderr, "WARNING: could not remove %s\n", iconPath_.c_str());
    }
}

// GtkProxy

GtkProxy::GtkProxy(std::shared_ptr<GtkLoopState> state, GMainContext* context)
    : state_(std::move(state)), context_(g_main_context_ref(context)) {}

GtkProxy::~GtkProxy() {
    g_main_context_unref(context_);
}

bool GtkProxy::sendEvent(Message message) {
    if (!state_->queue.send(Event::user(std::move(message)))) {
        return false;
    }
    g_main_context_wakeup(context_);
    return true;
}

void GtkProxy::wakeUp() {
    g_main_context_wakeup(context_);
}

WindowIcon GtkProxy::loadIcon(const Icon& icon) const {
    return decodeGtkIcon(icon);
}

// GtkEventLoop

GtkEventLoop::GtkEventLoop() : state_(std::make_shared<GtkLoopState>()) {
    initializeGTK();
    context_ = g_main_context_ref(g_main_context_default());
}

GtkEventLoop::~GtkEventLoop() {
    state_->queue.close();
    tray_.reset();
    g_main_context_unref(context_);
}

std::shared_ptr<EventLoopProxy> GtkEventLoop::createProxy() {
    return std::make_shared<GtkProxy>(state_, context_);
}

bool GtkEventLoop::dispatch(Event& event, EventHandler& handler) {
    ControlFlow controlFlow = ControlFlow::WAIT;
    handler(event, *this, controlFlow);
    return controlFlow != ControlFlow::EXIT;
}

bool GtkEventLoop::drainQueue(EventHandler& handler) {
    Event newEvents = Event::of(Event::Type::NEW_EVENTS);
    if (!dispatch(newEvents, handler)) {
        return false;
    }

    // Events raised while handling these wait for the next pass
    size_t pending = state_->queue.size();
    for (size_t i = 0; i < pending; i++) {
        std::optional<Event> event = state_->queue.tryRecv();
        if (!event) {
            break;
        }
        if (!dispatch(*event, handler)) {
            return false;
        }
    }

    Event cleared = Event::of(Event::Type::MAIN_EVENTS_CLEARED);
    return dispatch(cleared, handler);
}

void GtkEventLoop::pumpPending() {
    while (g_main_context_pending(context_)) {
        g_main_context_iteration(context_, FALSE);
    }
}

void GtkEventLoop::run(EventHandler handler) {
    struct QueueCloser {
        GtkLoopState& state;
        ~QueueCloser() { state.queue.close(); }
    } closer{*state_};

    while (drainQueue(handler)) {
        if (state_->queue.size() == 0) {
            // blocks until a GTK source fires or a proxy wakes the context
            g_main_context_iteration(context_, TRUE);
        }
        pumpPending();
    }

    Event destroyed = Event::of(Event::Type::LOOP_DESTROYED);
    ControlFlow controlFlow = ControlFlow::EXIT;
    handler(destroyed, *this, controlFlow);
}

void GtkEventLoop::runReturn(EventHandler handler) {
    pumpPending();
    drainQueue(handler);
}

std::unique_ptr<AbstractWebview> GtkEventLoop::buildWebview(NativeWebviewOptions options) {
    WindowId id = state_->nextWindowId++;
    return std::make_unique<WebKitWebviewImpl>(state_, id, std::move(options));
}

void GtkEventLoop::buildSystemTray(const Icon& icon, const std::vector<MenuItem>& menu) {
    // the old tray goes first so its icon file is released
    tray_.reset();
    tray_ = std::make_unique<GtkSystemTray>(state_, icon, menu);
}

} // namespace webshell
