#include "gtk_backend.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <map>
#include <stdexcept>

#include "../shared/accelerator_parser.h"
#include "../shared/error.h"

namespace webshell {

namespace {

struct MenuItemData {
    std::shared_ptr<GtkLoopState> state;
    std::string id;
    MenuType menuType;
};

void onMenuItemActivate(GtkMenuItem* menuItem, gpointer userData) {
    MenuItemData* data = static_cast<MenuItemData*>(userData);
    printf("DEBUG: menu item activated: %s\n", data->id.c_str());
    data->state->push(Event::menu(data->id, data->menuType));
}

void freeMenuItemData(gpointer userData, GClosure*) {
    delete static_cast<MenuItemData*>(userData);
}

// Canonical accelerator key names that differ from GDK's
guint keyvalFromAcceleratorKey(const std::string& key) {
    static const std::map<std::string, std::string> gdkNames = {
        {"enter", "Return"}, {"escape", "Escape"}, {"tab", "Tab"}, {"space", "space"},
        {"backspace", "BackSpace"}, {"delete", "Delete"}, {"insert", "Insert"}, {"home", "Home"},
        {"end", "End"}, {"pageup", "Page_Up"}, {"pagedown", "Page_Down"}, {"up", "Up"},
        {"down", "Down"}, {"left", "Left"}, {"right", "Right"}, {"plus", "plus"},
        {"-", "minus"}, {"=", "equal"}, {",", "comma"}, {".", "period"}, {"/", "slash"}
    };

    auto it = gdkNames.find(key);
    if (it != gdkNames.end()) {
        return gdk_keyval_from_name(it->second.c_str());
    }
    if (key.size() > 1 && key[0] == 'f') {
        std::string function = "F" + key.substr(1);
        return gdk_keyval_from_name(function.c_str());
    }
    if (key.size() == 1) {
        return gdk_unicode_to_keyval(static_cast<guint32>(static_cast<unsigned char>(key[0])));
    }
    return gdk_keyval_from_name(key.c_str());
}

GdkModifierType gdkModifiers(const Accelerator& accelerator) {
    int modifiers = 0;
    if (accelerator.has(Modifier::CONTROL)) modifiers |= GDK_CONTROL_MASK;
    if (accelerator.has(Modifier::ALT)) modifiers |= GDK_MOD1_MASK;
    if (accelerator.has(Modifier::SHIFT)) modifiers |= GDK_SHIFT_MASK;
    if (accelerator.has(Modifier::SUPER)) modifiers |= GDK_SUPER_MASK;
    return static_cast<GdkModifierType>(modifiers);
}

void addAccelerator(GtkWidget* menuItem, const MenuItem& item, GtkAccelGroup* accelGroup) {
    std::optional<Accelerator> accelerator = item.shortcut();
    if (!accelerator) {
        fprintf(stderr, "WARNING: ignoring malformed accelerator '%s' on menu item '%s'\n",
                item.accelerator.c_str(), item.id.c_str());
        return;
    }
    guint keyval = keyvalFromAcceleratorKey(accelerator->key);
    if (keyval == GDK_KEY_VoidSymbol || keyval == 0) {
        fprintf(stderr, "WARNING: unsupported accelerator key in '%s'\n", accelerator->toString().c_str());
        return;
    }

    gtk_widget_add_accelerator(menuItem, "activate", accelGroup, keyval,
                               gdkModifiers(*accelerator), GTK_ACCEL_VISIBLE);
}

} // namespace

void appendMenuItems(GtkWidget* menuShell,
                     const std::vector<MenuItem>& items,
                     MenuType menuType,
                     std::shared_ptr<GtkLoopState> state,
                     GtkAccelGroup* accelGroup) {
    for (const auto& item : items) {
        if (item.hidden) {
            continue;
        }

        GtkWidget* menuItem = nullptr;
        switch (item.type) {
            case MenuItemType::SEPARATOR:
                menuItem = gtk_separator_menu_item_new();
                break;
            case MenuItemType::CHECKBOX:
                menuItem = gtk_check_menu_item_new_with_label(item.label.c_str());
                gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(menuItem), item.checked);
                break;
            case MenuItemType::SUBMENU: {
                menuItem = gtk_menu_item_new_with_label(item.label.c_str());
                GtkWidget* submenu = gtk_menu_new();
                if (accelGroup) {
                    gtk_menu_set_accel_group(GTK_MENU(submenu), accelGroup);
                }
                appendMenuItems(submenu, item.submenu, menuType, state, accelGroup);
                gtk_menu_item_set_submenu(GTK_MENU_ITEM(menuItem), submenu);
                break;
            }
            default:
                menuItem = gtk_menu_item_new_with_label(item.label.c_str());
                break;
        }

        if (item.type != MenuItemType::SEPARATOR) {
            gtk_widget_set_sensitive(menuItem, item.enabled);
            if (!item.tooltip.empty()) {
                gtk_widget_set_tooltip_text(menuItem, item.tooltip.c_str());
            }
        }

        if ((item.type == MenuItemType::NORMAL || item.type == MenuItemType::CHECKBOX) && !item.id.empty()) {
            g_signal_connect_data(menuItem, "activate", G_CALLBACK(onMenuItemActivate),
                                  new MenuItemData{state, item.id, menuType},
                                  freeMenuItemData, static_cast<GConnectFlags>(0));
            if (accelGroup && !item.accelerator.empty()) {
                addAccelerator(menuItem, item, accelGroup);
            }
        }

        gtk_menu_shell_append(GTK_MENU_SHELL(menuShell), menuItem);
    }
}

// GtkWindowImpl

GtkWindowImpl::GtkWindowImpl(std::shared_ptr<GtkLoopState> state, WindowId id,
                             const WindowAttributes& attributes, bool transparent)
    : state_(std::move(state)), id_(id) {
    window_ = gtk_window_new(GTK_WINDOW_TOPLEVEL);
    if (!window_) {
        throw Error(ErrorKind::CREATE_WINDOW, "gtk_window_new failed");
    }

    gtk_window_set_title(GTK_WINDOW(window_), attributes.title.c_str());

    // sizes are given to GTK in logical units
    double scale = gtk_widget_get_scale_factor(window_);
    LogicalSize<double> size = attributes.innerSize
        ? attributes.innerSize->toLogical(scale)
        : LogicalSize<double>(DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT);
    gtk_window_set_default_size(GTK_WINDOW(window_), static_cast<int>(size.width), static_cast<int>(size.height));

    if (attributes.minInnerSize) {
        minSize_ = attributes.minInnerSize->toLogical(scale);
    }
    if (attributes.maxInnerSize) {
        maxSize_ = attributes.maxInnerSize->toLogical(scale);
    }
    applyGeometryHints();

    if (attributes.position) {
        LogicalPosition<double> position = attributes.position->toLogical(scale);
        gtk_window_move(GTK_WINDOW(window_), static_cast<int>(position.x), static_cast<int>(position.y));
    }

    gtk_window_set_resizable(GTK_WINDOW(window_), attributes.resizable);
    gtk_window_set_decorated(GTK_WINDOW(window_), attributes.decorations);
    gtk_window_set_keep_above(GTK_WINDOW(window_), attributes.alwaysOnTop);
    gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window_), attributes.skipTaskbar);
    gtk_window_set_accept_focus(GTK_WINDOW(window_), TRUE);
    gtk_window_set_focus_on_map(GTK_WINDOW(window_), attributes.focus);
    if (attributes.maximized) {
        gtk_window_maximize(GTK_WINDOW(window_));
    }
    if (attributes.fullscreen) {
        gtk_window_fullscreen(GTK_WINDOW(window_));
    }

    if (transparent) {
        GdkScreen* screen = gtk_window_get_screen(GTK_WINDOW(window_));
        GdkVisual* visual = gdk_screen_get_rgba_visual(screen);
        if (visual && gdk_screen_is_composited(screen)) {
            gtk_widget_set_visual(window_, visual);
            gtk_widget_set_app_paintable(window_, TRUE);
            printf("GTK: Created transparent window\n");
        } else {
            printf("GTK WARNING: Transparency not supported (no RGBA visual or compositor)\n");
        }
    }

    box_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
    gtk_container_add(GTK_CONTAINER(window_), box_);

    if (!attributes.menu.empty()) {
        accelGroup_ = gtk_accel_group_new();
        gtk_window_add_accel_group(GTK_WINDOW(window_), accelGroup_);
        menuBar_ = gtk_menu_bar_new();
        appendMenuItems(menuBar_, attributes.menu, MenuType::MENUBAR, state_, accelGroup_);
        gtk_box_pack_start(GTK_BOX(box_), menuBar_, FALSE, FALSE, 0);
    }

    if (attributes.icon) {
        try {
            setWindowIcon(decodeGtkIcon(*attributes.icon));
        } catch (const Error& e) {
            gtk_widget_destroy(window_);
            window_ = nullptr;
            if (accelGroup_) {
                g_object_unref(accelGroup_);
            }
            throw Error(ErrorKind::CREATE_WINDOW, e.what());
        }
    }

    g_signal_connect(window_, "delete-event", G_CALLBACK(onDeleteEvent), this);
    g_signal_connect(window_, "configure-event", G_CALLBACK(onConfigureEvent), this);
    g_signal_connect(window_, "focus-in-event", G_CALLBACK(onFocusIn), this);
    g_signal_connect(window_, "focus-out-event", G_CALLBACK(onFocusOut), this);
    g_signal_connect(window_, "window-state-event", G_CALLBACK(onWindowStateEvent), this);
    g_signal_connect(window_, "notify::scale-factor", G_CALLBACK(onScaleFactorChanged), this);
    g_signal_connect(window_, "destroy", G_CALLBACK(onDestroy), this);
}

GtkWindowImpl::~GtkWindowImpl() {
    if (window_) {
        gtk_widget_destroy(window_);
    }
    if (accelGroup_) {
        g_object_unref(accelGroup_);
    }
}

void GtkWindowImpl::applyGeometryHints() {
    GdkGeometry geometry;
    memset(&geometry, 0, sizeof(geometry));
    int hints = 0;
    if (minSize_) {
        geometry.min_width = static_cast<int>(minSize_->width);
        geometry.min_height = static_cast<int>(minSize_->height);
        hints |= GDK_HINT_MIN_SIZE;
    }
    if (maxSize_) {
        geometry.max_width = static_cast<int>(maxSize_->width);
        geometry.max_height = static_cast<int>(maxSize_->height);
        hints |= GDK_HINT_MAX_SIZE;
    }
    gtk_window_set_geometry_hints(GTK_WINDOW(window_), nullptr, &geometry, static_cast<GdkWindowHints>(hints));
}

double GtkWindowImpl::scaleFactor() {
    return gtk_widget_get_scale_factor(window_);
}

PhysicalPosition<int32_t> GtkWindowImpl::innerPosition() {
    int scale = gtk_widget_get_scale_factor(window_);
    GdkWindow* gdkWindow = gtk_widget_get_window(window_);
    int x = 0;
    int y = 0;
    if (gdkWindow) {
        gdk_window_get_origin(gdkWindow, &x, &y);
    } else {
        gtk_window_get_position(GTK_WINDOW(window_), &x, &y);
    }
    return PhysicalPosition<int32_t>(x * scale, y * scale);
}

PhysicalPosition<int32_t> GtkWindowImpl::outerPosition() {
    int scale = gtk_widget_get_scale_factor(window_);
    int x = 0;
    int y = 0;
    gtk_window_get_position(GTK_WINDOW(window_), &x, &y);
    return PhysicalPosition<int32_t>(x * scale, y * scale);
}

PhysicalSize<uint32_t> GtkWindowImpl::innerSize() {
    int scale = gtk_widget_get_scale_factor(window_);
    int width = 0;
    int height = 0;
    gtk_window_get_size(GTK_WINDOW(window_), &width, &height);
    return PhysicalSize<uint32_t>(static_cast<uint32_t>(width * scale), static_cast<uint32_t>(height * scale));
}

PhysicalSize<uint32_t> GtkWindowImpl::outerSize() {
    GdkWindow* gdkWindow = gtk_widget_get_window(window_);
    if (!gdkWindow) {
        return innerSize();
    }
    int scale = gtk_widget_get_scale_factor(window_);
    GdkRectangle frame;
    gdk_window_get_frame_extents(gdkWindow, &frame);
    return PhysicalSize<uint32_t>(static_cast<uint32_t>(frame.width * scale),
                                  static_cast<uint32_t>(frame.height * scale));
}

bool GtkWindowImpl::isFullscreen() {
    return fullscreen_;
}

bool GtkWindowImpl::isMaximized() {
    return gtk_window_is_maximized(GTK_WINDOW(window_));
}

bool GtkWindowImpl::isDecorated() {
    return gtk_window_get_decorated(GTK_WINDOW(window_));
}

bool GtkWindowImpl::isResizable() {
    return gtk_window_get_resizable(GTK_WINDOW(window_));
}

bool GtkWindowImpl::isVisible() {
    return gtk_widget_get_visible(window_);
}

std::optional<Monitor> GtkWindowImpl::currentMonitor() {
    GdkWindow* gdkWindow = gtk_widget_get_window(window_);
    GdkDisplay* display = gdk_display_get_default();
    if (!gdkWindow || !display) {
        return std::nullopt;
    }
    GdkMonitor* monitor = gdk_display_get_monitor_at_window(display, gdkWindow);
    if (!monitor) {
        return std::nullopt;
    }
    return monitorFromGdk(monitor);
}

std::optional<Monitor> GtkWindowImpl::primaryMonitor() {
    GdkDisplay* display = gdk_display_get_default();
    if (!display) {
        return std::nullopt;
    }
    GdkMonitor* monitor = gdk_display_get_primary_monitor(display);
    if (!monitor && gdk_display_get_n_monitors(display) > 0) {
        // Wayland has no primary monitor
        monitor = gdk_display_get_monitor(display, 0);
    }
    if (!monitor) {
        return std::nullopt;
    }
    return monitorFromGdk(monitor);
}

std::vector<Monitor> GtkWindowImpl::availableMonitors() {
    return gtkMonitors();
}

void GtkWindowImpl::setResizable(bool resizable) {
    gtk_window_set_resizable(GTK_WINDOW(window_), resizable);
}

void GtkWindowImpl::setTitle(const std::string& title) {
    gtk_window_set_title(GTK_WINDOW(window_), title.c_str());
}

void GtkWindowImpl::setMaximized(bool maximized) {
    if (maximized) {
        gtk_window_maximize(GTK_WINDOW(window_));
    } else {
        gtk_window_unmaximize(GTK_WINDOW(window_));
    }
}

void GtkWindowImpl::setMinimized(bool minimized) {
    if (minimized) {
        gtk_window_iconify(GTK_WINDOW(window_));
    } else {
        gtk_window_deiconify(GTK_WINDOW(window_));
    }
}

void GtkWindowImpl::setVisible(bool visible) {
    if (visible) {
        gtk_widget_show_all(window_);
    } else {
        gtk_widget_hide(window_);
    }
}

void GtkWindowImpl::setDecorations(bool decorations) {
    gtk_window_set_decorated(GTK_WINDOW(window_), decorations);
}

void GtkWindowImpl::setAlwaysOnTop(bool alwaysOnTop) {
    gtk_window_set_keep_above(GTK_WINDOW(window_), alwaysOnTop);
}

void GtkWindowImpl::setInnerSize(const Size& size) {
    LogicalSize<double> logical = size.toLogical(scaleFactor());
    gtk_window_resize(GTK_WINDOW(window_),
                      std::max(1, static_cast<int>(std::lround(logical.width))),
                      std::max(1, static_cast<int>(std::lround(logical.height))));
}

void GtkWindowImpl::setMinInnerSize(const std::optional<Size>& size) {
    if (size) {
        minSize_ = size->toLogical(scaleFactor());
    } else {
        minSize_.reset();
    }
    applyGeometryHints();
}

void GtkWindowImpl::setMaxInnerSize(const std::optional<Size>& size) {
    if (size) {
        maxSize_ = size->toLogical(scaleFactor());
    } else {
        maxSize_.reset();
    }
    applyGeometryHints();
}

void GtkWindowImpl::setOuterPosition(const Position& position) {
    LogicalPosition<double> logical = position.toLogical(scaleFactor());
    gtk_window_move(GTK_WINDOW(window_), static_cast<int>(std::lround(logical.x)),
                    static_cast<int>(std::lround(logical.y)));
}

void GtkWindowImpl::setFullscreen(bool fullscreen) {
    if (fullscreen) {
        gtk_window_fullscreen(GTK_WINDOW(window_));
    } else {
        gtk_window_unfullscreen(GTK_WINDOW(window_));
    }
}

void GtkWindowImpl::setFocus() {
    gtk_window_present(GTK_WINDOW(window_));
}

void GtkWindowImpl::setWindowIcon(const WindowIcon& icon) {
    if (icon.width == 0 || icon.height == 0 ||
        icon.rgba.size() != static_cast<size_t>(icon.width) * icon.height * 4) {
        throw Error(ErrorKind::INVALID_ICON, "icon buffer does not match its dimensions");
    }
    GBytes* bytes = g_bytes_new(icon.rgba.data(), icon.rgba.size());
    GdkPixbuf* pixbuf = gdk_pixbuf_new_from_bytes(bytes, GDK_COLORSPACE_RGB, TRUE, 8,
                                                  static_cast<int>(icon.width),
                                                  static_cast<int>(icon.height),
                                                  static_cast<int>(icon.width * 4));
    g_bytes_unref(bytes);
    gtk_window_set_icon(GTK_WINDOW(window_), pixbuf);
    g_object_unref(pixbuf);
}

void GtkWindowImpl::setSkipTaskbar(bool skip) {
    gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window_), skip);
}

void GtkWindowImpl::dragWindow() {
    GdkDisplay* display = gtk_widget_get_display(window_);
    GdkSeat* seat = display ? gdk_display_get_default_seat(display) : nullptr;
    GdkDevice* pointer = seat ? gdk_seat_get_pointer(seat) : nullptr;
    if (!pointer) {
        throw std::runtime_error("no pointer device");
    }

    GdkModifierType mask = static_cast<GdkModifierType>(0);
    gdk_window_get_device_position(gdk_get_default_root_window(), pointer, nullptr, nullptr, &mask);
    if (!(mask & GDK_BUTTON1_MASK)) {
        throw std::runtime_error("no pointer button is held");
    }

    int x = 0;
    int y = 0;
    gdk_device_get_position(pointer, nullptr, &x, &y);
    gtk_window_begin_move_drag(GTK_WINDOW(window_), 1, x, y, GDK_CURRENT_TIME);
}

// Signal handlers

gboolean GtkWindowImpl::onDeleteEvent(GtkWidget* widget, GdkEvent* event, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    window->state_->push(Event::window(window->id_, NativeWindowEvent::of(NativeWindowEventType::CLOSE_REQUESTED)));
    // the runtime decides whether and when the window goes away
    return TRUE;
}

gboolean GtkWindowImpl::onConfigureEvent(GtkWidget* widget, GdkEventConfigure* event, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    int scale = gtk_widget_get_scale_factor(widget);

    int width = 0;
    int height = 0;
    gtk_window_get_size(GTK_WINDOW(widget), &width, &height);
    if (width != window->lastWidth_ || height != window->lastHeight_) {
        window->lastWidth_ = width;
        window->lastHeight_ = height;
        window->state_->push(Event::window(window->id_, NativeWindowEvent::resized(
            static_cast<uint32_t>(width * scale), static_cast<uint32_t>(height * scale))));
    }

    if (event->x != window->lastX_ || event->y != window->lastY_) {
        window->lastX_ = event->x;
        window->lastY_ = event->y;
        window->state_->push(Event::window(window->id_, NativeWindowEvent::moved(event->x * scale, event->y * scale)));
    }
    return FALSE;
}

gboolean GtkWindowImpl::onFocusIn(GtkWidget* widget, GdkEventFocus* event, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    window->state_->push(Event::window(window->id_, NativeWindowEvent::focusChanged(true)));
    return FALSE;
}

gboolean GtkWindowImpl::onFocusOut(GtkWidget* widget, GdkEventFocus* event, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    window->state_->push(Event::window(window->id_, NativeWindowEvent::focusChanged(false)));
    return FALSE;
}

gboolean GtkWindowImpl::onWindowStateEvent(GtkWidget* widget, GdkEventWindowState* event, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    window->fullscreen_ = (event->new_window_state & GDK_WINDOW_STATE_FULLSCREEN) != 0;
    window->state_->push(Event::window(window->id_, NativeWindowEvent::of(NativeWindowEventType::STATE_CHANGED)));
    return FALSE;
}

void GtkWindowImpl::onScaleFactorChanged(GObject* object, GParamSpec* pspec, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    int scale = gtk_widget_get_scale_factor(window->window_);
    int width = 0;
    int height = 0;
    gtk_window_get_size(GTK_WINDOW(window->window_), &width, &height);
    window->state_->push(Event::window(window->id_, NativeWindowEvent::scaleFactorChanged(
        scale, static_cast<uint32_t>(width * scale), static_cast<uint32_t>(height * scale))));
}

void GtkWindowImpl::onDestroy(GtkWidget* widget, gpointer userData) {
    GtkWindowImpl* window = static_cast<GtkWindowImpl*>(userData);
    printf("DEBUG: Window destroyed, window ID: %u\n", window->id_);
    window->state_->push(Event::window(window->id_, NativeWindowEvent::of(NativeWindowEventType::DESTROYED)));
}

} // namespace webshell
