// window_event.h - Window and menu events
// NativeWindowEvent is the toolkit's vocabulary; WindowEvent is the subset delivered to listeners.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_WINDOW_EVENT_H
#define WEBSHELL_WINDOW_EVENT_H

#include <cstdint>
#include <optional>
#include <string>

#include "geometry.h"

namespace webshell {

// Assigned by the toolkit when the native window is created, never reused while it lives
typedef uint32_t WindowId;

enum class WindowEventType {
    RESIZED,
    MOVED,
    CLOSE_REQUESTED,
    DESTROYED,
    FOCUSED,
    SCALE_FACTOR_CHANGED
};

inline const char* windowEventTypeToString(WindowEventType type) {
    switch (type) {
        case WindowEventType::RESIZED:              return "resized";
        case WindowEventType::MOVED:                return "moved";
        case WindowEventType::CLOSE_REQUESTED:      return "close-requested";
        case WindowEventType::DESTROYED:            return "destroyed";
        case WindowEventType::FOCUSED:              return "focused";
        case WindowEventType::SCALE_FACTOR_CHANGED: return "scale-factor-changed";
        default: return "unknown";
    }
}

struct WindowEvent {
    WindowEventType type = WindowEventType::CLOSE_REQUESTED;
    PhysicalSize<uint32_t> size;          // RESIZED, and the new inner size for SCALE_FACTOR_CHANGED
    PhysicalPosition<int32_t> position;   // MOVED
    bool focused = false;                 // FOCUSED
    double scaleFactor = 1.0;             // SCALE_FACTOR_CHANGED
};

enum class NativeWindowEventType {
    RESIZED,
    MOVED,
    CLOSE_REQUESTED,
    DESTROYED,
    FOCUSED,
    SCALE_FACTOR_CHANGED,
    // Reported by toolkits but not part of the public vocabulary
    STATE_CHANGED,
    CURSOR_MOVED,
    CURSOR_ENTERED,
    CURSOR_LEFT,
    KEYBOARD_INPUT,
    THEME_CHANGED
};

struct NativeWindowEvent {
    NativeWindowEventType type = NativeWindowEventType::CLOSE_REQUESTED;
    PhysicalSize<uint32_t> size;
    PhysicalPosition<int32_t> position;
    bool focused = false;
    double scaleFactor = 1.0;

    static NativeWindowEvent resized(uint32_t width, uint32_t height) {
        NativeWindowEvent event;
        event.type = NativeWindowEventType::RESIZED;
        event.size = PhysicalSize<uint32_t>(width, height);
        return event;
    }

    static NativeWindowEvent moved(int32_t x, int32_t y) {
        NativeWindowEvent event;
        event.type = NativeWindowEventType::MOVED;
        event.position = PhysicalPosition<int32_t>(x, y);
        return event;
    }

    static NativeWindowEvent focusChanged(bool focused) {
        NativeWindowEvent event;
        event.type = NativeWindowEventType::FOCUSED;
        event.focused = focused;
        return event;
    }

    static NativeWindowEvent scaleFactorChanged(double scaleFactor, uint32_t width, uint32_t height) {
        NativeWindowEvent event;
        event.type = NativeWindowEventType::SCALE_FACTOR_CHANGED;
        event.scaleFactor = scaleFactor;
        event.size = PhysicalSize<uint32_t>(width, height);
        return event;
    }

    static NativeWindowEvent of(NativeWindowEventType type) {
        NativeWindowEvent event;
        event.type = type;
        return event;
    }
};

// Returns nullopt for native events outside the public vocabulary
inline std::optional<WindowEvent> translateWindowEvent(const NativeWindowEvent& native) {
    WindowEvent event;
    switch (native.type) {
        case NativeWindowEventType::RESIZED:
            event.type = WindowEventType::RESIZED;
            event.size = native.size;
            break;
        case NativeWindowEventType::MOVED:
            event.type = WindowEventType::MOVED;
            event.position = native.position;
            break;
        case NativeWindowEventType::CLOSE_REQUESTED:
            event.type = WindowEventType::CLOSE_REQUESTED;
            break;
        case NativeWindowEventType::DESTROYED:
            event.type = WindowEventType::DESTROYED;
            break;
        case NativeWindowEventType::FOCUSED:
            event.type = WindowEventType::FOCUSED;
            event.focused = native.focused;
            break;
        case NativeWindowEventType::SCALE_FACTOR_CHANGED:
            event.type = WindowEventType::SCALE_FACTOR_CHANGED;
            event.scaleFactor = native.scaleFactor;
            event.size = native.size;
            break;
        default:
            return std::nullopt;
    }
    return event;
}

// Selection of an item in a window menubar
struct MenuEvent {
    std::string menuItemId;
};

// Selection of an item in the system tray menu
struct SystemTrayEvent {
    std::string menuItemId;
};

} // namespace webshell

#endif // WEBSHELL_WINDOW_EVENT_H
