// window.h - Declarative window description
// WindowAttributes is consumed once by the toolkit when the native window is built.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_WINDOW_H
#define WEBSHELL_WINDOW_H

#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "geometry.h"
#include "menu.h"

namespace webshell {

// Default inner size used when none is given
const double DEFAULT_WINDOW_WIDTH = 800;
const double DEFAULT_WINDOW_HEIGHT = 600;

struct WindowAttributes {
    std::string title = "webshell";
    std::optional<Size> innerSize;       // unset: DEFAULT_WINDOW_WIDTH x DEFAULT_WINDOW_HEIGHT
    std::optional<Size> minInnerSize;
    std::optional<Size> maxInnerSize;
    std::optional<Position> position;    // unset: placed by the window manager
    bool resizable = true;
    bool fullscreen = false;
    bool focus = false;
    bool maximized = false;
    bool visible = true;
    bool transparent = false;
    bool decorations = true;
    bool alwaysOnTop = false;
    bool skipTaskbar = false;
    std::optional<Icon> icon;
    std::vector<MenuItem> menu;
};

class WindowBuilder {
public:
    WindowBuilder() = default;

    WindowBuilder& title(const std::string& title) { attributes_.title = title; return *this; }
    WindowBuilder& innerSize(double width, double height) {
        attributes_.innerSize = Size::logical(width, height);
        return *this;
    }
    WindowBuilder& minInnerSize(double width, double height) {
        attributes_.minInnerSize = Size::logical(width, height);
        return *this;
    }
    WindowBuilder& maxInnerSize(double width, double height) {
        attributes_.maxInnerSize = Size::logical(width, height);
        return *this;
    }
    WindowBuilder& position(double x, double y) {
        attributes_.position = Position::logical(x, y);
        return *this;
    }
    WindowBuilder& resizable(bool resizable) { attributes_.resizable = resizable; return *this; }
    WindowBuilder& fullscreen(bool fullscreen) { attributes_.fullscreen = fullscreen; return *this; }
    WindowBuilder& focus() { attributes_.focus = true; return *this; }
    WindowBuilder& maximized(bool maximized) { attributes_.maximized = maximized; return *this; }
    WindowBuilder& visible(bool visible) { attributes_.visible = visible; return *this; }
    WindowBuilder& transparent(bool transparent) { attributes_.transparent = transparent; return *this; }
    WindowBuilder& decorations(bool decorations) { attributes_.decorations = decorations; return *this; }
    WindowBuilder& alwaysOnTop(bool alwaysOnTop) { attributes_.alwaysOnTop = alwaysOnTop; return *this; }
    WindowBuilder& skipTaskbar(bool skip) { attributes_.skipTaskbar = skip; return *this; }
    WindowBuilder& icon(const Icon& icon) { attributes_.icon = icon; return *this; }
    WindowBuilder& menu(std::vector<MenuItem> items) { attributes_.menu = std::move(items); return *this; }

    bool hasIcon() const { return attributes_.icon.has_value(); }
    bool hasMenu() const { return !attributes_.menu.empty(); }

    // Min and max sizes apply only when both dimensions are configured,
    // the position only when both coordinates are
    static WindowBuilder withConfig(const WindowConfig& config) {
        WindowBuilder builder;
        builder.title(config.title)
            .innerSize(config.width, config.height)
            .visible(config.visible)
            .resizable(config.resizable)
            .decorations(config.decorations)
            .maximized(config.maximized)
            .fullscreen(config.fullscreen)
            .transparent(config.transparent)
            .alwaysOnTop(config.alwaysOnTop)
            .skipTaskbar(config.skipTaskbar);

        if (config.minWidth && config.minHeight) {
            builder.minInnerSize(*config.minWidth, *config.minHeight);
        }
        if (config.maxWidth && config.maxHeight) {
            builder.maxInnerSize(*config.maxWidth, *config.maxHeight);
        }
        if (config.x && config.y) {
            builder.position(*config.x, *config.y);
        }
        if (config.focus) {
            builder.focus();
        }
        if (!config.menu.empty()) {
            builder.menu(config.menu);
        }
        return builder;
    }

    const WindowAttributes& attributes() const { return attributes_; }

private:
    WindowAttributes attributes_;
};

} // namespace webshell

#endif // WEBSHELL_WINDOW_H
