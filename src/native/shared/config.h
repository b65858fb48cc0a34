// config.h - Application and window configuration
// Parsed from the application config file:
//   {"identifier": "dev.webshell.hello", "channel": "dev", "productName": "Hello",
//    "windows": [{"label": "main", "title": "Hello", "width": 1024, "height": 768}]}
// Unknown keys are ignored; missing keys keep their defaults.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_CONFIG_H
#define WEBSHELL_CONFIG_H

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "app_paths.h"
#include "error.h"
#include "json_parser.h"
#include "menu.h"

namespace webshell {

struct WindowConfig {
    std::string label = "main";
    std::string url = "index.html";
    std::string title;
    double width = 800;
    double height = 600;
    std::optional<double> minWidth;
    std::optional<double> minHeight;
    std::optional<double> maxWidth;
    std::optional<double> maxHeight;
    std::optional<double> x;
    std::optional<double> y;
    bool resizable = true;
    bool fullscreen = false;
    bool focus = true;
    bool maximized = false;
    bool visible = true;
    bool transparent = false;
    bool decorations = true;
    bool alwaysOnTop = false;
    bool skipTaskbar = false;
    bool fileDropEnabled = true;
    std::vector<MenuItem> menu;

    // Parse the object spanning [startPos, endPos] of json
    static WindowConfig fromJson(const std::string& json, size_t startPos, size_t endPos) {
        WindowConfig config;
        config.label = extractJsonStringValue(json, "label", startPos, endPos, config.label);
        config.url = extractJsonStringValue(json, "url", startPos, endPos, config.url);
        config.title = extractJsonStringValue(json, "title", startPos, endPos);
        config.width = extractJsonNumberValue(json, "width", startPos, endPos).value_or(config.width);
        config.height = extractJsonNumberValue(json, "height", startPos, endPos).value_or(config.height);
        config.minWidth = extractJsonNumberValue(json, "minWidth", startPos, endPos);
        config.minHeight = extractJsonNumberValue(json, "minHeight", startPos, endPos);
        config.maxWidth = extractJsonNumberValue(json, "maxWidth", startPos, endPos);
        config.maxHeight = extractJsonNumberValue(json, "maxHeight", startPos, endPos);
        config.x = extractJsonNumberValue(json, "x", startPos, endPos);
        config.y = extractJsonNumberValue(json, "y", startPos, endPos);
        config.resizable = extractJsonBoolValue(json, "resizable", startPos, endPos, config.resizable);
        config.fullscreen = extractJsonBoolValue(json, "fullscreen", startPos, endPos, config.fullscreen);
        config.focus = extractJsonBoolValue(json, "focus", startPos, endPos, config.focus);
        config.maximized = extractJsonBoolValue(json, "maximized", startPos, endPos, config.maximized);
        config.visible = extractJsonBoolValue(json, "visible", startPos, endPos, config.visible);
        config.transparent = extractJsonBoolValue(json, "transparent", startPos, endPos, config.transparent);
        config.decorations = extractJsonBoolValue(json, "decorations", startPos, endPos, config.decorations);
        config.alwaysOnTop = extractJsonBoolValue(json, "alwaysOnTop", startPos, endPos, config.alwaysOnTop);
        config.skipTaskbar = extractJsonBoolValue(json, "skipTaskbar", startPos, endPos, config.skipTaskbar);
        config.fileDropEnabled = extractJsonBoolValue(json, "fileDropEnabled", startPos, endPos,
                                                      config.fileDropEnabled);

        size_t menuStart = findJsonValue(json, "menu", startPos, endPos);
        if (menuStart != std::string::npos && menuStart < endPos && json[menuStart] == '[') {
            config.menu = parseMenuItemArray(json, menuStart);
        }
        return config;
    }
};

struct AppConfig {
    std::string identifier;
    std::string channel;
    std::string productName;
    std::vector<WindowConfig> windows;

    static AppConfig fromJson(const std::string& json) {
        size_t start = skipJsonWhitespace(json, 0, json.length());
        if (start >= json.length() || json[start] != '{') {
            throw Error(ErrorKind::INVALID_CONFIG, "expected a JSON object");
        }
        size_t end = findObjectEnd(json, start);
        if (end == std::string::npos) {
            throw Error(ErrorKind::INVALID_CONFIG, "unterminated JSON object");
        }

        AppConfig config;
        config.identifier = extractJsonStringValue(json, "identifier", start, end);
        config.channel = extractJsonStringValue(json, "channel", start, end);
        config.productName = extractJsonStringValue(json, "productName", start, end);
        for (const auto& bounds : extractJsonObjectArray(json, "windows", start, end)) {
            config.windows.push_back(WindowConfig::fromJson(json, bounds.first, bounds.second));
        }
        return config;
    }

    static AppConfig loadFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw Error(ErrorKind::INVALID_CONFIG, "cannot read " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return fromJson(buffer.str());
    }

    // base/<identifier>/<channel>/WebKit
    std::string dataDirectory(const std::string& basePath) const {
        return buildAppDataPath(basePath, identifier, channel, "WebKit");
    }

    const WindowConfig* findWindow(const std::string& label) const {
        for (const auto& window : windows) {
            if (window.label == label) {
                return &window;
            }
        }
        return nullptr;
    }
};

} // namespace webshell

#endif // WEBSHELL_CONFIG_H
