// menu.h - Menubar and system tray menu descriptions
// Menus are built in code or parsed from a JSON array of items:
//   [{"label": "File", "submenu": [{"label": "Quit", "action": "quit", "accelerator": "CmdOrCtrl+Q"}]}]
// "id" is accepted in place of "action".
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_MENU_H
#define WEBSHELL_MENU_H

#include <optional>
#include <string>
#include <vector>

#include "accelerator_parser.h"
#include "json_parser.h"

namespace webshell {

enum class MenuItemType { NORMAL, SEPARATOR, CHECKBOX, SUBMENU };

struct MenuItem {
    MenuItemType type = MenuItemType::NORMAL;
    std::string id;          // reported back in MenuEvent / SystemTrayEvent
    std::string label;
    std::string accelerator;
    std::string tooltip;
    bool enabled = true;
    bool checked = false;
    bool hidden = false;
    std::vector<MenuItem> submenu;

    // Parsed accelerator; nullopt when there is none or it does not parse
    std::optional<Accelerator> shortcut() const { return parseAccelerator(accelerator); }

    static MenuItem item(const std::string& id, const std::string& label,
                         const std::string& accelerator = "") {
        MenuItem menuItem;
        menuItem.id = id;
        menuItem.label = label;
        menuItem.accelerator = accelerator;
        return menuItem;
    }

    static MenuItem checkbox(const std::string& id, const std::string& label, bool checked) {
        MenuItem menuItem = item(id, label);
        menuItem.type = MenuItemType::CHECKBOX;
        menuItem.checked = checked;
        return menuItem;
    }

    static MenuItem separator() {
        MenuItem menuItem;
        menuItem.type = MenuItemType::SEPARATOR;
        return menuItem;
    }

    static MenuItem submenuOf(const std::string& label, std::vector<MenuItem> items) {
        MenuItem menuItem;
        menuItem.type = MenuItemType::SUBMENU;
        menuItem.label = label;
        menuItem.submenu = std::move(items);
        return menuItem;
    }
};

inline std::vector<MenuItem> parseMenuItemArray(const std::string& json, size_t arrayStart);

// Parse a single menu item from JSON object boundaries
inline MenuItem parseMenuItem(const std::string& json, size_t startPos, size_t endPos) {
    MenuItem item;

    item.label = extractJsonStringValue(json, "label", startPos, endPos);
    item.id = extractJsonStringValue(json, "action", startPos, endPos);
    if (item.id.empty()) {
        item.id = extractJsonStringValue(json, "id", startPos, endPos);
    }
    item.tooltip = extractJsonStringValue(json, "tooltip", startPos, endPos);
    item.accelerator = extractJsonStringValue(json, "accelerator", startPos, endPos);
    item.enabled = extractJsonBoolValue(json, "enabled", startPos, endPos, true);
    item.checked = extractJsonBoolValue(json, "checked", startPos, endPos, false);
    item.hidden = extractJsonBoolValue(json, "hidden", startPos, endPos, false);

    size_t submenuStart = findJsonValue(json, "submenu", startPos, endPos);
    if (submenuStart != std::string::npos && submenuStart < endPos && json[submenuStart] == '[') {
        item.submenu = parseMenuItemArray(json, submenuStart);
    }

    std::string type = extractJsonStringValue(json, "type", startPos, endPos);
    if (type == "separator" || type == "divider") {
        item.type = MenuItemType::SEPARATOR;
    } else if (type == "checkbox") {
        item.type = MenuItemType::CHECKBOX;
    } else if (type == "submenu") {
        item.type = MenuItemType::SUBMENU;
    } else if (type == "normal") {
        item.type = MenuItemType::NORMAL;
    } else if (item.label == "-" || item.label.empty()) {
        // Set default type based on content
        item.type = MenuItemType::SEPARATOR;
    } else if (!item.submenu.empty()) {
        item.type = MenuItemType::SUBMENU;
    } else {
        item.type = MenuItemType::NORMAL;
    }

    return item;
}

inline std::vector<MenuItem> parseMenuItemArray(const std::string& json, size_t arrayStart) {
    std::vector<MenuItem> items;
    for (const auto& bounds : findJsonObjectsInArray(json, arrayStart)) {
        items.push_back(parseMenuItem(json, bounds.first, bounds.second));
    }
    return items;
}

// Parse a JSON array of menu items, or a single item object
inline std::vector<MenuItem> parseMenuJson(const std::string& jsonStr) {
    std::vector<MenuItem> items;

    size_t start = skipJsonWhitespace(jsonStr, 0, jsonStr.length());
    if (start >= jsonStr.length()) return items;

    if (jsonStr[start] == '[') {
        return parseMenuItemArray(jsonStr, start);
    }

    if (jsonStr[start] == '{') {
        size_t objEnd = findObjectEnd(jsonStr, start);
        if (objEnd != std::string::npos) {
            items.push_back(parseMenuItem(jsonStr, start, objEnd));
        }
    }
    return items;
}

// Depth-first search for an item by id
inline const MenuItem* findMenuItem(const std::vector<MenuItem>& items, const std::string& id) {
    for (const auto& item : items) {
        if (!item.id.empty() && item.id == id) {
            return &item;
        }
        const MenuItem* found = findMenuItem(item.submenu, id);
        if (found) {
            return found;
        }
    }
    return nullptr;
}

} // namespace webshell

#endif // WEBSHELL_MENU_H
