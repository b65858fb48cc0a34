// accelerator_parser.h - Menu accelerator strings
// Turns strings like "CommandOrControl+Shift+T" into an Accelerator: a modifier set and a
// canonical key name that backends map onto their own key codes.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_ACCELERATOR_PARSER_H
#define WEBSHELL_ACCELERATOR_PARSER_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace webshell {

enum class Modifier : uint8_t {
    NONE = 0,
    CONTROL = 1 << 0,
    ALT = 1 << 1,
    SHIFT = 1 << 2,
    SUPER = 1 << 3,
};

inline Modifier operator|(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline Modifier operator&(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline Modifier& operator|=(Modifier& a, Modifier b) {
    a = a | b;
    return a;
}

struct Accelerator {
    Modifier modifiers = Modifier::NONE;
    std::string key;  // canonical lowercase name: "t", "f11", "enter", "plus"

    bool has(Modifier modifier) const { return (modifiers & modifier) != Modifier::NONE; }
    bool isBareKey() const { return modifiers == Modifier::NONE; }

    // Canonical spelling, e.g. "Ctrl+Shift+T"
    std::string toString() const {
        std::string text;
        if (has(Modifier::CONTROL)) text += "Ctrl+";
        if (has(Modifier::ALT)) text += "Alt+";
        if (has(Modifier::SHIFT)) text += "Shift+";
        if (has(Modifier::SUPER)) text += "Super+";
        if (key.size() == 1 || (key.size() > 1 && key[0] == 'f' && std::isdigit(static_cast<unsigned char>(key[1])))) {
            std::string upper = key;
            upper[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(upper[0])));
            return text + upper;
        }
        return text + key;
    }

    bool operator==(const Accelerator& other) const { return modifiers == other.modifiers && key == other.key; }
    bool operator!=(const Accelerator& other) const { return !(*this == other); }
};

inline std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::optional<Modifier> modifierFromName(const std::string& name) {
    static const std::map<std::string, Modifier> names = {
        // CommandOrControl resolves to Control outside macOS
        {"commandorcontrol", Modifier::CONTROL}, {"cmdorctrl", Modifier::CONTROL},
        {"control", Modifier::CONTROL}, {"ctrl", Modifier::CONTROL},
        {"command", Modifier::SUPER}, {"cmd", Modifier::SUPER},
        {"super", Modifier::SUPER}, {"meta", Modifier::SUPER}, {"win", Modifier::SUPER},
        {"alt", Modifier::ALT}, {"option", Modifier::ALT},
        {"shift", Modifier::SHIFT},
    };
    auto it = names.find(toLowerAscii(name));
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

inline std::string canonicalKeyName(const std::string& key) {
    static const std::map<std::string, std::string> aliases = {
        {"+", "plus"}, {"return", "enter"}, {"esc", "escape"}, {"del", "delete"},
        {"ins", "insert"}, {"pgup", "pageup"}, {"pgdn", "pagedown"},
    };
    std::string lower = toLowerAscii(key);
    auto it = aliases.find(lower);
    return it == aliases.end() ? lower : it->second;
}

// Modifier names are case-insensitive and may repeat; a trailing '+' names the plus key.
// Returns nullopt for an empty string, a missing key or an unknown modifier.
inline std::optional<Accelerator> parseAccelerator(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> tokens;
    size_t start = 0;
    size_t plus;
    while ((plus = text.find('+', start)) != std::string::npos) {
        if (plus == text.size() - 1 && plus == start) {
            break;
        }
        tokens.push_back(text.substr(start, plus - start));
        start = plus + 1;
    }
    tokens.push_back(text.substr(start));

    Accelerator accelerator;
    accelerator.key = canonicalKeyName(tokens.back());
    tokens.pop_back();
    if (accelerator.key.empty()) {
        return std::nullopt;
    }

    for (const auto& token : tokens) {
        std::optional<Modifier> modifier = modifierFromName(token);
        if (!modifier) {
            return std::nullopt;
        }
        accelerator.modifiers |= *modifier;
    }
    return accelerator;
}

} // namespace webshell

#endif // WEBSHELL_ACCELERATOR_PARSER_H
