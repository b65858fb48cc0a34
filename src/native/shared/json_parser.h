// json_parser.h - Lightweight JSON value extraction
// Used for menu descriptions and the application config file.
// Keys are matched only at the top level of the object being scanned, so a nested
// object with the same key name never shadows a missing key of its parent.
//
// This is a header-only implementation to avoid build complexity.
// For complex JSON needs, use a proper JSON library instead.

#ifndef WEBSHELL_JSON_PARSER_H
#define WEBSHELL_JSON_PARSER_H

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace webshell {

// Skip a string literal starting at the opening quote
// Returns the position just past the closing quote
inline size_t skipJsonString(const std::string& json, size_t pos, size_t endPos) {
    pos++;
    while (pos < endPos) {
        if (json[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (json[pos] == '"') {
            return pos + 1;
        }
        pos++;
    }
    return endPos;
}

inline size_t skipJsonWhitespace(const std::string& json, size_t pos, size_t endPos) {
    while (pos < endPos && (json[pos] == ' ' || json[pos] == '\t' ||
                            json[pos] == '\n' || json[pos] == '\r')) {
        pos++;
    }
    return pos;
}

// Find the end of a JSON object starting at the given position
// Returns the position of the closing brace
inline size_t findObjectEnd(const std::string& json, size_t startPos) {
    if (startPos >= json.length() || json[startPos] != '{') {
        return std::string::npos;
    }

    int braceCount = 1;
    size_t pos = startPos + 1;

    while (pos < json.length() && braceCount > 0) {
        if (json[pos] == '"') {
            pos = skipJsonString(json, pos, json.length());
            continue;
        }
        if (json[pos] == '{') braceCount++;
        else if (json[pos] == '}') braceCount--;
        pos++;
    }

    return braceCount == 0 ? pos - 1 : std::string::npos;
}

// Find the end of a JSON array starting at the given position
inline size_t findArrayEnd(const std::string& json, size_t startPos) {
    if (startPos >= json.length() || json[startPos] != '[') {
        return std::string::npos;
    }

    int bracketCount = 1;
    size_t pos = startPos + 1;

    while (pos < json.length() && bracketCount > 0) {
        if (json[pos] == '"') {
            pos = skipJsonString(json, pos, json.length());
            continue;
        }
        if (json[pos] == '[') bracketCount++;
        else if (json[pos] == ']') bracketCount--;
        pos++;
    }

    return bracketCount == 0 ? pos - 1 : std::string::npos;
}

// Locate the value of "key" directly inside the object spanning [startPos, endPos]
// startPos is the opening brace. Returns the position of the first value character.
inline size_t findJsonValue(const std::string& json,
                            const std::string& key,
                            size_t startPos,
                            size_t endPos) {
    if (endPos > json.length()) endPos = json.length();
    int depth = 0;
    size_t pos = startPos;

    while (pos < endPos) {
        char c = json[pos];
        if (c == '{' || c == '[') {
            depth++;
            pos++;
        } else if (c == '}' || c == ']') {
            depth--;
            pos++;
        } else if (c == '"') {
            size_t stringEnd = skipJsonString(json, pos, endPos);
            if (depth == 1) {
                std::string name = json.substr(pos + 1, stringEnd - pos - 2);
                size_t colon = skipJsonWhitespace(json, stringEnd, endPos);
                if (colon < endPos && json[colon] == ':') {
                    if (name == key) {
                        return skipJsonWhitespace(json, colon + 1, endPos);
                    }
                }
            }
            pos = stringEnd;
        } else {
            pos++;
        }
    }

    return std::string::npos;
}

inline std::string unescapeJson(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            char next = value[++i];
            switch (next) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                default: result += next; break;
            }
        } else {
            result += value[i];
        }
    }
    return result;
}

inline std::string escapeJson(const std::string& value) {
    std::string result;
    result.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default: result += c; break;
        }
    }
    return result;
}

inline bool hasJsonKey(const std::string& json,
                       const std::string& key,
                       size_t startPos,
                       size_t endPos) {
    return findJsonValue(json, key, startPos, endPos) != std::string::npos;
}

// Simple JSON string value extractor
// Finds "key": "value" patterns and extracts the value
inline std::string extractJsonStringValue(const std::string& json,
                                          const std::string& key,
                                          size_t startPos,
                                          size_t endPos,
                                          const std::string& defaultValue = "") {
    size_t valueStart = findJsonValue(json, key, startPos, endPos);
    if (valueStart == std::string::npos || valueStart >= endPos) {
        return defaultValue;
    }

    if (json[valueStart] == '"') {
        size_t valueEnd = skipJsonString(json, valueStart, endPos);
        if (valueEnd <= endPos && valueEnd > valueStart + 1) {
            return unescapeJson(json.substr(valueStart + 1, valueEnd - valueStart - 2));
        }
    }

    return defaultValue;
}

// Simple JSON boolean value extractor
inline bool extractJsonBoolValue(const std::string& json,
                                 const std::string& key,
                                 size_t startPos,
                                 size_t endPos,
                                 bool defaultValue = false) {
    size_t valueStart = findJsonValue(json, key, startPos, endPos);
    if (valueStart == std::string::npos || valueStart >= endPos) {
        return defaultValue;
    }

    if (json.compare(valueStart, 4, "true") == 0) {
        return true;
    } else if (json.compare(valueStart, 5, "false") == 0) {
        return false;
    }

    return defaultValue;
}

inline std::optional<double> extractJsonNumberValue(const std::string& json,
                                                    const std::string& key,
                                                    size_t startPos,
                                                    size_t endPos) {
    size_t valueStart = findJsonValue(json, key, startPos, endPos);
    if (valueStart == std::string::npos || valueStart >= endPos) {
        return std::nullopt;
    }

    const char* begin = json.c_str() + valueStart;
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return std::nullopt;
    }
    return value;
}

// Raw JSON text of the value of "key": an object, array, string literal (quotes kept) or scalar
inline std::optional<std::string> extractJsonRawValue(const std::string& json,
                                                      const std::string& key,
                                                      size_t startPos,
                                                      size_t endPos) {
    size_t valueStart = findJsonValue(json, key, startPos, endPos);
    if (valueStart == std::string::npos || valueStart >= endPos) {
        return std::nullopt;
    }

    size_t valueEnd = std::string::npos;
    char c = json[valueStart];
    if (c == '{') {
        valueEnd = findObjectEnd(json, valueStart);
        if (valueEnd != std::string::npos) valueEnd++;
    } else if (c == '[') {
        valueEnd = findArrayEnd(json, valueStart);
        if (valueEnd != std::string::npos) valueEnd++;
    } else if (c == '"') {
        valueEnd = skipJsonString(json, valueStart, endPos);
    } else {
        valueEnd = valueStart;
        while (valueEnd < endPos && json[valueEnd] != ',' && json[valueEnd] != '}' &&
               json[valueEnd] != ']' && json[valueEnd] != ' ' && json[valueEnd] != '\n' &&
               json[valueEnd] != '\r' && json[valueEnd] != '\t') {
            valueEnd++;
        }
    }

    if (valueEnd == std::string::npos || valueEnd > endPos + 1 || valueEnd <= valueStart) {
        return std::nullopt;
    }
    return json.substr(valueStart, valueEnd - valueStart);
}

// Boundaries [start, end] of every object inside the array value of "key"
inline std::vector<std::pair<size_t, size_t>> findJsonObjectsInArray(const std::string& json,
                                                                    size_t arrayStart) {
    std::vector<std::pair<size_t, size_t>> objects;
    size_t arrayEnd = findArrayEnd(json, arrayStart);
    if (arrayEnd == std::string::npos) {
        return objects;
    }

    size_t pos = arrayStart + 1;
    while (pos < arrayEnd) {
        pos = skipJsonWhitespace(json, pos, arrayEnd);
        if (pos >= arrayEnd) break;
        if (json[pos] == '{') {
            size_t objEnd = findObjectEnd(json, pos);
            if (objEnd == std::string::npos || objEnd > arrayEnd) break;
            objects.emplace_back(pos, objEnd);
            pos = objEnd + 1;
        } else {
            pos++;
        }
    }
    return objects;
}

inline std::vector<std::pair<size_t, size_t>> extractJsonObjectArray(const std::string& json,
                                                                    const std::string& key,
                                                                    size_t startPos,
                                                                    size_t endPos) {
    size_t valueStart = findJsonValue(json, key, startPos, endPos);
    if (valueStart == std::string::npos || valueStart >= endPos || json[valueStart] != '[') {
        return {};
    }
    return findJsonObjectsInArray(json, valueStart);
}

} // namespace webshell

#endif // WEBSHELL_JSON_PARSER_H
