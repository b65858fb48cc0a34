// mime_types.h - MIME type detection for custom protocol responses
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_MIME_TYPES_H
#define WEBSHELL_MIME_TYPES_H

#include <map>
#include <string>

#include "accelerator_parser.h"

namespace webshell {

// Lowercased extension of the last path segment, without the dot
// Query strings and fragments are ignored
inline std::string extensionOf(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return toLowerAscii(path.substr(dot + 1));
}

// Returns "application/octet-stream" for unknown types
inline std::string getMimeTypeFromUrl(const std::string& url) {
    static const std::map<std::string, std::string> mimeTypes = {
        // Web/Code Files
        {"html", "text/html"}, {"htm", "text/html"},
        {"js", "text/javascript"}, {"mjs", "text/javascript"}, {"cjs", "text/javascript"},
        {"ts", "text/typescript"}, {"mts", "text/typescript"}, {"cts", "text/typescript"},
        {"jsx", "text/jsx"}, {"tsx", "text/tsx"},
        {"css", "text/css"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"md", "text/markdown"},
        {"txt", "text/plain"},
        {"toml", "application/toml"},
        {"yaml", "application/x-yaml"}, {"yml", "application/x-yaml"},

        // Image Files
        {"png", "image/png"},
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"ico", "image/x-icon"},
        {"avif", "image/avif"},

        // Font Files
        {"woff", "font/woff"}, {"woff2", "font/woff2"},
        {"ttf", "font/ttf"}, {"otf", "font/otf"},

        // Media Files
        {"mp3", "audio/mpeg"}, {"mp4", "video/mp4"}, {"webm", "video/webm"},
        {"ogg", "audio/ogg"}, {"wav", "audio/wav"},

        {"pdf", "application/pdf"},
        {"wasm", "application/wasm"},
        {"zip", "application/zip"}, {"gz", "application/gzip"},
    };

    auto it = mimeTypes.find(extensionOf(url));
    if (it != mimeTypes.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

} // namespace webshell

#endif // WEBSHELL_MIME_TYPES_H
