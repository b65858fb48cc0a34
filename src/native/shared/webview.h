// webview.h - Webview attributes and the values exchanged with web content
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_WEBVIEW_H
#define WEBSHELL_WEBVIEW_H

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "json_parser.h"

namespace webshell {

// Call from web content: {"method": "...", "params": ...}
struct RpcRequest {
    std::string command;
    std::optional<std::string> params;  // raw JSON text
};

// Immediate answer to an RPC call, evaluated in the calling page
struct RpcResponse {
    std::optional<std::string> id;
    std::optional<std::string> result;  // raw JSON text
    std::optional<std::string> error;   // raw JSON text
};

// Parses a message posted by web content. Returns nullopt unless it is an object with a string "method".
// The request id, when present, is returned through id as raw JSON text.
inline std::optional<RpcRequest> parseRpcRequest(const std::string& message,
                                                 std::optional<std::string>* id = nullptr) {
    size_t start = skipJsonWhitespace(message, 0, message.length());
    size_t end = findObjectEnd(message, start);
    if (end == std::string::npos) {
        return std::nullopt;
    }

    std::optional<std::string> method = extractJsonRawValue(message, "method", start, end);
    if (!method || method->size() < 2 || (*method)[0] != '"') {
        return std::nullopt;
    }

    RpcRequest request;
    request.command = unescapeJson(method->substr(1, method->size() - 2));
    request.params = extractJsonRawValue(message, "params", start, end);
    if (id) {
        *id = extractJsonRawValue(message, "id", start, end);
    }
    return request;
}

// Script delivering a response to the page; empty when the response carries no id
inline std::string rpcResponseScript(const RpcResponse& response) {
    if (!response.id) {
        return "";
    }
    if (response.error) {
        return "window.external.rpc._error(" + *response.id + ", " + *response.error + ")";
    }
    return "window.external.rpc._result(" + *response.id + ", " +
           (response.result ? *response.result : std::string("null")) + ")";
}

struct FileDropEvent {
    enum class Type { HOVERED, DROPPED, CANCELLED };

    Type type = Type::CANCELLED;
    std::vector<std::string> paths;

    static FileDropEvent hovered(std::vector<std::string> paths) {
        return FileDropEvent{Type::HOVERED, std::move(paths)};
    }
    static FileDropEvent dropped(std::vector<std::string> paths) {
        return FileDropEvent{Type::DROPPED, std::move(paths)};
    }
    static FileDropEvent cancelled() {
        return FileDropEvent{Type::CANCELLED, {}};
    }
};

// Serves every request of one URI scheme; receives the full request URL
// Throwing reports the request as failed
typedef std::function<std::vector<uint8_t>(const std::string& url)> UriSchemeProtocol;

struct WebviewAttributes {
    std::vector<std::string> initializationScripts;  // run before any page script, in order
    std::optional<std::string> dataDirectory;
    std::map<std::string, UriSchemeProtocol> uriSchemeProtocols;
    bool fileDropEnabled = true;

    WebviewAttributes& initializationScript(const std::string& script) {
        initializationScripts.push_back(script);
        return *this;
    }

    WebviewAttributes& registerUriSchemeProtocol(const std::string& scheme, UriSchemeProtocol protocol) {
        uriSchemeProtocols[scheme] = std::move(protocol);
        return *this;
    }

    bool hasUriSchemeProtocol(const std::string& scheme) const {
        return uriSchemeProtocols.find(scheme) != uriSchemeProtocols.end();
    }
};

} // namespace webshell

#endif // WEBSHELL_WEBVIEW_H
