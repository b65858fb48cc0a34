// error.h - Error type raised by the dispatcher, the runtime and the backends
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_ERROR_H
#define WEBSHELL_ERROR_H

#include <stdexcept>
#include <string>

namespace webshell {

enum class ErrorKind {
    FAILED_TO_SEND_MESSAGE,
    FAILED_TO_RECEIVE_MESSAGE,
    WINDOW_NOT_FOUND,
    CREATE_WINDOW,
    CREATE_WEBVIEW,
    INVALID_ICON,
    CUSTOM_PROTOCOL,
    ASSET_NOT_FOUND,
    INVALID_CONFIG
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FAILED_TO_SEND_MESSAGE:    return "failed to send message";
        case ErrorKind::FAILED_TO_RECEIVE_MESSAGE: return "failed to receive message";
        case ErrorKind::WINDOW_NOT_FOUND:          return "window not found";
        case ErrorKind::CREATE_WINDOW:             return "failed to create window";
        case ErrorKind::CREATE_WEBVIEW:            return "failed to create webview";
        case ErrorKind::INVALID_ICON:              return "invalid icon";
        case ErrorKind::CUSTOM_PROTOCOL:           return "custom protocol handler failed";
        case ErrorKind::ASSET_NOT_FOUND:           return "asset not found";
        case ErrorKind::INVALID_CONFIG:            return "invalid config";
        default: return "unknown error";
    }
}

class Error : public std::runtime_error {
public:
    explicit Error(ErrorKind kind)
        : std::runtime_error(errorKindToString(kind)), kind_(kind) {}

    // detail is appended to the kind description: "invalid icon: <detail>"
    Error(ErrorKind kind, const std::string& detail)
        : std::runtime_error(std::string(errorKindToString(kind)) + ": " + detail), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace webshell

#endif // WEBSHELL_ERROR_H
