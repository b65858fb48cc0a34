// pending_window.h - A window that has been described but not yet created
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_PENDING_WINDOW_H
#define WEBSHELL_PENDING_WINDOW_H

#include <functional>
#include <string>

#include "config.h"
#include "webview.h"
#include "window.h"

namespace webshell {

struct DetachedWindow;

// Called on the event loop thread for every RPC call made by the window's content
typedef std::function<void(const DetachedWindow& window, const RpcRequest& request)> WebviewRpcHandler;

// Returns true when the drop was handled and the webview should not see it
typedef std::function<bool(const FileDropEvent& event, const DetachedWindow& window)> FileDropHandler;

struct PendingWindow {
    std::string label = "main";
    WindowBuilder windowBuilder;
    WebviewAttributes webviewAttributes;
    std::string url = "about:blank";
    WebviewRpcHandler rpcHandler;            // empty: content RPC calls are ignored
    FileDropHandler fileDropHandler;         // empty: drops go to the webview

    PendingWindow() = default;

    PendingWindow(const WindowBuilder& windowBuilder,
                  const WebviewAttributes& webviewAttributes,
                  const std::string& label)
        : label(label), windowBuilder(windowBuilder), webviewAttributes(webviewAttributes) {}

    static PendingWindow withConfig(const WindowConfig& config,
                                    const WebviewAttributes& webviewAttributes) {
        PendingWindow pending(WindowBuilder::withConfig(config), webviewAttributes, config.label);
        pending.url = config.url;
        pending.webviewAttributes.fileDropEnabled = config.fileDropEnabled;
        return pending;
    }
};

} // namespace webshell

#endif // WEBSHELL_PENDING_WINDOW_H
