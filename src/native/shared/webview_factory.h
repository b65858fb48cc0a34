// webview_factory.h - Turns a pending window into a native window and webview
// Native callbacks (RPC calls, file drops, custom protocol fetches) are wrapped so they
// reach application handlers with a DetachedWindow for the originating window.

#ifndef WEBSHELL_WEBVIEW_FACTORY_H
#define WEBSHELL_WEBVIEW_FACTORY_H

#include <memory>
#include <optional>
#include <string>

#include "dispatcher.h"
#include "native.h"
#include "pending_window.h"

namespace webshell {

// Runs on the event loop thread. Throws the toolkit's construction error.
std::unique_ptr<AbstractWebview> createWebview(EventLoopTarget& target,
                                               const DispatcherContext& context,
                                               const PendingWindow& pending);

// Never answers directly; responses go back through evalScript
std::function<std::optional<RpcResponse>(WindowId, const RpcRequest&)> makeRpcHandler(
    const DispatcherContext& context, const std::string& label, WebviewRpcHandler handler);

std::function<bool(WindowId, const FileDropEvent&)> makeFileDropHandler(
    const DispatcherContext& context, const std::string& label, FileDropHandler handler);

// Any failure of protocol is reported as Error(CUSTOM_PROTOCOL) without the original detail
UriSchemeProtocol makeCustomProtocol(UriSchemeProtocol protocol);

} // namespace webshell

#endif // WEBSHELL_WEBVIEW_FACTORY_H
