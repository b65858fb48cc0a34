#include "webview_factory.h"

namespace webshell {

std::function<std::optional<RpcResponse>(WindowId, const RpcRequest&)> makeRpcHandler(
    const DispatcherContext& context, const std::string& label, WebviewRpcHandler handler) {
    return [context, label, handler](WindowId windowId, const RpcRequest& request)
               -> std::optional<RpcResponse> {
        handler(DetachedWindow{label, Dispatcher(windowId, context)}, request);
        return std::nullopt;
    };
}

std::function<bool(WindowId, const FileDropEvent&)> makeFileDropHandler(
    const DispatcherContext& context, const std::string& label, FileDropHandler handler) {
    return [context, label, handler](WindowId windowId, const FileDropEvent& event) {
        return handler(event, DetachedWindow{label, Dispatcher(windowId, context)});
    };
}

UriSchemeProtocol makeCustomProtocol(UriSchemeProtocol protocol) {
    return [protocol](const std::string& url) {
        try {
            return protocol(url);
        } catch (const std::exception&) {
            throw Error(ErrorKind::CUSTOM_PROTOCOL);
        }
    };
}

std::unique_ptr<AbstractWebview> createWebview(EventLoopTarget& target,
                                               const DispatcherContext& context,
                                               const PendingWindow& pending) {
    NativeWebviewOptions options;
    options.window = pending.windowBuilder.attributes();
    options.url = pending.url;
    options.transparent = options.window.transparent;
    options.fileDropEnabled = pending.webviewAttributes.fileDropEnabled;

    if (pending.rpcHandler) {
        options.rpcHandler = makeRpcHandler(context, pending.label, pending.rpcHandler);
    }
    if (pending.fileDropHandler) {
        options.fileDropHandler = makeFileDropHandler(context, pending.label, pending.fileDropHandler);
    }
    for (const auto& entry : pending.webviewAttributes.uriSchemeProtocols) {
        options.customProtocols[entry.first] = makeCustomProtocol(entry.second);
    }
    options.dataDirectory = pending.webviewAttributes.dataDirectory;
    options.initializationScripts = pending.webviewAttributes.initializationScripts;

    return target.buildWebview(std::move(options));
}

} // namespace webshell
