#include "gtk_backend.h"

#include <cstdio>
#include <cstring>
#include <stdexcept>

#include "../shared/error.h"
#include "../shared/mime_types.h"

namespace webshell {

namespace {

// Name of the script message handler web content posts RPC calls to
const char* const RPC_HANDLER_NAME = "external";

// Gives pages window.external.invoke(message), message being a JSON string or object
const char* const RPC_BRIDGE_SCRIPT =
    "(function() {\n"
    "  window.external = window.external || {};\n"
    "  window.external.invoke = function(message) {\n"
    "    var text = typeof message === 'string' ? message : JSON.stringify(message);\n"
    "    window.webkit.messageHandlers.external.postMessage(text);\n"
    "  };\n"
    "})();\n";

struct CustomProtocolData {
    std::string scheme;
    UriSchemeProtocol handler;
};

void freeCustomProtocolData(gpointer userData) {
    delete static_cast<CustomProtocolData*>(userData);
}

void handleCustomProtocol(WebKitURISchemeRequest* request, gpointer userData) {
    CustomProtocolData* protocol = static_cast<CustomProtocolData*>(userData);
    const gchar* uri = webkit_uri_scheme_request_get_uri(request);
    std::string url = uri ? uri : "";

    std::vector<uint8_t> body;
    try {
        body = protocol->handler(url);
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: %s:// request failed for %s: %s\n", protocol->scheme.c_str(), url.c_str(), e.what());
        GError* error = g_error_new(G_IO_ERROR, G_IO_ERROR_FAILED, "%s", e.what());
        webkit_uri_scheme_request_finish_error(request, error);
        g_error_free(error);
        return;
    }

    gsize length = body.size();
    gpointer data = g_malloc(length > 0 ? length : 1);
    if (length > 0) {
        memcpy(data, body.data(), length);
    }
    GInputStream* stream = g_memory_input_stream_new_from_data(data, length, g_free);
    std::string mimeType = getMimeTypeFromUrl(url);
    webkit_uri_scheme_request_finish(request, stream, length, mimeType.c_str());
    g_object_unref(stream);
}

void onEvaluateFinished(GObject* source, GAsyncResult* result, gpointer userData) {
    GError* error = nullptr;
    JSCValue* value = webkit_web_view_evaluate_javascript_finish(WEBKIT_WEB_VIEW(source), result, &error);
    if (error) {
        fprintf(stderr, "ERROR: script failed in window %u: %s\n", GPOINTER_TO_UINT(userData), error->message);
        g_error_free(error);
        return;
    }
    if (value) {
        g_object_unref(value);
    }
}

} // namespace

WebKitWebviewImpl::WebKitWebviewImpl(std::shared_ptr<GtkLoopState> state, WindowId id, NativeWebviewOptions options)
    : state_(state),
      window_(state, id, options.window, options.transparent || options.window.transparent),
      options_(std::move(options)) {
    manager_ = webkit_user_content_manager_new();
    if (!manager_) {
        fprintf(stderr, "ERROR: Failed to create WebKit user content manager\n");
        throw Error(ErrorKind::CREATE_WEBVIEW, "Failed to create WebKit user content manager");
    }

    WebKitSettings* settings = webkit_settings_new();
    webkit_settings_set_enable_javascript(settings, TRUE);
    webkit_settings_set_javascript_can_access_clipboard(settings, FALSE);
    webkit_settings_set_enable_developer_extras(settings, TRUE);

    // a private context whenever this webview needs its own storage or schemes
    if (options_.dataDirectory || !options_.customProtocols.empty()) {
        WebKitWebsiteDataManager* dataManager = nullptr;
        if (options_.dataDirectory) {
            g_mkdir_with_parents(options_.dataDirectory->c_str(), 0755);
            dataManager = webkit_website_data_manager_new(
                "base-data-directory", options_.dataDirectory->c_str(),
                "base-cache-directory", options_.dataDirectory->c_str(),
                NULL);
        } else {
            dataManager = webkit_website_data_manager_new_ephemeral();
        }
        context_ = webkit_web_context_new_with_website_data_manager(dataManager);
        g_object_unref(dataManager);
    } else {
        context_ = webkit_web_context_get_default();
        g_object_ref(context_);
    }
    registerCustomProtocols();

    webview_ = GTK_WIDGET(g_object_new(WEBKIT_TYPE_WEB_VIEW,
        "web-context", context_,
        "user-content-manager", manager_,
        "settings", settings,
        NULL));
    g_object_unref(settings);
    if (!webview_) {
        fprintf(stderr, "ERROR: Failed to create WebKit webview\n");
        g_object_unref(context_);
        g_object_unref(manager_);
        throw Error(ErrorKind::CREATE_WEBVIEW, "Failed to create WebKit webview");
    }

    if (options_.transparent || options_.window.transparent) {
        GdkRGBA transparent = {0.0, 0.0, 0.0, 0.0};
        webkit_web_view_set_background_color(WEBKIT_WEB_VIEW(webview_), &transparent);
    }

    installUserScripts();

    g_signal_connect(manager_, "script-message-received::external", G_CALLBACK(onScriptMessage), this);
    webkit_user_content_manager_register_script_message_handler(manager_, RPC_HANDLER_NAME);

    if (options_.fileDropEnabled) {
        g_signal_connect(webview_, "drag-drop", G_CALLBACK(onDragDrop), this);
        g_signal_connect(webview_, "drag-data-received", G_CALLBACK(onDragDataReceived), this);
        g_signal_connect(webview_, "drag-leave", G_CALLBACK(onDragLeave), this);
    }

    gtk_box_pack_start(GTK_BOX(window_.contentBox()), webview_, TRUE, TRUE, 0);

    webkit_web_view_load_uri(WEBKIT_WEB_VIEW(webview_), options_.url.c_str());

    if (options_.window.visible) {
        gtk_widget_show_all(window_.widget());
        if (options_.window.focus) {
            gtk_window_present(GTK_WINDOW(window_.widget()));
        }
    } else {
        gtk_widget_show_all(window_.contentBox());
    }

    printf("GTK: window %u created for %s\n", window_.id(), options_.url.c_str());
}

WebKitWebviewImpl::~WebKitWebviewImpl() {
    if (leaveIdleId_ != 0) {
        g_source_remove(leaveIdleId_);
    }
    // no more callbacks into this object; the window member destroys the widgets
    g_signal_handlers_disconnect_by_data(manager_, this);
    g_signal_handlers_disconnect_by_data(webview_, this);
    webkit_user_content_manager_unregister_script_message_handler(manager_, RPC_HANDLER_NAME);
    g_object_unref(manager_);
    g_object_unref(context_);
}

void WebKitWebviewImpl::registerCustomProtocols() {
    WebKitSecurityManager* security = webkit_web_context_get_security_manager(context_);
    for (const auto& protocol : options_.customProtocols) {
        webkit_web_context_register_uri_scheme(context_, protocol.first.c_str(), handleCustomProtocol,
                                               new CustomProtocolData{protocol.first, protocol.second},
                                               freeCustomProtocolData);
        webkit_security_manager_register_uri_scheme_as_secure(security, protocol.first.c_str());
        webkit_security_manager_register_uri_scheme_as_cors_enabled(security, protocol.first.c_str());
    }
}

void WebKitWebviewImpl::installUserScripts() {
    std::vector<std::string> scripts;
    scripts.push_back(RPC_BRIDGE_SCRIPT);
    scripts.insert(scripts.end(), options_.initializationScripts.begin(), options_.initializationScripts.end());

    for (const auto& script : scripts) {
        WebKitUserScript* userScript = webkit_user_script_new(
            script.c_str(),
            WEBKIT_USER_CONTENT_INJECT_TOP_FRAME,
            WEBKIT_USER_SCRIPT_INJECT_AT_DOCUMENT_START,
            nullptr,
            nullptr);
        webkit_user_content_manager_add_script(manager_, userScript);
        webkit_user_script_unref(userScript);
    }
}

void WebKitWebviewImpl::evaluateJavaScript(const std::string& script) {
    // failures inside the page are reported asynchronously by onEvaluateFinished
    webkit_web_view_evaluate_javascript(WEBKIT_WEB_VIEW(webview_), script.c_str(), -1,
                                        nullptr, nullptr, nullptr,
                                        onEvaluateFinished, GUINT_TO_POINTER(window_.id()));
}

void WebKitWebviewImpl::print() {
    WebKitPrintOperation* operation = webkit_print_operation_new(WEBKIT_WEB_VIEW(webview_));
    WebKitPrintOperationResponse response =
        webkit_print_operation_run_dialog(operation, GTK_WINDOW(window_.widget()));
    g_object_unref(operation);
    printf("DEBUG: print dialog for window %u %s\n", window_.id(),
           response == WEBKIT_PRINT_OPERATION_RESPONSE_PRINT ? "printed" : "cancelled");
}

void WebKitWebviewImpl::resize() {
    // the webview fills the content box; GTK only needs a new layout pass
    gtk_widget_queue_resize(webview_);
}

// Signal handlers

void WebKitWebviewImpl::onScriptMessage(WebKitUserContentManager* manager, WebKitJavascriptResult* jsResult, gpointer userData) {
    WebKitWebviewImpl* impl = static_cast<WebKitWebviewImpl*>(userData);
    if (!impl->options_.rpcHandler || !jsResult) {
        return;
    }

    JSCValue* value = webkit_javascript_result_get_js_value(jsResult);
    if (!value || !JSC_IS_VALUE(value) || !jsc_value_is_string(value)) {
        fprintf(stderr, "WARNING: ignoring non-string message from window %u\n", impl->window_.id());
        return;
    }
    gchar* text = jsc_value_to_string(value);
    std::string message = text ? text : "";
    g_free(text);

    std::optional<std::string> id;
    std::optional<RpcRequest> request = parseRpcRequest(message, &id);
    if (!request) {
        fprintf(stderr, "WARNING: malformed RPC message from window %u\n", impl->window_.id());
        return;
    }

    try {
        std::optional<RpcResponse> response = impl->options_.rpcHandler(impl->window_.id(), *request);
        if (response) {
            if (!response->id) {
                response->id = id;
            }
            std::string script = rpcResponseScript(*response);
            if (!script.empty()) {
                impl->dispatchScript(script);
            }
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: RPC handler for window %u failed: %s\n", impl->window_.id(), e.what());
    }
}

gboolean WebKitWebviewImpl::onDragDrop(GtkWidget* widget, GdkDragContext* context, gint x, gint y, guint time, gpointer userData) {
    WebKitWebviewImpl* impl = static_cast<WebKitWebviewImpl*>(userData);
    impl->dropPending_ = true;
    // WebKit requests the data itself; onDragDataReceived sees it first
    return FALSE;
}

void WebKitWebviewImpl::onDragDataReceived(GtkWidget* widget, GdkDragContext* context, gint x, gint y,
                                           GtkSelectionData* data, guint info, guint time, gpointer userData) {
    WebKitWebviewImpl* impl = static_cast<WebKitWebviewImpl*>(userData);
    if (!impl->options_.fileDropHandler) {
        return;
    }

    std::vector<std::string> paths;
    gchar** uris = gtk_selection_data_get_uris(data);
    if (uris) {
        for (gchar** uri = uris; *uri; uri++) {
            gchar* path = g_filename_from_uri(*uri, nullptr, nullptr);
            if (path) {
                paths.push_back(path);
                g_free(path);
            }
        }
        g_strfreev(uris);
    }
    if (paths.empty()) {
        return;
    }

    bool dropped = impl->dropPending_;
    impl->dropPending_ = false;
    FileDropEvent event = dropped ? FileDropEvent::dropped(paths) : FileDropEvent::hovered(paths);
    if (dropped) {
        impl->dragHovering_ = false;
    } else if (impl->dragHovering_) {
        // already reported for this drag
        return;
    } else {
        impl->dragHovering_ = true;
    }

    bool handled = false;
    try {
        handled = impl->options_.fileDropHandler(impl->window_.id(), event);
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: file drop handler for window %u failed: %s\n", impl->window_.id(), e.what());
    }

    if (handled && dropped) {
        // the application took the files; keep WebKit from navigating to them
        g_signal_stop_emission_by_name(widget, "drag-data-received");
        gtk_drag_finish(context, TRUE, FALSE, time);
    }
}

void WebKitWebviewImpl::onDragLeave(GtkWidget* widget, GdkDragContext* context, guint time, gpointer userData) {
    WebKitWebviewImpl* impl = static_cast<WebKitWebviewImpl*>(userData);
    if (!impl->dragHovering_ || impl->leaveIdleId_ != 0) {
        return;
    }
    // GTK also sends drag-leave right before drag-drop, so wait for the drop to show up
    impl->leaveIdleId_ = g_idle_add(onDragLeaveIdle, impl);
}

gboolean WebKitWebviewImpl::onDragLeaveIdle(gpointer userData) {
    WebKitWebviewImpl* impl = static_cast<WebKitWebviewImpl*>(userData);
    impl->leaveIdleId_ = 0;
    if (impl->dropPending_ || !impl->dragHovering_) {
        return G_SOURCE_REMOVE;
    }
    impl->dragHovering_ = false;
    try {
        impl->options_.fileDropHandler(impl->window_.id(), FileDropEvent::cancelled());
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: file drop handler for window %u failed: %s\n", impl->window_.id(), e.what());
    }
    return G_SOURCE_REMOVE;
}

} // namespace webshell
