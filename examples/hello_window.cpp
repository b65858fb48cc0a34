// hello_window.cpp - Demo: one window served from in-memory assets, driven from a worker thread
//
//   webshell-hello [config.json]
//
// With a config file the "main" window entry and the data directory come from it.
// WEBSHELL_TRAY_ICON=<png> adds a system tray.

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "../src/native/linux/gtk_backend.h"
#include "../src/native/shared/app_paths.h"
#include "../src/native/shared/assets.h"
#include "../src/native/shared/config.h"
#include "../src/native/shared/runtime.h"

using namespace webshell;

namespace {

const char* const INDEX_HTML =
    "<!doctype html>\n"
    "<html><head><title>webshell</title><link rel=\"stylesheet\" href=\"style.css\"></head>\n"
    "<body>\n"
    "  <h1>Hello from webshell</h1>\n"
    "  <button id=\"ping\">Ping</button>\n"
    "  <p id=\"answer\"></p>\n"
    "  <script>\n"
    "    document.getElementById('ping').onclick = function() {\n"
    "      window.external.invoke({method: 'ping', params: {at: Date.now()}});\n"
    "    };\n"
    "  </script>\n"
    "</body></html>\n";

const char* const STYLE_CSS =
    "body { font-family: sans-serif; margin: 2em; }\n"
    "#answer { color: #2a7; }\n";

std::vector<MenuItem> buildMenu() {
    return {
        MenuItem::submenuOf("File", {
            MenuItem::item("reload", "Reload", "CommandOrControl+R"),
            MenuItem::separator(),
            MenuItem::item("quit", "Quit", "CommandOrControl+Q"),
        }),
        MenuItem::submenuOf("View", {
            MenuItem::checkbox("always-on-top", "Always on Top", false),
            MenuItem::item("fullscreen", "Toggle Fullscreen", "F11"),
        }),
    };
}

} // namespace

int main(int argc, char** argv) {
    try {
        Runtime runtime(std::make_unique<GtkEventLoop>());

        auto assets = std::make_shared<MemoryAssets>();
        assets->insert("/index.html", INDEX_HTML);
        assets->insert("/style.css", STYLE_CSS);

        WebviewAttributes webview;
        webview.registerUriSchemeProtocol("app", assetProtocol(assets));

        PendingWindow pending(WindowBuilder().title("webshell").innerSize(900, 640).minInnerSize(400, 300)
                                  .menu(buildMenu()).focus(),
                              webview, "main");
        pending.url = "app://localhost/";

        if (argc > 1) {
            AppConfig config = AppConfig::loadFile(argv[1]);
            webview.dataDirectory = config.dataDirectory(defaultDataHome());
            const WindowConfig* windowConfig = config.findWindow("main");
            if (windowConfig) {
                pending = PendingWindow::withConfig(*windowConfig, webview);
                if (pending.url.find("://") == std::string::npos) {
                    pending.url = "app://localhost/" + pending.url;
                }
                if (!pending.windowBuilder.hasMenu()) {
                    pending.windowBuilder.menu(buildMenu());
                }
            }
        }

        pending.rpcHandler = [](const DetachedWindow& window, const RpcRequest& request) {
            printf("DEBUG: rpc %s from %s, params %s\n", request.command.c_str(), window.label.c_str(),
                   request.params ? request.params->c_str() : "none");
            if (request.command == "ping") {
                window.dispatcher.evalScript("document.getElementById('answer').textContent = 'pong';");
            }
        };
        pending.fileDropHandler = [](const FileDropEvent& event, const DetachedWindow& window) {
            for (const auto& path : event.paths) {
                printf("DEBUG: file dropped on %s: %s\n", window.label.c_str(), path.c_str());
            }
            return event.type == FileDropEvent::Type::DROPPED;
        };

        DetachedWindow main = runtime.createWindow(std::move(pending));
        Dispatcher dispatcher = main.dispatcher;

        bool alwaysOnTop = false;
        bool fullscreen = false;
        dispatcher.onMenuEvent([dispatcher, &alwaysOnTop, &fullscreen](const MenuEvent& event) {
            if (event.menuItemId == "quit") {
                dispatcher.close();
            } else if (event.menuItemId == "reload") {
                dispatcher.evalScript("location.reload();");
            } else if (event.menuItemId == "always-on-top") {
                alwaysOnTop = !alwaysOnTop;
                dispatcher.setAlwaysOnTop(alwaysOnTop);
            } else if (event.menuItemId == "fullscreen") {
                fullscreen = !fullscreen;
                dispatcher.setFullscreen(fullscreen);
            }
        });

        dispatcher.onWindowEvent([](const WindowEvent& event) {
            if (event.type == WindowEventType::RESIZED) {
                printf("DEBUG: resized to %ux%u\n", event.size.width, event.size.height);
            } else {
                printf("DEBUG: window event %s\n", windowEventTypeToString(event.type));
            }
        });

        const char* trayIcon = getenv("WEBSHELL_TRAY_ICON");
        if (trayIcon) {
            runtime.systemTray(Icon::fromFile(trayIcon), {
                MenuItem::item("show", "Show Window"),
                MenuItem::separator(),
                MenuItem::item("quit", "Quit"),
            });
            runtime.onSystemTrayEvent([dispatcher](const SystemTrayEvent& event) {
                if (event.menuItemId == "show") {
                    dispatcher.show();
                    dispatcher.setFocus();
                } else if (event.menuItemId == "quit") {
                    dispatcher.close();
                }
            });
        }

        // Blocking calls are fine here: this is not the event loop thread
        std::thread worker([dispatcher]() {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            try {
                PhysicalSize<uint32_t> size = dispatcher.innerSize();
                double scale = dispatcher.scaleFactor();
                dispatcher.setTitle("webshell " + std::to_string(size.width) + "x" + std::to_string(size.height) +
                                    " @" + std::to_string(static_cast<int>(scale)) + "x");
                std::optional<Monitor> monitor = dispatcher.currentMonitor();
                if (monitor) {
                    printf("DEBUG: on monitor %s\n", monitor->name ? monitor->name->c_str() : "(unnamed)");
                }
            } catch (const Error& e) {
                // the window may already be gone
                fprintf(stderr, "WARNING: %s\n", e.what());
            }
        });

        runtime.run();
        worker.join();
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }
    return 0;
}
