#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "../src/native/shared/pending_window.h"
#include "test_support.h"

using namespace webshell;

namespace {

const char* const APP_CONFIG = R"({
    "identifier": "dev.webshell.hello",
    "channel": "canary",
    "productName": "Hello",
    "build": {"ignored": true},
    "windows": [
        {"label": "main", "url": "index.html", "title": "Hello \"world\"", "width": 1024, "height": 768,
         "minWidth": 400, "minHeight": 300, "maxWidth": 1600,
         "x": 10, "y": 20, "resizable": false, "focus": false, "alwaysOnTop": true,
         "fileDropEnabled": false,
         "menu": [{"label": "File", "submenu": [{"label": "Quit", "action": "quit"}]}]},
        {"label": "settings", "url": "settings.html"}
    ]
})";

} // namespace

TEST_CASE("app config is read from JSON", "[config]") {
    AppConfig config = AppConfig::fromJson(APP_CONFIG);
    CHECK(config.identifier == "dev.webshell.hello");
    CHECK(config.channel == "canary");
    CHECK(config.productName == "Hello");
    REQUIRE(config.windows.size() == 2);

    const WindowConfig& main = config.windows[0];
    CHECK(main.label == "main");
    CHECK(main.title == "Hello \"world\"");
    CHECK(main.width == 1024);
    CHECK(main.height == 768);
    CHECK(main.minWidth == 400.0);
    CHECK(main.maxWidth == 1600.0);
    CHECK_FALSE(main.maxHeight);
    CHECK_FALSE(main.resizable);
    CHECK_FALSE(main.focus);
    CHECK(main.alwaysOnTop);
    CHECK_FALSE(main.fileDropEnabled);
    REQUIRE(main.menu.size() == 1);
    CHECK(main.menu[0].submenu.at(0).id == "quit");
}

TEST_CASE("missing window keys keep their defaults", "[config]") {
    AppConfig config = AppConfig::fromJson(APP_CONFIG);
    const WindowConfig* settings = config.findWindow("settings");
    REQUIRE(settings);
    CHECK(settings->url == "settings.html");
    CHECK(settings->title.empty());
    CHECK(settings->width == 800);
    CHECK(settings->height == 600);
    CHECK(settings->resizable);
    CHECK(settings->focus);
    CHECK(settings->decorations);
    CHECK(settings->fileDropEnabled);
    CHECK_FALSE(settings->x);
    CHECK(settings->menu.empty());

    CHECK(config.findWindow("missing") == nullptr);
}

TEST_CASE("invalid config documents are rejected", "[config]") {
    CHECK_THROWS_MATCHES(AppConfig::fromJson("[]"), Error, HasKind(ErrorKind::INVALID_CONFIG));
    CHECK_THROWS_MATCHES(AppConfig::fromJson(""), Error, HasKind(ErrorKind::INVALID_CONFIG));
    CHECK_THROWS_MATCHES(AppConfig::fromJson("{\"windows\": ["), Error, HasKind(ErrorKind::INVALID_CONFIG));
    CHECK_THROWS_MATCHES(AppConfig::loadFile("/nonexistent/webshell.json"), Error,
                         HasKind(ErrorKind::INVALID_CONFIG));
}

TEST_CASE("app config loads from a file", "[config]") {
    const std::string path = "webshell_test_config.json";
    {
        std::ofstream file(path);
        file << APP_CONFIG;
    }
    AppConfig config = AppConfig::loadFile(path);
    std::remove(path.c_str());

    CHECK(config.identifier == "dev.webshell.hello");
    CHECK(config.windows.size() == 2);
}

TEST_CASE("the data directory is derived from identifier and channel", "[config]") {
    AppConfig config = AppConfig::fromJson(APP_CONFIG);
    CHECK(config.dataDirectory("/home/u/.local/share") == "/home/u/.local/share/dev.webshell.hello/canary/WebKit");

    AppConfig empty;
    CHECK(empty.dataDirectory("/data/") == "/data/webshell/default/WebKit");
    CHECK(buildAppDataPath("/data", "app", "stable") == "/data/app/stable");
}

TEST_CASE("window builders apply sizes only when both dimensions are set", "[config]") {
    AppConfig config = AppConfig::fromJson(APP_CONFIG);
    WindowAttributes attributes = WindowBuilder::withConfig(config.windows[0]).attributes();

    CHECK(attributes.title == "Hello \"world\"");
    REQUIRE(attributes.innerSize);
    CHECK(attributes.innerSize->toLogical(1.0) == LogicalSize<double>(1024, 768));
    REQUIRE(attributes.minInnerSize);
    CHECK(attributes.minInnerSize->toLogical(1.0) == LogicalSize<double>(400, 300));
    CHECK_FALSE(attributes.maxInnerSize);
    REQUIRE(attributes.position);
    CHECK(attributes.position->toLogical(1.0) == LogicalPosition<double>(10, 20));
    CHECK_FALSE(attributes.resizable);
    CHECK_FALSE(attributes.focus);
    CHECK(attributes.alwaysOnTop);
    CHECK(attributes.menu.size() == 1);

    WindowAttributes defaults = WindowBuilder::withConfig(config.windows[1]).attributes();
    CHECK_FALSE(defaults.position);
    CHECK_FALSE(defaults.minInnerSize);
    CHECK(defaults.focus);
}

TEST_CASE("pending windows take label, url and file drop setting from config", "[config]") {
    AppConfig config = AppConfig::fromJson(APP_CONFIG);
    WebviewAttributes webview;
    webview.initializationScript("window.answer = 42;");

    PendingWindow pending = PendingWindow::withConfig(config.windows[0], webview);
    CHECK(pending.label == "main");
    CHECK(pending.url == "index.html");
    CHECK_FALSE(pending.webviewAttributes.fileDropEnabled);
    CHECK(pending.webviewAttributes.initializationScripts.size() == 1);
    CHECK_FALSE(pending.rpcHandler);
}
