#include <catch2/catch.hpp>

#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/native/shared/webview_factory.h"
#include "test_support.h"

using namespace webshell;

namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

TEST_CASE("the RPC adapter addresses the calling window and never answers", "[factory]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow();

    std::optional<WindowId> seenId;
    std::string seenLabel;
    std::string seenCommand;
    auto adapter = makeRpcHandler(main.context(), "editor",
                                  [&](const DetachedWindow& window, const RpcRequest& request) {
                                      seenId = window.dispatcher.windowId();
                                      seenLabel = window.label;
                                      seenCommand = request.command;
                                  });

    std::optional<RpcResponse> response = adapter(42, RpcRequest{"save", std::string("{}")});
    CHECK_FALSE(response);
    CHECK(seenId == WindowId(42));
    CHECK(seenLabel == "editor");
    CHECK(seenCommand == "save");
}

TEST_CASE("the file drop adapter returns the handler's verdict", "[factory]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow();

    std::vector<FileDropEvent::Type> seen;
    auto adapter = makeFileDropHandler(main.context(), "main",
                                       [&seen](const FileDropEvent& event, const DetachedWindow& window) {
                                           seen.push_back(event.type);
                                           return event.type == FileDropEvent::Type::DROPPED &&
                                                  window.label == "main";
                                       });

    CHECK_FALSE(adapter(1, FileDropEvent::hovered({"/tmp/a"})));
    CHECK(adapter(1, FileDropEvent::dropped({"/tmp/a"})));
    CHECK(seen.size() == 2);
}

TEST_CASE("custom protocol failures lose their detail", "[factory]") {
    UriSchemeProtocol failing = makeCustomProtocol([](const std::string& url) -> std::vector<uint8_t> {
        throw std::runtime_error("disk on fire: " + url);
    });

    try {
        failing("app://localhost/index.html");
        FAIL("expected the protocol to throw");
    } catch (const Error& e) {
        CHECK(e.kind() == ErrorKind::CUSTOM_PROTOCOL);
        CHECK(std::string(e.what()) == "custom protocol handler failed");
    }

    UriSchemeProtocol working = makeCustomProtocol([](const std::string& url) { return bytesOf(url); });
    CHECK(working("app://x") == bytesOf("app://x"));
}

TEST_CASE("construction passes webview settings through verbatim", "[factory]") {
    HeadlessRuntime headless;

    WebviewAttributes webview;
    webview.initializationScript("window.first = 1;").initializationScript("window.second = 2;");
    webview.dataDirectory = std::string("/tmp/webshell-data");
    webview.registerUriSchemeProtocol("app", [](const std::string&) { return bytesOf("ok"); });

    PendingWindow pending(WindowBuilder().title("settings").transparent(true), webview, "settings");
    pending.url = "app://localhost/settings.html";
    DetachedWindow window = headless.runtime->createWindow(std::move(pending));

    CHECK(window.label == "settings");
    HeadlessWindowState state = headless.state(window.dispatcher.windowId());
    CHECK(state.url == "app://localhost/settings.html");
    CHECK(state.title == "settings");
    CHECK(state.transparent);
    CHECK(state.initializationScripts == std::vector<std::string>{"window.first = 1;", "window.second = 2;"});
    CHECK(state.dataDirectory == std::string("/tmp/webshell-data"));
    CHECK(state.customProtocols == std::vector<std::string>{"app"});
}

TEST_CASE("native RPC calls reach the handler on the loop thread", "[factory]") {
    Recorder<std::string> calls;
    std::thread::id handlerThread;
    HeadlessRuntime headless;

    PendingWindow pending(WindowBuilder().title("rpc"), WebviewAttributes(), "rpc-window");
    pending.rpcHandler = [&](const DetachedWindow& window, const RpcRequest& request) {
        handlerThread = std::this_thread::get_id();
        calls.push(window.label + ":" + request.command + ":" + request.params.value_or("none"));
        window.dispatcher.evalScript("window.reply = 'pong';");
    };
    WindowId id = headless.runtime->createWindow(std::move(pending)).dispatcher.windowId();
    headless.start();

    std::future<std::optional<RpcResponse>> response =
        headless.controller->simulateRpc(id, RpcRequest{"ping", std::string("[1]")});
    REQUIRE(response.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK_FALSE(response.get());
    CHECK(handlerThread != std::this_thread::get_id());
    CHECK(calls.items() == std::vector<std::string>{"rpc-window:ping:[1]"});

    headless.drain();
    CHECK(headless.state(id).evaluatedScripts == std::vector<std::string>{"window.reply = 'pong';"});
}

TEST_CASE("a window without an RPC handler ignores calls", "[factory]") {
    HeadlessRuntime headless;
    WindowId id = headless.createWindow().windowId();
    headless.start();

    std::future<std::optional<RpcResponse>> response = headless.controller->simulateRpc(id, RpcRequest{"ping", {}});
    REQUIRE(response.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK_FALSE(response.get());
}

TEST_CASE("native file drops reach the handler", "[factory]") {
    Recorder<std::string> paths;
    HeadlessRuntime headless;

    PendingWindow pending(WindowBuilder(), WebviewAttributes(), "main");
    pending.fileDropHandler = [&paths](const FileDropEvent& event, const DetachedWindow&) {
        for (const auto& path : event.paths) {
            paths.push(path);
        }
        return event.type == FileDropEvent::Type::DROPPED;
    };
    WindowId id = headless.runtime->createWindow(std::move(pending)).dispatcher.windowId();
    headless.start();

    std::future<bool> hovered = headless.controller->simulateFileDrop(id, FileDropEvent::hovered({"/tmp/a.png"}));
    std::future<bool> dropped = headless.controller->simulateFileDrop(id, FileDropEvent::dropped({"/tmp/a.png"}));
    std::future<bool> cancelled = headless.controller->simulateFileDrop(id, FileDropEvent::cancelled());

    REQUIRE(cancelled.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK_FALSE(hovered.get());
    CHECK(dropped.get());
    CHECK_FALSE(cancelled.get());
    CHECK(paths.items() == std::vector<std::string>{"/tmp/a.png", "/tmp/a.png"});
}

TEST_CASE("file drops are not delivered when disabled", "[factory]") {
    bool called = false;
    HeadlessRuntime headless;

    WebviewAttributes webview;
    webview.fileDropEnabled = false;
    PendingWindow pending(WindowBuilder(), webview, "main");
    pending.fileDropHandler = [&called](const FileDropEvent&, const DetachedWindow&) {
        called = true;
        return true;
    };
    WindowId id = headless.runtime->createWindow(std::move(pending)).dispatcher.windowId();
    headless.start();

    std::future<bool> dropped = headless.controller->simulateFileDrop(id, FileDropEvent::dropped({"/tmp/a"}));
    REQUIRE(dropped.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK_FALSE(dropped.get());
    CHECK_FALSE(called);
}

TEST_CASE("custom protocol fetches are served per scheme", "[factory]") {
    HeadlessRuntime headless;

    WebviewAttributes webview;
    webview.registerUriSchemeProtocol("app", [](const std::string& url) { return bytesOf("served " + url); });
    webview.registerUriSchemeProtocol("broken", [](const std::string&) -> std::vector<uint8_t> {
        throw Error(ErrorKind::ASSET_NOT_FOUND, "/secret.txt");
    });
    WindowId id = headless.runtime->createWindow(PendingWindow(WindowBuilder(), webview, "main"))
                      .dispatcher.windowId();
    headless.start();

    std::future<std::vector<uint8_t>> served = headless.controller->fetchCustomProtocol(id, "app://localhost/a");
    REQUIRE(served.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK(served.get() == bytesOf("served app://localhost/a"));

    std::future<std::vector<uint8_t>> broken = headless.controller->fetchCustomProtocol(id, "broken://x");
    REQUIRE(broken.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK_THROWS_MATCHES(broken.get(), Error, HasKind(ErrorKind::CUSTOM_PROTOCOL));

    std::future<std::vector<uint8_t>> unknown = headless.controller->fetchCustomProtocol(id, "other://x");
    REQUIRE(unknown.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK_THROWS_MATCHES(unknown.get(), Error, HasKind(ErrorKind::CUSTOM_PROTOCOL));
}
