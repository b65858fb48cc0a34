#include <catch2/catch.hpp>

#include <future>
#include <string>
#include <thread>
#include <vector>

#include "../src/native/shared/webview_factory.h"
#include "test_support.h"

using namespace webshell;

TEST_CASE("a materialized window reports the attributes it was built with", "[dispatcher]") {
    HeadlessRuntime headless;
    PendingWindow pending(WindowBuilder().title("T").innerSize(800, 600).resizable(false), WebviewAttributes(), "t");
    Dispatcher window = headless.runtime->createWindow(std::move(pending)).dispatcher;
    headless.start();

    CHECK(window.innerSize() == PhysicalSize<uint32_t>(800, 600));
    CHECK_FALSE(window.isResizable());
    CHECK(window.isVisible());
    CHECK(window.isDecorated());
    CHECK_FALSE(window.isMaximized());
    CHECK_FALSE(window.isFullscreen());
    CHECK(window.scaleFactor() == 1.0);
    CHECK(headless.state(window.windowId()).title == "T");
}

TEST_CASE("getters see the effect of earlier setters from the same thread", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    window.setSize(Size::physical(1024, 700));
    CHECK(window.innerSize() == PhysicalSize<uint32_t>(1024, 700));
    CHECK(window.outerSize() == PhysicalSize<uint32_t>(1024, 700 + HEADLESS_TITLE_BAR_HEIGHT));

    window.maximize();
    CHECK(window.isMaximized());
    window.unmaximize();
    CHECK_FALSE(window.isMaximized());

    window.setFullscreen(true);
    CHECK(window.isFullscreen());
    CHECK(window.outerSize() == window.innerSize());

    window.hide();
    CHECK_FALSE(window.isVisible());
    window.setDecorations(false);
    CHECK_FALSE(window.isDecorated());
    window.setResizable(false);
    CHECK_FALSE(window.isResizable());
}

TEST_CASE("setters are applied in submission order", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow("start");
    headless.start();

    window.setTitle("A");
    window.setTitle("B");
    window.maximize();
    window.unmaximize();
    window.minimize();
    window.unminimize();
    window.setMinSize(Size::physical(200, 100));
    window.setMaxSize(std::nullopt);
    window.setSize(Size::logical(640, 480));
    window.setPosition(Position::physical(10, 20));
    window.hide();
    window.show();
    window.setAlwaysOnTop(true);
    window.setSkipTaskbar(true);
    window.setFocus();
    window.setIcon(Icon::fromBytes(pngHeader(16, 16)));
    window.startDragging();
    window.setTitle("C");
    headless.drain();

    HeadlessWindowState state = headless.state(window.windowId());
    CHECK(state.history == std::vector<std::string>{
        "setTitle A",
        "setTitle B",
        "maximize",
        "unmaximize",
        "minimize",
        "unminimize",
        "setMinSize 200x100",
        "setMaxSize none",
        "setSize 640x480",
        "setPosition 10,20",
        "hide",
        "show",
        "setAlwaysOnTop true",
        "setSkipTaskbar true",
        "setFocus",
        "setIcon 16x16",
        "dragWindow",
        "setTitle C",
    });
    CHECK(state.title == "C");
    CHECK(state.alwaysOnTop);
    CHECK(state.skipTaskbar);
    CHECK(state.dragCount == 1);
    REQUIRE(state.icon);
    CHECK(state.icon->rgba.size() == 16 * 16 * 4);
}

TEST_CASE("sizes are clamped to the configured limits", "[dispatcher]") {
    HeadlessRuntime headless;
    PendingWindow pending(WindowBuilder().innerSize(500, 400).minInnerSize(300, 200).maxInnerSize(900, 700),
                          WebviewAttributes(), "main");
    Dispatcher window = headless.runtime->createWindow(std::move(pending)).dispatcher;
    headless.start();

    window.setSize(Size::logical(100, 100));
    CHECK(window.innerSize() == PhysicalSize<uint32_t>(300, 200));
    window.setSize(Size::logical(2000, 2000));
    CHECK(window.innerSize() == PhysicalSize<uint32_t>(900, 700));
    window.setMaxSize(std::nullopt);
    window.setSize(Size::logical(2000, 2000));
    CHECK(window.innerSize() == PhysicalSize<uint32_t>(2000, 2000));
}

TEST_CASE("positions are reported for the frame and the content", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    window.setPosition(Position::logical(100, 50));
    CHECK(window.outerPosition() == PhysicalPosition<int32_t>(100, 50));
    CHECK(window.innerPosition() == PhysicalPosition<int32_t>(100, 50 + HEADLESS_TITLE_BAR_HEIGHT));
}

TEST_CASE("monitor queries follow the window position", "[dispatcher]") {
    HeadlessRuntime headless;

    Monitor left;
    left.name = "LEFT";
    left.size = PhysicalSize<uint32_t>(1920, 1080);
    Monitor right;
    right.name = "RIGHT";
    right.position = PhysicalPosition<int32_t>(1920, 0);
    right.size = PhysicalSize<uint32_t>(2560, 1440);
    right.scaleFactor = 2.0;
    headless.controller->setMonitors({left, right});

    Dispatcher window = headless.createWindow();
    headless.start();

    std::optional<Monitor> current = window.currentMonitor();
    REQUIRE(current);
    CHECK(current->name == std::string("LEFT"));

    window.setPosition(Position::physical(2000, 100));
    current = window.currentMonitor();
    REQUIRE(current);
    CHECK(current->name == std::string("RIGHT"));
    CHECK(current->scaleFactor == 2.0);

    std::optional<Monitor> primary = window.primaryMonitor();
    REQUIRE(primary);
    CHECK(primary->name == std::string("LEFT"));
    CHECK(window.availableMonitors().size() == 2);

    headless.controller->setMonitors({});
    CHECK_FALSE(window.currentMonitor());
    CHECK_FALSE(window.primaryMonitor());
    CHECK(window.availableMonitors().empty());
}

TEST_CASE("invalid icons are rejected on the calling thread", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    CHECK_THROWS_MATCHES(window.setIcon(Icon::fromBytes({1, 2, 3})), Error, HasKind(ErrorKind::INVALID_ICON));
    CHECK_THROWS_MATCHES(window.setIcon(Icon::fromFile("/nonexistent/icon.png")), Error,
                         HasKind(ErrorKind::INVALID_ICON));
    CHECK_THROWS_MATCHES(window.setIcon(Icon::fromBytes(pngHeader(0, 16))), Error,
                         HasKind(ErrorKind::INVALID_ICON));
    headless.drain();
    CHECK_FALSE(headless.state(window.windowId()).icon);
}

TEST_CASE("scripts are evaluated in order and failures do not stop the loop", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    window.evalScript("first()");
    window.evalScript("");
    window.evalScript("second()");
    window.print();
    headless.drain();

    HeadlessWindowState state = headless.state(window.windowId());
    CHECK(state.evaluatedScripts == std::vector<std::string>{"first()", "second()"});
    CHECK(state.printCount == 1);
    CHECK(window.isVisible());
}

TEST_CASE("dispatchers are usable from many threads at once", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    std::vector<std::future<void>> clients;
    for (int t = 0; t < 4; t++) {
        clients.push_back(std::async(std::launch::async, [window, t]() {
            for (int i = 0; i < 50; i++) {
                window.setTitle("client " + std::to_string(t) + " #" + std::to_string(i));
                window.innerSize();
            }
        }));
    }
    for (auto& client : clients) {
        REQUIRE(client.wait_for(TEST_TIMEOUT) == std::future_status::ready);
        client.get();
    }

    headless.drain();
    std::vector<std::string> history = headless.state(window.windowId()).history;
    CHECK(history.size() == 200);

    // each client's own titles keep their relative order
    for (int t = 0; t < 4; t++) {
        std::string prefix = "setTitle client " + std::to_string(t) + " #";
        int next = 0;
        for (const auto& entry : history) {
            if (entry.compare(0, prefix.size(), prefix) == 0) {
                CHECK(entry == prefix + std::to_string(next));
                next++;
            }
        }
        CHECK(next == 50);
    }
}

TEST_CASE("commands for a removed window", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow("main");
    Dispatcher other = headless.createWindow("other", "other");
    headless.start();

    other.close();
    headless.drain();
    REQUIRE(headless.controller->liveWindowIds() == std::vector<WindowId>{main.windowId()});

    SECTION("getters fail with window not found") {
        CHECK_THROWS_MATCHES(other.innerSize(), Error, HasKind(ErrorKind::WINDOW_NOT_FOUND));
        CHECK_THROWS_MATCHES(other.currentMonitor(), Error, HasKind(ErrorKind::WINDOW_NOT_FOUND));
    }

    SECTION("setters are dropped") {
        CHECK_NOTHROW(other.setTitle("ignored"));
        CHECK_NOTHROW(other.evalScript("ignored()"));
        CHECK_NOTHROW(other.close());
        headless.drain();
        CHECK(headless.state(other.windowId()).title == "other");
        CHECK(headless.state(other.windowId()).evaluatedScripts.empty());
    }

    CHECK(main.isVisible());
}

TEST_CASE("every call fails to send once the runtime has stopped", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    window.close();
    REQUIRE(headless.stopped());
    headless.finished.get();

    CHECK_THROWS_MATCHES(window.setTitle("late"), Error, HasKind(ErrorKind::FAILED_TO_SEND_MESSAGE));
    CHECK_THROWS_MATCHES(window.innerSize(), Error, HasKind(ErrorKind::FAILED_TO_SEND_MESSAGE));
    CHECK_THROWS_MATCHES(window.evalScript("late()"), Error, HasKind(ErrorKind::FAILED_TO_SEND_MESSAGE));
    CHECK_THROWS_MATCHES(window.runOnMainThread([]() {}), Error, HasKind(ErrorKind::FAILED_TO_SEND_MESSAGE));
    CHECK_THROWS_MATCHES(window.createWindow(PendingWindow()), Error, HasKind(ErrorKind::FAILED_TO_SEND_MESSAGE));
}

TEST_CASE("windows created from client threads get distinct ids", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow();
    headless.start();

    DetachedWindow second =
        main.createWindow(PendingWindow(WindowBuilder().title("second"), WebviewAttributes(), "second"));
    DetachedWindow third = headless.runtime->handle().createWindow(PendingWindow());

    CHECK(second.label == "second");
    CHECK(third.label == "main");
    CHECK(second.dispatcher.windowId() != main.windowId());
    CHECK(third.dispatcher.windowId() != second.dispatcher.windowId());
    CHECK(third.dispatcher.windowId() != main.windowId());
    CHECK(second.dispatcher.innerSize() == toPhysical(LogicalSize<double>(DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT), 1.0));
    CHECK(headless.state(second.dispatcher.windowId()).title == "second");
}

TEST_CASE("window construction failures reach the caller", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow();
    headless.start();

    SECTION("toolkit failure") {
        headless.controller->failNextWindow("no more windows");
        CHECK_THROWS_MATCHES(main.createWindow(PendingWindow()), Error, HasKind(ErrorKind::CREATE_WEBVIEW));
    }

    SECTION("undecodable icon") {
        PendingWindow pending(WindowBuilder().icon(Icon::fromBytes({0, 1, 2})), WebviewAttributes(), "broken");
        CHECK_THROWS_MATCHES(main.createWindow(std::move(pending)), Error, HasKind(ErrorKind::CREATE_WINDOW));
    }

    DetachedWindow next = main.createWindow(PendingWindow());
    CHECK(next.dispatcher.isVisible());
    CHECK(headless.controller->liveWindowIds().size() == 2);
}

TEST_CASE("window construction failures propagate from the loop thread", "[dispatcher]") {
    HeadlessRuntime headless;
    headless.controller->failNextWindow("display gone");
    CHECK_THROWS_MATCHES(headless.createWindow(), Error, HasKind(ErrorKind::CREATE_WEBVIEW));
    CHECK(headless.runtime->webviewCount() == 0);
}

TEST_CASE("a creation request is consumed only once", "[dispatcher]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow();
    headless.start();

    DispatcherContext context = main.context();
    auto handler = std::make_shared<OneShot<CreateWebviewHandler>>(
        [context](EventLoopTarget& target) { return createWebview(target, context, PendingWindow()); });

    Reply<WindowId> firstTx;
    std::future<WindowId> first = firstTx.get_future();
    context.send(CreateWebviewCommand{handler, std::move(firstTx)});

    Reply<WindowId> secondTx;
    std::future<WindowId> second = secondTx.get_future();
    context.send(CreateWebviewCommand{handler, std::move(secondTx)});

    CHECK(receiveReply(first) != main.windowId());
    CHECK_THROWS_MATCHES(receiveReply(second), Error, HasKind(ErrorKind::CREATE_WEBVIEW));
    CHECK(handler->taken());
}
