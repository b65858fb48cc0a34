#include <catch2/catch.hpp>

#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support.h"

using namespace webshell;

TEST_CASE("a window created from a client thread closes the loop down", "[runtime]") {
    HeadlessRuntime headless;
    headless.start();

    RuntimeHandle handle = headless.runtime->handle();
    std::future<DetachedWindow> created = std::async(std::launch::async, [handle]() {
        return handle.createWindow(PendingWindow(WindowBuilder().title("A"), WebviewAttributes(), "a"));
    });
    REQUIRE(created.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    Dispatcher window = created.get().dispatcher;

    std::future<PhysicalSize<uint32_t>> size =
        std::async(std::launch::async, [window]() { return window.innerSize(); });
    REQUIRE(size.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK(size.get() == toPhysical(LogicalSize<double>(DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT), 1.0));

    window.close();
    REQUIRE(headless.stopped());
    headless.finished.get();
    CHECK(headless.runtime->webviewCount() == 0);
    CHECK(headless.controller->liveWindowIds().empty());
}

TEST_CASE("closing every window ends run", "[runtime]") {
    HeadlessRuntime headless;
    std::vector<WindowId> ids;
    for (int i = 0; i < 5; i++) {
        ids.push_back(headless.createWindow("window " + std::to_string(i)).windowId());
    }
    CHECK(std::set<WindowId>(ids.begin(), ids.end()).size() == ids.size());
    CHECK(headless.runtime->webviewCount() == 5);
    headless.start();

    for (size_t i = 0; i + 1 < ids.size(); i++) {
        headless.controller->simulateCloseRequested(ids[i]);
    }
    headless.drain();
    CHECK_FALSE(headless.stopped(std::chrono::milliseconds(0)));
    CHECK(headless.controller->liveWindowIds() == std::vector<WindowId>{ids.back()});

    headless.controller->simulateCloseRequested(ids.back());
    REQUIRE(headless.stopped());
    headless.finished.get();
    CHECK(headless.runtime->webviewCount() == 0);
}

TEST_CASE("every listener sees a close request exactly once", "[runtime]") {
    Recorder<WindowEventType> first;
    Recorder<WindowEventType> second;
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    window.onWindowEvent([&first](const WindowEvent& event) { first.push(event.type); });
    window.onWindowEvent([&second](const WindowEvent& event) { second.push(event.type); });
    headless.start();

    headless.controller->simulateCloseRequested(window.windowId());
    REQUIRE(headless.stopped());
    headless.finished.get();

    CHECK(first.items() == std::vector<WindowEventType>{WindowEventType::CLOSE_REQUESTED});
    CHECK(second.items() == std::vector<WindowEventType>{WindowEventType::CLOSE_REQUESTED});
}

TEST_CASE("window listeners only hear about their own window", "[runtime]") {
    Recorder<WindowId> seenByFirst;
    HeadlessRuntime headless;
    Dispatcher first = headless.createWindow("first");
    Dispatcher second = headless.createWindow("second", "second");
    WindowId firstId = first.windowId();
    first.onWindowEvent([&seenByFirst, firstId](const WindowEvent&) { seenByFirst.push(firstId); });
    headless.start();

    headless.controller->simulateResize(second.windowId(), 300, 300);
    headless.controller->simulateMove(second.windowId(), 5, 5);
    headless.drain();
    CHECK(seenByFirst.size() == 0);

    headless.controller->simulateMove(first.windowId(), 5, 5);
    headless.drain();
    CHECK(seenByFirst.size() == 1);
}

TEST_CASE("native window events are translated for listeners", "[runtime]") {
    Recorder<WindowEvent> events;
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    window.onWindowEvent([&events](const WindowEvent& event) { events.push(event); });
    headless.start();

    WindowId id = window.windowId();
    headless.controller->simulateResize(id, 1280, 720);
    headless.controller->simulateMove(id, -40, 12);
    headless.controller->simulateFocus(id, true);
    headless.controller->simulateScaleFactorChange(id, 2.0);
    headless.controller->simulateNativeEvent(id, NativeWindowEvent::of(NativeWindowEventType::CURSOR_MOVED));
    headless.controller->simulateNativeEvent(id, NativeWindowEvent::of(NativeWindowEventType::THEME_CHANGED));
    headless.drain();

    std::vector<WindowEvent> seen = events.items();
    REQUIRE(seen.size() == 4);
    CHECK(seen[0].type == WindowEventType::RESIZED);
    CHECK(seen[0].size == PhysicalSize<uint32_t>(1280, 720));
    CHECK(seen[1].type == WindowEventType::MOVED);
    CHECK(seen[1].position == PhysicalPosition<int32_t>(-40, 12));
    CHECK(seen[2].type == WindowEventType::FOCUSED);
    CHECK(seen[2].focused);
    CHECK(seen[3].type == WindowEventType::SCALE_FACTOR_CHANGED);
    CHECK(seen[3].scaleFactor == 2.0);
    CHECK(seen[3].size == PhysicalSize<uint32_t>(2560, 1440));

    CHECK(window.scaleFactor() == 2.0);
}

TEST_CASE("a resize refits the webview", "[runtime]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    headless.controller->simulateResize(window.windowId(), 640, 480);
    window.setSize(Size::physical(700, 500));
    headless.drain();

    CHECK(headless.state(window.windowId()).resizeCount == 2);
    CHECK(window.innerSize() == PhysicalSize<uint32_t>(700, 500));
}

TEST_CASE("a destroyed window reports DESTROYED to its listeners", "[runtime]") {
    Recorder<WindowEventType> events;
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow("main");
    Dispatcher popup = headless.createWindow("popup", "popup");
    popup.onWindowEvent([&events](const WindowEvent& event) { events.push(event.type); });
    headless.start();

    popup.close();
    headless.drain();

    CHECK(events.items() == std::vector<WindowEventType>{WindowEventType::DESTROYED});
    CHECK(headless.state(popup.windowId()).destroyed);
    CHECK_FALSE(headless.state(main.windowId()).destroyed);
    CHECK(headless.runtime->webviewCount() == 1);
}

TEST_CASE("removed window listeners are not called", "[runtime]") {
    Recorder<WindowEventType> kept;
    Recorder<WindowEventType> removed;
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    window.onWindowEvent([&kept](const WindowEvent& event) { kept.push(event.type); });
    ListenerId id = window.onWindowEvent([&removed](const WindowEvent& event) { removed.push(event.type); });
    CHECK(window.removeWindowEventListener(id));
    CHECK_FALSE(window.removeWindowEventListener(id));
    headless.start();

    headless.controller->simulateFocus(window.windowId(), true);
    headless.drain();
    CHECK(kept.size() == 1);
    CHECK(removed.size() == 0);
}

TEST_CASE("menubar selections go to every menu listener", "[runtime]") {
    Recorder<std::string> first;
    Recorder<std::string> second;
    Recorder<std::string> tray;
    HeadlessRuntime headless;
    Dispatcher a = headless.createWindow("a");
    Dispatcher b = headless.createWindow("b", "b");
    a.onMenuEvent([&first](const MenuEvent& event) { first.push(event.menuItemId); });
    ListenerId removable = b.onMenuEvent([&second](const MenuEvent& event) { second.push(event.menuItemId); });
    headless.runtime->onSystemTrayEvent([&tray](const SystemTrayEvent& event) { tray.push(event.menuItemId); });
    headless.start();

    headless.controller->simulateMenuClick("copy", MenuType::MENUBAR);
    headless.drain();
    CHECK(first.items() == std::vector<std::string>{"copy"});
    CHECK(second.items() == std::vector<std::string>{"copy"});
    CHECK(tray.size() == 0);

    CHECK(b.removeMenuEventListener(removable));
    headless.controller->simulateMenuClick("paste", MenuType::MENUBAR);
    headless.drain();
    CHECK(first.items() == std::vector<std::string>{"copy", "paste"});
    CHECK(second.items() == std::vector<std::string>{"copy"});
}

TEST_CASE("system tray selections go to tray listeners only", "[runtime]") {
    Recorder<std::string> tray;
    Recorder<std::string> menu;
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();

    headless.runtime->systemTray(Icon::fromBytes(pngHeader(22, 22)), {
        MenuItem::item("show", "Show"),
        MenuItem::separator(),
        MenuItem::item("quit", "Quit"),
    });
    std::optional<std::vector<MenuItem>> trayMenu = headless.controller->trayMenu();
    REQUIRE(trayMenu);
    CHECK(trayMenu->size() == 3);

    ListenerId id = headless.runtime->onSystemTrayEvent([&tray](const SystemTrayEvent& event) {
        tray.push(event.menuItemId);
    });
    window.onMenuEvent([&menu](const MenuEvent& event) { menu.push(event.menuItemId); });
    headless.start();

    headless.controller->simulateMenuClick("show", MenuType::SYSTEM_TRAY);
    headless.drain();
    CHECK(tray.items() == std::vector<std::string>{"show"});
    CHECK(menu.size() == 0);

    CHECK(headless.runtime->removeSystemTrayEventListener(id));
    CHECK_FALSE(headless.runtime->removeSystemTrayEventListener(id));
    headless.controller->simulateMenuClick("quit", MenuType::SYSTEM_TRAY);
    headless.drain();
    CHECK(tray.size() == 1);
}

TEST_CASE("a tray needs a decodable icon", "[runtime]") {
    HeadlessRuntime headless;
    CHECK_THROWS_MATCHES(headless.runtime->systemTray(Icon::fromBytes({1, 2}), {}), Error,
                         HasKind(ErrorKind::INVALID_ICON));
    CHECK_FALSE(headless.controller->trayMenu());
}

TEST_CASE("main thread tasks run on the loop thread in order", "[runtime]") {
    Recorder<int> order;
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    std::promise<std::thread::id> loopThread;
    std::future<std::thread::id> ran = loopThread.get_future();
    for (int i = 0; i < 3; i++) {
        window.runOnMainThread([&order, i]() { order.push(i); });
    }
    headless.runtime->handle().runOnMainThread([&loopThread]() { loopThread.set_value(std::this_thread::get_id()); });

    REQUIRE(ran.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK(ran.get() != std::this_thread::get_id());
    CHECK(order.items() == std::vector<int>{0, 1, 2});
}

TEST_CASE("a main thread task may issue setters", "[runtime]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    std::promise<void> done;
    std::future<void> finished = done.get_future();
    window.runOnMainThread([window, &done]() {
        window.setTitle("from the loop");
        done.set_value();
    });
    REQUIRE(finished.wait_for(TEST_TIMEOUT) == std::future_status::ready);

    headless.drain();
    CHECK(headless.state(window.windowId()).title == "from the loop");
}

TEST_CASE("runIteration pumps the loop from the calling thread", "[runtime]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    bool taskRan = false;
    window.runOnMainThread([&taskRan]() { taskRan = true; });
    window.setTitle("pumped");
    window.evalScript("tick()");

    RunIteration iteration = headless.runtime->runIteration();
    CHECK(iteration.webviewCount == 1);
    CHECK(taskRan);

    HeadlessWindowState state = headless.state(window.windowId());
    CHECK(state.title == "pumped");
    CHECK(state.evaluatedScripts == std::vector<std::string>{"tick()"});

    window.close();
    iteration = headless.runtime->runIteration();
    CHECK(iteration.webviewCount == 0);
    CHECK(headless.state(window.windowId()).destroyed);
}

TEST_CASE("an exception thrown by a listener unwinds out of run", "[runtime]") {
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    window.onWindowEvent([](const WindowEvent& event) {
        if (event.type == WindowEventType::MOVED) {
            throw std::runtime_error("listener failed");
        }
    });
    headless.start();

    headless.controller->simulateMove(window.windowId(), 1, 1);
    REQUIRE(headless.stopped());
    CHECK_THROWS_WITH(headless.finished.get(), "listener failed");
    CHECK_THROWS_MATCHES(window.setTitle("after"), Error, HasKind(ErrorKind::FAILED_TO_SEND_MESSAGE));
}

TEST_CASE("a second close request for the same window is ignored", "[runtime]") {
    HeadlessRuntime headless;
    Dispatcher main = headless.createWindow("main");
    Dispatcher other = headless.createWindow("other", "other");
    headless.start();

    headless.controller->simulateCloseRequested(other.windowId());
    headless.controller->simulateCloseRequested(other.windowId());
    other.close();
    headless.drain();

    CHECK(headless.runtime->webviewCount() == 1);
    CHECK(main.isVisible());
}

TEST_CASE("a getter queued behind the last close fails instead of hanging", "[runtime]") {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    headless.start();

    // Holds the loop so the close and the getter queue up behind each other
    window.runOnMainThread([gate]() { gate.wait(); });

    std::promise<void> closeSent;
    std::future<void> closed = closeSent.get_future();
    std::future<ErrorKind> failure = std::async(std::launch::async, [window, &closeSent]() {
        window.close();
        closeSent.set_value();
        try {
            window.innerSize();
        } catch (const Error& e) {
            return e.kind();
        }
        return ErrorKind::WINDOW_NOT_FOUND;
    });
    closed.wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();

    REQUIRE(failure.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    ErrorKind kind = failure.get();
    CHECK((kind == ErrorKind::FAILED_TO_RECEIVE_MESSAGE || kind == ErrorKind::FAILED_TO_SEND_MESSAGE));
    REQUIRE(headless.stopped());
    headless.finished.get();
}

TEST_CASE("printing leaves the window table usable from the print dialog", "[runtime]") {
    std::promise<size_t> seen;
    HeadlessRuntime headless;
    Dispatcher window = headless.createWindow();
    Runtime* runtime = headless.runtime.get();
    headless.controller->onPrintDialog([runtime, &seen](WindowId) {
        seen.set_value(runtime->webviewCount());
    });
    headless.start();

    std::future<size_t> count = seen.get_future();
    window.print();
    REQUIRE(count.wait_for(TEST_TIMEOUT) == std::future_status::ready);
    CHECK(count.get() == 1);
    CHECK(headless.state(window.windowId()).printCount == 1);
}
