#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "../src/native/shared/listeners.h"

using namespace webshell;

TEST_CASE("listener ids are unique across registries", "[listeners]") {
    WindowEventListeners windows;
    MenuEventListeners menus;
    ListenerId a = windows.add([](const WindowEvent&) {});
    ListenerId b = menus.add([](const MenuEvent&) {});
    ListenerId c = windows.add([](const WindowEvent&) {});
    CHECK(a != b);
    CHECK(b != c);
    CHECK(a != c);
}

TEST_CASE("every listener sees each event exactly once", "[listeners]") {
    MenuEventListeners listeners;
    std::vector<std::string> first;
    std::vector<std::string> second;
    listeners.add([&first](const MenuEvent& event) { first.push_back(event.menuItemId); });
    listeners.add([&second](const MenuEvent& event) { second.push_back(event.menuItemId); });

    listeners.emit(MenuEvent{"copy"});
    CHECK(first == std::vector<std::string>{"copy"});
    CHECK(second == std::vector<std::string>{"copy"});
}

TEST_CASE("window-bound listeners only see their window", "[listeners]") {
    WindowEventListeners listeners;
    int boundCalls = 0;
    int unboundCalls = 0;
    listeners.add([&boundCalls](const WindowEvent&) { boundCalls++; }, WindowId(1));
    listeners.add([&unboundCalls](const WindowEvent&) { unboundCalls++; });

    WindowEvent event;
    listeners.emit(event, WindowId(2));
    CHECK(boundCalls == 0);
    CHECK(unboundCalls == 1);

    listeners.emit(event, WindowId(1));
    CHECK(boundCalls == 1);
    CHECK(unboundCalls == 2);

    listeners.emit(event);
    CHECK(boundCalls == 2);
}

TEST_CASE("removed listeners stop receiving events", "[listeners]") {
    SystemTrayEventListeners listeners;
    int calls = 0;
    ListenerId id = listeners.add([&calls](const SystemTrayEvent&) { calls++; });
    CHECK(listeners.size() == 1);

    CHECK(listeners.remove(id));
    CHECK_FALSE(listeners.remove(id));
    CHECK(listeners.size() == 0);

    listeners.emit(SystemTrayEvent{"quit"});
    CHECK(calls == 0);
}

TEST_CASE("listeners may change the registry while an event is emitted", "[listeners]") {
    MenuEventListeners listeners;
    int selfRemovingCalls = 0;
    int addedCalls = 0;
    ListenerId selfRemoving = 0;

    selfRemoving = listeners.add([&](const MenuEvent&) {
        selfRemovingCalls++;
        listeners.remove(selfRemoving);
        listeners.add([&addedCalls](const MenuEvent&) { addedCalls++; });
    });

    listeners.emit(MenuEvent{"a"});
    CHECK(selfRemovingCalls == 1);
    CHECK(addedCalls == 0);

    listeners.emit(MenuEvent{"b"});
    CHECK(selfRemovingCalls == 1);
    CHECK(addedCalls == 1);
}

TEST_CASE("ThreadSafeMap snapshots values in key order", "[listeners]") {
    ThreadSafeMap<int, std::string> map;
    map.set(2, "two");
    map.set(1, "one");
    map.set(2, "deux");
    CHECK(map.size() == 2);

    std::vector<std::string> snapshot = map.values();
    CHECK(map.remove(1));
    CHECK_FALSE(map.remove(1));
    CHECK(snapshot == std::vector<std::string>{"one", "deux"});
    CHECK(map.values() == std::vector<std::string>{"deux"});
}
