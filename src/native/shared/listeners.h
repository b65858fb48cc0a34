// listeners.h - Event listener registries shared by every dispatcher of a runtime
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_LISTENERS_H
#define WEBSHELL_LISTENERS_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "thread_safe_map.h"
#include "window_event.h"

namespace webshell {

typedef uint64_t ListenerId;

// Process-unique, never reused
inline ListenerId nextListenerId() {
    static std::atomic<ListenerId> nextId{1};
    return nextId++;
}

// Registration id -> callback. A listener bound to a window only sees that window's events.
// Dispatch order between listeners is unspecified.
template<typename EventType>
class ListenerRegistry {
public:
    typedef std::function<void(const EventType&)> Handler;

    ListenerId add(Handler handler, std::optional<WindowId> window = std::nullopt) {
        ListenerId id = nextListenerId();
        entries_.set(id, Entry{window, std::make_shared<Handler>(std::move(handler))});
        return id;
    }

    bool remove(ListenerId id) {
        return entries_.remove(id);
    }

    size_t size() const {
        return entries_.size();
    }

    // Listeners run outside the registry lock, so they may add or remove listeners
    void emit(const EventType& event, std::optional<WindowId> source = std::nullopt) const {
        for (const auto& entry : entries_.values()) {
            if (entry.window && source && *entry.window != *source) {
                continue;
            }
            (*entry.handler)(event);
        }
    }

private:
    struct Entry {
        std::optional<WindowId> window;
        std::shared_ptr<Handler> handler;
    };

    ThreadSafeMap<ListenerId, Entry> entries_;
};

typedef ListenerRegistry<WindowEvent> WindowEventListeners;
typedef ListenerRegistry<MenuEvent> MenuEventListeners;
typedef ListenerRegistry<SystemTrayEvent> SystemTrayEventListeners;

} // namespace webshell

#endif // WEBSHELL_LISTENERS_H
