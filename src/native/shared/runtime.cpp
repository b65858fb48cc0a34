#include "runtime.h"

#include <cstdio>
#include <exception>
#include <string>

#include "webview_factory.h"

namespace webshell {

namespace {

// Answers a getter with the native value, or with whatever the native query threw
template<typename T, typename Query>
void fulfil(Reply<T>& tx, Query query) {
    try {
        tx.set_value(query());
    } catch (...) {
        tx.set_exception(std::current_exception());
    }
}

// Applies one window message to a live native window
struct WindowMessageApplier {
    AbstractWindow& window;

    void operator()(window_message::ScaleFactor& m) { fulfil(m.tx, [&] { return window.scaleFactor(); }); }
    void operator()(window_message::InnerPosition& m) { fulfil(m.tx, [&] { return window.innerPosition(); }); }
    void operator()(window_message::OuterPosition& m) { fulfil(m.tx, [&] { return window.outerPosition(); }); }
    void operator()(window_message::InnerSize& m) { fulfil(m.tx, [&] { return window.innerSize(); }); }
    void operator()(window_message::OuterSize& m) { fulfil(m.tx, [&] { return window.outerSize(); }); }
    void operator()(window_message::IsFullscreen& m) { fulfil(m.tx, [&] { return window.isFullscreen(); }); }
    void operator()(window_message::IsMaximized& m) { fulfil(m.tx, [&] { return window.isMaximized(); }); }
    void operator()(window_message::IsDecorated& m) { fulfil(m.tx, [&] { return window.isDecorated(); }); }
    void operator()(window_message::IsResizable& m) { fulfil(m.tx, [&] { return window.isResizable(); }); }
    void operator()(window_message::IsVisible& m) { fulfil(m.tx, [&] { return window.isVisible(); }); }
    void operator()(window_message::CurrentMonitor& m) { fulfil(m.tx, [&] { return window.currentMonitor(); }); }
    void operator()(window_message::PrimaryMonitor& m) { fulfil(m.tx, [&] { return window.primaryMonitor(); }); }
    void operator()(window_message::AvailableMonitors& m) { fulfil(m.tx, [&] { return window.availableMonitors(); }); }

    void operator()(window_message::SetResizable& m) { window.setResizable(m.resizable); }
    void operator()(window_message::SetTitle& m) { window.setTitle(m.title); }
    void operator()(window_message::Maximize&) { window.setMaximized(true); }
    void operator()(window_message::Unmaximize&) { window.setMaximized(false); }
    void operator()(window_message::Minimize&) { window.setMinimized(true); }
    void operator()(window_message::Unminimize&) { window.setMinimized(false); }
    void operator()(window_message::Show&) { window.setVisible(true); }
    void operator()(window_message::Hide&) { window.setVisible(false); }
    void operator()(window_message::Close&) {}  // handled by the runtime
    void operator()(window_message::SetDecorations& m) { window.setDecorations(m.decorations); }
    void operator()(window_message::SetAlwaysOnTop& m) { window.setAlwaysOnTop(m.alwaysOnTop); }
    void operator()(window_message::SetSize& m) { window.setInnerSize(m.size); }
    void operator()(window_message::SetMinSize& m) { window.setMinInnerSize(m.size); }
    void operator()(window_message::SetMaxSize& m) { window.setMaxInnerSize(m.size); }
    void operator()(window_message::SetPosition& m) { window.setOuterPosition(m.position); }
    void operator()(window_message::SetFullscreen& m) { window.setFullscreen(m.fullscreen); }
    void operator()(window_message::SetFocus&) { window.setFocus(); }
    void operator()(window_message::SetIcon& m) { window.setWindowIcon(m.icon); }
    void operator()(window_message::SetSkipTaskbar& m) { window.setSkipTaskbar(m.skip); }
    void operator()(window_message::DragWindow&) { window.dragWindow(); }
};

} // namespace

DetachedWindow RuntimeHandle::createWindow(PendingWindow pending) const {
    return webshell::createWindow(context_, std::move(pending));
}

void RuntimeHandle::runOnMainThread(MainThreadTask task) const {
    context_.runOnMainThread(std::move(task));
}

Runtime::Runtime(std::unique_ptr<EventLoop> eventLoop)
    : eventLoop_(std::move(eventLoop)),
      trayEventListeners_(std::make_shared<SystemTrayEventListeners>()) {
    context_.proxy = eventLoop_->createProxy();
    context_.mainThreadTasks = std::make_shared<MessageChannel<MainThreadTask>>();
    context_.windowEventListeners = std::make_shared<WindowEventListeners>();
    context_.menuEventListeners = std::make_shared<MenuEventListeners>();
}

Runtime::~Runtime() {
    context_.mainThreadTasks->close();
    std::map<WindowId, std::unique_ptr<AbstractWebview>> webviews;
    {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        webviews.swap(webviews_);
    }
    webviews.clear();
}

DetachedWindow Runtime::createWindow(PendingWindow pending) {
    std::string label = pending.label;
    std::unique_ptr<AbstractWebview> webview = createWebview(eventLoop_->target(), context_, pending);
    WindowId windowId = webview->window().id();
    {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        webviews_[windowId] = std::move(webview);
    }
    return DetachedWindow{label, Dispatcher(windowId, context_)};
}

void Runtime::systemTray(const Icon& icon, const std::vector<MenuItem>& menu) {
    eventLoop_->target().buildSystemTray(icon, menu);
}

ListenerId Runtime::onSystemTrayEvent(std::function<void(const SystemTrayEvent&)> handler) {
    return trayEventListeners_->add(std::move(handler));
}

bool Runtime::removeSystemTrayEventListener(ListenerId id) {
    return trayEventListeners_->remove(id);
}

size_t Runtime::webviewCount() const {
    std::lock_guard<std::mutex> lock(webviewsMutex_);
    return webviews_.size();
}

RunIteration Runtime::runIteration() {
    eventLoop_->runReturn([this](Event& event, EventLoopTarget& target, ControlFlow& controlFlow) {
        handleEvent(event, target, controlFlow);
    });

    RunIteration iteration;
    iteration.webviewCount = webviewCount();
    return iteration;
}

void Runtime::run() {
    eventLoop_->run([this](Event& event, EventLoopTarget& target, ControlFlow& controlFlow) {
        handleEvent(event, target, controlFlow);
    });

    // Tear down on the loop thread; queued tasks are dropped unrun
    context_.mainThreadTasks->close();
    std::map<WindowId, std::unique_ptr<AbstractWebview>> remaining;
    {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        remaining.swap(webviews_);
    }
    remaining.clear();
}

void Runtime::flushPendingScripts() {
    std::lock_guard<std::mutex> lock(webviewsMutex_);
    for (auto& entry : webviews_) {
        try {
            entry.second->evaluatePendingScripts();
        } catch (const std::exception& e) {
            fprintf(stderr, "ERROR: failed to evaluate script in window %u: %s\n", entry.first, e.what());
        }
    }
}

void Runtime::runMainThreadTasks() {
    while (std::optional<MainThreadTask> task = context_.mainThreadTasks->tryRecv()) {
        (*task)();
    }
}

void Runtime::handleEvent(Event& event, EventLoopTarget& target, ControlFlow& controlFlow) {
    flushPendingScripts();
    runMainThreadTasks();

    switch (event.type) {
        case Event::Type::MENU_EVENT:
            if (event.menuType == MenuType::SYSTEM_TRAY) {
                trayEventListeners_->emit(SystemTrayEvent{event.menuItemId});
            } else {
                context_.menuEventListeners->emit(MenuEvent{event.menuItemId});
            }
            break;
        case Event::Type::WINDOW_EVENT:
            handleWindowEvent(event.windowId, event.windowEvent, controlFlow);
            break;
        case Event::Type::USER_EVENT:
            if (event.message) {
                handleMessage(*event.message, target, controlFlow);
            }
            break;
        default:
            break;
    }
}

void Runtime::handleWindowEvent(WindowId windowId, const NativeWindowEvent& nativeEvent, ControlFlow& controlFlow) {
    std::optional<WindowEvent> event = translateWindowEvent(nativeEvent);
    if (!event) {
        return;
    }

    context_.windowEventListeners->emit(*event, windowId);

    if (event->type == WindowEventType::CLOSE_REQUESTED) {
        removeWebview(windowId, controlFlow);
    } else if (event->type == WindowEventType::RESIZED) {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        auto it = webviews_.find(windowId);
        if (it != webviews_.end()) {
            try {
                it->second->resize();
            } catch (const std::exception& e) {
                fprintf(stderr, "ERROR: failed to resize webview of window %u: %s\n", windowId, e.what());
            }
        }
    }
}

void Runtime::removeWebview(WindowId windowId, ControlFlow& controlFlow) {
    std::unique_ptr<AbstractWebview> removed;
    {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        auto it = webviews_.find(windowId);
        if (it == webviews_.end()) {
            return;
        }
        removed = std::move(it->second);
        webviews_.erase(it);
        if (webviews_.empty()) {
            controlFlow = ControlFlow::EXIT;
        }
    }
    // destroyed outside the table lock
}

void Runtime::handleMessage(Message& message, EventLoopTarget& target, ControlFlow& controlFlow) {
    if (auto* command = std::get_if<WindowCommand>(&message)) {
        handleWindowMessage(*command, controlFlow);
    } else if (auto* command = std::get_if<WebviewCommand>(&message)) {
        handleWebviewMessage(*command);
    } else if (auto* command = std::get_if<CreateWebviewCommand>(&message)) {
        handleCreateWebview(*command, target);
    }
}

void Runtime::handleWindowMessage(WindowCommand& command, ControlFlow& controlFlow) {
    if (std::holds_alternative<window_message::Close>(command.message)) {
        removeWebview(command.id, controlFlow);
        return;
    }

    std::lock_guard<std::mutex> lock(webviewsMutex_);
    auto it = webviews_.find(command.id);
    if (it == webviews_.end()) {
        // Setters are dropped; getters learn the window is gone
        WindowId windowId = command.id;
        std::visit([windowId](auto& m) {
            if constexpr (IsGetter<std::decay_t<decltype(m)>>::value) {
                m.tx.set_exception(std::make_exception_ptr(
                    Error(ErrorKind::WINDOW_NOT_FOUND, "window " + std::to_string(windowId))));
            }
        }, command.message);
        return;
    }

    try {
        std::visit(WindowMessageApplier{it->second->window()}, command.message);
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: window %u command failed: %s\n", command.id, e.what());
    }
}

void Runtime::handleWebviewMessage(WebviewCommand& command) {
    // Only this thread removes webviews, so the pointer outlives the lock. Printing may
    // spin a nested toolkit loop and must not hold it.
    AbstractWebview* webview = nullptr;
    {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        auto it = webviews_.find(command.id);
        if (it == webviews_.end()) {
            return;
        }
        webview = it->second.get();
    }

    if (auto* evaluate = std::get_if<webview_message::EvaluateScript>(&command.message)) {
        webview->dispatchScript(evaluate->script);
    } else if (std::holds_alternative<webview_message::Print>(command.message)) {
        try {
            webview->print();
        } catch (const std::exception& e) {
            printf("DEBUG: print ignored for window %u: %s\n", command.id, e.what());
        }
    }
}

void Runtime::handleCreateWebview(CreateWebviewCommand& command, EventLoopTarget& target) {
    std::optional<CreateWebviewHandler> handler = command.handler->take();
    if (!handler) {
        command.tx.set_exception(std::make_exception_ptr(
            Error(ErrorKind::CREATE_WEBVIEW, "window creation request already consumed")));
        return;
    }

    std::unique_ptr<AbstractWebview> webview;
    try {
        webview = (*handler)(target);
    } catch (const std::exception& e) {
        fprintf(stderr, "ERROR: %s\n", e.what());
        command.tx.set_exception(std::current_exception());
        return;
    }

    WindowId windowId = webview->window().id();
    {
        std::lock_guard<std::mutex> lock(webviewsMutex_);
        webviews_[windowId] = std::move(webview);
    }
    command.tx.set_value(windowId);
}

} // namespace webshell
