#include "dispatcher.h"

#include "webview_factory.h"

namespace webshell {

void DispatcherContext::send(Message message) const {
    if (!proxy->sendEvent(std::move(message))) {
        throw Error(ErrorKind::FAILED_TO_SEND_MESSAGE);
    }
}

void DispatcherContext::runOnMainThread(MainThreadTask task) const {
    if (!mainThreadTasks->send(std::move(task))) {
        throw Error(ErrorKind::FAILED_TO_SEND_MESSAGE);
    }
    proxy->wakeUp();
}

DetachedWindow createWindow(const DispatcherContext& context, PendingWindow pending) {
    std::string label = pending.label;

    CreateWebviewHandler build = [context, pending = std::move(pending)](EventLoopTarget& target) {
        return createWebview(target, context, pending);
    };

    Reply<WindowId> tx;
    std::future<WindowId> rx = tx.get_future();
    context.send(CreateWebviewCommand{
        std::make_shared<OneShot<CreateWebviewHandler>>(std::move(build)),
        std::move(tx)});

    WindowId windowId = receiveReply(rx);
    return DetachedWindow{label, Dispatcher(windowId, context)};
}

Dispatcher::Dispatcher(WindowId windowId, DispatcherContext context)
    : windowId_(windowId), context_(std::move(context)) {}

void Dispatcher::runOnMainThread(MainThreadTask task) const {
    context_.runOnMainThread(std::move(task));
}

ListenerId Dispatcher::onWindowEvent(std::function<void(const WindowEvent&)> handler) const {
    return context_.windowEventListeners->add(std::move(handler), windowId_);
}

bool Dispatcher::removeWindowEventListener(ListenerId id) const {
    return context_.windowEventListeners->remove(id);
}

ListenerId Dispatcher::onMenuEvent(std::function<void(const MenuEvent&)> handler) const {
    return context_.menuEventListeners->add(std::move(handler));
}

bool Dispatcher::removeMenuEventListener(ListenerId id) const {
    return context_.menuEventListeners->remove(id);
}

template<typename T, typename Getter>
T Dispatcher::request() const {
    Reply<T> tx;
    std::future<T> rx = tx.get_future();
    context_.send(WindowCommand{windowId_, Getter{std::move(tx)}});
    return receiveReply(rx);
}

void Dispatcher::sendWindowMessage(WindowMessage message) const {
    context_.send(WindowCommand{windowId_, std::move(message)});
}

// Getters

double Dispatcher::scaleFactor() const {
    return request<double, window_message::ScaleFactor>();
}

PhysicalPosition<int32_t> Dispatcher::innerPosition() const {
    return request<PhysicalPosition<int32_t>, window_message::InnerPosition>();
}

PhysicalPosition<int32_t> Dispatcher::outerPosition() const {
    return request<PhysicalPosition<int32_t>, window_message::OuterPosition>();
}

PhysicalSize<uint32_t> Dispatcher::innerSize() const {
    return request<PhysicalSize<uint32_t>, window_message::InnerSize>();
}

PhysicalSize<uint32_t> Dispatcher::outerSize() const {
    return request<PhysicalSize<uint32_t>, window_message::OuterSize>();
}

bool Dispatcher::isFullscreen() const {
    return request<bool, window_message::IsFullscreen>();
}

bool Dispatcher::isMaximized() const {
    return request<bool, window_message::IsMaximized>();
}

bool Dispatcher::isDecorated() const {
    return request<bool, window_message::IsDecorated>();
}

bool Dispatcher::isResizable() const {
    return request<bool, window_message::IsResizable>();
}

bool Dispatcher::isVisible() const {
    return request<bool, window_message::IsVisible>();
}

std::optional<Monitor> Dispatcher::currentMonitor() const {
    return request<std::optional<Monitor>, window_message::CurrentMonitor>();
}

std::optional<Monitor> Dispatcher::primaryMonitor() const {
    return request<std::optional<Monitor>, window_message::PrimaryMonitor>();
}

std::vector<Monitor> Dispatcher::availableMonitors() const {
    return request<std::vector<Monitor>, window_message::AvailableMonitors>();
}

DetachedWindow Dispatcher::createWindow(PendingWindow pending) const {
    return webshell::createWindow(context_, std::move(pending));
}

// Setters

void Dispatcher::setResizable(bool resizable) const {
    sendWindowMessage(window_message::SetResizable{resizable});
}

void Dispatcher::setTitle(const std::string& title) const {
    sendWindowMessage(window_message::SetTitle{title});
}

void Dispatcher::maximize() const {
    sendWindowMessage(window_message::Maximize{});
}

void Dispatcher::unmaximize() const {
    sendWindowMessage(window_message::Unmaximize{});
}

void Dispatcher::minimize() const {
    sendWindowMessage(window_message::Minimize{});
}

void Dispatcher::unminimize() const {
    sendWindowMessage(window_message::Unminimize{});
}

void Dispatcher::show() const {
    sendWindowMessage(window_message::Show{});
}

void Dispatcher::hide() const {
    sendWindowMessage(window_message::Hide{});
}

void Dispatcher::close() const {
    sendWindowMessage(window_message::Close{});
}

void Dispatcher::setDecorations(bool decorations) const {
    sendWindowMessage(window_message::SetDecorations{decorations});
}

void Dispatcher::setAlwaysOnTop(bool alwaysOnTop) const {
    sendWindowMessage(window_message::SetAlwaysOnTop{alwaysOnTop});
}

void Dispatcher::setSize(const Size& size) const {
    sendWindowMessage(window_message::SetSize{size});
}

void Dispatcher::setMinSize(const std::optional<Size>& size) const {
    sendWindowMessage(window_message::SetMinSize{size});
}

void Dispatcher::setMaxSize(const std::optional<Size>& size) const {
    sendWindowMessage(window_message::SetMaxSize{size});
}

void Dispatcher::setPosition(const Position& position) const {
    sendWindowMessage(window_message::SetPosition{position});
}

void Dispatcher::setFullscreen(bool fullscreen) const {
    sendWindowMessage(window_message::SetFullscreen{fullscreen});
}

void Dispatcher::setFocus() const {
    sendWindowMessage(window_message::SetFocus{});
}

void Dispatcher::setIcon(const Icon& icon) const {
    sendWindowMessage(window_message::SetIcon{context_.proxy->loadIcon(icon)});
}

void Dispatcher::setSkipTaskbar(bool skip) const {
    sendWindowMessage(window_message::SetSkipTaskbar{skip});
}

void Dispatcher::startDragging() const {
    sendWindowMessage(window_message::DragWindow{});
}

void Dispatcher::evalScript(const std::string& script) const {
    context_.send(WebviewCommand{windowId_, webview_message::EvaluateScript{script}});
}

void Dispatcher::print() const {
    context_.send(WebviewCommand{windowId_, webview_message::Print{}});
}

} // namespace webshell
