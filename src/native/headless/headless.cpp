#include "headless.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "../shared/error.h"

namespace webshell {

namespace {

const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
const uint32_t MAX_ICON_DIMENSION = 4096;

uint32_t readBigEndian32(const std::vector<uint8_t>& bytes, size_t offset) {
    return (static_cast<uint32_t>(bytes[offset]) << 24) |
           (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 8) |
           static_cast<uint32_t>(bytes[offset + 3]);
}

std::string describeSize(const PhysicalSize<uint32_t>& size) {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

PhysicalSize<uint32_t> clampSize(PhysicalSize<uint32_t> size,
                                 const std::optional<PhysicalSize<uint32_t>>& minSize,
                                 const std::optional<PhysicalSize<uint32_t>>& maxSize) {
    if (minSize) {
        size.width = std::max(size.width, minSize->width);
        size.height = std::max(size.height, minSize->height);
    }
    if (maxSize) {
        size.width = std::min(size.width, maxSize->width);
        size.height = std::min(size.height, maxSize->height);
    }
    return size;
}

std::vector<Monitor> defaultMonitors() {
    Monitor monitor;
    monitor.name = "HEADLESS-1";
    monitor.size = PhysicalSize<uint32_t>(1920, 1080);
    return {monitor};
}

} // namespace

WindowIcon decodeHeadlessIcon(const Icon& icon) {
    std::vector<uint8_t> bytes = icon.bytes;
    if (icon.source == Icon::Source::FILE) {
        std::ifstream file(icon.path, std::ios::binary);
        if (!file) {
            throw Error(ErrorKind::INVALID_ICON, "cannot read " + icon.path);
        }
        bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    // signature, IHDR length and type, width, height
    if (bytes.size() < 24 || !std::equal(PNG_SIGNATURE, PNG_SIGNATURE + 8, bytes.begin()) ||
        bytes[12] != 'I' || bytes[13] != 'H' || bytes[14] != 'D' || bytes[15] != 'R') {
        throw Error(ErrorKind::INVALID_ICON, "not a PNG image");
    }

    WindowIcon decoded;
    decoded.width = readBigEndian32(bytes, 16);
    decoded.height = readBigEndian32(bytes, 20);
    if (decoded.width == 0 || decoded.height == 0 ||
        decoded.width > MAX_ICON_DIMENSION || decoded.height > MAX_ICON_DIMENSION) {
        throw Error(ErrorKind::INVALID_ICON, "unsupported icon dimensions");
    }
    decoded.rgba.assign(static_cast<size_t>(decoded.width) * decoded.height * 4, 0);
    return decoded;
}

// HeadlessState

void HeadlessState::push(Event event) {
    HeadlessQueueItem item;
    item.event = std::move(event);
    if (!queue.send(std::move(item))) {
        printf("DEBUG: event dropped, event loop already closed\n");
    }
}

void HeadlessState::pushCallback(std::function<void()> callback) {
    HeadlessQueueItem item;
    item.callback = std::move(callback);
    if (!queue.send(std::move(item))) {
        printf("DEBUG: native callback dropped, event loop already closed\n");
    }
}

// HeadlessWindow

HeadlessWindow::HeadlessWindow(std::shared_ptr<HeadlessState> state, WindowId id)
    : state_(std::move(state)), id_(id) {}

template<typename Fn>
auto HeadlessWindow::withState(Fn fn) -> decltype(fn(std::declval<HeadlessWindowState&>())) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return fn(state_->windows[id_]);
}

double HeadlessWindow::scaleFactor() {
    return withState([](HeadlessWindowState& s) { return s.scaleFactor; });
}

PhysicalPosition<int32_t> HeadlessWindow::innerPosition() {
    return withState([](HeadlessWindowState& s) {
        int32_t titleBar = s.decorated && !s.fullscreen ? HEADLESS_TITLE_BAR_HEIGHT : 0;
        return PhysicalPosition<int32_t>(s.position.x, s.position.y + titleBar);
    });
}

PhysicalPosition<int32_t> HeadlessWindow::outerPosition() {
    return withState([](HeadlessWindowState& s) { return s.position; });
}

PhysicalSize<uint32_t> HeadlessWindow::innerSize() {
    return withState([](HeadlessWindowState& s) { return s.innerSize; });
}

PhysicalSize<uint32_t> HeadlessWindow::outerSize() {
    return withState([](HeadlessWindowState& s) {
        uint32_t titleBar = s.decorated && !s.fullscreen ? HEADLESS_TITLE_BAR_HEIGHT : 0;
        return PhysicalSize<uint32_t>(s.innerSize.width, s.innerSize.height + titleBar);
    });
}

bool HeadlessWindow::isFullscreen() {
    return withState([](HeadlessWindowState& s) { return s.fullscreen; });
}

bool HeadlessWindow::isMaximized() {
    return withState([](HeadlessWindowState& s) { return s.maximized; });
}

bool HeadlessWindow::isDecorated() {
    return withState([](HeadlessWindowState& s) { return s.decorated; });
}

bool HeadlessWindow::isResizable() {
    return withState([](HeadlessWindowState& s) { return s.resizable; });
}

bool HeadlessWindow::isVisible() {
    return withState([](HeadlessWindowState& s) { return s.visible; });
}

std::optional<Monitor> HeadlessWindow::currentMonitor() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    const HeadlessWindowState& window = state_->windows[id_];
    for (const auto& monitor : state_->monitors) {
        if (window.position.x >= monitor.position.x &&
            window.position.y >= monitor.position.y &&
            window.position.x < monitor.position.x + static_cast<int32_t>(monitor.size.width) &&
            window.position.y < monitor.position.y + static_cast<int32_t>(monitor.size.height)) {
            return monitor;
        }
    }
    if (state_->monitors.empty()) {
        return std::nullopt;
    }
    return state_->monitors.front();
}

std::optional<Monitor> HeadlessWindow::primaryMonitor() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->monitors.empty()) {
        return std::nullopt;
    }
    return state_->monitors.front();
}

std::vector<Monitor> HeadlessWindow::availableMonitors() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->monitors;
}

void HeadlessWindow::setResizable(bool resizable) {
    withState([&](HeadlessWindowState& s) {
        s.resizable = resizable;
        s.history.push_back(std::string("setResizable ") + (resizable ? "true" : "false"));
    });
}

void HeadlessWindow::setTitle(const std::string& title) {
    withState([&](HeadlessWindowState& s) {
        s.title = title;
        s.history.push_back("setTitle " + title);
    });
}

void HeadlessWindow::setMaximized(bool maximized) {
    withState([&](HeadlessWindowState& s) {
        s.maximized = maximized;
        s.history.push_back(maximized ? "maximize" : "unmaximize");
    });
}

void HeadlessWindow::setMinimized(bool minimized) {
    withState([&](HeadlessWindowState& s) {
        s.minimized = minimized;
        s.history.push_back(minimized ? "minimize" : "unminimize");
    });
}

void HeadlessWindow::setVisible(bool visible) {
    withState([&](HeadlessWindowState& s) {
        s.visible = visible;
        s.history.push_back(visible ? "show" : "hide");
    });
}

void HeadlessWindow::setDecorations(bool decorations) {
    withState([&](HeadlessWindowState& s) {
        s.decorated = decorations;
        s.history.push_back(std::string("setDecorations ") + (decorations ? "true" : "false"));
    });
}

void HeadlessWindow::setAlwaysOnTop(bool alwaysOnTop) {
    withState([&](HeadlessWindowState& s) {
        s.alwaysOnTop = alwaysOnTop;
        s.history.push_back(std::string("setAlwaysOnTop ") + (alwaysOnTop ? "true" : "false"));
    });
}

void HeadlessWindow::setInnerSize(const Size& size) {
    PhysicalSize<uint32_t> applied = withState([&](HeadlessWindowState& s) {
        s.innerSize = clampSize(size.toPhysical(s.scaleFactor), s.minInnerSize, s.maxInnerSize);
        s.history.push_back("setSize " + describeSize(s.innerSize));
        return s.innerSize;
    });
    state_->push(Event::window(id_, NativeWindowEvent::resized(applied.width, applied.height)));
}

void HeadlessWindow::setMinInnerSize(const std::optional<Size>& size) {
    withState([&](HeadlessWindowState& s) {
        if (size) {
            s.minInnerSize = size->toPhysical(s.scaleFactor);
            s.innerSize = clampSize(s.innerSize, s.minInnerSize, s.maxInnerSize);
            s.history.push_back("setMinSize " + describeSize(*s.minInnerSize));
        } else {
            s.minInnerSize.reset();
            s.history.push_back("setMinSize none");
        }
    });
}

void HeadlessWindow::setMaxInnerSize(const std::optional<Size>& size) {
    withState([&](HeadlessWindowState& s) {
        if (size) {
            s.maxInnerSize = size->toPhysical(s.scaleFactor);
            s.innerSize = clampSize(s.innerSize, s.minInnerSize, s.maxInnerSize);
            s.history.push_back("setMaxSize " + describeSize(*s.maxInnerSize));
        } else {
            s.maxInnerSize.reset();
            s.history.push_back("setMaxSize none");
        }
    });
}

void HeadlessWindow::setOuterPosition(const Position& position) {
    PhysicalPosition<int32_t> applied = withState([&](HeadlessWindowState& s) {
        s.position = position.toPhysical(s.scaleFactor);
        s.history.push_back("setPosition " + std::to_string(s.position.x) + "," + std::to_string(s.position.y));
        return s.position;
    });
    state_->push(Event::window(id_, NativeWindowEvent::moved(applied.x, applied.y)));
}

void HeadlessWindow::setFullscreen(bool fullscreen) {
    withState([&](HeadlessWindowState& s) {
        s.fullscreen = fullscreen;
        s.history.push_back(std::string("setFullscreen ") + (fullscreen ? "true" : "false"));
    });
}

void HeadlessWindow::setFocus() {
    bool changed = withState([&](HeadlessWindowState& s) {
        bool wasFocused = s.focused;
        s.focused = true;
        s.history.push_back("setFocus");
        return !wasFocused;
    });
    if (changed) {
        state_->push(Event::window(id_, NativeWindowEvent::focusChanged(true)));
    }
}

void HeadlessWindow::setWindowIcon(const WindowIcon& icon) {
    withState([&](HeadlessWindowState& s) {
        s.icon = icon;
        s.history.push_back("setIcon " + std::to_string(icon.width) + "x" + std::to_string(icon.height));
    });
}

void HeadlessWindow::setSkipTaskbar(bool skip) {
    withState([&](HeadlessWindowState& s) {
        s.skipTaskbar = skip;
        s.history.push_back(std::string("setSkipTaskbar ") + (skip ? "true" : "false"));
    });
}

void HeadlessWindow::dragWindow() {
    withState([&](HeadlessWindowState& s) {
        s.dragCount++;
        s.history.push_back("dragWindow");
    });
}

// HeadlessWebview

HeadlessWebview::HeadlessWebview(std::shared_ptr<HeadlessState> state, WindowId id, NativeWebviewOptions options)
    : state_(state), window_(state, id), options_(std::move(options)) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->webviews[id] = this;
}

HeadlessWebview::~HeadlessWebview() {
    WindowId id = window_.id();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->webviews.erase(id);
        state_->windows[id].destroyed = true;
    }
    state_->push(Event::window(id, NativeWindowEvent::of(NativeWindowEventType::DESTROYED)));
}

void HeadlessWebview::evaluateJavaScript(const std::string& script) {
    if (script.empty()) {
        throw std::runtime_error("SyntaxError: empty script");
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->windows[window_.id()].evaluatedScripts.push_back(script);
}

void HeadlessWebview::print() {
    std::function<void(WindowId)> dialog;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->windows[window_.id()].printCount++;
        dialog = state_->printDialog;
    }
    if (dialog) {
        dialog(window_.id());
    }
}

void HeadlessWebview::resize() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->windows[window_.id()].resizeCount++;
}

// HeadlessProxy

bool HeadlessProxy::sendEvent(Message message) {
    HeadlessQueueItem item;
    item.event = Event::user(std::move(message));
    return state_->queue.send(std::move(item));
}

void HeadlessProxy::wakeUp() {
    state_->queue.wakeUp();
}

WindowIcon HeadlessProxy::loadIcon(const Icon& icon) const {
    return decodeHeadlessIcon(icon);
}

// HeadlessController

std::optional<HeadlessWindowState> HeadlessController::windowState(WindowId id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->windows.find(id);
    if (it == state_->windows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<WindowId> HeadlessController::liveWindowIds() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<WindowId> ids;
    for (const auto& entry : state_->windows) {
        if (!entry.second.destroyed) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

std::optional<std::vector<MenuItem>> HeadlessController::trayMenu() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->trayMenu;
}

void HeadlessController::setMonitors(std::vector<Monitor> monitors) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->monitors = std::move(monitors);
}

void HeadlessController::failNextWindow(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->nextWindowFailure = reason;
}

void HeadlessController::onPrintDialog(std::function<void(WindowId)> hook) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->printDialog = std::move(hook);
}

void HeadlessController::simulateCloseRequested(WindowId id) {
    state_->push(Event::window(id, NativeWindowEvent::of(NativeWindowEventType::CLOSE_REQUESTED)));
}

void HeadlessController::simulateResize(WindowId id, uint32_t width, uint32_t height) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->windows.find(id);
        if (it != state_->windows.end()) {
            it->second.innerSize = PhysicalSize<uint32_t>(width, height);
        }
    }
    state_->push(Event::window(id, NativeWindowEvent::resized(width, height)));
}

void HeadlessController::simulateMove(WindowId id, int32_t x, int32_t y) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->windows.find(id);
        if (it != state_->windows.end()) {
            it->second.position = PhysicalPosition<int32_t>(x, y);
        }
    }
    state_->push(Event::window(id, NativeWindowEvent::moved(x, y)));
}

void HeadlessController::simulateFocus(WindowId id, bool focused) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->windows.find(id);
        if (it != state_->windows.end()) {
            it->second.focused = focused;
        }
    }
    state_->push(Event::window(id, NativeWindowEvent::focusChanged(focused)));
}

void HeadlessController::simulateScaleFactorChange(WindowId id, double scaleFactor) {
    PhysicalSize<uint32_t> size;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->windows.find(id);
        if (it != state_->windows.end()) {
            LogicalSize<double> logical = toLogical(it->second.innerSize, it->second.scaleFactor);
            it->second.scaleFactor = scaleFactor;
            it->second.innerSize = toPhysical(logical, scaleFactor);
            size = it->second.innerSize;
        }
    }
    state_->push(Event::window(id, NativeWindowEvent::scaleFactorChanged(scaleFactor, size.width, size.height)));
}

void HeadlessController::simulateNativeEvent(WindowId id, const NativeWindowEvent& event) {
    state_->push(Event::window(id, event));
}

void HeadlessController::simulateMenuClick(const std::string& menuItemId, MenuType menuType) {
    state_->push(Event::menu(menuItemId, menuType));
}

std::future<std::optional<RpcResponse>> HeadlessController::simulateRpc(WindowId id, const RpcRequest& request) {
    auto reply = std::make_shared<std::promise<std::optional<RpcResponse>>>();
    std::future<std::optional<RpcResponse>> result = reply->get_future();
    std::shared_ptr<HeadlessState> state = state_;
    state_->pushCallback([state, id, request, reply]() {
        HeadlessWebview* webview = nullptr;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto it = state->webviews.find(id);
            if (it != state->webviews.end()) {
                webview = it->second;
            }
        }
        try {
            if (!webview || !webview->options().rpcHandler) {
                reply->set_value(std::nullopt);
                return;
            }
            reply->set_value(webview->options().rpcHandler(id, request));
        } catch (...) {
            reply->set_exception(std::current_exception());
        }
    });
    return result;
}

std::future<bool> HeadlessController::simulateFileDrop(WindowId id, const FileDropEvent& event) {
    auto reply = std::make_shared<std::promise<bool>>();
    std::future<bool> result = reply->get_future();
    std::shared_ptr<HeadlessState> state = state_;
    state_->pushCallback([state, id, event, reply]() {
        HeadlessWebview* webview = nullptr;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto it = state->webviews.find(id);
            if (it != state->webviews.end()) {
                webview = it->second;
            }
        }
        try {
            const NativeWebviewOptions* options = webview ? &webview->options() : nullptr;
            if (!options || !options->fileDropEnabled || !options->fileDropHandler) {
                reply->set_value(false);
                return;
            }
            reply->set_value(options->fileDropHandler(id, event));
        } catch (...) {
            reply->set_exception(std::current_exception());
        }
    });
    return result;
}

std::future<std::vector<uint8_t>> HeadlessController::fetchCustomProtocol(WindowId id, const std::string& url) {
    auto reply = std::make_shared<std::promise<std::vector<uint8_t>>>();
    std::future<std::vector<uint8_t>> result = reply->get_future();
    std::shared_ptr<HeadlessState> state = state_;
    state_->pushCallback([state, id, url, reply]() {
        HeadlessWebview* webview = nullptr;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto it = state->webviews.find(id);
            if (it != state->webviews.end()) {
                webview = it->second;
            }
        }
        try {
            if (!webview) {
                throw Error(ErrorKind::WINDOW_NOT_FOUND, "window " + std::to_string(id));
            }
            std::string scheme = url.substr(0, url.find(':'));
            auto protocol = webview->options().customProtocols.find(scheme);
            if (protocol == webview->options().customProtocols.end()) {
                throw Error(ErrorKind::CUSTOM_PROTOCOL, "unregistered scheme " + scheme);
            }
            reply->set_value(protocol->second(url));
        } catch (...) {
            reply->set_exception(std::current_exception());
        }
    });
    return result;
}

void HeadlessController::terminate() {
    std::shared_ptr<HeadlessState> state = state_;
    state_->pushCallback([state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->terminateRequested = true;
    });
}

// HeadlessEventLoop

HeadlessEventLoop::HeadlessEventLoop() : state_(std::make_shared<HeadlessState>()) {
    state_->monitors = defaultMonitors();
}

HeadlessEventLoop::~HeadlessEventLoop() {
    state_->queue.close();
}

std::shared_ptr<HeadlessController> HeadlessEventLoop::controller() const {
    return std::make_shared<HeadlessController>(state_);
}

std::shared_ptr<EventLoopProxy> HeadlessEventLoop::createProxy() {
    return std::make_shared<HeadlessProxy>(state_);
}

bool HeadlessEventLoop::dispatch(Event& event, EventHandler& handler) {
    ControlFlow controlFlow = ControlFlow::WAIT;
    handler(event, *this, controlFlow);
    if (controlFlow == ControlFlow::EXIT) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->terminateRequested;
}

bool HeadlessEventLoop::drainQueue(EventHandler& handler) {
    Event newEvents = Event::of(Event::Type::NEW_EVENTS);
    if (!dispatch(newEvents, handler)) {
        return false;
    }

    // Only items queued before this pass; later ones wait for the next pass
    size_t pending = state_->queue.size();
    for (size_t i = 0; i < pending; i++) {
        std::optional<HeadlessQueueItem> item = state_->queue.tryRecv();
        if (!item) {
            break;
        }
        if (item->callback) {
            item->callback();
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->terminateRequested) {
                return false;
            }
        }
        if (item->event && !dispatch(*item->event, handler)) {
            return false;
        }
    }

    Event cleared = Event::of(Event::Type::MAIN_EVENTS_CLEARED);
    return dispatch(cleared, handler);
}

void HeadlessEventLoop::run(EventHandler handler) {
    // Closes the queue however the loop ends, so pending requests fail instead of hanging
    struct QueueCloser {
        HeadlessState& state;
        ~QueueCloser() { state.queue.close(); }
    } closer{*state_};

    while (drainQueue(handler)) {
        if (state_->queue.size() == 0 && !state_->queue.wait()) {
            break;
        }
    }

    Event destroyed = Event::of(Event::Type::LOOP_DESTROYED);
    ControlFlow controlFlow = ControlFlow::EXIT;
    handler(destroyed, *this, controlFlow);
}

void HeadlessEventLoop::runReturn(EventHandler handler) {
    drainQueue(handler);
}

std::unique_ptr<AbstractWebview> HeadlessEventLoop::buildWebview(NativeWebviewOptions options) {
    HeadlessWindowState window;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->nextWindowFailure) {
            std::string reason = *state_->nextWindowFailure;
            state_->nextWindowFailure.reset();
            throw Error(ErrorKind::CREATE_WEBVIEW, reason);
        }
        window.id = state_->nextWindowId++;
    }

    const WindowAttributes& attributes = options.window;
    if (attributes.icon) {
        try {
            window.icon = decodeHeadlessIcon(*attributes.icon);
        } catch (const Error& e) {
            throw Error(ErrorKind::CREATE_WINDOW, e.what());
        }
    }

    window.url = options.url;
    window.title = attributes.title;
    window.innerSize = attributes.innerSize
        ? attributes.innerSize->toPhysical(window.scaleFactor)
        : toPhysical(LogicalSize<double>(DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT), window.scaleFactor);
    if (attributes.minInnerSize) {
        window.minInnerSize = attributes.minInnerSize->toPhysical(window.scaleFactor);
    }
    if (attributes.maxInnerSize) {
        window.maxInnerSize = attributes.maxInnerSize->toPhysical(window.scaleFactor);
    }
    window.innerSize = clampSize(window.innerSize, window.minInnerSize, window.maxInnerSize);
    if (attributes.position) {
        window.position = attributes.position->toPhysical(window.scaleFactor);
    } else {
        // cascade, like a window manager placing new windows
        int32_t offset = static_cast<int32_t>((window.id - 1) % 10) * 32;
        window.position = PhysicalPosition<int32_t>(64 + offset, 64 + offset);
    }
    window.resizable = attributes.resizable;
    window.maximized = attributes.maximized;
    window.visible = attributes.visible;
    window.decorated = attributes.decorations;
    window.alwaysOnTop = attributes.alwaysOnTop;
    window.fullscreen = attributes.fullscreen;
    window.focused = attributes.focus;
    window.skipTaskbar = attributes.skipTaskbar;
    window.transparent = options.transparent;
    window.menu = attributes.menu;
    window.initializationScripts = options.initializationScripts;
    window.dataDirectory = options.dataDirectory;
    for (const auto& protocol : options.customProtocols) {
        window.customProtocols.push_back(protocol.first);
    }

    WindowId id = window.id;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->windows[id] = window;
    }
    return std::make_unique<HeadlessWebview>(state_, id, std::move(options));
}

void HeadlessEventLoop::buildSystemTray(const Icon& icon, const std::vector<MenuItem>& menu) {
    decodeHeadlessIcon(icon);
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->trayMenu = menu;
}

} // namespace webshell
