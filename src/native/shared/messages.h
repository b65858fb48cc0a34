// messages.h - Commands sent from client threads to the event loop thread
// Getters carry a one-shot reply; setters are fire-and-forget. Both share one variant
// so they travel through the same queue and are applied in submission order.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_MESSAGES_H
#define WEBSHELL_MESSAGES_H

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "channel.h"
#include "geometry.h"
#include "window_event.h"

namespace webshell {

class AbstractWebview;
class EventLoopTarget;

template<typename T>
using Reply = std::promise<T>;

namespace window_message {

// Getters
struct ScaleFactor { Reply<double> tx; };
struct InnerPosition { Reply<PhysicalPosition<int32_t>> tx; };
struct OuterPosition { Reply<PhysicalPosition<int32_t>> tx; };
struct InnerSize { Reply<PhysicalSize<uint32_t>> tx; };
struct OuterSize { Reply<PhysicalSize<uint32_t>> tx; };
struct IsFullscreen { Reply<bool> tx; };
struct IsMaximized { Reply<bool> tx; };
struct IsDecorated { Reply<bool> tx; };
struct IsResizable { Reply<bool> tx; };
struct IsVisible { Reply<bool> tx; };
struct CurrentMonitor { Reply<std::optional<Monitor>> tx; };
struct PrimaryMonitor { Reply<std::optional<Monitor>> tx; };
struct AvailableMonitors { Reply<std::vector<Monitor>> tx; };

// Setters
struct SetResizable { bool resizable; };
struct SetTitle { std::string title; };
struct Maximize {};
struct Unmaximize {};
struct Minimize {};
struct Unminimize {};
struct Show {};
struct Hide {};
struct Close {};
struct SetDecorations { bool decorations; };
struct SetAlwaysOnTop { bool alwaysOnTop; };
struct SetSize { Size size; };
struct SetMinSize { std::optional<Size> size; };
struct SetMaxSize { std::optional<Size> size; };
struct SetPosition { Position position; };
struct SetFullscreen { bool fullscreen; };
struct SetFocus {};
struct SetIcon { WindowIcon icon; };
struct SetSkipTaskbar { bool skip; };
struct DragWindow {};

} // namespace window_message

using WindowMessage = std::variant<
    window_message::ScaleFactor,
    window_message::InnerPosition,
    window_message::OuterPosition,
    window_message::InnerSize,
    window_message::OuterSize,
    window_message::IsFullscreen,
    window_message::IsMaximized,
    window_message::IsDecorated,
    window_message::IsResizable,
    window_message::IsVisible,
    window_message::CurrentMonitor,
    window_message::PrimaryMonitor,
    window_message::AvailableMonitors,
    window_message::SetResizable,
    window_message::SetTitle,
    window_message::Maximize,
    window_message::Unmaximize,
    window_message::Minimize,
    window_message::Unminimize,
    window_message::Show,
    window_message::Hide,
    window_message::Close,
    window_message::SetDecorations,
    window_message::SetAlwaysOnTop,
    window_message::SetSize,
    window_message::SetMinSize,
    window_message::SetMaxSize,
    window_message::SetPosition,
    window_message::SetFullscreen,
    window_message::SetFocus,
    window_message::SetIcon,
    window_message::SetSkipTaskbar,
    window_message::DragWindow>;

namespace webview_message {

struct EvaluateScript { std::string script; };
struct Print {};

} // namespace webview_message

using WebviewMessage = std::variant<webview_message::EvaluateScript, webview_message::Print>;

// Materializes a window and its webview on the event loop thread
typedef std::function<std::unique_ptr<AbstractWebview>(EventLoopTarget&)> CreateWebviewHandler;

struct WindowCommand {
    WindowId id;
    WindowMessage message;
};

struct WebviewCommand {
    WindowId id;
    WebviewMessage message;
};

struct CreateWebviewCommand {
    std::shared_ptr<OneShot<CreateWebviewHandler>> handler;
    Reply<WindowId> tx;
};

using Message = std::variant<WindowCommand, WebviewCommand, CreateWebviewCommand>;

// True for window messages that carry a reply
template<typename M, typename = void>
struct IsGetter : std::false_type {};

template<typename M>
struct IsGetter<M, std::void_t<decltype(std::declval<M&>().tx)>> : std::true_type {};

} // namespace webshell

#endif // WEBSHELL_MESSAGES_H
