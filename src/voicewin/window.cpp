#include "window.hpp"

#include "window_mover.hpp"
#include "window_registry.hpp"

#include <algorithm>
#include <format>

std::string_view to_string(Capability capability) {
    switch (capability) {
    case Capability::title: return "title";
    case Capability::class_name: return "class_name";
    case Capability::executable: return "executable";
    case Capability::minimized: return "minimized";
    case Capability::maximized: return "maximized";
    case Capability::visible: return "visible";
    case Capability::valid: return "valid";
    case Capability::enabled: return "enabled";
    case Capability::get_position: return "get_position";
    case Capability::set_position: return "set_position";
    case Capability::minimize: return "minimize";
    case Capability::maximize: return "maximize";
    case Capability::restore: return "restore";
    case Capability::foreground: return "foreground";
    }
    return "unknown";
}

Window::Window(WindowId id, WindowRegistry* registry, const WindowMoverRegistry* movers)
    : id_(id), registry_(registry), movers_(movers) {}

void Window::set_id(WindowId id) {
    id_ = id;
    if (registry_) registry_->register_id(shared_from_this());
}

void Window::add_name(const std::string& name) {
    if (std::ranges::find(names_, name) == names_.end()) {
        names_.push_back(name);
    }
    if (registry_) registry_->register_name(name, shared_from_this());
}

std::string Window::name() const {
    if (names_.empty()) return {};
    return names_.front();
}

std::string Window::describe() const {
    std::string out = std::format("{}(handle={}", kind(), id_);
    for (const auto& n : names_) {
        out += ", ";
        out += n;
    }
    out += ")";
    return out;
}

bool Window::supports(Capability) const {
    return false;
}

WindowResult<std::string> Window::title() const {
    return std::unexpected(WindowError::not_implemented("title"));
}

WindowResult<std::string> Window::class_name() const {
    return std::unexpected(WindowError::not_implemented("class_name"));
}

WindowResult<std::string> Window::executable() const {
    return std::unexpected(WindowError::not_implemented("executable"));
}

WindowResult<bool> Window::is_minimized() const {
    return std::unexpected(WindowError::not_implemented("is_minimized"));
}

WindowResult<bool> Window::is_maximized() const {
    return std::unexpected(WindowError::not_implemented("is_maximized"));
}

WindowResult<bool> Window::is_visible() const {
    return std::unexpected(WindowError::not_implemented("is_visible"));
}

WindowResult<bool> Window::is_valid() const {
    return std::unexpected(WindowError::not_implemented("is_valid"));
}

WindowResult<bool> Window::is_enabled() const {
    return std::unexpected(WindowError::not_implemented("is_enabled"));
}

WindowResult<Rectangle> Window::get_position() const {
    return std::unexpected(WindowError::not_implemented("get_position"));
}

WindowResult<void> Window::set_position(const Rectangle&) {
    return std::unexpected(WindowError::not_implemented("set_position"));
}

WindowResult<void> Window::minimize() {
    return std::unexpected(WindowError::not_implemented("minimize"));
}

WindowResult<void> Window::maximize() {
    return std::unexpected(WindowError::not_implemented("maximize"));
}

WindowResult<void> Window::restore() {
    return std::unexpected(WindowError::not_implemented("restore"));
}

WindowResult<void> Window::activate() {
    return std::unexpected(WindowError::not_implemented("set_foreground"));
}

WindowResult<void> Window::set_foreground() {
    auto minimized = is_minimized();
    if (!minimized) return std::unexpected(minimized.error());

    // Most window systems refuse to focus an iconified window.
    if (*minimized) {
        auto restored = restore();
        if (!restored) return restored;
    }
    return activate();
}

WindowResult<void> Window::move(const Rectangle& rectangle, std::string_view animate) {
    WindowMover* mover = nullptr;
    if (!animate.empty() && movers_) mover = movers_->find(animate);
    if (!mover) return set_position(rectangle);

    auto from = get_position();
    if (!from) return std::unexpected(from.error());
    return mover->move_window(*this, *from, rectangle);
}

WindowResult<Monitor> Window::get_containing_monitor(const std::vector<Monitor>& monitors) const {
    auto position = get_position();
    if (!position) return std::unexpected(position.error());
    return containing_monitor(monitors, position->center());
}

WindowResult<Rectangle> Window::get_normalized_position(const std::vector<Monitor>& monitors) const {
    auto monitor = get_containing_monitor(monitors);
    if (!monitor) return std::unexpected(monitor.error());

    auto rectangle = get_position();
    if (!rectangle) return std::unexpected(rectangle.error());
    rectangle->renormalize(monitor->rectangle, unit);
    return rectangle;
}

WindowResult<void> Window::set_normalized_position(const Rectangle& rectangle,
                                                   const std::vector<Monitor>& monitors,
                                                   const Monitor* monitor) {
    Rectangle target;
    if (monitor) {
        target = monitor->rectangle;
    } else {
        auto containing = get_containing_monitor(monitors);
        if (!containing) return std::unexpected(containing.error());
        target = containing->rectangle;
    }
    return set_position(rectangle.renormalized(unit, target));
}
