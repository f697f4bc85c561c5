#include "platform/linux/sway_window.hpp"

#include "platform/process_image.hpp"
#include "sway/tree.hpp"
#include "window_registry.hpp"

#include <format>

SwayWindow::SwayWindow(WindowId id, std::shared_ptr<SwayIpc> ipc,
                       WindowRegistry* registry, const WindowMoverRegistry* movers)
    : Window(id, registry, movers), ipc_(std::move(ipc)) {}

std::shared_ptr<SwayWindow> SwayWindow::create(WindowId id, std::shared_ptr<SwayIpc> ipc,
                                               WindowRegistry* registry,
                                               const WindowMoverRegistry* movers) {
    std::shared_ptr<SwayWindow> window(new SwayWindow(id, std::move(ipc), registry, movers));
    if (registry) registry->register_id(window);
    return window;
}

bool SwayWindow::supports(Capability capability) const {
    return capability != Capability::enabled;
}

WindowResult<WindowInfo> SwayWindow::info() const {
    auto tree = ipc_->get_tree();
    if (!tree) return std::unexpected(tree.error());

    auto found = sway::find_window(*tree, id());
    if (!found) {
        return std::unexpected(WindowError{WindowErrc::window_not_found,
            std::format("no sway container with id {}", id())});
    }
    return *found;
}

WindowResult<std::string> SwayWindow::title() const {
    return info().transform([](const WindowInfo& w) { return w.title; });
}

WindowResult<std::string> SwayWindow::class_name() const {
    return info().transform([](const WindowInfo& w) { return w.class_name(); });
}

WindowResult<std::string> SwayWindow::executable() const {
    return info().and_then([](const WindowInfo& w) { return process_image_path(w.pid); });
}

WindowResult<bool> SwayWindow::is_minimized() const {
    return info().transform([](const WindowInfo& w) { return w.in_scratchpad; });
}

WindowResult<bool> SwayWindow::is_maximized() const {
    return info().transform([](const WindowInfo& w) { return w.fullscreen_mode != 0; });
}

WindowResult<bool> SwayWindow::is_visible() const {
    return info().transform([](const WindowInfo& w) { return w.visible; });
}

WindowResult<bool> SwayWindow::is_valid() const {
    auto w = info();
    if (w) return true;
    if (w.error().code == WindowErrc::window_not_found) return false;
    return std::unexpected(w.error());
}

WindowResult<Rectangle> SwayWindow::get_position() const {
    return info().transform([](const WindowInfo& w) { return w.rect; });
}

WindowResult<void> SwayWindow::set_position(const Rectangle& rectangle) {
    // Only floating containers can be placed freely.
    return command(std::format(
        "floating enable, resize set width {} px height {} px, move absolute position {} px {} px",
        rectangle.ltwh_width(), rectangle.ltwh_height(),
        rectangle.ltwh_left(), rectangle.ltwh_top()));
}

WindowResult<void> SwayWindow::minimize() {
    return command("move scratchpad");
}

WindowResult<void> SwayWindow::maximize() {
    return command("fullscreen enable");
}

WindowResult<void> SwayWindow::restore() {
    auto w = info();
    if (!w) return std::unexpected(w.error());
    if (w->in_scratchpad) return command("scratchpad show");
    return command("fullscreen disable");
}

WindowResult<void> SwayWindow::activate() {
    return command("focus");
}

WindowResult<void> SwayWindow::command(const std::string& cmd) {
    return ipc_->run_command(std::format("[con_id={}] {}", id(), cmd));
}
