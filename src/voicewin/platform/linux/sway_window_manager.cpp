#include "platform/linux/sway_window_manager.hpp"

#include "config.hpp"
#include "platform/linux/sway_window.hpp"
#include "sway/tree.hpp"

SwayWindowManager::SwayWindowManager(std::string socket_path)
    : ipc_(std::make_shared<SwayIpc>()), socket_path_(std::move(socket_path)) {}

SwayWindowManager::SwayWindowManager(std::shared_ptr<SwayIpc> ipc)
    : ipc_(std::move(ipc)) {}

SwayWindowManager::~SwayWindowManager() {
    shutdown();
}

bool SwayWindowManager::connect() {
    if (ipc_->connected()) return true;
    return ipc_->connect(socket_path_);
}

WindowResult<WindowId> SwayWindowManager::foreground_id() {
    auto tree = ipc_->get_tree();
    if (!tree) return std::unexpected(tree.error());

    auto focused = sway::find_focused(*tree);
    if (!focused) {
        return std::unexpected(WindowError{WindowErrc::window_not_found, "no focused window"});
    }
    return focused->id;
}

WindowResult<std::vector<WindowId>> SwayWindowManager::enumerate_ids() {
    auto tree = ipc_->get_tree();
    if (!tree) return std::unexpected(tree.error());

    std::vector<WindowId> ids;
    for (const auto& w : sway::collect_windows(*tree)) ids.push_back(w.id);
    return ids;
}

std::shared_ptr<Window> SwayWindowManager::make_window(WindowId id) {
    return SwayWindow::create(id, ipc_, &registry_, &movers_);
}

std::unique_ptr<WindowManager> create_window_manager(const Config& config) {
    return std::make_unique<SwayWindowManager>(config.sway.socket);
}
