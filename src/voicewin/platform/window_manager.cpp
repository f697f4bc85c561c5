#include "platform/window_manager.hpp"

std::shared_ptr<Window> WindowManager::get_window(WindowId id) {
    if (auto existing = registry_.find(id)) return existing;

    auto window = make_window(id);
    registry_.register_id(window);
    return window;
}

WindowResult<std::shared_ptr<Window>> WindowManager::get_foreground() {
    auto id = foreground_id();
    if (!id) return std::unexpected(id.error());
    return get_window(*id);
}

WindowResult<std::vector<std::shared_ptr<Window>>> WindowManager::get_all_windows() {
    auto ids = enumerate_ids();
    if (!ids) return std::unexpected(ids.error());

    std::vector<std::shared_ptr<Window>> windows;
    windows.reserve(ids->size());
    for (WindowId id : *ids) {
        windows.push_back(get_window(id));
    }
    return windows;
}
