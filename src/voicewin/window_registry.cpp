#include "window_registry.hpp"

#include "window.hpp"

WindowRegistry::~WindowRegistry() {
    clear();
}

void WindowRegistry::register_id(std::shared_ptr<Window> window) {
    WindowId id = window->id();
    by_id_.insert_or_assign(id, std::move(window));
}

void WindowRegistry::register_name(const std::string& name, std::shared_ptr<Window> window) {
    by_name_.insert_or_assign(name, std::move(window));
}

std::shared_ptr<Window> WindowRegistry::find(WindowId id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<Window> WindowRegistry::find(std::string_view name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return nullptr;
    return it->second;
}

void WindowRegistry::clear() {
    for (auto& [id, window] : by_id_) window->detach();
    for (auto& [name, window] : by_name_) window->detach();
    by_id_.clear();
    by_name_.clear();
}
