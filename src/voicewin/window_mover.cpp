#include "window_mover.hpp"

void WindowMoverRegistry::add(std::string name, std::unique_ptr<WindowMover> mover) {
    movers_.insert_or_assign(std::move(name), std::move(mover));
}

bool WindowMoverRegistry::remove(std::string_view name) {
    auto it = movers_.find(name);
    if (it == movers_.end()) return false;
    movers_.erase(it);
    return true;
}

WindowMover* WindowMoverRegistry::find(std::string_view name) const {
    auto it = movers_.find(name);
    if (it == movers_.end()) return nullptr;
    return it->second.get();
}

std::vector<std::string> WindowMoverRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(movers_.size());
    for (const auto& [name, mover] : movers_) result.push_back(name);
    return result;
}
