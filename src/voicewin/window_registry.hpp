#pragma once

#include "window_error.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

class Window;

// Handle -> window and name -> window lookups for one window manager.
// Entries are never removed individually; clear() drops them all and
// detaches the windows so they stop registering themselves.
class WindowRegistry {
public:
    WindowRegistry() = default;
    ~WindowRegistry();

    WindowRegistry(const WindowRegistry&) = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;

    void register_id(std::shared_ptr<Window> window);
    void register_name(const std::string& name, std::shared_ptr<Window> window);

    std::shared_ptr<Window> find(WindowId id) const;
    std::shared_ptr<Window> find(std::string_view name) const;

    size_t id_count() const { return by_id_.size(); }
    size_t name_count() const { return by_name_.size(); }

    void clear();

private:
    std::unordered_map<WindowId, std::shared_ptr<Window>> by_id_;
    std::map<std::string, std::shared_ptr<Window>, std::less<>> by_name_;
};
