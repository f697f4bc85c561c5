#pragma once

#include "monitor.hpp"
#include "window.hpp"
#include "window_error.hpp"
#include "window_mover.hpp"
#include "window_registry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct Config;

// Window discovery for one windowing system. Owns the registry of window
// objects, the caller-supplied monitor list and the named window movers.
// Single-threaded: callers must not share a manager between threads.
class WindowManager {
public:
    virtual ~WindowManager() = default;

    virtual bool connect() = 0;

    // The window that currently has input focus.
    WindowResult<std::shared_ptr<Window>> get_foreground();

    // Every top-level window, in the order the windowing system reports them.
    WindowResult<std::vector<std::shared_ptr<Window>>> get_all_windows();

    // Registered window for `id`, or a new one registered under it.
    std::shared_ptr<Window> get_window(WindowId id);

    std::shared_ptr<Window> find_window(WindowId id) const { return registry_.find(id); }
    std::shared_ptr<Window> find_window(std::string_view name) const { return registry_.find(name); }

    WindowMoverRegistry& movers() { return movers_; }

    const std::vector<Monitor>& monitors() const { return monitors_; }
    void set_monitors(std::vector<Monitor> monitors) { monitors_ = std::move(monitors); }

    void shutdown() { registry_.clear(); }

protected:
    virtual WindowResult<WindowId> foreground_id() = 0;
    virtual WindowResult<std::vector<WindowId>> enumerate_ids() = 0;
    // Construct the binding's window type for `id`.
    virtual std::shared_ptr<Window> make_window(WindowId id) = 0;

    WindowRegistry registry_;
    WindowMoverRegistry movers_;
    std::vector<Monitor> monitors_;
};

// Manager for the windowing system this build targets.
std::unique_ptr<WindowManager> create_window_manager(const Config& config);
