#pragma once

#include "monitor.hpp"
#include "rectangle.hpp"
#include "window_error.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

class WindowRegistry;
class WindowMoverRegistry;

enum class Capability {
    title,
    class_name,
    executable,
    minimized,
    maximized,
    visible,
    valid,
    enabled,
    get_position,
    set_position,
    minimize,
    maximize,
    restore,
    foreground,
};

std::string_view to_string(Capability capability);

// A top-level window identified by its platform handle.
//
// Every capability fails with WindowErrc::not_implemented here; a platform
// binding overrides the ones its windowing system provides and reports them
// through supports(). Only the handle and the names are cached, everything
// else is queried on each call.
//
// Windows are always owned by std::shared_ptr so that the registry can hold
// on to them; bindings construct them through a static create(), which
// registers the new window under its handle when given a registry.
class Window : public std::enable_shared_from_this<Window> {
public:
    virtual ~Window() = default;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    WindowId id() const { return id_; }
    WindowId handle() const { return id_; }

    // Reassign the handle and register the window under it. The previous
    // handle keeps pointing at this window.
    void set_id(WindowId id);

    // The first name added is the canonical one. Adding a name maps it to
    // this window in the registry, replacing any earlier owner.
    void add_name(const std::string& name);
    std::string name() const;
    const std::vector<std::string>& names() const { return names_; }

    std::string describe() const;

    virtual bool supports(Capability capability) const;

    virtual WindowResult<std::string> title() const;
    virtual WindowResult<std::string> class_name() const;
    virtual WindowResult<std::string> executable() const;

    virtual WindowResult<bool> is_minimized() const;
    virtual WindowResult<bool> is_maximized() const;
    // May be indeterminable for some windows; bindings return a best guess.
    virtual WindowResult<bool> is_visible() const;
    virtual WindowResult<bool> is_valid() const;
    virtual WindowResult<bool> is_enabled() const;

    // Absolute screen coordinates.
    virtual WindowResult<Rectangle> get_position() const;
    virtual WindowResult<void> set_position(const Rectangle& rectangle);

    virtual WindowResult<void> minimize();
    virtual WindowResult<void> maximize();
    virtual WindowResult<void> restore();

    // Bring the window to the front and give it input focus. A minimized
    // window is restored first.
    WindowResult<void> set_foreground();

    // Move to `rectangle`, animated by the named mover when one is
    // registered. An empty or unknown name moves immediately.
    WindowResult<void> move(const Rectangle& rectangle, std::string_view animate = {});

    WindowResult<Monitor> get_containing_monitor(const std::vector<Monitor>& monitors) const;
    WindowResult<Rectangle> get_normalized_position(const std::vector<Monitor>& monitors) const;
    // Place the window at `rectangle` given in unit-square coordinates of
    // `monitor`, or of the containing monitor when none is given.
    WindowResult<void> set_normalized_position(const Rectangle& rectangle,
                                               const std::vector<Monitor>& monitors,
                                               const Monitor* monitor = nullptr);

protected:
    Window(WindowId id, WindowRegistry* registry, const WindowMoverRegistry* movers);

    // Platform half of set_foreground().
    virtual WindowResult<void> activate();

    virtual std::string_view kind() const { return "Window"; }

private:
    friend class WindowRegistry;

    // Called by the registry when it is cleared.
    void detach() {
        registry_ = nullptr;
        movers_ = nullptr;
    }

    WindowId id_;
    std::vector<std::string> names_;
    WindowRegistry* registry_;
    const WindowMoverRegistry* movers_;
};
