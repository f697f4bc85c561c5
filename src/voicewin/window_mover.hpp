#pragma once

#include "rectangle.hpp"
#include "window_error.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class Window;

// Strategy that carries a window from one rectangle to another, e.g. by
// stepping set_position() over several frames.
class WindowMover {
public:
    virtual ~WindowMover() = default;
    virtual WindowResult<void> move_window(Window& window, const Rectangle& from,
                                           const Rectangle& to) = 0;
};

class WindowMoverRegistry {
public:
    // Replaces any mover already registered under `name`.
    void add(std::string name, std::unique_ptr<WindowMover> mover);
    bool remove(std::string_view name);

    // nullptr when no mover has that name.
    WindowMover* find(std::string_view name) const;

    std::vector<std::string> names() const;
    bool empty() const { return movers_.empty(); }

private:
    std::map<std::string, std::unique_ptr<WindowMover>, std::less<>> movers_;
};
