#pragma once

#include "rectangle.hpp"
#include "window_error.hpp"

#include <string>

// A view (leaf container) of the Sway tree.
struct WindowInfo {
    WindowId id = 0;           // container id, stable for the view's lifetime
    std::string app_id;        // Wayland app_id (e.g. "kitty")
    std::string window_class;  // X11 class for XWayland views (e.g. "Firefox")
    std::string title;         // container name
    int pid = 0;               // window process PID
    Rectangle rect;            // absolute layout coordinates
    bool focused = false;
    bool visible = false;
    int fullscreen_mode = 0;   // 0 none, 1 workspace, 2 global
    bool in_scratchpad = false;

    // X11 class when there is one, app_id otherwise.
    const std::string& class_name() const { return window_class.empty() ? app_id : window_class; }
};
