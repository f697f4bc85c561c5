#pragma once

#include "rectangle.hpp"
#include "window_error.hpp"

#include <string>
#include <vector>

struct Monitor {
    std::string name;
    Rectangle rectangle;
};

// First monitor whose rectangle contains `point`, or the first monitor of the
// list when none does. Fails only for an empty list.
WindowResult<Monitor> containing_monitor(const std::vector<Monitor>& monitors, const Point& point);
