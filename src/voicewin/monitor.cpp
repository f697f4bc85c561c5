#include "monitor.hpp"

WindowResult<Monitor> containing_monitor(const std::vector<Monitor>& monitors, const Point& point) {
    if (monitors.empty()) {
        return std::unexpected(WindowError{WindowErrc::no_monitors, "no monitors configured"});
    }
    for (const auto& monitor : monitors) {
        if (monitor.rectangle.contains(point)) return monitor;
    }
    return monitors.front();
}
