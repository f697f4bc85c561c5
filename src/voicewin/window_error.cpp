#include "window_error.hpp"

#include <charconv>
#include <format>

WindowResult<WindowId> parse_window_id(std::string_view text) {
    auto invalid = [&] {
        return std::unexpected(WindowError{
            WindowErrc::invalid_handle,
            std::format("window handle must be a non-negative integer, got '{}'", text)});
    };
    if (text.empty()) return invalid();

    WindowId id = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || end != text.data() + text.size()) return invalid();
    return id;
}

std::string_view to_string(WindowErrc code) {
    switch (code) {
    case WindowErrc::not_implemented: return "not implemented";
    case WindowErrc::invalid_handle: return "invalid handle";
    case WindowErrc::invalid_argument: return "invalid argument";
    case WindowErrc::window_not_found: return "window not found";
    case WindowErrc::no_monitors: return "no monitors";
    case WindowErrc::native_call_failed: return "native call failed";
    case WindowErrc::ipc_error: return "ipc error";
    }
    return "unknown";
}
