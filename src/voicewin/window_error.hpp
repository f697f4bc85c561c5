#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

enum class WindowErrc {
    not_implemented,
    invalid_handle,
    invalid_argument,
    window_not_found,
    no_monitors,
    native_call_failed,
    ipc_error,
};

struct WindowError {
    WindowErrc code = WindowErrc::native_call_failed;
    std::string message;

    static WindowError not_implemented(std::string_view what) {
        return {WindowErrc::not_implemented, std::string(what) + " is not implemented"};
    }
};

template <typename T>
using WindowResult = std::expected<T, WindowError>;

// Opaque platform handle (HWND value, Sway container id, ...).
using WindowId = uint64_t;

// Parse a handle given as text. Anything but a non-negative base-10 integer
// fails with WindowErrc::invalid_handle.
WindowResult<WindowId> parse_window_id(std::string_view text);

std::string_view to_string(WindowErrc code);
