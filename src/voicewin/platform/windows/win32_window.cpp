#include "platform/windows/win32_window.hpp"

#include "platform/process_image.hpp"
#include "platform/windows/win32_util.hpp"
#include "window_registry.hpp"

#include <iterator>

Win32Window::Win32Window(WindowId id, WindowRegistry* registry, const WindowMoverRegistry* movers)
    : Window(id, registry, movers) {}

std::shared_ptr<Win32Window> Win32Window::create(WindowId id, WindowRegistry* registry,
                                                 const WindowMoverRegistry* movers) {
    std::shared_ptr<Win32Window> window(new Win32Window(id, registry, movers));
    if (registry) registry->register_id(window);
    return window;
}

bool Win32Window::supports(Capability capability) const {
    return capability != Capability::maximized;
}

WindowResult<std::string> Win32Window::title() const {
    HWND hwnd = win32::to_hwnd(id());
    wchar_t buf[512];
    SetLastError(ERROR_SUCCESS);
    int n = GetWindowTextW(hwnd, buf, static_cast<int>(std::size(buf)));
    if (n == 0 && GetLastError() != ERROR_SUCCESS) {
        return std::unexpected(win32::last_error("GetWindowTextW"));
    }
    return win32::to_utf8(std::wstring(buf, static_cast<size_t>(n)));
}

WindowResult<std::string> Win32Window::class_name() const {
    HWND hwnd = win32::to_hwnd(id());
    wchar_t buf[256];
    int n = GetClassNameW(hwnd, buf, static_cast<int>(std::size(buf)));
    if (n == 0) return std::unexpected(win32::last_error("GetClassNameW"));
    return win32::to_utf8(std::wstring(buf, static_cast<size_t>(n)));
}

WindowResult<std::string> Win32Window::executable() const {
    DWORD pid = 0;
    if (GetWindowThreadProcessId(win32::to_hwnd(id()), &pid) == 0) {
        return std::unexpected(win32::last_error("GetWindowThreadProcessId"));
    }
    return process_image_path(static_cast<int>(pid));
}

WindowResult<bool> Win32Window::is_minimized() const {
    return IsIconic(win32::to_hwnd(id())) != FALSE;
}

WindowResult<bool> Win32Window::is_visible() const {
    return IsWindowVisible(win32::to_hwnd(id())) != FALSE;
}

WindowResult<bool> Win32Window::is_valid() const {
    return IsWindow(win32::to_hwnd(id())) != FALSE;
}

WindowResult<bool> Win32Window::is_enabled() const {
    return IsWindowEnabled(win32::to_hwnd(id())) != FALSE;
}

WindowResult<Rectangle> Win32Window::get_position() const {
    RECT r{};
    if (!GetWindowRect(win32::to_hwnd(id()), &r)) {
        return std::unexpected(win32::last_error("GetWindowRect"));
    }
    return Rectangle{
        static_cast<double>(r.left),
        static_cast<double>(r.top),
        static_cast<double>(r.right - r.left),
        static_cast<double>(r.bottom - r.top),
    };
}

WindowResult<void> Win32Window::set_position(const Rectangle& rectangle) {
    if (!MoveWindow(win32::to_hwnd(id()), rectangle.ltwh_left(), rectangle.ltwh_top(),
                    rectangle.ltwh_width(), rectangle.ltwh_height(), TRUE)) {
        return std::unexpected(win32::last_error("MoveWindow"));
    }
    return {};
}

WindowResult<void> Win32Window::minimize() {
    return show(SW_MINIMIZE);
}

WindowResult<void> Win32Window::maximize() {
    return show(SW_MAXIMIZE);
}

WindowResult<void> Win32Window::restore() {
    return show(SW_RESTORE);
}

WindowResult<void> Win32Window::activate() {
    // Windows may refuse the focus change; that is not reported as an error.
    SetForegroundWindow(win32::to_hwnd(id()));
    return {};
}

WindowResult<void> Win32Window::show(int command) {
    // The return value is the previous visibility, not a status.
    ShowWindow(win32::to_hwnd(id()), command);
    return {};
}
