#include "platform/windows/win32_window_manager.hpp"

#include "config.hpp"
#include "platform/windows/win32_util.hpp"
#include "platform/windows/win32_window.hpp"

Win32WindowManager::~Win32WindowManager() {
    shutdown();
}

WindowResult<WindowId> Win32WindowManager::foreground_id() {
    HWND hwnd = GetForegroundWindow();
    if (!hwnd) {
        return std::unexpected(WindowError{WindowErrc::window_not_found, "no foreground window"});
    }
    return win32::to_id(hwnd);
}

namespace {

BOOL CALLBACK collect_window(HWND hwnd, LPARAM param) {
    auto* ids = reinterpret_cast<std::vector<WindowId>*>(param);
    ids->push_back(win32::to_id(hwnd));
    return TRUE;
}

} // namespace

WindowResult<std::vector<WindowId>> Win32WindowManager::enumerate_ids() {
    std::vector<WindowId> ids;
    if (!EnumWindows(collect_window, reinterpret_cast<LPARAM>(&ids))) {
        return std::unexpected(win32::last_error("EnumWindows"));
    }
    return ids;
}

std::shared_ptr<Window> Win32WindowManager::make_window(WindowId id) {
    return Win32Window::create(id, &registry_, &movers_);
}

std::unique_ptr<WindowManager> create_window_manager(const Config&) {
    return std::make_unique<Win32WindowManager>();
}
