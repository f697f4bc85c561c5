#pragma once

#include "platform/window_manager.hpp"

class Win32WindowManager : public WindowManager {
public:
    Win32WindowManager() = default;
    ~Win32WindowManager() override;

    Win32WindowManager(const Win32WindowManager&) = delete;
    Win32WindowManager& operator=(const Win32WindowManager&) = delete;

    // user32 needs no connection.
    bool connect() override { return true; }

protected:
    WindowResult<WindowId> foreground_id() override;
    WindowResult<std::vector<WindowId>> enumerate_ids() override;
    std::shared_ptr<Window> make_window(WindowId id) override;
};
