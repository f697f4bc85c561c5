#pragma once

#include "platform/window_manager.hpp"
#include "sway/ipc.hpp"

#include <memory>
#include <string>

class SwayWindowManager : public WindowManager {
public:
    // Empty socket path: use $SWAYSOCK.
    explicit SwayWindowManager(std::string socket_path = {});
    explicit SwayWindowManager(std::shared_ptr<SwayIpc> ipc);
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    bool connect() override;

protected:
    WindowResult<WindowId> foreground_id() override;
    WindowResult<std::vector<WindowId>> enumerate_ids() override;
    std::shared_ptr<Window> make_window(WindowId id) override;

private:
    std::shared_ptr<SwayIpc> ipc_;
    std::string socket_path_;
};
