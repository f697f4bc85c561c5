#pragma once

#include "sway/ipc.hpp"
#include "sway/window_info.hpp"
#include "window.hpp"

#include <memory>
#include <string>

// Window backed by a Sway container. Queries re-read the layout tree; control
// operations are RUN_COMMAND requests scoped with [con_id=<handle>].
class SwayWindow : public Window {
public:
    static std::shared_ptr<SwayWindow> create(WindowId id, std::shared_ptr<SwayIpc> ipc,
                                              WindowRegistry* registry,
                                              const WindowMoverRegistry* movers);

    bool supports(Capability capability) const override;

    WindowResult<std::string> title() const override;
    WindowResult<std::string> class_name() const override;
    WindowResult<std::string> executable() const override;

    WindowResult<bool> is_minimized() const override;
    WindowResult<bool> is_maximized() const override;
    WindowResult<bool> is_visible() const override;
    WindowResult<bool> is_valid() const override;

    WindowResult<Rectangle> get_position() const override;
    WindowResult<void> set_position(const Rectangle& rectangle) override;

    WindowResult<void> minimize() override;
    WindowResult<void> maximize() override;
    WindowResult<void> restore() override;

    // Snapshot of the container as sway currently reports it.
    WindowResult<WindowInfo> info() const;

protected:
    SwayWindow(WindowId id, std::shared_ptr<SwayIpc> ipc,
               WindowRegistry* registry, const WindowMoverRegistry* movers);

    WindowResult<void> activate() override;
    std::string_view kind() const override { return "SwayWindow"; }

private:
    WindowResult<void> command(const std::string& cmd);

    std::shared_ptr<SwayIpc> ipc_;
};
