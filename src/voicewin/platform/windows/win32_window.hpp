#pragma once

#include "window.hpp"

#include <memory>
#include <string>

// Window backed by an HWND. Every operation is a direct user32 call on the
// handle.
class Win32Window : public Window {
public:
    static std::shared_ptr<Win32Window> create(WindowId id, WindowRegistry* registry,
                                               const WindowMoverRegistry* movers);

    bool supports(Capability capability) const override;

    WindowResult<std::string> title() const override;
    WindowResult<std::string> class_name() const override;
    WindowResult<std::string> executable() const override;

    WindowResult<bool> is_minimized() const override;
    // is_maximized() stays unimplemented for this binding.
    WindowResult<bool> is_visible() const override;
    WindowResult<bool> is_valid() const override;
    WindowResult<bool> is_enabled() const override;

    WindowResult<Rectangle> get_position() const override;
    WindowResult<void> set_position(const Rectangle& rectangle) override;

    WindowResult<void> minimize() override;
    WindowResult<void> maximize() override;
    WindowResult<void> restore() override;

protected:
    Win32Window(WindowId id, WindowRegistry* registry, const WindowMoverRegistry* movers);

    WindowResult<void> activate() override;
    std::string_view kind() const override { return "Win32Window"; }

private:
    WindowResult<void> show(int command);
};
