#pragma once

#include "sway/window_info.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace sway {

// Name of the hidden workspace that holds scratchpad containers.
inline constexpr char SCRATCHPAD_WORKSPACE[] = "__i3_scratch";

// All views in the GET_TREE reply, depth first, tiling before floating.
std::vector<WindowInfo> collect_windows(const nlohmann::json& tree);

std::optional<WindowInfo> find_window(const nlohmann::json& tree, WindowId id);
std::optional<WindowInfo> find_focused(const nlohmann::json& tree);

// Parse one view node. `in_scratchpad` is inherited from its workspace.
WindowInfo parse_window(const nlohmann::json& node, bool in_scratchpad);

} // namespace sway
