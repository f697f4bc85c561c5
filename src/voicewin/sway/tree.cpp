#include "sway/tree.hpp"

#include <functional>
#include <string>

using json = nlohmann::json;

namespace sway {

namespace {

// app_id and window_properties are null for some views, so json::value()
// cannot be used on them directly.
std::string string_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// json::value() throws on a present key of the wrong type (e.g. "pid": null).
template <typename T>
T number_field(const json& node, const char* key, T fallback = 0) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number()) return fallback;
    return it->get<T>();
}

bool bool_field(const json& node, const char* key) {
    auto it = node.find(key);
    return it != node.end() && it->is_boolean() && it->get<bool>();
}

bool is_view(const json& node) {
    auto type = string_field(node, "type");
    return (type == "con" || type == "floating_con") && node.contains("pid");
}

// Visit every view until `fn` returns true.
bool walk(const json& node, bool in_scratchpad,
          const std::function<bool(const json&, bool)>& fn) {
    if (string_field(node, "type") == "workspace" &&
        string_field(node, "name") == SCRATCHPAD_WORKSPACE) {
        in_scratchpad = true;
    }

    if (is_view(node) && fn(node, in_scratchpad)) return true;

    for (const char* key : {"nodes", "floating_nodes"}) {
        auto it = node.find(key);
        if (it == node.end() || !it->is_array()) continue;
        for (const auto& child : *it) {
            if (walk(child, in_scratchpad, fn)) return true;
        }
    }
    return false;
}

} // namespace

WindowInfo parse_window(const json& node, bool in_scratchpad) {
    WindowInfo info;
    info.id = number_field<WindowId>(node, "id");
    info.app_id = string_field(node, "app_id");
    info.title = string_field(node, "name");
    info.pid = number_field<int>(node, "pid");
    info.focused = bool_field(node, "focused");
    info.visible = bool_field(node, "visible");
    info.fullscreen_mode = number_field<int>(node, "fullscreen_mode");
    info.in_scratchpad = in_scratchpad;

    auto props = node.find("window_properties");
    if (props != node.end() && props->is_object()) {
        info.window_class = string_field(*props, "class");
    }

    auto rect = node.find("rect");
    if (rect != node.end() && rect->is_object()) {
        info.rect = Rectangle{
            number_field<double>(*rect, "x"),
            number_field<double>(*rect, "y"),
            number_field<double>(*rect, "width"),
            number_field<double>(*rect, "height"),
        };
    }
    return info;
}

std::vector<WindowInfo> collect_windows(const json& tree) {
    std::vector<WindowInfo> windows;
    walk(tree, false, [&](const json& node, bool scratch) {
        windows.push_back(parse_window(node, scratch));
        return false;
    });
    return windows;
}

std::optional<WindowInfo> find_window(const json& tree, WindowId id) {
    std::optional<WindowInfo> found;
    walk(tree, false, [&](const json& node, bool scratch) {
        if (number_field<WindowId>(node, "id") != id) return false;
        found = parse_window(node, scratch);
        return true;
    });
    return found;
}

std::optional<WindowInfo> find_focused(const json& tree) {
    std::optional<WindowInfo> found;
    walk(tree, false, [&](const json& node, bool scratch) {
        if (!bool_field(node, "focused")) return false;
        found = parse_window(node, scratch);
        return true;
    });
    return found;
}

} // namespace sway
