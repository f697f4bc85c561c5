#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::vector<Monitor> parse_monitors(const json& list) {
    std::vector<Monitor> monitors;
    for (const auto& m : list) {
        auto rect = m.at("rect").get<std::vector<double>>();
        if (rect.size() != 4) {
            std::println(stderr, "config: monitor rect needs 4 numbers, skipping");
            continue;
        }
        monitors.push_back(Monitor{
            m.value("name", std::string("monitor") + std::to_string(monitors.size())),
            Rectangle{rect[0], rect[1], rect[2], rect[3]},
        });
    }
    return monitors;
}

std::map<std::string, WindowId> parse_names(const json& obj) {
    std::map<std::string, WindowId> names;
    for (const auto& entry : obj.items()) {
        // Handles may be written as numbers or as numeric strings.
        const auto& value = entry.value();
        std::string text = value.is_string() ? value.get<std::string>() : value.dump();
        auto id = parse_window_id(text);
        if (!id) {
            std::println(stderr, "config: name '{}': {}", entry.key(), id.error().message);
            continue;
        }
        names[entry.key()] = *id;
    }
    return names;
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("monitors")) cfg.monitors = parse_monitors(j["monitors"]);
        if (j.contains("names")) cfg.names = parse_names(j["names"]);
        if (j.contains("animation")) cfg.animation = j["animation"].get<std::string>();

        if (j.contains("sway")) {
            auto& s = j["sway"];
            if (s.contains("socket")) cfg.sway.socket = s["socket"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
