#pragma once

#include "monitor.hpp"
#include "window_error.hpp"

#include <map>
#include <string>
#include <vector>

struct Config {
    // Monitor layout in screen coordinates, in lookup order.
    std::vector<Monitor> monitors;

    // Names assigned to window handles at startup.
    std::map<std::string, WindowId> names;

    // Window mover used by `move` when none is given on the command line.
    std::string animation;

    struct Sway {
        std::string socket; // empty: $SWAYSOCK
    } sway;

    static Config load(const std::string& path);
    static Config load_default();
};
