#include "config.hpp"
#include "platform/window_manager.hpp"

#include <cstdlib>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

bool verbose = false;

void log(const std::string& msg) {
    if (verbose) std::println(stderr, "[voicewin] {}", msg);
}

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [args] [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  list                              List all windows");
    std::println(stderr, "  foreground                        Show the focused window");
    std::println(stderr, "  info <window>                     Show window details");
    std::println(stderr, "  focus <window>                    Bring window to the foreground");
    std::println(stderr, "  minimize|maximize|restore <window>");
    std::println(stderr, "  move <window> X Y W H             Move window (screen coordinates)");
    std::println(stderr, "  place <window> X Y W H            Move window (fractions of its monitor)");
    std::println(stderr, "  monitor <window>                  Show the monitor containing the window");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -a, --animate NAME  Window mover for move");
    std::println(stderr, "  -j, --json          JSON output");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "<window> is a handle or a name from the config file.");
}

int fail(const WindowError& error) {
    std::println(stderr, "Error: {}", error.message);
    return 1;
}

WindowResult<std::shared_ptr<Window>> resolve(WindowManager& wm, const std::string& arg) {
    if (auto id = parse_window_id(arg)) return wm.get_window(*id);
    if (auto w = wm.find_window(arg)) return w;
    return std::unexpected(WindowError{WindowErrc::window_not_found,
        std::format("'{}' is neither a window handle nor a known name", arg)});
}

WindowResult<Rectangle> parse_rectangle(const std::vector<std::string>& args, size_t first) {
    if (args.size() < first + 4) {
        return std::unexpected(WindowError{WindowErrc::invalid_argument, "expected X Y W H"});
    }
    try {
        return Rectangle{std::stod(args[first]), std::stod(args[first + 1]),
                         std::stod(args[first + 2]), std::stod(args[first + 3])};
    } catch (const std::exception&) {
        return std::unexpected(WindowError{WindowErrc::invalid_argument, "X Y W H must be numbers"});
    }
}

// Fields that fail to resolve are left out rather than failing the listing.
json describe_window(const Window& w) {
    json j = {{"handle", w.id()}};
    if (!w.names().empty()) j["names"] = w.names();
    if (auto v = w.title()) j["title"] = *v;
    if (auto v = w.class_name()) j["class"] = *v;
    if (auto v = w.executable()) j["executable"] = *v;
    if (auto v = w.is_minimized()) j["minimized"] = *v;
    if (auto v = w.is_maximized()) j["maximized"] = *v;
    if (auto v = w.is_visible()) j["visible"] = *v;
    if (auto r = w.get_position()) j["rect"] = {r->x, r->y, r->dx, r->dy};
    return j;
}

void print_window(const json& j, bool as_json) {
    if (as_json) {
        std::println("{}", j.dump());
        return;
    }
    std::println("{:>10}  {:<20}  {}", j["handle"].get<WindowId>(),
                 j.value("class", std::string("?")), j.value("title", std::string()));
}

int run_control(Window& w, const std::string& command) {
    WindowResult<void> result;
    if (command == "focus") result = w.set_foreground();
    else if (command == "minimize") result = w.minimize();
    else if (command == "maximize") result = w.maximize();
    else result = w.restore();

    if (!result) return fail(result.error());
    log(std::format("{} {}", command, w.describe()));
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string animate;
    bool as_json = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--animate" || arg == "-a") {
            if (i + 1 < argc) animate = argv[++i];
        } else if (arg == "--json" || arg == "-j") {
            as_json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (animate.empty()) animate = config.animation;

    auto wm = create_window_manager(config);
    if (!wm->connect()) {
        std::println(stderr, "Failed to connect to the window system");
        return 1;
    }
    wm->set_monitors(config.monitors);
    for (const auto& [name, id] : config.names) {
        wm->get_window(id)->add_name(name);
    }
    log(std::format("{} monitors, {} named windows", config.monitors.size(), config.names.size()));

    const std::string& command = args[0];

    if (command == "list") {
        auto windows = wm->get_all_windows();
        if (!windows) return fail(windows.error());
        for (const auto& w : *windows) print_window(describe_window(*w), as_json);
        return 0;
    }

    if (command == "foreground") {
        auto w = wm->get_foreground();
        if (!w) return fail(w.error());
        print_window(describe_window(**w), as_json);
        return 0;
    }

    if (args.size() < 2) {
        std::println(stderr, "{} needs a window", command);
        usage(argv[0]);
        return 1;
    }

    auto window = resolve(*wm, args[1]);
    if (!window) return fail(window.error());
    Window& w = **window;

    if (command == "info") {
        std::println("{}", describe_window(w).dump(2));
        return 0;
    }

    if (command == "focus" || command == "minimize" || command == "maximize" ||
        command == "restore") {
        return run_control(w, command);
    }

    if (command == "move" || command == "place") {
        auto rect = parse_rectangle(args, 2);
        if (!rect) return fail(rect.error());

        auto result = command == "move" ? w.move(*rect, animate)
                                        : w.set_normalized_position(*rect, wm->monitors());
        if (!result) return fail(result.error());
        log(std::format("{} {} to {}", command, w.describe(), rect->to_string()));
        return 0;
    }

    if (command == "monitor") {
        auto monitor = w.get_containing_monitor(wm->monitors());
        if (!monitor) return fail(monitor.error());
        auto normalized = w.get_normalized_position(wm->monitors());
        if (!normalized) return fail(normalized.error());

        if (as_json) {
            const auto& r = *normalized;
            std::println("{}", json{{"monitor", monitor->name},
                                    {"normalized", {r.x, r.y, r.dx, r.dy}}}.dump());
        } else {
            std::println("{} {}", monitor->name, normalized->to_string());
        }
        return 0;
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
