#include <catch2/catch_test_macros.hpp>

#include "fake_window.hpp"
#include "window_registry.hpp"

#include <memory>
#include <vector>

TEST_CASE("Window defaults", "[window]") {
    auto w = BareWindow::create(7);

    SECTION("IdRoundTrips") {
        REQUIRE(w->id() == 7);
        REQUIRE(w->handle() == 7);
    }

    SECTION("EveryCapabilityIsNotImplemented") {
        REQUIRE(w->title().error().code == WindowErrc::not_implemented);
        REQUIRE(w->class_name().error().code == WindowErrc::not_implemented);
        REQUIRE(w->executable().error().code == WindowErrc::not_implemented);
        REQUIRE(w->is_minimized().error().code == WindowErrc::not_implemented);
        REQUIRE(w->is_maximized().error().code == WindowErrc::not_implemented);
        REQUIRE(w->is_visible().error().code == WindowErrc::not_implemented);
        REQUIRE(w->is_valid().error().code == WindowErrc::not_implemented);
        REQUIRE(w->is_enabled().error().code == WindowErrc::not_implemented);
        REQUIRE(w->get_position().error().code == WindowErrc::not_implemented);
        REQUIRE(w->set_position({0, 0, 1, 1}).error().code == WindowErrc::not_implemented);
        REQUIRE(w->minimize().error().code == WindowErrc::not_implemented);
        REQUIRE(w->maximize().error().code == WindowErrc::not_implemented);
        REQUIRE(w->restore().error().code == WindowErrc::not_implemented);
        REQUIRE(w->set_foreground().error().code == WindowErrc::not_implemented);
        REQUIRE(w->move({0, 0, 1, 1}).error().code == WindowErrc::not_implemented);
    }

    SECTION("SupportsNothing") {
        REQUIRE_FALSE(w->supports(Capability::title));
        REQUIRE_FALSE(w->supports(Capability::foreground));
    }

    SECTION("DescribeListsNames") {
        REQUIRE(w->describe() == "Window(handle=7)");
        w->add_name("editor");
        w->add_name("main");
        REQUIRE(w->describe() == "Window(handle=7, editor, main)");
    }
}

TEST_CASE("Window names", "[window]") {
    WindowRegistry registry;
    auto w = BareWindow::create(1, &registry);

    SECTION("NoNameByDefault") {
        REQUIRE(w->name().empty());
        REQUIRE(w->names().empty());
    }

    SECTION("FirstNameIsCanonical") {
        w->add_name("browser");
        w->add_name("web");
        REQUIRE(w->name() == "browser");
        REQUIRE(w->names() == std::vector<std::string>{"browser", "web"});
    }

    SECTION("NamesAreRegistered") {
        w->add_name("browser");
        w->add_name("web");
        REQUIRE(registry.find("browser") == w);
        REQUIRE(registry.find("web") == w);
    }

    SECTION("DuplicateNameIsKeptOnce") {
        w->add_name("browser");
        w->add_name("browser");
        REQUIRE(w->names().size() == 1);
    }

    SECTION("SetIdRegistersNewHandle") {
        w->set_id(99);
        REQUIRE(w->id() == 99);
        REQUIRE(registry.find(WindowId{99}) == w);
    }
}

TEST_CASE("Window move", "[window]") {
    WindowMoverRegistry movers;
    auto mover = std::make_unique<RecordingMover>();
    auto* mover_ptr = mover.get();
    movers.add("slide", std::move(mover));

    auto w = RecordingWindow::create(3, nullptr, &movers);
    w->position = {0, 0, 100, 100};
    Rectangle target{50, 60, 300, 200};

    SECTION("NoAnimationSetsPosition") {
        REQUIRE(w->move(target).has_value());
        REQUIRE(w->calls == std::vector<std::string>{"set_position"});
        REQUIRE(w->position == target);
        REQUIRE(mover_ptr->calls.empty());
    }

    SECTION("UnknownAnimationFallsBack") {
        REQUIRE(w->move(target, "unregistered_name").has_value());
        REQUIRE(w->calls == std::vector<std::string>{"set_position"});
        REQUIRE(w->position == target);
        REQUIRE(mover_ptr->calls.empty());
    }

    SECTION("KnownAnimationDelegates") {
        REQUIRE(w->move(target, "slide").has_value());
        REQUIRE(w->calls == std::vector<std::string>{"get_position"});
        REQUIRE(mover_ptr->calls.size() == 1);
        REQUIRE(mover_ptr->calls[0].window == 3);
        REQUIRE(mover_ptr->calls[0].from == Rectangle{0, 0, 100, 100});
        REQUIRE(mover_ptr->calls[0].to == target);
    }

    SECTION("NoMoverRegistryFallsBack") {
        auto loose = RecordingWindow::create(4);
        REQUIRE(loose->move(target, "slide").has_value());
        REQUIRE(loose->calls == std::vector<std::string>{"set_position"});
    }
}

TEST_CASE("Window set_foreground", "[window]") {
    auto w = RecordingWindow::create(5);

    SECTION("MinimizedIsRestoredFirst") {
        w->minimized = true;
        REQUIRE(w->set_foreground().has_value());
        REQUIRE(w->calls == std::vector<std::string>{"is_minimized", "restore", "activate"});
        REQUIRE_FALSE(w->minimized);
    }

    SECTION("NormalWindowIsOnlyActivated") {
        REQUIRE(w->set_foreground().has_value());
        REQUIRE(w->calls == std::vector<std::string>{"is_minimized", "activate"});
    }
}

TEST_CASE("Window monitors", "[window][monitor]") {
    std::vector<Monitor> monitors = {
        {"left", {0, 0, 1000, 1000}},
        {"right", {1000, 0, 2000, 1000}},
    };
    auto w = RecordingWindow::create(6);

    SECTION("ContainingMonitorUsesCenter") {
        // Mostly on the left monitor, but centred on the right one.
        w->position = {600, 0, 900, 500};
        REQUIRE(w->get_containing_monitor(monitors)->name == "right");
    }

    SECTION("OffscreenFallsBackToFirst") {
        w->position = {-500, -500, 100, 100};
        REQUIRE(w->get_containing_monitor(monitors)->name == "left");
    }

    SECTION("NoMonitors") {
        REQUIRE(w->get_containing_monitor({}).error().code == WindowErrc::no_monitors);
    }

    SECTION("NormalizedPosition") {
        w->position = {1500, 250, 1000, 500};
        auto r = w->get_normalized_position(monitors);
        REQUIRE(r.has_value());
        REQUIRE(*r == Rectangle{0.25, 0.25, 0.5, 0.5});
    }

    SECTION("SetNormalizedOnContainingMonitor") {
        w->position = {1100, 100, 10, 10};
        REQUIRE(w->set_normalized_position({0.5, 0.0, 0.5, 1.0}, monitors).has_value());
        REQUIRE(w->position == Rectangle{2000, 0, 1000, 1000});
    }

    SECTION("SetNormalizedOnGivenMonitor") {
        w->position = {1100, 100, 10, 10};
        REQUIRE(w->set_normalized_position({0.0, 0.0, 0.5, 0.5}, monitors, &monitors[0]).has_value());
        REQUIRE(w->position == Rectangle{0, 0, 500, 500});
    }
}
