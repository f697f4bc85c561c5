#include <catch2/catch_test_macros.hpp>

#include "fake_window.hpp"

#include <memory>

TEST_CASE("WindowManager", "[manager]") {
    FakeWindowManager wm;

    SECTION("ForegroundReusesRegisteredWindow") {
        wm.foreground = 10;
        auto first = wm.get_foreground();
        auto second = wm.get_foreground();
        REQUIRE(first.has_value());
        REQUIRE(*first == *second);
        REQUIRE(wm.windows_made == 1);
    }

    SECTION("ForegroundRegistersNewWindow") {
        wm.foreground = 11;
        auto w = wm.get_foreground();
        REQUIRE((*w)->id() == 11);
        REQUIRE(wm.find_window(WindowId{11}) == *w);
    }

    SECTION("AllWindowsInEnumerationOrder") {
        wm.ids = {3, 1, 2};
        auto windows = wm.get_all_windows();
        REQUIRE(windows.has_value());
        REQUIRE(windows->size() == 3);
        REQUIRE((*windows)[0]->id() == 3);
        REQUIRE((*windows)[1]->id() == 1);
        REQUIRE((*windows)[2]->id() == 2);
    }

    SECTION("EnumerationReusesRegisteredWindows") {
        wm.foreground = 2;
        auto focused = wm.get_foreground();
        wm.ids = {1, 2};
        auto windows = wm.get_all_windows();
        REQUIRE((*windows)[1] == *focused);
        REQUIRE(wm.windows_made == 2);

        auto again = wm.get_all_windows();
        REQUIRE((*again)[0] == (*windows)[0]);
        REQUIRE(wm.windows_made == 2);
    }

    SECTION("FindByName") {
        auto w = wm.get_window(5);
        w->add_name("music");
        REQUIRE(wm.find_window("music") == w);
        REQUIRE(wm.find_window("video") == nullptr);
    }

    SECTION("MoveUsesManagerMovers") {
        auto mover = std::make_unique<RecordingMover>();
        auto* mover_ptr = mover.get();
        wm.movers().add("slide", std::move(mover));

        auto w = wm.get_window(8);
        REQUIRE(w->move({1, 2, 3, 4}, "slide").has_value());
        REQUIRE(mover_ptr->calls.size() == 1);
    }

    SECTION("ShutdownClearsRegistry") {
        auto w = wm.get_window(5);
        w->add_name("music");
        wm.shutdown();
        REQUIRE(wm.find_window(WindowId{5}) == nullptr);
        REQUIRE(wm.find_window("music") == nullptr);
        REQUIRE(wm.get_window(5) != w);
    }

    SECTION("Monitors") {
        REQUIRE(wm.monitors().empty());
        wm.set_monitors({{"main", {0, 0, 1920, 1080}}});
        REQUIRE(wm.monitors().size() == 1);
    }
}

TEST_CASE("WindowMoverRegistry", "[mover]") {
    WindowMoverRegistry movers;

    SECTION("FindUnknownIsNull") {
        REQUIRE(movers.empty());
        REQUIRE(movers.find("slide") == nullptr);
    }

    SECTION("AddFindRemove") {
        movers.add("slide", std::make_unique<RecordingMover>());
        movers.add("fade", std::make_unique<RecordingMover>());
        REQUIRE(movers.find("slide") != nullptr);
        REQUIRE(movers.names() == std::vector<std::string>{"fade", "slide"});
        REQUIRE(movers.remove("slide"));
        REQUIRE_FALSE(movers.remove("slide"));
        REQUIRE(movers.find("slide") == nullptr);
    }

    SECTION("AddReplaces") {
        auto first = std::make_unique<RecordingMover>();
        auto second = std::make_unique<RecordingMover>();
        auto* second_ptr = second.get();
        movers.add("slide", std::move(first));
        movers.add("slide", std::move(second));
        REQUIRE(movers.find("slide") == second_ptr);
    }
}
