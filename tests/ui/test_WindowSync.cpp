#include <doctest/doctest.h>

#include "ui/FakeHost.hpp"

#include <rtk/ui/WindowSync.hpp>

#include <algorithm>

using namespace RTK;
using namespace RTK::UI;
using RTK::UI::Testing::FakeNativeApi;
using RTK::UI::Testing::WindowHarness;

TEST_CASE("Resize classification") {
    CHECK(ClassifyResize(800, 600, SizeI{800, 600}) == ResizeKind::Unchanged);
    CHECK(ClassifyResize(640, 600, SizeI{800, 600}) == ResizeKind::Shrink);
    CHECK(ClassifyResize(900, 500, SizeI{800, 600}) == ResizeKind::Grow);
}

TEST_CASE("Opening resolves the native window without moving it") {
    WindowHarness harness{true};
    harness.open();
    harness.tick();
    REQUIRE(harness.window->native().handle().has_value());
    CHECK(*harness.window->native().handle() == FakeNativeApi::kOwn);
    CHECK(harness.native.set_position_calls == 0);
    CHECK(harness.screen.w == 800);
}

TEST_CASE("Geometry changes within a tick coalesce into one OS call") {
    WindowHarness harness{true};
    std::vector<std::pair<double, double>> resizes;
    harness.window->callbacks().on_resize = [&resizes](double w, double h) { resizes.emplace_back(w, h); };
    harness.open();
    harness.tick();

    REQUIRE(harness.window->move(100, 50).has_value());
    REQUIRE(harness.window->resize(900, 700).has_value());
    REQUIRE(harness.window->move(120, 60).has_value());
    harness.tick();

    CHECK(harness.native.set_position_calls == 1);
    REQUIRE_FALSE(harness.native.positions.empty());
    auto const& outer = harness.native.positions.back();
    CHECK(outer.width() == 916);
    CHECK(outer.height() == 738);
    CHECK(harness.screen.x == 120);
    CHECK(harness.screen.y == 60);
    CHECK(harness.screen.w == 900);
    CHECK(harness.screen.h == 700);
    CHECK(harness.window->framebuffer_size().w == 900);
    REQUIRE(resizes.size() == 1);
    CHECK(resizes.front().first == 800.0);

    harness.tick();
    CHECK(harness.native.set_position_calls == 1);
    REQUIRE(harness.root->last_box.has_value());
    CHECK(harness.root->last_box->w == 900.0);
}

TEST_CASE("Without the native capability geometry is left to the host") {
    WindowHarness harness;
    harness.open();
    harness.tick();
    REQUIRE(harness.window->move(100, 50).has_value());
    harness.tick();
    CHECK(harness.native.set_position_calls == 0);
    // The host still reports the old position, which wins.
    CHECK(harness.window->attributes().x == 0.0);
}

TEST_CASE("Docking round trip restores the undocked geometry") {
    WindowHarness harness{true};
    harness.host.dockers = {{1, static_cast<int>(DockPosition::Right)}};
    int docks = 0;
    harness.window->callbacks().on_dock = [&docks] { ++docks; };
    REQUIRE(harness.window->move(200, 150).has_value());
    REQUIRE(harness.window->resize(640, 480).has_value());
    harness.open();
    harness.tick();
    CHECK(harness.window->dock_state() == MakeDockState(1, false));
    CHECK(harness.native.set_position_calls == 0);

    for (int round = 0; round < 2; ++round) {
        CAPTURE(round);
        harness.screen.calls.clear();
        harness.native.set_position_calls = 0;
        auto const docks_before = docks;

        REQUIRE(harness.window->set_attribute(WindowAttribute::Docked, AttributeValue{true}).has_value());
        harness.tick();
        CHECK(harness.window->docked());
        CHECK(harness.window->dock_state() == MakeDockState(1, true));
        CHECK(harness.native.set_position_calls == 0);
        CHECK(harness.screen.calls == std::vector<std::string>{"set_dock", "strip_layered"});
        CHECK(harness.window->calculated().w == 300.0);
        CHECK(harness.window->calculated().h == 200.0);
        CHECK(docks > docks_before);
        REQUIRE(harness.window->sync().undocked_geometry().has_value());
        CHECK(harness.window->sync().undocked_geometry()->w == 640.0);

        harness.screen.calls.clear();
        REQUIRE(harness.window->set_attribute(WindowAttribute::Docked, AttributeValue{false}).has_value());
        harness.tick();
        CHECK_FALSE(harness.window->docked());
        CHECK(harness.screen.calls == std::vector<std::string>{"set_dock", "set_position"});
        REQUIRE_FALSE(harness.native.positions.empty());
        CHECK(harness.native.positions.back().width() == 656);
        CHECK(harness.native.positions.back().height() == 518);
        auto const& attrs = harness.window->attributes();
        CHECK(attrs.x == 200.0);
        CHECK(attrs.y == 150.0);
        CHECK(attrs.w == 640.0);
        CHECK(attrs.h == 480.0);
        CHECK(harness.screen.w == 640);
        CHECK(harness.screen.h == 480);
    }
}

TEST_CASE("Dock changes made by the host are pulled in") {
    WindowHarness harness{true};
    harness.open();
    harness.tick();
    int docks = 0;
    harness.window->callbacks().on_dock = [&docks] { ++docks; };

    harness.screen.dock = MakeDockState(4, true);
    harness.screen.w = 300;
    harness.screen.h = 200;
    harness.tick();
    CHECK(docks == 1);
    CHECK(harness.window->docked());
    CHECK(std::get<int>(harness.window->attributes().dock) == 4);
    CHECK(harness.window->calculated().w == 300.0);
    // The host initiated the change, so it is not echoed back.
    CHECK(harness.host.dock_requests.empty());
}

TEST_CASE("Docking works without the native capability") {
    WindowHarness harness;
    harness.host.dockers = {{2, static_cast<int>(DockPosition::Left)}};
    REQUIRE(harness.window->set_attribute(WindowAttribute::Dock, AttributeValue{std::string{"left"}}).has_value());
    REQUIRE(harness.window->set_attribute(WindowAttribute::Docked, AttributeValue{true}).has_value());
    harness.open();
    harness.tick();
    CHECK(harness.window->dock_state() == MakeDockState(2, true));
    CHECK(harness.screen.w == 300);
    CHECK(harness.window->calculated().w == 300.0);

    REQUIRE(harness.window->set_attribute(WindowAttribute::Docked, AttributeValue{false}).has_value());
    harness.tick();
    CHECK_FALSE(harness.window->docked());
    CHECK(harness.host.dock_requests.back() == MakeDockState(2, false));
}

TEST_CASE("Unresolved dock positions fall back to docker zero") {
    WindowHarness harness;
    CHECK(harness.window->sync().resolve_docker(DockPosition::Top) == 0);
    harness.host.dockers = {{7, static_cast<int>(DockPosition::Top)}};
    CHECK(harness.window->sync().resolve_docker(DockPosition::Top) == 7);
}

TEST_CASE("Placement hints position the window on its display") {
    SUBCASE("Centered") {
        WindowHarness harness{true};
        PlacementHints hints;
        hints.halign = HAlign::Center;
        hints.valign = VAlign::Center;
        harness.open(hints);
        CHECK(harness.window->attributes().x == 552.0);
        CHECK(harness.window->attributes().y == 221.0);
        CHECK(harness.screen.x == 552);
        CHECK(harness.screen.y == 221);
    }
    SUBCASE("Far edges with offsets") {
        WindowHarness harness{true};
        PlacementHints hints;
        hints.halign = HAlign::Right;
        hints.valign = VAlign::Bottom;
        hints.x = -10.0;
        hints.y = -20.0;
        harness.open(hints);
        CHECK(harness.window->attributes().x == 1094.0);
        CHECK(harness.window->attributes().y == 422.0);
    }
    SUBCASE("Bottom-up displays swap the vertical edges") {
        WindowHarness harness{true};
        harness.native.bottom_up = true;
        PlacementHints hints;
        hints.valign = VAlign::Top;
        harness.open(hints);
        CHECK(harness.window->attributes().y == 442.0);
    }
    SUBCASE("Constrained to the working area") {
        WindowHarness harness{true};
        REQUIRE(harness.window->move(1500, -40).has_value());
        REQUIRE(harness.window->resize(3000, 600).has_value());
        PlacementHints hints;
        hints.constrain = true;
        harness.open(hints);
        CHECK(harness.window->attributes().w == 1904.0);
        CHECK(harness.window->attributes().x == 0.0);
        CHECK(harness.window->attributes().y == 0.0);
    }
    SUBCASE("Ignored without the native capability") {
        WindowHarness harness;
        PlacementHints hints;
        hints.halign = HAlign::Center;
        harness.open(hints);
        CHECK(harness.window->attributes().x == 0.0);
    }
}

TEST_CASE("Visibility and style are pushed to the OS window") {
    WindowHarness harness{true};
    harness.open();
    harness.tick();

    harness.window->hide();
    harness.tick();
    CHECK_FALSE(harness.screen.visible);

    harness.window->show();
    harness.tick();
    CHECK(harness.screen.visible);
    CHECK_FALSE(harness.window->sync().restyle_pending());

    REQUIRE(harness.window->set_attribute(WindowAttribute::Pinned, AttributeValue{true}).has_value());
    REQUIRE(harness.window->set_attribute(WindowAttribute::Opacity, AttributeValue{0.5}).has_value());
    REQUIRE(harness.window->set_attribute(WindowAttribute::Title, AttributeValue{std::string{"Mixer"}}).has_value());
    harness.tick();
    CHECK(harness.screen.topmost);
    CHECK(harness.screen.opacity == 0.5);
    CHECK(harness.screen.title == "Mixer");
}

TEST_CASE("Borderless windows drop the frame overhead") {
    WindowHarness harness{true};
    harness.open();
    harness.tick();
    auto const calls = harness.native.set_position_calls;

    REQUIRE(harness.window->set_attribute(WindowAttribute::Borderless, AttributeValue{true}).has_value());
    harness.tick();
    CHECK(harness.window->calculated().borderless);
    CHECK(harness.native.set_position_calls == calls + 1);
    CHECK(harness.native.positions.back().width() == 800);
    CHECK(harness.native.positions.back().height() == 600);
    CHECK(harness.window->native().frame_overhead().w == 0);
}
