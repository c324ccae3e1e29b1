#include <doctest/doctest.h>

#include "ui/FakeHost.hpp"

#include <rtk/ui/NativeWindow.hpp>

using namespace RTK;
using namespace RTK::UI;
using RTK::UI::Testing::FakeNativeApi;
using RTK::UI::Testing::FakeOsWindow;
using RTK::UI::Testing::FakeScreen;

namespace {

auto mixer_screen() -> FakeScreen {
    FakeScreen screen;
    screen.title = "Mixer";
    screen.x = 50;
    screen.y = 60;
    screen.w = 400;
    screen.h = 300;
    return screen;
}

} // namespace

TEST_CASE("Without the capability every operation reports NotSupported") {
    NativeWindowController controller;
    CHECK_FALSE(controller.available());
    CHECK(controller.resolve_handle("Mixer", PointI{}, false).error().code == Error::Code::NotSupported);
    CHECK(controller.set_position(0, 0, 10, 10).error().code == Error::Code::NotSupported);
    CHECK(controller.set_cursor(Cursor::Hand).error().code == Error::Code::NotSupported);
    CHECK(controller.display_rect(NativeRect{}, true).error().code == Error::Code::NotSupported);
    CHECK(controller.frame_overhead().w == 0);
    CHECK(controller.normalize_y(42, 10, PointI{}) == 42);
}

TEST_CASE("Operations need a resolved handle") {
    auto screen = mixer_screen();
    FakeNativeApi api{screen};
    NativeWindowController controller{&api};
    CHECK(controller.show(false).error().code == Error::Code::NotFound);
    CHECK(controller.is_focused().error().code == Error::Code::NotFound);
    CHECK(screen.visible);
}

TEST_CASE("Handle resolution by title and client origin") {
    auto screen = mixer_screen();
    FakeNativeApi api{screen};
    NativeWindowController controller{&api};

    SUBCASE("Unique title resolves directly") {
        auto handle = controller.resolve_handle("Mixer", PointI{50, 60}, false);
        REQUIRE(handle.has_value());
        CHECK(*handle == FakeNativeApi::kOwn);
        CHECK(api.enumerate_calls == 0);
        CHECK(controller.frame_overhead().w == 16);
        CHECK(controller.frame_overhead().h == 38);
    }
    SUBCASE("Duplicate titles fall back to enumerating") {
        api.others[5] = FakeOsWindow{"Mixer", NativeRect{0, 0, 200, 100}, SizeI{}};
        auto handle = controller.resolve_handle("Mixer", PointI{50, 60}, false);
        REQUIRE(handle.has_value());
        CHECK(*handle == FakeNativeApi::kOwn);
        CHECK(api.enumerate_calls == 1);
        CHECK(api.list_children_calls == 0);
    }
    SUBCASE("Docked windows search the host's children first") {
        api.others[5] = FakeOsWindow{"Mixer", NativeRect{0, 0, 200, 100}, SizeI{}};
        api.host_children = {FakeNativeApi::kHost, FakeNativeApi::kOwn};
        auto handle = controller.resolve_handle("Mixer", PointI{50, 60}, true);
        REQUIRE(handle.has_value());
        CHECK(*handle == FakeNativeApi::kOwn);
        CHECK(api.list_children_calls == 1);
        CHECK(api.enumerate_calls == 0);
    }
    SUBCASE("No matching window clears the handle") {
        REQUIRE(controller.resolve_handle("Mixer", PointI{50, 60}, false).has_value());
        auto missing = controller.resolve_handle("Sampler", PointI{50, 60}, false);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
        CHECK_FALSE(controller.handle().has_value());
    }
    SUBCASE("A window at another origin is not ours") {
        auto handle = controller.resolve_handle("Mixer", PointI{0, 0}, false);
        REQUIRE_FALSE(handle.has_value());
        CHECK(api.enumerate_calls == 1);
    }
}

TEST_CASE("Frame overhead follows style changes") {
    auto screen = mixer_screen();
    FakeNativeApi api{screen};
    NativeWindowController controller{&api};

    auto estimate = controller.estimate_frame_overhead_from_host();
    REQUIRE(estimate.has_value());
    CHECK(estimate->w == 16);
    CHECK(controller.frame_overhead().h == 38);

    REQUIRE(controller.resolve_handle("Mixer", PointI{50, 60}, false).has_value());
    REQUIRE(controller.apply_style(true, true, true).has_value());
    CHECK(screen.topmost);
    CHECK(controller.frame_overhead().w == 0);
    CHECK(controller.frame_overhead().h == 0);
    CHECK(screen.w == 400);

    REQUIRE(controller.apply_style(false, false, true).has_value());
    CHECK_FALSE(screen.topmost);
    CHECK(controller.frame_overhead().h == 38);
}

TEST_CASE("Focus, occlusion and layered style on the resolved window") {
    auto screen = mixer_screen();
    FakeNativeApi api{screen};
    NativeWindowController controller{&api};
    REQUIRE(controller.resolve_handle("Mixer", PointI{50, 60}, false).has_value());

    CHECK_FALSE(*controller.is_focused());
    REQUIRE(controller.set_focus().has_value());
    CHECK(*controller.is_focused());

    CHECK(*controller.owns_point(PointI{60, 70}));
    api.occluded = true;
    CHECK_FALSE(*controller.owns_point(PointI{60, 70}));

    REQUIRE(controller.strip_layered().has_value());
    CHECK_FALSE(screen.layered);
}

TEST_CASE("Bottom-up y is normalized against a cached display height") {
    auto screen = mixer_screen();
    FakeNativeApi api{screen};
    NativeWindowController controller{&api};

    CHECK(controller.normalize_y(100, 200, PointI{}) == 100);
    api.bottom_up = true;
    CHECK(controller.normalize_y(100, 200, PointI{}) == 780);

    api.display = NativeRect{0, 0, 1920, 1200};
    CHECK(controller.normalize_y(100, 200, PointI{}) == 780);
    controller.invalidate_screen_height();
    CHECK(controller.normalize_y(100, 200, PointI{}) == 900);
}
