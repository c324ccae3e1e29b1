#include <doctest/doctest.h>

#include <rtk/ui/Cursor.hpp>
#include <rtk/ui/Event.hpp>

#include <cmath>

using namespace RTK::UI;

TEST_CASE("Key codes classify into printable characters") {
    CHECK(ClassifyKeyChar('a', false) == 'a');
    CHECK(ClassifyKeyChar(' ', false) == ' ');
    SUBCASE("Control codes with ctrl map to letters") {
        CHECK(ClassifyKeyChar(1, true) == 'a');
        CHECK(ClassifyKeyChar(26, true) == 'z');
        CHECK_FALSE(ClassifyKeyChar(1, false).has_value());
    }
    SUBCASE("Extended ranges fold back to ASCII") {
        CHECK(ClassifyKeyChar(257, false) == 'a');
        CHECK(ClassifyKeyChar(321, false) == 'a');
    }
    SUBCASE("Non-printable codes stay keycodes") {
        CHECK_FALSE(ClassifyKeyChar(Keycode::Escape, false).has_value());
        CHECK_FALSE(ClassifyKeyChar(Keycode::Enter, false).has_value());
        CHECK_FALSE(ClassifyKeyChar(127, false).has_value());
        CHECK_FALSE(ClassifyKeyChar(Keycode::F12, false).has_value());
        CHECK_FALSE(ClassifyKeyChar(0, false).has_value());
    }
}

TEST_CASE("Damped wheel distance keeps direction and compresses magnitude") {
    auto const up = WheelDistance(-120.0, WheelMode::Damped);
    auto const down = WheelDistance(120.0, WheelMode::Damped);
    CHECK(up > 0.0);
    CHECK(down < 0.0);

    auto const small = std::abs(WheelDistance(60.0, WheelMode::Damped));
    auto const large = std::abs(WheelDistance(240.0, WheelMode::Damped));
    CHECK(large > small);
    // Four times the delta gives only twice the distance.
    CHECK(large == doctest::Approx(2.0 * small));
    CHECK(WheelDistance(0.0, WheelMode::Damped) == 0.0);
}

TEST_CASE("Linear wheel distance scales one notch to one unit") {
    CHECK(WheelDistance(120.0, WheelMode::Linear) == doctest::Approx(-1.0));
    CHECK(WheelDistance(-240.0, WheelMode::Linear) == doctest::Approx(2.0));
}

TEST_CASE("Event reset, modifiers and cloning") {
    Event event;
    event.reset(EventType::MouseDown, 4.0, 5.0);
    event.set_modifiers(MouseButton::Left | Modifier::Ctrl | Modifier::Alt, MouseButton::Left);
    CHECK(event.ctrl);
    CHECK(event.alt);
    CHECK_FALSE(event.shift);
    CHECK(event.buttons == MouseButton::Left);
    CHECK(event.button == MouseButton::Left);
    CHECK(event.is_mouse_event());

    event.set_handled();
    auto copy = event.clone_as(EventType::MouseMove, true);
    CHECK(copy.type == EventType::MouseMove);
    CHECK(copy.simulated);
    CHECK_FALSE(copy.handled());
    CHECK(copy.x == 4.0);
    CHECK(event.handled());

    event.reset(EventType::Key, 0.0, 0.0);
    CHECK_FALSE(event.handled());
    CHECK_FALSE(event.ctrl);
    CHECK_FALSE(event.is_mouse_event());
    CHECK(event.describe().find("key") != std::string::npos);
}

TEST_CASE("Cursor names round trip") {
    CHECK(CursorFromName("hand") == Cursor::Hand);
    CHECK(CursorName(Cursor::SizeNwSe) == "size_nw_se");
    CHECK(CursorFromName("nope") == Cursor::Undefined);
    CHECK(CursorRequiresNative(Cursor::DragDropCopy));
    CHECK_FALSE(CursorRequiresNative(Cursor::Beam));
}
