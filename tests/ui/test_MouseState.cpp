#include <doctest/doctest.h>

#include <rtk/ui/MouseState.hpp>

using namespace RTK::UI;

TEST_CASE("Button table flips one bit per sync") {
    MouseButtonTable table;
    unsigned const host = MouseButton::Left | MouseButton::Right;

    CHECK(table.sync_bit(MouseButton::Left, host) == EventType::MouseDown);
    CHECK(table.down() == MouseButton::Left);
    // Right is still pending until it is synced on its own.
    CHECK(table.sync_bit(MouseButton::Left, host) == std::nullopt);
    CHECK(table.sync_bit(MouseButton::Right, host) == EventType::MouseDown);
    CHECK(table.down() == host);
    CHECK(table.sync_bit(MouseButton::Left, MouseButton::Right) == EventType::MouseUp);
    CHECK(table.down() == MouseButton::Right);
}

TEST_CASE("Latest tracks the most recent held button") {
    MouseButtonTable table;
    CHECK(table.latest() == MouseButton::None);

    table.press(MouseButton::Left, 1.0, 1);
    table.press(MouseButton::Middle, 2.0, 2);
    CHECK(table.latest() == MouseButton::Middle);
    CHECK(table.order().size() == 2);

    table.release(MouseButton::Middle);
    CHECK(table.latest() == MouseButton::Left);
    // The state record outlives the release until explicitly cleared.
    REQUIRE(table.state(MouseButton::Middle) != nullptr);
    CHECK(table.state(MouseButton::Middle)->tick == 2);
    table.clear_state(MouseButton::Middle);
    CHECK(table.state(MouseButton::Middle) == nullptr);

    table.reset();
    CHECK(table.latest() == MouseButton::None);
    CHECK(table.state(MouseButton::Left) == nullptr);
}

TEST_CASE("Pressed widgets keep one record per widget") {
    PressedWidgets pressed;
    auto* widget = reinterpret_cast<Widget*>(0x10);
    pressed.add(widget, 1.0, 2.0, 3.0);
    pressed.add(widget, 5.0, 6.0, 7.0);
    REQUIRE(pressed.records().size() == 1);
    CHECK(pressed.find(widget)->x == 5.0);
    pressed.forget(widget);
    CHECK(pressed.empty());
}

TEST_CASE("Drag state resets to inactive") {
    DragDropState drag;
    drag.dragging = reinterpret_cast<Widget*>(0x20);
    drag.payload = 7;
    drag.buttons = MouseButton::Left;
    CHECK(drag.active());
    drag.reset();
    CHECK_FALSE(drag.active());
    CHECK_FALSE(drag.payload.has_value());
    CHECK(drag.buttons == 0);
}
