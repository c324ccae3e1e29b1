#pragma once

#include <string_view>

namespace RTK::UI {

enum class Cursor {
    Undefined,
    Pointer,
    Beam,
    Loading,
    Crosshair,
    Hand,
    Move,
    SizeNs,
    SizeEw,
    SizeNwSe,
    SizeNeSw,
    Invisible,
    // Only available through the native window capability.
    DragDropCopy,
    DragDropMove,
};

// Cursors the host's basic cursor mechanism cannot display.
[[nodiscard]] constexpr auto CursorRequiresNative(Cursor cursor) -> bool {
    return cursor == Cursor::DragDropCopy || cursor == Cursor::DragDropMove;
}

[[nodiscard]] auto CursorName(Cursor cursor) -> std::string_view;
[[nodiscard]] auto CursorFromName(std::string_view name) -> Cursor;

} // namespace RTK::UI
