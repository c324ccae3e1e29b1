#include <rtk/ui/Cursor.hpp>

#include <array>
#include <utility>

namespace RTK::UI {

namespace {

constexpr auto kCursorNames = std::to_array<std::pair<Cursor, std::string_view>>({
    {Cursor::Undefined, "undefined"},
    {Cursor::Pointer, "pointer"},
    {Cursor::Beam, "beam"},
    {Cursor::Loading, "loading"},
    {Cursor::Crosshair, "crosshair"},
    {Cursor::Hand, "hand"},
    {Cursor::Move, "move"},
    {Cursor::SizeNs, "size_ns"},
    {Cursor::SizeEw, "size_ew"},
    {Cursor::SizeNwSe, "size_nw_se"},
    {Cursor::SizeNeSw, "size_ne_sw"},
    {Cursor::Invisible, "invisible"},
    {Cursor::DragDropCopy, "dragdrop_copy"},
    {Cursor::DragDropMove, "dragdrop_move"},
});

} // namespace

auto CursorName(Cursor cursor) -> std::string_view {
    for (auto const& [value, name] : kCursorNames) {
        if (value == cursor) {
            return name;
        }
    }
    return "undefined";
}

auto CursorFromName(std::string_view name) -> Cursor {
    for (auto const& [value, label] : kCursorNames) {
        if (label == name) {
            return value;
        }
    }
    return Cursor::Undefined;
}

} // namespace RTK::UI
