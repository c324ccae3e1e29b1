#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace RTK::UI {

class Widget;

enum class EventType {
    MouseDown = 1,
    MouseUp,
    MouseMove,
    MouseWheel,
    Key,
    DropFile,
    WindowClose,
};

namespace MouseButton {
inline constexpr unsigned None   = 0;
inline constexpr unsigned Left   = 1;
inline constexpr unsigned Right  = 2;
inline constexpr unsigned Middle = 64;
inline constexpr unsigned Mask   = Left | Right | Middle;
} // namespace MouseButton

namespace Modifier {
inline constexpr unsigned Ctrl  = 4;
inline constexpr unsigned Shift = 8;
inline constexpr unsigned Alt   = 16;
inline constexpr unsigned Meta  = 32;
inline constexpr unsigned Mask  = Ctrl | Shift | Alt | Meta;
} // namespace Modifier

namespace Keycode {
inline constexpr long Up        = 30064;
inline constexpr long Down      = 1685026670;
inline constexpr long Left      = 1818584692;
inline constexpr long Right     = 1919379572;
inline constexpr long Enter     = 13;
inline constexpr long Space     = 32;
inline constexpr long Backspace = 8;
inline constexpr long Escape    = 27;
inline constexpr long Tab       = 9;
inline constexpr long Home      = 1752132965;
inline constexpr long End       = 6647396;
inline constexpr long Insert    = 6909555;
inline constexpr long Delete    = 6579564;
inline constexpr long F1        = 26161;
inline constexpr long F2        = 26162;
inline constexpr long F3        = 26163;
inline constexpr long F4        = 26164;
inline constexpr long F5        = 26165;
inline constexpr long F6        = 26166;
inline constexpr long F7        = 26167;
inline constexpr long F8        = 26168;
inline constexpr long F9        = 26169;
inline constexpr long F10       = 6697264;
inline constexpr long F11       = 6697265;
inline constexpr long F12       = 6697266;
} // namespace Keycode

enum class WheelMode {
    Linear,
    Damped,
};

/**
 * A single input event delivered to the widget tree.
 *
 * The window reuses one scratch Event for every dispatch within a tick, so a reference
 * received by a handler is only valid until that handler returns. Handlers that need to
 * keep an event must clone() it.
 */
struct Event {
    EventType                type = EventType::MouseMove;
    double                   x = 0.0;
    double                   y = 0.0;
    unsigned                 button = MouseButton::None;
    unsigned                 buttons = 0;
    unsigned                 modifiers = 0;
    bool                     ctrl = false;
    bool                     shift = false;
    bool                     alt = false;
    bool                     meta = false;
    double                   wheel = 0.0;
    double                   hwheel = 0.0;
    std::optional<long>      keycode;
    std::optional<char>      character;
    std::vector<std::string> files;
    double                   time = 0.0;
    bool                     simulated = false;
    Widget*                  debug = nullptr;

    auto reset(EventType type, double x, double y) -> Event&;
    void set_modifiers(unsigned cap, unsigned button);

    void set_handled(Widget* widget = nullptr);
    [[nodiscard]] auto handled() const -> bool { return handled_; }
    [[nodiscard]] auto handled_by() const -> Widget* { return handled_by_; }
    void clear_handled();

    [[nodiscard]] auto is_mouse_event() const -> bool;
    [[nodiscard]] auto clone() const -> Event;
    [[nodiscard]] auto clone_as(EventType type, bool simulated) const -> Event;
    [[nodiscard]] auto describe() const -> std::string;

private:
    bool    handled_ = false;
    Widget* handled_by_ = nullptr;
};

[[nodiscard]] auto EventTypeName(EventType type) -> char const*;

// Maps a polled host character code to the printable character it represents, if any.
[[nodiscard]] auto ClassifyKeyChar(long code, bool ctrl) -> std::optional<char>;

// Normalizes a raw wheel delta. Positive raw deltas (wheel away from the user) produce
// negative distances in both modes.
[[nodiscard]] auto WheelDistance(double raw, WheelMode mode) -> double;

[[nodiscard]] auto DefaultWheelMode() -> WheelMode;

} // namespace RTK::UI
