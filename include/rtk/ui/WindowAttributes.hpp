#pragma once

#include <rtk/core/Error.hpp>
#include <rtk/ui/BackingStore.hpp>
#include <rtk/ui/ReflowScheduler.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace RTK::UI {

enum class WindowAttribute {
    X,
    Y,
    W,
    H,
    MinW,
    MinH,
    Visible,
    Docked,
    Dock,
    Pinned,
    Borderless,
    Title,
    Opacity,
    Background,
};

// Screen edge of the host window a docker is attached to.
enum class DockPosition {
    Bottom = 0,
    Left = 1,
    Top = 2,
    Right = 3,
    Floating = 4,
};

// Either a docker id or the first docker found at a screen edge.
using DockTarget = std::variant<int, DockPosition>;

using AttributeValue = std::variant<bool, double, std::string, DockTarget, Color>;

struct WindowAttributes {
    double      x = 0.0;
    double      y = 0.0;
    double      w = 800.0;
    double      h = 600.0;
    double      minw = 100.0;
    double      minh = 30.0;
    bool        visible = true;
    bool        docked = false;
    DockTarget  dock = DockPosition::Right;
    bool        pinned = false;
    bool        borderless = false;
    std::string title = "rtk application";
    double      opacity = 1.0;
    Color       background = 0x252525ffu;
};

struct AttributeContext {
    bool native_available = false;
};

struct AttributeDescriptor {
    WindowAttribute           attribute;
    std::string_view          name;
    // Changing the attribute needs a push to the OS window on the next tick.
    bool                      window_sync;
    std::optional<ReflowMode> reflow;
    auto (*validate)(AttributeValue const& value) -> Expected<void>;
    void (*store)(WindowAttributes& attrs, AttributeValue const& value);
    // Derives the effective value from the declared ones.
    void (*calculate)(WindowAttributes& calc, AttributeContext const& ctx);
};

[[nodiscard]] auto AttributeDescriptors() -> std::span<AttributeDescriptor const>;
[[nodiscard]] auto DescribeAttribute(WindowAttribute attribute) -> AttributeDescriptor const&;
[[nodiscard]] auto FindAttribute(std::string_view name) -> std::optional<WindowAttribute>;

// Validates and stores a declared value. Invalid values leave attrs unchanged.
auto AssignAttribute(WindowAttributes& attrs, WindowAttribute attribute, AttributeValue const& value) -> Expected<void>;
[[nodiscard]] auto ReadAttribute(WindowAttributes const& attrs, WindowAttribute attribute) -> AttributeValue;

// Runs every calculator over a copy of the declared attributes.
[[nodiscard]] auto CalculateAttributes(WindowAttributes const& declared, AttributeContext const& ctx) -> WindowAttributes;

// Refreshes one calculated value (and any value it constrains) from the declared ones,
// leaving every other calculated value as it is.
void RecalculateAttribute(WindowAttributes const& declared, WindowAttributes& calc, WindowAttribute attribute,
                          AttributeContext const& ctx);

[[nodiscard]] auto ParseDockPosition(std::string_view name) -> std::optional<DockPosition>;
[[nodiscard]] auto DockPositionName(DockPosition position) -> std::string_view;

} // namespace RTK::UI
