#pragma once

#include <rtk/core/Error.hpp>
#include <rtk/ui/Cursor.hpp>
#include <rtk/ui/Event.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace RTK::UI {

/**
 * Policy constants for the window runtime. The defaults reproduce the toolkit's tuned
 * touchscreen ergonomics; none of the formulas depend on the exact values beyond being
 * monotonic in scale and time.
 */
struct RuntimeConfig {
    bool touch_scroll = false;

    // Seconds between a press and its activation when touch scrolling is enabled.
    double touch_activate_delay = 0.1;
    double long_press_delay = 0.5;
    double tooltip_delay = 0.5;
    double fps = 30.0;

    // Drag threshold in pixels is ceil(scale ^ drag_threshold_exponent).
    double drag_threshold_exponent = 1.7;
    // A press within this many seconds of the previous release uses
    // scale * double_click_threshold_factor instead (touch mode only).
    double double_click_guard = 0.2;
    double double_click_threshold_factor = 10.0;

    std::size_t partial_reflow_limit = 20;
    double slow_reflow_threshold = 0.02;
    double slow_tick_threshold = 0.04;

    WheelMode wheel_mode = DefaultWheelMode();
    double user_scale = 1.0;
    long debug_toggle_key = Keycode::F12;
    Cursor default_cursor = Cursor::Pointer;
    bool debug = false;

    [[nodiscard]] auto tick_interval() const -> double { return fps > 0.0 ? 1.0 / fps : 0.0; }
};

[[nodiscard]] auto ParseRuntimeConfig(std::string_view json_text) -> Expected<RuntimeConfig>;
[[nodiscard]] auto LoadRuntimeConfig(std::filesystem::path const& path) -> Expected<RuntimeConfig>;

// Applies RTK_TOUCH_SCROLL, RTK_UI_SCALE, RTK_WHEEL_MODE and RTK_UI_DEBUG.
void ApplyEnvironmentOverrides(RuntimeConfig& config);

[[nodiscard]] auto WheelModeName(WheelMode mode) -> std::string_view;
[[nodiscard]] auto WheelModeFromName(std::string_view name) -> std::optional<WheelMode>;

} // namespace RTK::UI
