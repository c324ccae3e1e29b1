#pragma once

#include <rtk/core/Error.hpp>
#include <rtk/ui/BackingStore.hpp>
#include <rtk/ui/Cursor.hpp>
#include <rtk/ui/HostSurface.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace RTK::UI {

using NativeHandle = std::uintptr_t;

struct NativeRect {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    [[nodiscard]] auto width() const -> int { return right - left; }
    // Bottom-up platforms report top < bottom reversed, so the height is always positive.
    [[nodiscard]] auto height() const -> int { return bottom > top ? bottom - top : top - bottom; }
};

struct NativeStyle {
    bool borderless = false;
    bool resizable = true;
};

/**
 * Primitives of the optional OS window extension. The capability is all or nothing: a
 * host either provides every operation or the window runs without it.
 *
 * Setters return false when the OS rejected the call.
 */
class NativeWindowApi {
public:
    virtual ~NativeWindowApi() = default;

    [[nodiscard]] virtual auto find(std::string_view title, bool exact) const -> std::optional<NativeHandle> = 0;
    [[nodiscard]] virtual auto enumerate(std::string_view title, bool exact) const -> std::vector<NativeHandle> = 0;
    [[nodiscard]] virtual auto host_main_window() const -> std::optional<NativeHandle> = 0;
    [[nodiscard]] virtual auto list_children(NativeHandle parent) const -> std::vector<NativeHandle> = 0;
    [[nodiscard]] virtual auto title(NativeHandle handle) const -> std::optional<std::string> = 0;

    // Client area in screen coordinates.
    [[nodiscard]] virtual auto client_rect(NativeHandle handle) const -> std::optional<NativeRect> = 0;
    [[nodiscard]] virtual auto client_size(NativeHandle handle) const -> std::optional<SizeI> = 0;
    // Outer rectangle including the OS frame.
    [[nodiscard]] virtual auto window_rect(NativeHandle handle) const -> std::optional<NativeRect> = 0;

    virtual auto set_style(NativeHandle handle, NativeStyle style) -> bool = 0;
    virtual auto set_zorder(NativeHandle handle, bool topmost) -> bool = 0;
    virtual auto set_position(NativeHandle handle, int x, int y, int w, int h) -> bool = 0;
    virtual auto resize(NativeHandle handle, int w, int h) -> bool = 0;
    virtual auto set_opacity(NativeHandle handle, double opacity) -> bool = 0;
    virtual auto set_title(NativeHandle handle, std::string_view title) -> bool = 0;
    virtual auto show(NativeHandle handle, bool visible) -> bool = 0;
    [[nodiscard]] virtual auto is_visible(NativeHandle handle) const -> bool = 0;

    [[nodiscard]] virtual auto focused() const -> std::optional<NativeHandle> = 0;
    virtual auto set_focus(NativeHandle handle) -> bool = 0;
    [[nodiscard]] virtual auto window_from_point(PointI screen) const -> std::optional<NativeHandle> = 0;

    virtual auto set_cursor(Cursor cursor) -> bool = 0;
    virtual auto release_cursor() -> bool = 0;

    // Paints directly on the OS window, bypassing the host's framebuffer.
    virtual auto fill_rect(NativeHandle handle, PixelRect rect, Color color) -> bool = 0;
    // Drops the layered (transparency) extended style.
    virtual auto strip_layered(NativeHandle handle) -> bool = 0;

    // Display containing the given rectangle; working excludes taskbars and menus.
    [[nodiscard]] virtual auto display_rect(NativeRect area, bool working) const -> std::optional<NativeRect> = 0;
    // True on platforms where native y grows upward from the bottom of the display.
    [[nodiscard]] virtual auto bottom_up_coordinates() const -> bool = 0;
};

/**
 * Window-scoped wrapper around an optional NativeWindowApi. Every operation returns
 * NotSupported when the capability is absent and NotFound when no OS window has been
 * resolved yet; callers treat both as best effort.
 */
class NativeWindowController {
public:
    explicit NativeWindowController(NativeWindowApi* api = nullptr);

    [[nodiscard]] auto available() const -> bool { return api_ != nullptr; }
    [[nodiscard]] auto bottom_up() const -> bool { return api_ != nullptr && api_->bottom_up_coordinates(); }
    [[nodiscard]] auto handle() const -> std::optional<NativeHandle> { return handle_; }
    void clear_handle() { handle_.reset(); }

    // Locates the OS window whose client origin sits at the given screen coordinates.
    // On success the handle becomes current and its frame overhead is measured.
    auto resolve_handle(std::string_view title, PointI client_origin, bool docked) -> Expected<NativeHandle>;

    // Outer size minus client size for the current handle. Zero until measured.
    [[nodiscard]] auto frame_overhead() const -> SizeI;
    auto measure_frame_overhead(NativeHandle handle) -> Expected<SizeI>;
    // Seeds the overhead from another window (the host's) before our own exists.
    auto estimate_frame_overhead_from_host() -> Expected<SizeI>;

    auto apply_style(bool borderless, bool pinned, bool resizable) -> Expected<void>;
    auto set_position(int x, int y, int outer_w, int outer_h) -> Expected<void>;
    auto resize(int w, int h) -> Expected<void>;
    auto set_opacity(double opacity) -> Expected<void>;
    auto set_title(std::string_view title) -> Expected<void>;
    auto set_cursor(Cursor cursor) -> Expected<void>;
    auto release_cursor() -> Expected<void>;
    auto show(bool visible) -> Expected<void>;
    [[nodiscard]] auto is_visible() const -> Expected<bool>;

    [[nodiscard]] auto client_rect() const -> Expected<NativeRect>;
    [[nodiscard]] auto is_focused() const -> Expected<bool>;
    auto set_focus() -> Expected<void>;
    // True if our window is the topmost OS window at the given screen point.
    [[nodiscard]] auto owns_point(PointI screen) const -> Expected<bool>;

    auto fill_background(PixelRect rect, Color color) -> Expected<void>;
    auto strip_layered() -> Expected<void>;

    [[nodiscard]] auto display_rect(NativeRect area, bool working) const -> Expected<NativeRect>;

    // Converts a native y coordinate for a box of the given height into top-down space.
    // The display height is looked up from the monitor containing the given corner and
    // cached; without bottom-up coordinates or the capability this is the identity.
    auto normalize_y(int y, int height, PointI corner) -> int;
    void invalidate_screen_height() { screen_height_.reset(); }

private:
    [[nodiscard]] auto require_handle() const -> Expected<NativeHandle>;
    [[nodiscard]] auto verify_origin(NativeHandle handle, PointI origin) const -> bool;
    [[nodiscard]] auto search(std::vector<NativeHandle> const& candidates, std::optional<std::string_view> title,
                              PointI origin) const -> std::optional<NativeHandle>;

    NativeWindowApi*                          api_;
    std::optional<NativeHandle>               handle_;
    std::unordered_map<NativeHandle, SizeI>   frame_overhead_;
    std::optional<SizeI>                      host_frame_estimate_;
    std::optional<int>                        screen_height_;
};

} // namespace RTK::UI
