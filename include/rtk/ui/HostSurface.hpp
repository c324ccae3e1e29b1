#pragma once

#include <rtk/ui/Cursor.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RTK::UI {

// Docker id in bits 8..15, docked flag in bit 0.
using DockState = std::uint32_t;

[[nodiscard]] constexpr auto MakeDockState(int docker, bool docked) -> DockState {
    return (static_cast<DockState>(docker < 0 ? 0 : docker) << 8) | (docked ? 1u : 0u);
}
[[nodiscard]] constexpr auto DockStateDocked(DockState state) -> bool {
    return (state & 0x01u) != 0;
}
[[nodiscard]] constexpr auto DockStateDocker(DockState state) -> int {
    return static_cast<int>((state >> 8) & 0xffu);
}

struct DockQuery {
    DockState state = 0;
    // Screen position of the window as the host reports it (native y orientation).
    int x = 0;
    int y = 0;
};

struct PointI {
    int x = 0;
    int y = 0;
};

struct SizeI {
    int w = 0;
    int h = 0;
};

/**
 * The host application's immediate-mode graphics and input surface. Everything is
 * polled: the window reads it once per tick through HostSurfaceAdapter.
 */
class HostSurface {
public:
    virtual ~HostSurface() = default;

    virtual void init(std::string_view title, int w, int h, DockState dock, int x, int y) = 0;
    virtual void quit() = 0;

    // Commits the frame and refreshes polled state. Also discards the drop-file queue.
    virtual void commit() = 0;

    // Drop file at index, or nullopt past the end.
    [[nodiscard]] virtual auto drop_file(int index) const -> std::optional<std::string> = 0;
    virtual void clear_drop_files() = 0;

    [[nodiscard]] virtual auto mouse_position() const -> PointI = 0;
    // Button bits plus modifier bits.
    [[nodiscard]] virtual auto mouse_cap() const -> unsigned = 0;
    // Vertical and horizontal wheel deltas accumulated since the last clear.
    [[nodiscard]] virtual auto wheel() const -> std::pair<double, double> = 0;
    virtual void clear_wheel() = 0;

    // 0 for none, negative when the host wants the script to terminate.
    virtual auto poll_char() -> long = 0;

    [[nodiscard]] virtual auto canvas_size() const -> SizeI = 0;

    [[nodiscard]] virtual auto dock_state() const -> DockQuery = 0;
    virtual void set_dock(DockState state) = 0;
    // Screen edge a docker is attached to (0 bottom, 1 left, 2 top, 3 right, 4 floating).
    [[nodiscard]] virtual auto docker_position(int docker) const -> std::optional<int> = 0;

    [[nodiscard]] virtual auto client_to_screen(PointI client) const -> PointI = 0;
    [[nodiscard]] virtual auto screen_mouse_position() const -> PointI = 0;

    [[nodiscard]] virtual auto retina_scale() const -> double = 0;
    virtual void set_cursor(Cursor cursor) = 0;

    virtual void present(std::span<std::uint8_t const> pixels, int width, int height, std::size_t row_stride_bytes) = 0;

    // Monotonic seconds.
    [[nodiscard]] virtual auto now() const -> double = 0;
};

/**
 * Immutable view of the host state for one tick.
 */
struct TickSnapshot {
    PointI mouse{};
    unsigned mouse_cap = 0;
    double wheel = 0.0;
    double hwheel = 0.0;
    // Character codes polled this tick, in arrival order.
    std::vector<long> keys;
    bool terminate = false;
    std::vector<std::string> drop_files;
    SizeI canvas{};
    DockQuery dock{};
    double retina_scale = 1.0;
    double now = 0.0;

    [[nodiscard]] auto buttons() const -> unsigned;
    [[nodiscard]] auto has_wheel() const -> bool { return wheel != 0.0 || hwheel != 0.0; }
};

class HostSurfaceAdapter {
public:
    explicit HostSurfaceAdapter(HostSurface& host);

    // Drains the drop-file queue, commits the host frame and captures everything else.
    [[nodiscard]] auto poll() -> TickSnapshot;

    // Zeroes the wheel both in the snapshot and at the device level. Idempotent per tick.
    void consume_wheel(TickSnapshot& snapshot);

    [[nodiscard]] auto host() -> HostSurface& { return host_; }
    [[nodiscard]] auto host() const -> HostSurface const& { return host_; }

private:
    HostSurface& host_;
    bool wheel_consumed_ = false;
};

} // namespace RTK::UI
