#pragma once

#include <rtk/ui/HostSurface.hpp>
#include <rtk/ui/WindowAttributes.hpp>

#include <optional>

namespace RTK::UI {

class Window;

enum class HAlign {
    Left,
    Center,
    Right,
};

enum class VAlign {
    Top,
    Center,
    Bottom,
};

// One-time placement of an undocked window at open(), relative to its display.
struct PlacementHints {
    std::optional<HAlign> halign;
    std::optional<VAlign> valign;
    // Offsets added to centered or far-edge alignment.
    double x = 0.0;
    double y = 0.0;
    // Keep the whole window within the display's working area.
    bool constrain = false;
};

enum class ResizeKind {
    Unchanged = 0,
    Grow = 1,
    Shrink = -1,
};

struct WindowGeometry {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

/**
 * Two-way binding between a window's declared attributes and the live OS window.
 *
 * push() applies attributes to the OS. A dock change is applied on its own and confirmed
 * through pull() before any geometry is written, since the old geometry is stale until
 * the host finishes the transition. pull() absorbs externally observed dock changes and
 * then re-runs push(); a single guard stops the dock transition from re-entering itself.
 */
class WindowStateSynchronizer {
public:
    explicit WindowStateSynchronizer(Window& window);

    // Reports how the window content size changed as a result.
    auto push() -> ResizeKind;
    void pull(DockState state);

    // Dock state the current attributes ask for, with symbolic positions resolved.
    [[nodiscard]] auto target_dock_state() const -> DockState;
    [[nodiscard]] auto resolve_docker(DockPosition position) const -> int;

    // Window geometry from attributes, applying placement hints against the display.
    [[nodiscard]] auto geometry_from_attrs(PlacementHints const* hints) const -> WindowGeometry;

    [[nodiscard]] auto restyle_pending() const -> bool { return restyle_pending_; }
    // Applies a restyle deferred while the OS window was hidden, showing it.
    void apply_deferred_restyle();

    [[nodiscard]] auto undocked_geometry() const -> std::optional<WindowGeometry> const& { return undocked_geometry_; }
    [[nodiscard]] auto in_transition() const -> bool { return in_transition_; }

    // Re-resolves the OS window handle for the current title and position.
    void resolve_handle();

private:
    auto push_geometry() -> ResizeKind;

    Window&                       window_;
    std::optional<WindowGeometry> undocked_geometry_;
    bool                          last_synced_borderless_ = false;
    bool                          in_transition_ = false;
    bool                          restyle_pending_ = false;
};

[[nodiscard]] auto ClassifyResize(double w, double h, SizeI current) -> ResizeKind;

} // namespace RTK::UI
