#pragma once

#include <rtk/ui/Event.hpp>
#include <rtk/ui/HostSurface.hpp>
#include <rtk/ui/MouseState.hpp>
#include <rtk/ui/RuntimeConfig.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace RTK::UI {

class Widget;

/**
 * What the synthesizer needs from the window that owns it.
 */
class InputTarget {
public:
    virtual ~InputTarget() = default;

    // Propagates the event through the widget tree.
    virtual void deliver(Event& event) = 0;
    [[nodiscard]] virtual auto accepting_input() const -> bool = 0;
    [[nodiscard]] virtual auto running() const -> bool = 0;
    // Fired before and after a key event propagates. The post hook applies default key
    // bindings for unhandled events.
    virtual void key_pre(Event& event) = 0;
    virtual void key_post(Event& event) = 0;
    // True when another OS window covers the cursor; nullopt when that cannot be known.
    [[nodiscard]] virtual auto cursor_occluded() const -> std::optional<bool> = 0;
    virtual void request_close() = 0;
};

struct TickContext {
    double        now = 0.0;
    std::uint64_t tick = 0;
    double        scale = 1.0;
    bool          need_draw = false;
};

/**
 * Turns polled host state into the window's event stream: wheel, keys, dropped files,
 * real and simulated mouse moves, long-press repeats, button transitions, drag and drop.
 *
 * All events share one scratch Event owned by the synthesizer. Returned pointers refer to
 * it and are valid until the next synthesized event.
 */
class InputSynthesizer {
public:
    InputSynthesizer(InputTarget& target, RuntimeConfig const& config);

    // Wheel, keyboard and drop-file events. Returns the last event dispatched, if any.
    auto process_discrete(TickSnapshot& snapshot, HostSurfaceAdapter& adapter, TickContext& ctx) -> Event*;
    // Hover, long-press and button transitions. Returns the event the pipeline should
    // finish the tick with, or nullptr.
    auto process_pointer(TickSnapshot const& snapshot, TickContext& ctx, bool had_event) -> Event*;

    // Common bookkeeping and tree delivery for every synthesized event. With suppress the
    // tree is skipped but drag and drop still run.
    void handle(Event& event, double now, bool suppress = false);

    // Clears per-press state once a mouseup has been fully processed.
    void finish_event(Event const& event);
    void end_tick(double now);

    void queue_mouse_refresh() { refresh_queued_ = true; }

    void set_widget_pressed(Widget* widget, Event const& event);
    [[nodiscard]] auto is_widget_pressed(Widget const* widget) const -> bool { return pressed_.contains(widget); }
    void set_widget_mouseover(Widget* widget, Event const& event);
    void set_drop_target(Widget* widget) { drag_.dropping = widget; }

    void set_touch_scrolling(Widget* viewport, bool scrolling);
    [[nodiscard]] auto is_touch_scrolling(Widget const* viewport = nullptr) const -> bool;

    [[nodiscard]] auto tooltip_due(double now) const -> bool;
    void show_due_tooltip() { tooltip_ = mouseover_; }
    [[nodiscard]] auto tooltip_widget() const -> Widget* { return tooltip_; }
    [[nodiscard]] auto mouseover_widget() const -> Widget* { return mouseover_; }

    [[nodiscard]] auto in_window() const -> bool { return in_window_; }
    [[nodiscard]] auto in_window_changed() const -> bool { return in_window_changed_; }
    [[nodiscard]] auto mouse_position() const -> PointI { return mouse_; }

    [[nodiscard]] auto buttons() -> MouseButtonTable& { return buttons_; }
    [[nodiscard]] auto buttons() const -> MouseButtonTable const& { return buttons_; }
    [[nodiscard]] auto drag() const -> DragDropState const& { return drag_; }
    [[nodiscard]] auto drag_candidates() const -> std::vector<DragCandidate> const& { return candidates_; }

    // Pixels the cursor must travel from a press before a drag starts.
    [[nodiscard]] auto drag_threshold(double now, double scale) const -> double;
    // The event type whose unhandled delivery counts as a click outside modal widgets.
    [[nodiscard]] auto touch_activate_event() const -> EventType;

    void forget_widget(Widget const* widget);
    void reset();

private:
    auto make_move(TickSnapshot const& snapshot, bool simulated) -> Event&;
    auto make_button(TickSnapshot const& snapshot, unsigned button, EventType type) -> Event&;
    void offer_drag_start(Event& event);

    InputTarget&         target_;
    RuntimeConfig const& config_;
    Event                event_;

    MouseButtonTable           buttons_;
    PressedWidgets             pressed_;
    std::vector<DragCandidate> candidates_;
    DragDropState              drag_;

    PointI mouse_{};
    bool   moved_ = false;
    bool   in_window_ = false;
    bool   in_window_changed_ = false;
    bool   refresh_queued_ = false;
    double scale_ = 1.0;

    Widget*               mouseover_ = nullptr;
    Widget*               tooltip_ = nullptr;
    std::optional<double> last_mousemove_time_;
    std::optional<double> last_mouseup_time_;

    std::vector<Widget const*> touch_scrolling_;
};

} // namespace RTK::UI
