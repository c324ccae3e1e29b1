#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace RTK::UI {

class Widget;

enum class ReflowMode {
    Partial,
    Full,
};

struct ReflowPlan {
    ReflowMode           mode = ReflowMode::Full;
    // Only populated for partial plans, in request order.
    std::vector<Widget*> widgets;
};

/**
 * Pending layout work for one window: nothing, a set of widgets that already went
 * through a full layout, or the whole tree. Full requests are sticky until taken.
 *
 * Queued widget pointers are not owned; a widget destroyed while queued must be dropped
 * with forget().
 */
class ReflowScheduler {
public:
    // Partial requests without a widget, or for a widget that was never laid out,
    // escalate to Full.
    void queue(ReflowMode mode, Widget* widget = nullptr);
    void forget(Widget* widget);

    [[nodiscard]] auto pending() const -> bool { return state_ != State::Idle; }
    [[nodiscard]] auto full_pending() const -> bool { return state_ == State::Full; }
    [[nodiscard]] auto partial_widgets() const -> std::vector<Widget*> const& { return widgets_; }

    // Returns the pending plan and resets to idle, or nullopt if nothing is pending.
    [[nodiscard]] auto take() -> std::optional<ReflowPlan>;
    void clear();

private:
    enum class State {
        Idle,
        Partial,
        Full,
    };

    State                state_ = State::Idle;
    std::vector<Widget*> widgets_;
};

// Whether a partial plan may run incrementally. Otherwise the whole tree is laid out.
[[nodiscard]] auto CanReflowPartially(ReflowPlan const& plan, bool had_full_layout, std::size_t limit) -> bool;

} // namespace RTK::UI
