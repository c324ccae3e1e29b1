#include <rtk/ui/ReflowScheduler.hpp>
#include <rtk/ui/Widget.hpp>

#include <algorithm>
#include <utility>

namespace RTK::UI {

void ReflowScheduler::queue(ReflowMode mode, Widget* widget) {
    if (mode == ReflowMode::Full || widget == nullptr || !widget->has_layout()) {
        state_ = State::Full;
        widgets_.clear();
        return;
    }
    switch (state_) {
    case State::Full:
        return;
    case State::Idle:
        state_ = State::Partial;
        widgets_.assign(1, widget);
        return;
    case State::Partial:
        if (std::find(widgets_.begin(), widgets_.end(), widget) == widgets_.end()) {
            widgets_.push_back(widget);
        }
        return;
    }
}

void ReflowScheduler::forget(Widget* widget) {
    std::erase(widgets_, widget);
    if (state_ == State::Partial && widgets_.empty()) {
        state_ = State::Idle;
    }
}

auto ReflowScheduler::take() -> std::optional<ReflowPlan> {
    if (state_ == State::Idle) {
        return std::nullopt;
    }
    ReflowPlan plan{};
    if (state_ == State::Partial) {
        plan.mode = ReflowMode::Partial;
        plan.widgets = std::move(widgets_);
    }
    clear();
    return plan;
}

void ReflowScheduler::clear() {
    state_ = State::Idle;
    widgets_.clear();
}

auto CanReflowPartially(ReflowPlan const& plan, bool had_full_layout, std::size_t limit) -> bool {
    return plan.mode == ReflowMode::Partial && had_full_layout && !plan.widgets.empty() && plan.widgets.size() < limit;
}

} // namespace RTK::UI
