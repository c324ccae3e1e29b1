#include <rtk/ui/MouseState.hpp>

#include <algorithm>

namespace RTK::UI {

auto MouseButtonTable::sync_bit(unsigned bit, unsigned host_buttons) -> std::optional<EventType> {
    bool const was_down = (down_ & bit) != 0;
    bool const is_down = (host_buttons & bit) != 0;
    if (!was_down && is_down) {
        down_ |= bit;
        return EventType::MouseDown;
    }
    if (was_down && !is_down) {
        down_ &= ~bit;
        return EventType::MouseUp;
    }
    return std::nullopt;
}

void MouseButtonTable::press(unsigned button, double now, std::uint64_t tick) {
    auto& state = states_[button];
    state = ButtonState{};
    state.time = now;
    state.tick = tick;
    std::erase(order_, button);
    order_.push_back(button);
}

void MouseButtonTable::release(unsigned button) {
    std::erase(order_, button);
}

void MouseButtonTable::clear_state(unsigned button) {
    states_.erase(button);
}

void MouseButtonTable::reset() {
    down_ = 0;
    order_.clear();
    states_.clear();
}

auto MouseButtonTable::state(unsigned button) -> ButtonState* {
    auto it = states_.find(button);
    return it == states_.end() ? nullptr : &it->second;
}

auto MouseButtonTable::state(unsigned button) const -> ButtonState const* {
    auto it = states_.find(button);
    return it == states_.end() ? nullptr : &it->second;
}

void PressedWidgets::add(Widget* widget, double x, double y, double time) {
    forget(widget);
    records_.push_back(PressRecord{widget, x, y, time});
}

auto PressedWidgets::find(Widget const* widget) const -> PressRecord const* {
    auto it = std::find_if(records_.begin(), records_.end(), [widget](PressRecord const& record) {
        return record.widget == widget;
    });
    return it == records_.end() ? nullptr : &*it;
}

void PressedWidgets::forget(Widget const* widget) {
    std::erase_if(records_, [widget](PressRecord const& record) { return record.widget == widget; });
}

} // namespace RTK::UI
