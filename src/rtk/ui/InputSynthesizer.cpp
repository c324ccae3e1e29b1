#include <rtk/ui/InputSynthesizer.hpp>
#include <rtk/ui/Widget.hpp>

#include "rtk/log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace RTK::UI {

InputSynthesizer::InputSynthesizer(InputTarget& target, RuntimeConfig const& config)
    : target_(target)
    , config_(config) {}

auto InputSynthesizer::make_move(TickSnapshot const& snapshot, bool simulated) -> Event& {
    event_.reset(EventType::MouseMove, snapshot.mouse.x, snapshot.mouse.y);
    event_.simulated = simulated;
    event_.set_modifiers(snapshot.mouse_cap, buttons_.latest());
    return event_;
}

auto InputSynthesizer::make_button(TickSnapshot const& snapshot, unsigned button, EventType type) -> Event& {
    event_.reset(type, snapshot.mouse.x, snapshot.mouse.y);
    event_.set_modifiers(snapshot.mouse_cap, button);
    return event_;
}

auto InputSynthesizer::process_discrete(TickSnapshot& snapshot, HostSurfaceAdapter& adapter, TickContext& ctx) -> Event* {
    Event* event = nullptr;
    scale_ = ctx.scale;

    if (snapshot.has_wheel()) {
        event = &event_.reset(EventType::MouseWheel, snapshot.mouse.x, snapshot.mouse.y);
        event->set_modifiers(snapshot.mouse_cap, MouseButton::None);
        event->wheel = WheelDistance(snapshot.wheel, config_.wheel_mode);
        event->hwheel = WheelDistance(snapshot.hwheel, config_.wheel_mode);
        // The host expects the reader to zero the wheel after reading it.
        adapter.consume_wheel(snapshot);
        handle(*event, ctx.now);
    }

    for (auto code : snapshot.keys) {
        if (!target_.running()) {
            break;
        }
        event = &event_.reset(EventType::Key, snapshot.mouse.x, snapshot.mouse.y);
        event->set_modifiers(snapshot.mouse_cap, MouseButton::None);
        event->keycode = code;
        event->character = ClassifyKeyChar(code, event->ctrl);
        target_.key_pre(*event);
        handle(*event, ctx.now);
        target_.key_post(*event);
    }
    if (snapshot.terminate) {
        target_.request_close();
    }

    if (!snapshot.drop_files.empty() && target_.running()) {
        event = &make_move(snapshot, false);
        event->type = EventType::DropFile;
        event->files = snapshot.drop_files;
        handle(*event, ctx.now);
    }
    return event;
}

auto InputSynthesizer::process_pointer(TickSnapshot const& snapshot, TickContext& ctx, bool had_event) -> Event* {
    scale_ = ctx.scale;
    auto const host_buttons = snapshot.buttons();
    bool const button_changed = buttons_.down() != host_buttons;
    bool const buttons_down = host_buttons != 0;
    moved_ = mouse_.x != snapshot.mouse.x || mouse_.y != snapshot.mouse.y;

    bool const last_in_window = in_window_;
    in_window_ = snapshot.mouse.x >= 0 && snapshot.mouse.y >= 0 && snapshot.mouse.x <= snapshot.canvas.w
                 && snapshot.mouse.y <= snapshot.canvas.h;
    in_window_changed_ = in_window_ != last_in_window;

    if (tooltip_due(ctx.now)) {
        show_due_tooltip();
        ctx.need_draw = true;
    }

    if (moved_ && refresh_queued_) {
        // Only once the cursor moves: after the app was blocked the host needs an extra
        // tick before the new position is visible.
        refresh_queued_ = false;
        Event refresh;
        refresh.reset(EventType::MouseMove, snapshot.mouse.x, snapshot.mouse.y);
        refresh.simulated = true;
        refresh.set_modifiers(snapshot.mouse_cap & Modifier::Mask, MouseButton::None);
        handle(refresh, ctx.now);
        ctx.need_draw = true;
    }

    Event* event = nullptr;
    if (!had_event || moved_) {
        bool suppress = false;
        if (in_window_) {
            if (auto occluded = target_.cursor_occluded(); occluded && *occluded) {
                in_window_ = false;
                in_window_changed_ = last_in_window;
            }
        }
        if (ctx.need_draw || (moved_ && in_window_) || in_window_changed_ || (drag_.active() && buttons_down)) {
            event = &make_move(snapshot, !moved_);
            if (buttons_down && config_.touch_scroll && !drag_.active()) {
                // Hold back moves with a button down until the deferred mousedown fired.
                auto const* state = buttons_.state(event->button);
                suppress = state == nullptr || state->mousedown_handled == nullptr;
            }
        } else if (buttons_.down() != 0 && !button_changed) {
            // Repeat the latest press for long-press and touch-activation handlers, only as
            // long as either threshold can still trip.
            auto const latest = buttons_.latest();
            if (auto const* state = buttons_.state(latest)) {
                auto const wait = std::max(config_.long_press_delay, config_.touch_activate_delay);
                if (ctx.now - state->time <= wait + 2.0 * config_.tick_interval()) {
                    event = &make_button(snapshot, latest, EventType::MouseDown);
                    event->simulated = true;
                }
            }
        }
        if (event && (!event->simulated || touch_scrolling_.empty() || buttons_down)) {
            ctx.need_draw = ctx.need_draw || tooltip_ != nullptr;
            handle(*event, ctx.now, suppress);
        }
    }

    mouse_ = snapshot.mouse;

    // Moves run first: on touchscreens the press and the move arrive together and the
    // hover state must be current before the click lands.
    if (button_changed) {
        Event* button_event = nullptr;
        for (auto bit : MouseButtonTable::kButtonPriority) {
            if (auto type = buttons_.sync_bit(bit, host_buttons)) {
                button_event = &make_button(snapshot, bit, *type);
                break;
            }
        }
        if (button_event) {
            if (button_event->type == EventType::MouseDown) {
                buttons_.press(button_event->button, ctx.now, ctx.tick);
            } else {
                buttons_.release(button_event->button);
            }
            handle(*button_event, ctx.now);
            event = button_event;
        } else {
            std::ostringstream oss;
            oss << "no button event for mouse cap " << snapshot.mouse_cap << " (synced " << buttons_.down()
                << "), which indicates a toolkit bug";
            rtk_log_warning(oss.str(), "input");
        }
    }
    return event;
}

void InputSynthesizer::handle(Event& event, double now, bool suppress) {
    if (!target_.accepting_input()) {
        return;
    }
    if (!event.simulated) {
        // A real event re-elects the hovered widget.
        mouseover_ = nullptr;
        tooltip_ = nullptr;
        last_mousemove_time_.reset();
    }
    event.time = now;
    if (!suppress) {
        target_.deliver(event);
    }

    if (event.type == EventType::MouseUp) {
        last_mouseup_time_ = event.time;
        candidates_.clear();
        if (drag_.dropping) {
            auto* dropping = drag_.dropping;
            drag_.dropping = nullptr;
            dropping->handle_dropblur(event, drag_.dragging, drag_.payload);
        }
        if (drag_.dragging && (event.buttons & drag_.buttons) == 0) {
            auto* dragging = drag_.dragging;
            auto payload = std::move(drag_.payload);
            drag_.reset();
            dragging->handle_dragend(event, payload);
            // Lets post-drag state (a scrollbar shown during the drag, say) settle.
            Event trailing = event.clone_as(EventType::MouseMove, true);
            target_.deliver(trailing);
        }
    } else if (!candidates_.empty() && event.type == EventType::MouseMove && !event.simulated && event.buttons != 0
               && !drag_.active()) {
        offer_drag_start(event);
    }
}

void InputSynthesizer::offer_drag_start(Event& event) {
    // Handlers may mark the event handled to stop further offers.
    event.clear_handled();
    drag_.droppable = true;
    bool missed = false;
    auto const threshold = drag_threshold(event.time, scale_);
    for (auto& candidate : candidates_) {
        if (candidate.offered) {
            continue;
        }
        auto const* press = pressed_.find(candidate.widget);
        if (press == nullptr) {
            candidate.offered = true;
            continue;
        }
        auto const dx = std::abs(press->x - event.x);
        auto const dy = std::abs(press->y - event.y);
        auto const delay = candidate.widget->touch_activate_delay(event).value_or(
            config_.touch_scroll ? config_.touch_activate_delay : 0.0);
        if (event.time - press->time >= delay && (dx > threshold || dy > threshold)) {
            auto* widget = candidate.widget;
            auto start = widget->handle_dragstart(event, press->x, press->y, press->time);
            if (start) {
                widget->deferred_mousedown(event, press->x, press->y);
                drag_.dragging = widget;
                drag_.payload = std::move(start->payload);
                drag_.droppable = start->droppable;
                drag_.buttons = event.buttons;
                widget->handle_dragmousemove(event, drag_.payload);
                break;
            }
            if (event.handled()) {
                break;
            }
            candidate.offered = true;
        } else {
            missed = true;
        }
    }
    if (!missed || event.handled()) {
        candidates_.clear();
    }
}

void InputSynthesizer::finish_event(Event const& event) {
    if (event.type != EventType::MouseUp) {
        return;
    }
    buttons_.clear_state(event.button);
    if (event.buttons == 0) {
        // Kept until now so mouseup handlers can still ask whether they saw the press.
        pressed_.clear();
    }
}

void InputSynthesizer::end_tick(double now) {
    if (moved_) {
        last_mousemove_time_ = now;
    }
}

void InputSynthesizer::set_widget_pressed(Widget* widget, Event const& event) {
    pressed_.add(widget, event.x, event.y, event.time);
    candidates_.push_back(DragCandidate{widget, false});
}

void InputSynthesizer::set_widget_mouseover(Widget* widget, Event const& event) {
    if (mouseover_ == nullptr && event.type == EventType::MouseMove && !event.simulated
        && widget->tooltip().has_value()) {
        mouseover_ = widget;
    }
}

void InputSynthesizer::set_touch_scrolling(Widget* viewport, bool scrolling) {
    auto it = std::find(touch_scrolling_.begin(), touch_scrolling_.end(), viewport);
    if (scrolling && it == touch_scrolling_.end()) {
        touch_scrolling_.push_back(viewport);
    } else if (!scrolling && it != touch_scrolling_.end()) {
        touch_scrolling_.erase(it);
    }
}

auto InputSynthesizer::is_touch_scrolling(Widget const* viewport) const -> bool {
    if (viewport == nullptr) {
        return !touch_scrolling_.empty();
    }
    return std::find(touch_scrolling_.begin(), touch_scrolling_.end(), viewport) != touch_scrolling_.end();
}

auto InputSynthesizer::tooltip_due(double now) const -> bool {
    return last_mousemove_time_ && mouseover_ != nullptr && mouseover_ != tooltip_
           && now - *last_mousemove_time_ > config_.tooltip_delay;
}

auto InputSynthesizer::drag_threshold(double now, double scale) const -> double {
    if (config_.touch_scroll && last_mouseup_time_ && now - *last_mouseup_time_ < config_.double_click_guard) {
        // A second click in quick succession must not turn into an accidental touch drag.
        return scale * config_.double_click_threshold_factor;
    }
    return std::ceil(std::pow(scale, config_.drag_threshold_exponent));
}

auto InputSynthesizer::touch_activate_event() const -> EventType {
    return config_.touch_scroll ? EventType::MouseUp : EventType::MouseDown;
}

void InputSynthesizer::forget_widget(Widget const* widget) {
    pressed_.forget(widget);
    std::erase_if(candidates_, [widget](DragCandidate const& candidate) { return candidate.widget == widget; });
    std::erase(touch_scrolling_, widget);
    if (drag_.dragging == widget) {
        drag_.reset();
    }
    if (drag_.dropping == widget) {
        drag_.dropping = nullptr;
    }
    if (mouseover_ == widget) {
        mouseover_ = nullptr;
    }
    if (tooltip_ == widget) {
        tooltip_ = nullptr;
    }
}

void InputSynthesizer::reset() {
    buttons_.reset();
    pressed_.clear();
    candidates_.clear();
    drag_ = DragDropState{};
    mouseover_ = nullptr;
    tooltip_ = nullptr;
    last_mousemove_time_.reset();
    last_mouseup_time_.reset();
    touch_scrolling_.clear();
    refresh_queued_ = false;
    in_window_ = false;
    in_window_changed_ = false;
}

} // namespace RTK::UI
