#include <rtk/ui/Widget.hpp>
#include <rtk/ui/Window.hpp>

#include "rtk/log/TaggedLogger.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace RTK::UI {

namespace {

Window* live_window = nullptr;

auto seconds_since(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

void report(Expected<void> const& result, char const* what) {
    if (!result && result.error().code != Error::Code::NotSupported) {
        rtk_log_debug(std::string{what} + " failed: " + describeError(result.error()), "window");
    }
}

} // namespace

auto Window::Create(HostSurface& host, NativeWindowApi* native, RuntimeConfig config)
    -> Expected<std::unique_ptr<Window>> {
    if (live_window != nullptr) {
        return makeError(Error::Code::AlreadyExists, "a window already exists in this process");
    }
    auto window = std::unique_ptr<Window>(new Window(host, native, std::move(config)));
    live_window = window.get();
    return window;
}

Window::Window(HostSurface& host, NativeWindowApi* native, RuntimeConfig config)
    : host_(host)
    , adapter_(host)
    , native_(native)
    , config_(std::move(config))
    , input_(*this, config_)
    , sync_(*this) {
    debug_ = config_.debug;
    default_cursor_ = config_.default_cursor;
    recalculate();
}

Window::~Window() {
    if (live_window == this) {
        live_window = nullptr;
    }
}

void Window::recalculate() {
    calc_ = CalculateAttributes(attrs_, AttributeContext{native_.available()});
    strip_unsupported();
}

void Window::recalculate(WindowAttribute attribute) {
    RecalculateAttribute(attrs_, calc_, attribute, AttributeContext{native_.available()});
    strip_unsupported();
}

void Window::strip_unsupported() {
    if (!native_.available()) {
        // Capability-dependent attributes read back as unset rather than silently ignored.
        attrs_.pinned = calc_.pinned;
        attrs_.borderless = calc_.borderless;
    }
}

void Window::sync_geometry(std::optional<double> x, std::optional<double> y, std::optional<double> w,
                           std::optional<double> h) {
    // Observed geometry bypasses the minimum-size calculators.
    if (x) {
        attrs_.x = *x;
    }
    if (y) {
        attrs_.y = *y;
    }
    if (w) {
        attrs_.w = calc_.w = *w;
    }
    if (h) {
        attrs_.h = calc_.h = *h;
    }
}

auto Window::set_attribute(WindowAttribute attribute, AttributeValue const& value) -> Expected<void> {
    if (auto assigned = AssignAttribute(attrs_, attribute, value); !assigned) {
        return assigned;
    }
    recalculate(attribute);
    auto const& descriptor = DescribeAttribute(attribute);
    if (descriptor.window_sync) {
        // Coalesced into a single push on the next tick.
        sync_pending_ = true;
    }
    if (descriptor.reflow) {
        queue_reflow(*descriptor.reflow);
    }
    if (attribute == WindowAttribute::Background) {
        queue_draw();
    }
    return {};
}

auto Window::set_attribute(std::string_view name, AttributeValue const& value) -> Expected<void> {
    auto attribute = FindAttribute(name);
    if (!attribute) {
        return makeError(Error::Code::NotFound, "unknown window attribute '" + std::string{name} + "'");
    }
    return set_attribute(*attribute, value);
}

auto Window::attribute(WindowAttribute attribute) const -> AttributeValue {
    return ReadAttribute(attrs_, attribute);
}

auto Window::move(double x, double y) -> Expected<void> {
    if (auto result = set_attribute(WindowAttribute::X, x); !result) {
        return result;
    }
    return set_attribute(WindowAttribute::Y, y);
}

auto Window::resize(double w, double h) -> Expected<void> {
    if (auto result = set_attribute(WindowAttribute::W, w); !result) {
        return result;
    }
    return set_attribute(WindowAttribute::H, h);
}

void Window::hide() {
    attrs_.visible = false;
    recalculate(WindowAttribute::Visible);
    sync_pending_ = true;
}

void Window::show() {
    attrs_.visible = true;
    recalculate(WindowAttribute::Visible);
    sync_pending_ = true;
}

void Window::toggle() {
    if (attrs_.visible) {
        hide();
    } else {
        show();
    }
}

auto Window::focus() -> Expected<void> {
    if (!running_) {
        return makeError(Error::Code::InvalidState, "window is not open");
    }
    return native_.set_focus();
}

auto Window::normalized_y() -> double {
    auto const overhead = native_.frame_overhead();
    auto const x = static_cast<int>(attrs_.x);
    auto const y = static_cast<int>(attrs_.y);
    return native_.normalize_y(y, framebuffer_.h + overhead.h, PointI{x, y});
}

void Window::set_content(std::shared_ptr<Widget> content) {
    if (content_) {
        forget_widget(content_.get());
    }
    content_ = std::move(content);
    queue_reflow(ReflowMode::Full);
}

void Window::queue_reflow(ReflowMode mode, Widget* widget) {
    scheduler_.queue(mode, widget);
}

auto Window::request_cursor(Cursor cursor, bool force) -> bool {
    if (cursor_ != Cursor::Undefined && !force) {
        return false;
    }
    cursor_ = cursor;
    return true;
}

void Window::clear() {
    backing_.clear(calc_.background);
}

void Window::set_widget_mouseover(Widget* widget, Event& event) {
    if (debug_ && event.debug == nullptr) {
        event.debug = widget;
    }
    input_.set_widget_mouseover(widget, event);
}

void Window::set_mousedown_handled(Event const& event, Widget* widget) {
    if (auto* state = input_.buttons().state(event.button)) {
        state->mousedown_handled = widget;
    }
}

auto Window::mousedown_handled(Event const& event) const -> Widget* {
    auto const* state = input_.buttons().state(event.button);
    return state ? state->mousedown_handled : nullptr;
}

void Window::add_modal(Widget* widget) {
    if (widget == nullptr || is_modal(widget)) {
        return;
    }
    modal_.push_back(ModalEntry{widget, tick_});
}

void Window::remove_modal(Widget* widget) {
    std::erase_if(modal_, [widget](ModalEntry const& entry) { return entry.widget == widget; });
}

auto Window::is_modal(Widget const* widget) const -> bool {
    if (widget == nullptr) {
        return !modal_.empty();
    }
    return std::any_of(modal_.begin(), modal_.end(), [widget](ModalEntry const& entry) { return entry.widget == widget; });
}

auto Window::set_focused(Widget* widget, Event const* event) -> bool {
    if (widget == nullptr) {
        return false;
    }
    if (focused_ == widget) {
        return true;
    }
    blur_focused(event);
    focused_ = widget;
    widget->handle_focus(event);
    queue_draw();
    return true;
}

void Window::blur_focused(Event const* event) {
    if (focused_ == nullptr) {
        return;
    }
    auto* widget = focused_;
    focused_ = nullptr;
    widget->handle_blur(event);
    queue_draw();
}

void Window::forget_widget(Widget* widget) {
    scheduler_.forget(widget);
    input_.forget_widget(widget);
    remove_modal(widget);
    if (focused_ == widget) {
        focused_ = nullptr;
    }
    if (focused_saved_ == widget) {
        focused_saved_ = nullptr;
    }
}

void Window::set_debug(bool enabled) {
    debug_ = enabled;
    queue_draw();
}

auto Window::open(PlacementHints const& hints) -> Expected<void> {
    if (running_) {
        return makeError(Error::Code::InvalidState, "window is already open");
    }
    if (!calc_.borderless) {
        // Placement against the display needs the frame size before our own window exists.
        if (auto estimate = native_.estimate_frame_overhead_from_host();
            !estimate && estimate.error().code != Error::Code::NotSupported) {
            rtk_log_debug("frame overhead estimate failed: " + describeError(estimate.error()), "window");
        }
    }
    auto const geometry = sync_.geometry_from_attrs(&hints);
    sync_geometry(geometry.x, geometry.y, geometry.w, geometry.h);
    recalculate();

    running_ = true;
    input_.reset();
    system_scale_ = host_.retina_scale();
    host_.init(calc_.title, static_cast<int>(calc_.w), static_cast<int>(calc_.h), sync_.target_dock_state(),
               static_cast<int>(attrs_.x), static_cast<int>(attrs_.y));
    framebuffer_ = host_.canvas_size();
    sync_.pull(host_.dock_state().state);

    fill_background(PixelRect{0, 0, framebuffer_.w, framebuffer_.h});
    queue_reflow(ReflowMode::Full);
    draw_queued_ = true;
    rtk_log("window opened: " + calc_.title, "window");
    return {};
}

void Window::close() {
    if (!running_) {
        return;
    }
    auto const mouse = input_.mouse_position();
    Event event;
    event.reset(EventType::WindowClose, mouse.x, mouse.y);
    event.time = host_.now();
    deliver(event);

    running_ = false;
    host_.quit();
    rtk_log("window closed: " + calc_.title, "window");
    if (callbacks_.on_close) {
        callbacks_.on_close();
    }
}

void Window::tick() {
    if (!running_) {
        return;
    }
    auto const started = std::chrono::steady_clock::now();
    ++tick_;
    auto snapshot = adapter_.poll();
    TickContext ctx{snapshot.now, tick_, scale(), false};
    framebuffer_ = snapshot.canvas;

    if (snapshot.retina_scale != system_scale_) {
        system_scale_ = snapshot.retina_scale;
        ctx.scale = scale();
        queue_reflow(ReflowMode::Full);
    }

    bool focus_changed = false;
    if (auto focused = native_.is_focused()) {
        focus_changed = *focused != focused_window_;
        focused_window_ = *focused;
    }

    if (callbacks_.on_update && callbacks_.on_update() == UpdateResult::Skip) {
        return;
    }
    if (!running_) {
        return;
    }
    if (run_animations(ctx.now)) {
        ctx.need_draw = true;
    }

    bool const pushing = sync_pending_;
    if (sync_pending_) {
        // Cleared first so attribute writes from resize handlers schedule another push.
        sync_pending_ = false;
        if (sync_.push() != ResizeKind::Unchanged) {
            queue_reflow(ReflowMode::Full);
            ctx.need_draw = true;
        }
    }
    if (!running_) {
        return;
    }

    // A push may have moved or docked the window since the snapshot was taken.
    auto const dock = pushing ? host_.dock_state() : snapshot.dock;
    if (dock.state != dockstate_) {
        sync_.pull(dock.state);
    }
    if (dock.x != attrs_.x || dock.y != attrs_.y) {
        auto const last_x = attrs_.x;
        auto const last_y = attrs_.y;
        sync_geometry(dock.x, dock.y, std::nullopt, std::nullopt);
        if (callbacks_.on_move) {
            callbacks_.on_move(last_x, last_y);
        }
    }

    if ((framebuffer_.w != calc_.w || framebuffer_.h != calc_.h) && calc_.visible) {
        auto const last_w = calc_.w;
        auto const last_h = calc_.h;
        sync_geometry(std::nullopt, std::nullopt, framebuffer_.w, framebuffer_.h);
        fill_background(PixelRect{0, 0, framebuffer_.w, framebuffer_.h});
        if (callbacks_.on_resize) {
            callbacks_.on_resize(last_w, last_h);
        }
        queue_reflow(ReflowMode::Full);
    }
    if (scheduler_.pending()) {
        reflow(scheduler_.take());
        ctx.need_draw = true;
    }
    if (sync_.restyle_pending() && had_full_layout_) {
        sync_.apply_deferred_restyle();
    }
    if (!running_) {
        return;
    }

    cursor_ = Cursor::Undefined;
    Event* event = input_.process_discrete(snapshot, adapter_, ctx);
    if (!running_) {
        return;
    }
    ctx.need_draw = ctx.need_draw || draw_queued_ || focus_changed;
    if (auto* pointer = input_.process_pointer(snapshot, ctx, event != nullptr)) {
        event = pointer;
    }
    if (!running_) {
        return;
    }

    bool blitted = false;
    if (event != nullptr && calc_.visible) {
        if (ctx.need_draw || draw_queued_) {
            if (scheduler_.pending() && !sync_pending_) {
                // Reflow before drawing rather than next tick to avoid a frame of stale layout.
                if (reflow(scheduler_.take())) {
                    // Widgets may have moved under the cursor, so refresh hover state.
                    cursor_ = Cursor::Undefined;
                    auto refresh = event->clone_as(EventType::MouseMove, true);
                    input_.handle(refresh, ctx.now);
                }
            }
            draw(*event);
            blit();
            blitted = true;
        }

        if (focus_changed) {
            if (focused_window_) {
                if (auto* saved = focused_saved_) {
                    focused_saved_ = nullptr;
                    set_focused(saved, event);
                }
                if (callbacks_.on_focus) {
                    callbacks_.on_focus(event);
                }
            } else {
                if (focused_ != nullptr) {
                    focused_saved_ = focused_;
                    blur_focused(event);
                }
                if (callbacks_.on_blur) {
                    callbacks_.on_blur(event);
                }
            }
        }
        resolve_modal_and_focus(*event, focus_changed && !focused_window_);
        input_.finish_event(*event);

        if (cursor_ == Cursor::Undefined) {
            cursor_ = default_cursor_;
        }
        if (input_.in_window()) {
            apply_cursor();
        } else if (input_.in_window_changed()) {
            // Let the OS show its own resize cursors near the frame again.
            report(native_.release_cursor(), "release cursor");
        }
    }
    input_.end_tick(ctx.now);

    if (blits_queued_ > 0) {
        if (!blitted) {
            blit();
        }
        --blits_queued_;
    }

    if (auto const duration = seconds_since(started); duration > config_.slow_tick_threshold) {
        std::ostringstream oss;
        oss << "very slow update: " << duration << "s event=" << (event ? event->describe() : std::string{"none"});
        rtk_log_debug(oss.str(), "window", "perf");
    }
}

auto Window::run_animations(double now) -> bool {
    if (animations_.empty()) {
        return false;
    }
    // Steps may queue further animations; those start on the next tick.
    auto steps = std::move(animations_);
    animations_.clear();
    for (auto& step : steps) {
        if (step(now)) {
            animations_.push_back(std::move(step));
        }
    }
    return true;
}

auto Window::reflow(std::optional<ReflowPlan> plan) -> bool {
    if (!plan) {
        return false;
    }
    auto const started = std::chrono::steady_clock::now();
    bool full = !CanReflowPartially(*plan, had_full_layout_, config_.partial_reflow_limit);
    if (!full) {
        for (auto* widget : plan->widgets) {
            if (!widget->relayout(*this)) {
                full = true;
                break;
            }
            widget->realize_geometry();
        }
    }
    if (full) {
        if (content_) {
            content_->layout(LayoutBox{0.0, 0.0, calc_.w, calc_.h}, *this);
            content_->realize_geometry();
        }
        had_full_layout_ = true;
        plan->mode = ReflowMode::Full;
        plan->widgets.clear();
        if (auto const elapsed = seconds_since(started); elapsed > config_.slow_reflow_threshold) {
            std::ostringstream oss;
            oss << "slow reflow: " << elapsed * 1000.0 << "ms for " << calc_.w << "x" << calc_.h << " window";
            rtk_log_warning(oss.str(), "window", "perf");
        }
    }
    draw_queued_ = true;
    if (callbacks_.on_reflow) {
        callbacks_.on_reflow(*plan);
    }
    return full;
}

void Window::draw(Event const& event) {
    backing_.resize(static_cast<int>(calc_.w), static_cast<int>(calc_.h));
    clear();
    // Cleared before drawing so a redraw queued by a draw handler survives.
    draw_queued_ = false;
    if (content_) {
        DrawContext ctx{backing_, *this, &event, 0.0, 0.0, calc_.opacity, backing_.width(), backing_.height()};
        content_->draw(ctx);
        if (event.debug != nullptr) {
            event.debug->draw_debug_info(ctx);
        }
        if (auto* tooltip = input_.tooltip_widget(); tooltip != nullptr && !input_.drag().active()) {
            auto const mouse = input_.mouse_position();
            tooltip->draw_tooltip(ctx, mouse.x, mouse.y);
        }
    }
    backing_.commit_frame();
}

void Window::blit() {
    host_.present(backing_.pixels(), backing_.width(), backing_.height(), backing_.row_stride_bytes());
}

void Window::apply_cursor() {
    if (auto applied = native_.set_cursor(cursor_)) {
        return;
    } else if (applied.error().code != Error::Code::NotSupported && applied.error().code != Error::Code::NotFound) {
        rtk_log_debug("native cursor failed: " + describeError(applied.error()), "window");
    }
    host_.set_cursor(CursorRequiresNative(cursor_) ? Cursor::Pointer : cursor_);
}

void Window::fill_background(PixelRect rect) {
    // Paints the OS window directly so a growing window shows the background instead of
    // garbage until the next frame arrives.
    report(native_.fill_background(rect, calc_.background), "fill background");
}

void Window::resolve_modal_and_focus(Event& event, bool lost_focus) {
    if (event.handled()) {
        return;
    }
    bool const activation = event.type == input_.touch_activate_event();
    if (!modal_.empty() && (lost_focus || activation)) {
        auto const* state = input_.buttons().state(event.button);
        // Release handlers usually remove themselves from the registry.
        auto const modals = modal_;
        for (auto const& entry : modals) {
            // A modal opened in response to this very press must survive its release.
            if (state != nullptr && entry.tick == state->tick) {
                continue;
            }
            entry.widget->release_modal(event);
        }
    }
    if (activation && focused_ != nullptr) {
        blur_focused(&event);
    }
}

void Window::deliver(Event& event) {
    if (content_) {
        content_->dispatch_event(event, *this, modal_.empty());
    }
}

void Window::key_pre(Event& event) {
    if (callbacks_.on_key_pre) {
        callbacks_.on_key_pre(event);
    }
}

void Window::key_post(Event& event) {
    if (callbacks_.on_key_post) {
        callbacks_.on_key_post(event);
    }
    if (event.handled() || !event.keycode) {
        return;
    }
    if (*event.keycode == config_.debug_toggle_key && logger().enabledFor(LogLevel::Debug)) {
        set_debug(!debug_);
    } else if (*event.keycode == Keycode::Escape && !docked()) {
        close();
    }
}

auto Window::cursor_occluded() const -> std::optional<bool> {
    if (!native_.available() || !native_.handle()) {
        return std::nullopt;
    }
    auto owns = native_.owns_point(host_.screen_mouse_position());
    if (!owns) {
        return std::nullopt;
    }
    return !*owns;
}

} // namespace RTK::UI
