#pragma once

#include <rtk/core/Error.hpp>
#include <rtk/ui/BackingStore.hpp>
#include <rtk/ui/Cursor.hpp>
#include <rtk/ui/Event.hpp>
#include <rtk/ui/HostSurface.hpp>
#include <rtk/ui/InputSynthesizer.hpp>
#include <rtk/ui/NativeWindow.hpp>
#include <rtk/ui/ReflowScheduler.hpp>
#include <rtk/ui/RuntimeConfig.hpp>
#include <rtk/ui/WindowAttributes.hpp>
#include <rtk/ui/WindowSync.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace RTK::UI {

class Widget;

enum class UpdateResult {
    Continue,
    // Abandons the rest of the current tick.
    Skip,
};

using UpdateHandler = std::function<UpdateResult()>;
using ReflowHandler = std::function<void(ReflowPlan const&)>;
using MoveHandler = std::function<void(double last_x, double last_y)>;
using ResizeHandler = std::function<void(double last_w, double last_h)>;
using WindowHandler = std::function<void()>;
using KeyHandler = std::function<void(Event&)>;
using FocusHandler = std::function<void(Event const*)>;
// Advances one animation; returns false once it has finished.
using AnimationStep = std::function<bool(double now)>;

struct WindowCallbacks {
    UpdateHandler on_update;
    ReflowHandler on_reflow;
    MoveHandler   on_move;
    ResizeHandler on_resize;
    WindowHandler on_dock;
    WindowHandler on_close;
    KeyHandler    on_key_pre;
    KeyHandler    on_key_post;
    FocusHandler  on_focus;
    FocusHandler  on_blur;
};

/**
 * The toolkit's top-level window and its per-tick pipeline.
 *
 * At most one Window is alive per process. The host calls tick() repeatedly while
 * running() is true; each tick polls the host, synchronizes OS window state, lays out the
 * widget tree if needed, synthesizes and dispatches input, and redraws into the backing
 * store only when something visible changed.
 *
 * Handlers run inside tick() and may call back into the window (close(), attribute
 * setters, queue_*). Exceptions thrown by handlers propagate out of tick().
 */
class Window final : public InputTarget {
public:
    static auto Create(HostSurface& host, NativeWindowApi* native = nullptr, RuntimeConfig config = {})
        -> Expected<std::unique_ptr<Window>>;

    ~Window() override;
    Window(Window const&) = delete;
    Window& operator=(Window const&) = delete;

    auto open(PlacementHints const& hints = {}) -> Expected<void>;
    void close();
    void tick();
    [[nodiscard]] auto running() const -> bool override { return running_; }

    // Attributes. Window-synchronized changes are pushed to the OS on the next tick.
    auto set_attribute(WindowAttribute attribute, AttributeValue const& value) -> Expected<void>;
    auto set_attribute(std::string_view name, AttributeValue const& value) -> Expected<void>;
    [[nodiscard]] auto attribute(WindowAttribute attribute) const -> AttributeValue;
    [[nodiscard]] auto attributes() const -> WindowAttributes const& { return attrs_; }
    [[nodiscard]] auto calculated() const -> WindowAttributes const& { return calc_; }

    auto move(double x, double y) -> Expected<void>;
    auto resize(double w, double h) -> Expected<void>;
    void hide();
    void show();
    void toggle();
    auto focus() -> Expected<void>;
    [[nodiscard]] auto is_focused() const -> bool { return focused_window_; }
    [[nodiscard]] auto docked() const -> bool { return DockStateDocked(dockstate_); }
    [[nodiscard]] auto dock_state() const -> DockState { return dockstate_; }
    // y relative to the top of the display regardless of the platform's native orientation.
    [[nodiscard]] auto normalized_y() -> double;
    [[nodiscard]] auto in_window() const -> bool { return input_.in_window(); }
    [[nodiscard]] auto scale() const -> double { return config_.user_scale * system_scale_; }

    void set_content(std::shared_ptr<Widget> content);
    [[nodiscard]] auto content() const -> Widget* { return content_.get(); }
    [[nodiscard]] auto callbacks() -> WindowCallbacks& { return callbacks_; }

    void queue_reflow(ReflowMode mode = ReflowMode::Full, Widget* widget = nullptr);
    void queue_draw() { draw_queued_ = true; }
    // The host may need the frame presented again after OS-level geometry changes.
    void queue_blit() { blits_queued_ += 2; }
    // Injects a button-less simulated move once the cursor next moves, refreshing hover state.
    void queue_mouse_refresh() { input_.queue_mouse_refresh(); }

    // First come first served per tick unless forced. Returns whether the cursor was taken.
    auto request_cursor(Cursor cursor, bool force = false) -> bool;
    [[nodiscard]] auto cursor() const -> Cursor { return cursor_; }
    void set_default_cursor(Cursor cursor) { default_cursor_ = cursor; }
    // Clears the backing store to the window background.
    void clear();

    void set_widget_pressed(Widget* widget, Event const& event) { input_.set_widget_pressed(widget, event); }
    [[nodiscard]] auto is_widget_pressed(Widget const* widget) const -> bool { return input_.is_widget_pressed(widget); }
    void set_widget_mouseover(Widget* widget, Event& event);
    void set_drop_target(Widget* widget) { input_.set_drop_target(widget); }
    void set_mousedown_handled(Event const& event, Widget* widget);
    [[nodiscard]] auto mousedown_handled(Event const& event) const -> Widget*;

    void add_modal(Widget* widget);
    void remove_modal(Widget* widget);
    void reset_modal() { modal_.clear(); }
    [[nodiscard]] auto is_modal(Widget const* widget = nullptr) const -> bool;

    // Focus moves to widget, blurring the previous holder. Returns false if widget is null.
    auto set_focused(Widget* widget, Event const* event = nullptr) -> bool;
    void blur_focused(Event const* event = nullptr);
    [[nodiscard]] auto focused_widget() const -> Widget* { return focused_; }

    void set_touch_scrolling(Widget* viewport, bool scrolling) { input_.set_touch_scrolling(viewport, scrolling); }
    [[nodiscard]] auto is_touch_scrolling(Widget const* viewport = nullptr) const -> bool {
        return input_.is_touch_scrolling(viewport);
    }

    void add_animation(AnimationStep step) { animations_.push_back(std::move(step)); }

    // Drops every reference the window holds to a widget that is going away.
    void forget_widget(Widget* widget);

    [[nodiscard]] auto debug_enabled() const -> bool { return debug_; }
    void set_debug(bool enabled);

    [[nodiscard]] auto config() const -> RuntimeConfig const& { return config_; }
    [[nodiscard]] auto backing_store() const -> BackingStore const& { return backing_; }
    [[nodiscard]] auto input() const -> InputSynthesizer const& { return input_; }
    [[nodiscard]] auto native() -> NativeWindowController& { return native_; }
    [[nodiscard]] auto sync() const -> WindowStateSynchronizer const& { return sync_; }
    [[nodiscard]] auto ticks() const -> std::uint64_t { return tick_; }
    [[nodiscard]] auto framebuffer_size() const -> SizeI { return framebuffer_; }

private:
    friend class WindowStateSynchronizer;

    struct ModalEntry {
        Widget*       widget = nullptr;
        std::uint64_t tick = 0;
    };

    Window(HostSurface& host, NativeWindowApi* native, RuntimeConfig config);

    // InputTarget
    void deliver(Event& event) override;
    [[nodiscard]] auto accepting_input() const -> bool override { return calc_.visible; }
    void key_pre(Event& event) override;
    void key_post(Event& event) override;
    [[nodiscard]] auto cursor_occluded() const -> std::optional<bool> override;
    void request_close() override { close(); }

    void recalculate();
    void recalculate(WindowAttribute attribute);
    void strip_unsupported();
    // Writes OS-observed geometry to the declared attributes and the calculated size.
    void sync_geometry(std::optional<double> x, std::optional<double> y, std::optional<double> w, std::optional<double> h);
    // Returns true if the whole tree was laid out.
    auto reflow(std::optional<ReflowPlan> plan) -> bool;
    auto run_animations(double now) -> bool;
    void draw(Event const& event);
    void blit();
    void apply_cursor();
    void fill_background(PixelRect rect);
    void resolve_modal_and_focus(Event& event, bool focus_changed);

    HostSurface&            host_;
    HostSurfaceAdapter      adapter_;
    NativeWindowController  native_;
    RuntimeConfig           config_;
    InputSynthesizer        input_;
    ReflowScheduler         scheduler_;
    WindowStateSynchronizer sync_;
    BackingStore            backing_;
    WindowCallbacks         callbacks_;

    WindowAttributes attrs_;
    WindowAttributes calc_;
    DockState        dockstate_ = 0;
    SizeI            framebuffer_{};
    double           system_scale_ = 1.0;

    std::shared_ptr<Widget>    content_;
    std::vector<AnimationStep> animations_;
    std::vector<ModalEntry>    modal_;
    Widget*                    focused_ = nullptr;
    Widget*                    focused_saved_ = nullptr;

    bool          running_ = false;
    bool          sync_pending_ = false;
    bool          draw_queued_ = false;
    bool          had_full_layout_ = false;
    bool          focused_window_ = false;
    bool          debug_ = false;
    int           blits_queued_ = 0;
    std::uint64_t tick_ = 0;
    Cursor        cursor_ = Cursor::Undefined;
    Cursor        default_cursor_ = Cursor::Pointer;
};

} // namespace RTK::UI
