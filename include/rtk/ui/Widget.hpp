#pragma once

#include <rtk/ui/BackingStore.hpp>
#include <rtk/ui/Event.hpp>

#include <any>
#include <cstdint>
#include <optional>
#include <string>

namespace RTK::UI {

class Window;

struct LayoutBox {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

struct DrawContext {
    BackingStore& target;
    Window& window;
    Event const* event = nullptr;
    double offset_x = 0.0;
    double offset_y = 0.0;
    double alpha = 1.0;
    int clip_w = 0;
    int clip_h = 0;
};

// Returned by a widget accepting a drag start.
struct DragStart {
    std::any payload;
    bool droppable = true;
};

/**
 * The widget capabilities the window runtime consumes. Box-model layout, painting and
 * propagation through children are the implementer's business; the window only decides
 * when each happens.
 */
class Widget {
public:
    Widget();
    virtual ~Widget() = default;

    Widget(Widget const&) = delete;
    Widget& operator=(Widget const&) = delete;

    [[nodiscard]] auto id() const -> std::uint64_t { return id_; }

    // Full layout against the given box. The box is remembered for later partial passes.
    void layout(LayoutBox const& box, Window& window);
    // Recomputes layout within the previously assigned box. Returns false if the widget
    // has never been through layout().
    auto relayout(Window& window) -> bool;
    [[nodiscard]] auto has_layout() const -> bool { return box_.has_value(); }
    [[nodiscard]] auto box() const -> std::optional<LayoutBox> const& { return box_; }

    virtual void realize_geometry() {}
    virtual void draw(DrawContext& ctx) = 0;
    // listen is false while a modal widget holds input elsewhere in the tree.
    virtual void dispatch_event(Event& event, Window& window, bool listen) = 0;

    [[nodiscard]] virtual auto tooltip() const -> std::optional<std::string> { return std::nullopt; }
    virtual void draw_tooltip(DrawContext&, double, double) {}
    virtual void draw_debug_info(DrawContext&) {}

    // nullopt means the window default (the configured delay in touch-scroll mode, else 0).
    [[nodiscard]] virtual auto touch_activate_delay(Event const&) const -> std::optional<double> { return std::nullopt; }

    virtual auto handle_dragstart(Event&, double, double, double) -> std::optional<DragStart> { return std::nullopt; }
    virtual void handle_dragmousemove(Event&, std::any const&) {}
    virtual void handle_dragend(Event&, std::any const&) {}
    virtual void handle_dropblur(Event&, Widget*, std::any const&) {}
    virtual void deferred_mousedown(Event&, double, double) {}
    virtual void release_modal(Event&) {}
    virtual void handle_focus(Event const*) {}
    virtual void handle_blur(Event const*) {}

protected:
    virtual void on_reflow(LayoutBox const& box, Window& window) = 0;

private:
    std::uint64_t id_;
    std::optional<LayoutBox> box_;
};

} // namespace RTK::UI
