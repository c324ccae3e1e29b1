#pragma once

#include <rtk/ui/Event.hpp>

#include <any>
#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace RTK::UI {

class Widget;

struct ButtonState {
    double        time = 0.0;
    std::uint64_t tick = 0;
    // Widget whose (possibly deferred) mousedown handler has fired for this press.
    Widget*       mousedown_handled = nullptr;
};

/**
 * Per-button press bookkeeping. down() is the bitmask synced one bit at a time against
 * the host, so simultaneous transitions surface on consecutive ticks.
 */
class MouseButtonTable {
public:
    static constexpr std::array<unsigned, 3> kButtonPriority{MouseButton::Left, MouseButton::Right, MouseButton::Middle};

    // Flips the single bit toward the host state and reports the transition, if any.
    auto sync_bit(unsigned bit, unsigned host_buttons) -> std::optional<EventType>;

    void press(unsigned button, double now, std::uint64_t tick);
    // Removes the button from the press order. Its state record lives until clear_state().
    void release(unsigned button);
    void clear_state(unsigned button);
    void reset();

    [[nodiscard]] auto down() const -> unsigned { return down_; }
    // Most recently pressed button still held, or MouseButton::None.
    [[nodiscard]] auto latest() const -> unsigned { return order_.empty() ? MouseButton::None : order_.back(); }
    [[nodiscard]] auto order() const -> std::vector<unsigned> const& { return order_; }
    [[nodiscard]] auto state(unsigned button) -> ButtonState*;
    [[nodiscard]] auto state(unsigned button) const -> ButtonState const*;

private:
    unsigned                                   down_ = 0;
    std::vector<unsigned>                      order_;
    std::unordered_map<unsigned, ButtonState>  states_;
};

struct PressRecord {
    Widget* widget = nullptr;
    double  x = 0.0;
    double  y = 0.0;
    double  time = 0.0;
};

// Widgets that received a mousedown while buttons remain held, in press order.
class PressedWidgets {
public:
    void add(Widget* widget, double x, double y, double time);
    [[nodiscard]] auto find(Widget const* widget) const -> PressRecord const*;
    [[nodiscard]] auto contains(Widget const* widget) const -> bool { return find(widget) != nullptr; }
    [[nodiscard]] auto records() const -> std::vector<PressRecord> const& { return records_; }
    [[nodiscard]] auto empty() const -> bool { return records_.empty(); }
    void forget(Widget const* widget);
    void clear() { records_.clear(); }

private:
    std::vector<PressRecord> records_;
};

struct DragCandidate {
    Widget* widget = nullptr;
    bool    offered = false;
};

struct DragDropState {
    Widget*  dragging = nullptr;
    Widget*  dropping = nullptr;
    std::any payload;
    unsigned buttons = 0;
    bool     droppable = true;

    [[nodiscard]] auto active() const -> bool { return dragging != nullptr; }
    void reset() {
        dragging = nullptr;
        payload.reset();
        buttons = 0;
    }
};

} // namespace RTK::UI
