#include <rtk/ui/Widget.hpp>

#include <atomic>

namespace RTK::UI {

namespace {

auto next_widget_id() -> std::uint64_t {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

Widget::Widget()
    : id_(next_widget_id()) {}

void Widget::layout(LayoutBox const& box, Window& window) {
    on_reflow(box, window);
    box_ = box;
}

auto Widget::relayout(Window& window) -> bool {
    if (!box_) {
        return false;
    }
    on_reflow(*box_, window);
    return true;
}

} // namespace RTK::UI
