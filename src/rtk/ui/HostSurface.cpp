#include <rtk/ui/HostSurface.hpp>
#include <rtk/ui/Event.hpp>

namespace RTK::UI {

auto TickSnapshot::buttons() const -> unsigned {
    return mouse_cap & MouseButton::Mask;
}

HostSurfaceAdapter::HostSurfaceAdapter(HostSurface& host)
    : host_(host) {}

auto HostSurfaceAdapter::poll() -> TickSnapshot {
    TickSnapshot snapshot{};
    snapshot.now = host_.now();

    // The drop list must be read before commit(), which clears it.
    for (int index = 0;; ++index) {
        auto file = host_.drop_file(index);
        if (!file) {
            break;
        }
        snapshot.drop_files.push_back(std::move(*file));
    }
    if (!snapshot.drop_files.empty()) {
        host_.clear_drop_files();
    }

    host_.commit();
    wheel_consumed_ = false;

    snapshot.mouse = host_.mouse_position();
    snapshot.mouse_cap = host_.mouse_cap();
    auto [wheel, hwheel] = host_.wheel();
    snapshot.wheel = wheel;
    snapshot.hwheel = hwheel;
    snapshot.canvas = host_.canvas_size();
    snapshot.dock = host_.dock_state();
    snapshot.retina_scale = host_.retina_scale();

    for (auto key = host_.poll_char(); key != 0; key = host_.poll_char()) {
        if (key < 0) {
            snapshot.terminate = true;
            break;
        }
        snapshot.keys.push_back(key);
    }
    return snapshot;
}

void HostSurfaceAdapter::consume_wheel(TickSnapshot& snapshot) {
    snapshot.wheel = 0.0;
    snapshot.hwheel = 0.0;
    if (wheel_consumed_) {
        return;
    }
    host_.clear_wheel();
    wheel_consumed_ = true;
}

} // namespace RTK::UI
