#include <rtk/ui/Window.hpp>
#include <rtk/ui/WindowSync.hpp>

#include "rtk/log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <variant>

namespace RTK::UI {

namespace {

constexpr int kMaxDockerId = 20;

void report(Expected<void> const& result, char const* what) {
    if (!result && result.error().code != Error::Code::NotSupported) {
        rtk_log_debug(std::string{what} + " failed: " + describeError(result.error()), "window", "sync");
    }
}

auto align(double start, double extent, double size, double offset, int mode) -> double {
    switch (mode) {
    case 0:
        return start;
    case 1:
        return start + offset + (extent - size) / 2.0;
    default:
        return start + offset + (extent - size);
    }
}

} // namespace

WindowStateSynchronizer::WindowStateSynchronizer(Window& window)
    : window_(window) {}

auto WindowStateSynchronizer::resolve_docker(DockPosition position) const -> int {
    auto const& host = window_.host_;
    for (int docker = 1; docker <= kMaxDockerId; ++docker) {
        if (auto edge = host.docker_position(docker); edge && *edge == static_cast<int>(position)) {
            return docker;
        }
    }
    return 0;
}

auto WindowStateSynchronizer::target_dock_state() const -> DockState {
    auto const& calc = window_.calc_;
    auto const docker = std::visit(
        [this](auto const& target) -> int {
            if constexpr (std::is_same_v<std::decay_t<decltype(target)>, int>) {
                return target;
            } else {
                return resolve_docker(target);
            }
        },
        calc.dock);
    return MakeDockState(docker, calc.docked);
}

auto WindowStateSynchronizer::push() -> ResizeKind {
    auto& window = window_;
    auto const last_w = window.calc_.w;
    auto const last_h = window.calc_.h;
    auto const target = target_dock_state();

    if (target != window.dockstate_ && !in_transition_) {
        // Geometry is stale until the host finishes the transition, so only the dock
        // change is applied here and pull() confirms it.
        in_transition_ = true;
        window.host_.set_dock(target);
        pull(target);
        if (DockStateDocked(target)) {
            auto const size = window.host_.canvas_size();
            window.framebuffer_ = size;
            window.sync_geometry(std::nullopt, std::nullopt, size.w, size.h);
        }
        in_transition_ = false;
        if (window.callbacks_.on_resize) {
            window.callbacks_.on_resize(last_w, last_h);
        }
        return ResizeKind::Grow;
    }

    auto resized = ResizeKind::Unchanged;
    if (!window.native_.available() || !window.native_.handle()) {
        return resized;
    }
    if (!window.calc_.docked) {
        resized = push_geometry();
    } else {
        // Docked windows share the host's top-level window; transparency must not leak to it.
        report(window.native_.strip_layered(), "strip layered style");
    }
    last_synced_borderless_ = window.calc_.borderless;
    return resized;
}

auto WindowStateSynchronizer::push_geometry() -> ResizeKind {
    auto& window = window_;
    auto& native = window.native_;
    auto const& calc = window.calc_;

    if (!calc.visible) {
        report(native.show(false), "hide window");
        return ResizeKind::Unchanged;
    }

    if (auto visible = native.is_visible(); visible && *visible) {
        report(native.apply_style(calc.borderless, calc.pinned, true), "apply window style");
    } else {
        // Restyling a hidden window flashes its frame; wait until content has been laid out.
        restyle_pending_ = true;
    }

    if (calc.borderless && !window.had_full_layout_) {
        report(native.resize(static_cast<int>(std::ceil(calc.w)), static_cast<int>(std::ceil(calc.h))),
               "resize borderless window");
    }

    auto const geometry = geometry_from_attrs(nullptr);
    auto const resized = ClassifyResize(geometry.w, geometry.h, window.framebuffer_);
    auto const rect = native.client_rect();
    bool const moved = rect && (geometry.x != rect->left || geometry.y != rect->top);
    bool const restyled = calc.borderless != last_synced_borderless_;

    if (moved || resized != ResizeKind::Unchanged || restyled) {
        auto outer_w = geometry.w;
        auto outer_h = geometry.h;
        if (!calc.borderless) {
            auto const overhead = native.frame_overhead();
            outer_w += overhead.w;
            outer_h += overhead.h;
        }
        report(native.set_position(static_cast<int>(geometry.x), static_cast<int>(geometry.y),
                                   static_cast<int>(std::ceil(outer_w)), static_cast<int>(std::ceil(outer_h))),
               "set window position");
    }

    if (resized != ResizeKind::Unchanged) {
        auto const last = window.framebuffer_;
        window.framebuffer_ = SizeI{static_cast<int>(geometry.w), static_cast<int>(geometry.h)};
        window.sync_geometry(std::nullopt, std::nullopt, geometry.w, geometry.h);
        if (resized == ResizeKind::Grow) {
            window.fill_background(PixelRect{0, 0, window.framebuffer_.w, window.framebuffer_.h});
        }
        window.queue_blit();
        if (window.callbacks_.on_resize) {
            window.callbacks_.on_resize(last.w, last.h);
        }
    }
    if (moved) {
        window.sync_geometry(geometry.x, geometry.y, std::nullopt, std::nullopt);
        if (window.callbacks_.on_move) {
            window.callbacks_.on_move(rect->left, rect->top);
        }
    }

    report(native.set_opacity(calc.opacity), "set window opacity");
    report(native.set_title(calc.title), "set window title");
    return resized;
}

void WindowStateSynchronizer::pull(DockState state) {
    auto& window = window_;
    bool const was_docked = DockStateDocked(window.dockstate_);
    bool const docked = DockStateDocked(state);

    window.attrs_.docked = window.calc_.docked = docked;
    window.attrs_.dock = window.calc_.dock = DockTarget{DockStateDocker(state)};
    window.dockstate_ = state;

    resolve_handle();
    window.queue_reflow(ReflowMode::Full);

    if (was_docked != docked) {
        window.fill_background(PixelRect{0, 0, window.framebuffer_.w, window.framebuffer_.h});
        if (docked) {
            undocked_geometry_ = WindowGeometry{window.attrs_.x, window.attrs_.y, window.attrs_.w, window.attrs_.h};
        } else if (undocked_geometry_) {
            // The framebuffer keeps the docked size so the next push resizes the OS window.
            auto const& saved = *undocked_geometry_;
            window.sync_geometry(saved.x, saved.y, saved.w, saved.h);
        }
    }

    push();
    window.queue_blit();
    if (window.callbacks_.on_dock) {
        window.callbacks_.on_dock();
    }
}

void WindowStateSynchronizer::resolve_handle() {
    auto& window = window_;
    if (!window.native_.available()) {
        return;
    }
    auto const origin = window.host_.client_to_screen(PointI{0, 0});
    if (auto handle = window.native_.resolve_handle(window.calc_.title, origin, window.calc_.docked); !handle) {
        rtk_log_debug("window handle not resolved: " + describeError(handle.error()), "window", "sync");
    }
}

auto WindowStateSynchronizer::geometry_from_attrs(PlacementHints const* hints) const -> WindowGeometry {
    auto const& attrs = window_.attrs_;
    auto const& calc = window_.calc_;
    auto& native = window_.native_;
    WindowGeometry geometry{attrs.x, attrs.y, calc.w, calc.h};

    if (hints != nullptr && (hints->halign || hints->valign || hints->constrain)) {
        NativeRect const area{static_cast<int>(attrs.x), static_cast<int>(attrs.y),
                              static_cast<int>(attrs.x + calc.w), static_cast<int>(attrs.y + calc.h)};
        if (auto display = native.display_rect(area, true)) {
            double const sx = display->left;
            double const sy = std::min(display->top, display->bottom);
            double sw = display->width();
            double sh = display->height();
            if (!calc.borderless) {
                auto const overhead = native.frame_overhead();
                sw -= overhead.w;
                sh -= overhead.h;
            }
            if (hints->halign) {
                geometry.x = align(sx, sw, geometry.w, hints->x, static_cast<int>(*hints->halign));
            }
            if (hints->valign) {
                auto mode = static_cast<int>(*hints->valign);
                if (native.bottom_up() && mode != 1) {
                    // Native y grows upward, so the top edge is the far end.
                    mode = mode == 0 ? 2 : 0;
                }
                geometry.y = align(sy, sh, geometry.h, hints->y, mode);
            }
            if (hints->constrain) {
                geometry.w = std::min(geometry.w, sw);
                geometry.h = std::min(geometry.h, sh);
                geometry.x = std::clamp(geometry.x, sx, sx + sw - geometry.w);
                geometry.y = std::clamp(geometry.y, sy, sy + sh - geometry.h);
            }
        } else if (display.error().code != Error::Code::NotSupported) {
            rtk_log_debug("display rect unavailable: " + describeError(display.error()), "window", "sync");
        }
    }

    geometry.x = std::round(geometry.x);
    geometry.y = std::round(geometry.y);
    geometry.w = std::round(geometry.w);
    geometry.h = std::round(geometry.h);
    return geometry;
}

void WindowStateSynchronizer::apply_deferred_restyle() {
    restyle_pending_ = false;
    auto& window = window_;
    report(window.native_.apply_style(window.calc_.borderless, window.calc_.pinned, true), "apply window style");
    report(window.native_.show(true), "show window");
}

auto ClassifyResize(double w, double h, SizeI current) -> ResizeKind {
    if (w == current.w && h == current.h) {
        return ResizeKind::Unchanged;
    }
    if (w <= current.w && h <= current.h) {
        return ResizeKind::Shrink;
    }
    return ResizeKind::Grow;
}

} // namespace RTK::UI
