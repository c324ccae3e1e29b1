#include <rtk/ui/NativeWindow.hpp>

#include "rtk/log/TaggedLogger.hpp"

#include <chrono>
#include <cmath>
#include <sstream>

namespace RTK::UI {

namespace {

auto unavailable() -> std::unexpected<Error> {
    return makeError(Error::Code::NotSupported, "native window capability unavailable");
}

auto call_failed(char const* operation) -> std::unexpected<Error> {
    rtk_log_debug(std::string{"native "} + operation + " failed", "native");
    return makeError(Error::Code::InvalidState, std::string{"native "} + operation + " failed");
}

} // namespace

NativeWindowController::NativeWindowController(NativeWindowApi* api)
    : api_(api) {}

auto NativeWindowController::require_handle() const -> Expected<NativeHandle> {
    if (!api_) {
        return unavailable();
    }
    if (!handle_) {
        return makeError(Error::Code::NotFound, "native window handle not resolved");
    }
    return *handle_;
}

auto NativeWindowController::verify_origin(NativeHandle handle, PointI origin) const -> bool {
    auto rect = api_->client_rect(handle);
    return rect && rect->left == origin.x && rect->top == origin.y;
}

auto NativeWindowController::search(std::vector<NativeHandle> const& candidates,
                                    std::optional<std::string_view> title,
                                    PointI origin) const -> std::optional<NativeHandle> {
    for (auto candidate : candidates) {
        if (title) {
            auto candidate_title = api_->title(candidate);
            if (!candidate_title || *candidate_title != *title) {
                continue;
            }
        }
        if (verify_origin(candidate, origin)) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto NativeWindowController::resolve_handle(std::string_view title, PointI client_origin, bool docked)
    -> Expected<NativeHandle> {
    if (!api_) {
        return unavailable();
    }
    auto found = api_->find(title, true);
    if (found && !verify_origin(*found, client_origin)) {
        // Another window shares our title (a floating plugin editor, for instance).
        found.reset();
        if (docked) {
            if (auto host = api_->host_main_window()) {
                found = search(api_->list_children(*host), title, client_origin);
            }
        }
        if (!found) {
            auto start = std::chrono::steady_clock::now();
            found = search(api_->enumerate(title, true), std::nullopt, client_origin);
            auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            std::ostringstream oss;
            oss << "window handle lookup took slow path: title=" << title << " elapsed=" << elapsed << "ms";
            rtk_log_debug(oss.str(), "native");
        }
    }
    if (!found) {
        handle_.reset();
        return makeError(Error::Code::NotFound, "no native window matches title '" + std::string{title} + "'");
    }
    handle_ = *found;
    if (!frame_overhead_.contains(*found)) {
        if (auto overhead = measure_frame_overhead(*found); !overhead) {
            rtk_log_debug("unable to measure frame overhead: " + describeError(overhead.error()), "native");
        }
    }
    return *found;
}

auto NativeWindowController::frame_overhead() const -> SizeI {
    if (handle_) {
        if (auto it = frame_overhead_.find(*handle_); it != frame_overhead_.end()) {
            return it->second;
        }
    }
    return host_frame_estimate_.value_or(SizeI{});
}

auto NativeWindowController::measure_frame_overhead(NativeHandle handle) -> Expected<SizeI> {
    if (!api_) {
        return unavailable();
    }
    auto client = api_->client_size(handle);
    auto outer = api_->window_rect(handle);
    if (!client || !outer) {
        return makeError(Error::Code::NotFound, "window geometry unavailable");
    }
    SizeI overhead{outer->width() - client->w, outer->height() - client->h};
    frame_overhead_[handle] = overhead;
    return overhead;
}

auto NativeWindowController::estimate_frame_overhead_from_host() -> Expected<SizeI> {
    if (!api_) {
        return unavailable();
    }
    auto host = api_->host_main_window();
    if (!host) {
        return makeError(Error::Code::NotFound, "host main window not found");
    }
    auto overhead = measure_frame_overhead(*host);
    if (overhead) {
        host_frame_estimate_ = *overhead;
    }
    return overhead;
}

auto NativeWindowController::apply_style(bool borderless, bool pinned, bool resizable) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->set_style(*handle, NativeStyle{.borderless = borderless, .resizable = resizable})) {
        return call_failed("set_style");
    }
    if (!api_->set_zorder(*handle, pinned)) {
        return call_failed("set_zorder");
    }
    // Some platforms only apply a dropped frame style once the geometry changes, so resize
    // to the current rectangle before measuring the new frame.
    if (auto rect = api_->window_rect(*handle)) {
        if (!api_->resize(*handle, rect->width(), rect->height())) {
            return call_failed("resize");
        }
        frame_overhead_.erase(*handle);
        if (auto overhead = measure_frame_overhead(*handle); !overhead) {
            return std::unexpected(overhead.error());
        }
    }
    return {};
}

auto NativeWindowController::set_position(int x, int y, int outer_w, int outer_h) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->set_position(*handle, x, y, outer_w, outer_h)) {
        return call_failed("set_position");
    }
    return {};
}

auto NativeWindowController::resize(int w, int h) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->resize(*handle, w, h)) {
        return call_failed("resize");
    }
    return {};
}

auto NativeWindowController::set_opacity(double opacity) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->set_opacity(*handle, opacity)) {
        return call_failed("set_opacity");
    }
    return {};
}

auto NativeWindowController::set_title(std::string_view title) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->set_title(*handle, title)) {
        return call_failed("set_title");
    }
    return {};
}

auto NativeWindowController::set_cursor(Cursor cursor) -> Expected<void> {
    if (!api_) {
        return unavailable();
    }
    if (!api_->set_cursor(cursor)) {
        return call_failed("set_cursor");
    }
    return {};
}

auto NativeWindowController::release_cursor() -> Expected<void> {
    if (!api_) {
        return unavailable();
    }
    if (!api_->release_cursor()) {
        return call_failed("release_cursor");
    }
    return {};
}

auto NativeWindowController::show(bool visible) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->show(*handle, visible)) {
        return call_failed("show");
    }
    return {};
}

auto NativeWindowController::is_visible() const -> Expected<bool> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return api_->is_visible(*handle);
}

auto NativeWindowController::client_rect() const -> Expected<NativeRect> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    auto rect = api_->client_rect(*handle);
    if (!rect) {
        return makeError(Error::Code::NotFound, "client rect unavailable");
    }
    return *rect;
}

auto NativeWindowController::is_focused() const -> Expected<bool> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    auto focused = api_->focused();
    return focused && *focused == *handle;
}

auto NativeWindowController::set_focus() -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->set_focus(*handle)) {
        return call_failed("set_focus");
    }
    return {};
}

auto NativeWindowController::owns_point(PointI screen) const -> Expected<bool> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    auto topmost = api_->window_from_point(screen);
    return topmost && *topmost == *handle;
}

auto NativeWindowController::fill_background(PixelRect rect, Color color) -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->fill_rect(*handle, rect, color)) {
        return call_failed("fill_rect");
    }
    return {};
}

auto NativeWindowController::strip_layered() -> Expected<void> {
    auto handle = require_handle();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (!api_->strip_layered(*handle)) {
        return call_failed("strip_layered");
    }
    return {};
}

auto NativeWindowController::display_rect(NativeRect area, bool working) const -> Expected<NativeRect> {
    if (!api_) {
        return unavailable();
    }
    auto rect = api_->display_rect(area, working);
    if (!rect) {
        return makeError(Error::Code::NotFound, "no display contains the window");
    }
    return *rect;
}

auto NativeWindowController::normalize_y(int y, int height, PointI corner) -> int {
    if (!api_ || !api_->bottom_up_coordinates()) {
        return y;
    }
    if (!screen_height_) {
        auto display = api_->display_rect(NativeRect{corner.x, corner.y, corner.x + 1, corner.y + 1}, false);
        if (!display) {
            return y;
        }
        screen_height_ = display->height();
    }
    return *screen_height_ - y - height;
}

} // namespace RTK::UI
