#include <rtk/ui/BackingStore.hpp>

#include <algorithm>

namespace RTK::UI {

namespace {

constexpr std::size_t kBytesPerPixel = 4u;

auto clamp_non_negative(int value) -> int {
    return value < 0 ? 0 : value;
}

} // namespace

BackingStore::BackingStore(int width, int height) {
    resize(width, height);
}

auto BackingStore::resize(int width, int height) -> bool {
    width = clamp_non_negative(width);
    height = clamp_non_negative(height);
    if (width == width_ && height == height_) {
        return false;
    }
    width_ = width;
    height_ = height;
    row_stride_bytes_ = static_cast<std::size_t>(width_) * kBytesPerPixel;
    pixels_.assign(row_stride_bytes_ * static_cast<std::size_t>(height_), 0u);
    return true;
}

void BackingStore::clear(Color color) {
    fill_rect(PixelRect{0, 0, width_, height_}, color);
}

void BackingStore::fill_rect(PixelRect const& rect, Color color) {
    auto const x0 = std::clamp(rect.x, 0, width_);
    auto const y0 = std::clamp(rect.y, 0, height_);
    auto const x1 = std::clamp(rect.x + rect.width, 0, width_);
    auto const y1 = std::clamp(rect.y + rect.height, 0, height_);
    if (x0 >= x1 || y0 >= y1) {
        return;
    }
    std::uint8_t const channels[4] = {
        static_cast<std::uint8_t>((color >> 24) & 0xffu),
        static_cast<std::uint8_t>((color >> 16) & 0xffu),
        static_cast<std::uint8_t>((color >> 8) & 0xffu),
        static_cast<std::uint8_t>(color & 0xffu),
    };
    for (int y = y0; y < y1; ++y) {
        auto* row = pixels_.data() + static_cast<std::size_t>(y) * row_stride_bytes_;
        for (int x = x0; x < x1; ++x) {
            std::copy(std::begin(channels), std::end(channels), row + static_cast<std::size_t>(x) * kBytesPerPixel);
        }
    }
}

auto BackingStore::pixel(int x, int y) const -> Color {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return 0u;
    }
    auto const* p = pixels_.data() + static_cast<std::size_t>(y) * row_stride_bytes_ + static_cast<std::size_t>(x) * kBytesPerPixel;
    return (static_cast<Color>(p[0]) << 24) | (static_cast<Color>(p[1]) << 16) | (static_cast<Color>(p[2]) << 8)
           | static_cast<Color>(p[3]);
}

} // namespace RTK::UI
