#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace RTK::UI {

// Packed 0xRRGGBBAA.
using Color = std::uint32_t;

struct PixelRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

/**
 * Offscreen RGBA8 framebuffer holding the last fully drawn frame. Ticks with no
 * qualifying change re-present this buffer instead of redrawing.
 */
class BackingStore {
public:
    BackingStore() = default;
    BackingStore(int width, int height);

    // Returns true if the buffer was reallocated. A no-op when the size is unchanged.
    auto resize(int width, int height) -> bool;

    void clear(Color color);
    void fill_rect(PixelRect const& rect, Color color);

    [[nodiscard]] auto width() const -> int { return width_; }
    [[nodiscard]] auto height() const -> int { return height_; }
    [[nodiscard]] auto row_stride_bytes() const -> std::size_t { return row_stride_bytes_; }
    [[nodiscard]] auto frame_bytes() const -> std::size_t { return pixels_.size(); }
    [[nodiscard]] auto pixels() -> std::span<std::uint8_t> { return pixels_; }
    [[nodiscard]] auto pixels() const -> std::span<std::uint8_t const> { return pixels_; }
    [[nodiscard]] auto pixel(int x, int y) const -> Color;
    [[nodiscard]] auto generation() const -> std::uint64_t { return generation_; }

    // Marks the buffer contents as a new frame.
    void commit_frame() { ++generation_; }

private:
    int width_ = 0;
    int height_ = 0;
    std::size_t row_stride_bytes_ = 0;
    std::vector<std::uint8_t> pixels_;
    std::uint64_t generation_ = 0;
};

} // namespace RTK::UI
