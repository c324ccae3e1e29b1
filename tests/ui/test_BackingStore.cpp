#include <doctest/doctest.h>

#include <rtk/ui/BackingStore.hpp>

using namespace RTK::UI;

TEST_CASE("BackingStore resizes only when dimensions change") {
    BackingStore store;
    CHECK(store.resize(4, 3));
    CHECK(store.row_stride_bytes() == 16u);
    CHECK(store.frame_bytes() == 48u);
    CHECK_FALSE(store.resize(4, 3));
    CHECK(store.resize(-2, 3));
    CHECK(store.width() == 0);
}

TEST_CASE("BackingStore fills clipped rectangles") {
    BackingStore store(4, 4);
    store.clear(0x11223344u);
    CHECK(store.pixel(0, 0) == 0x11223344u);
    store.fill_rect(PixelRect{2, 2, 10, 10}, 0xff0000ffu);
    CHECK(store.pixel(3, 3) == 0xff0000ffu);
    CHECK(store.pixel(1, 1) == 0x11223344u);
    CHECK(store.pixel(9, 9) == 0u);

    auto const generation = store.generation();
    store.commit_frame();
    CHECK(store.generation() == generation + 1);
}
