#include <gtest/gtest.h>

#include "client.hpp"
#include "config.hpp"

namespace {

xcb_visualtype_t visual(uint32_t red_mask, uint32_t green_mask, uint32_t blue_mask) {
    xcb_visualtype_t visual {};
    visual._class = XCB_VISUAL_CLASS_TRUE_COLOR;
    visual.red_mask = red_mask;
    visual.green_mask = green_mask;
    visual.blue_mask = blue_mask;
    return visual;
}

}

TEST(PackPixelTest, TrueColor24) {
    xcb_visualtype_t rgb888 = visual(0xFF0000, 0x00FF00, 0x0000FF);

    EXPECT_EQ(Client::pack_pixel(Color::parse("#123456"), rgb888), 0x123456u);
    EXPECT_EQ(Client::pack_pixel(Color::parse("#FFFFFF"), rgb888), 0xFFFFFFu);
}

TEST(PackPixelTest, TrueColor16) {
    xcb_visualtype_t rgb565 = visual(0xF800, 0x07E0, 0x001F);

    EXPECT_EQ(Client::pack_pixel(Color::parse("#FFFFFF"), rgb565), 0xFFFFu);
    EXPECT_EQ(Client::pack_pixel(Color::parse("#FF0000"), rgb565), 0xF800u);
    EXPECT_EQ(Client::pack_pixel(Color::parse("#00FF00"), rgb565), 0x07E0u);
    EXPECT_EQ(Client::pack_pixel(Color::parse("#000000"), rgb565), 0x0000u);
}

TEST(PackPixelTest, SwappedChannelOrder) {
    xcb_visualtype_t bgr888 = visual(0x0000FF, 0x00FF00, 0xFF0000);

    EXPECT_EQ(Client::pack_pixel(Color::parse("#112233"), bgr888), 0x332211u);
}

TEST(PackPixelTest, ChannelsStayInsideTheirMasks) {
    xcb_visualtype_t rgb101010 = visual(0x3FF00000, 0x000FFC00, 0x000003FF);

    EXPECT_EQ(Client::pack_pixel(Color::parse("#FFFFFF"), rgb101010), 0x3FFFFFFFu);
    EXPECT_EQ(Client::pack_pixel(Color::parse("#0000FF"), rgb101010), 0x000003FFu);
}
