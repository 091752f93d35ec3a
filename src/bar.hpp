#pragma once

#include "atoms.hpp"
#include "config.hpp"

// C++ includes
#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

// Libraries
#include <xcb/xcb.h>

// Forward declaration
class Canvas;
class Client;

class PropertyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Partial strut layout: {left, right, top, bottom, left_start_y, left_end_y, right_start_y,
// right_end_y, top_start_x, top_end_x, bottom_start_x, bottom_end_x}
using Strut = std::array<uint32_t, 12>;

Strut make_strut(bool bottom, uint32_t height, uint32_t x, uint32_t width);

// 0.0 .. 1.0 scaled onto the full CARDINAL range
uint32_t opacity_cardinal(double opacity);

class Bar {
public:

    static constexpr const char *name = "barney";

    struct Geometry {
        int x, y;
        int width, height;
    };

    static Geometry geometry(const BarConfig &config, int screen_width, int screen_height);

    Bar(Client &client, const BarConfig &config);
    ~Bar();

    Bar(const Bar &) = delete;
    Bar &operator=(const Bar &) = delete;

    xcb_window_t window() const { return __window; }
    xcb_pixmap_t pixmap() const { return __pixmap; }
    const Geometry &geometry() const { return __geometry; }
    const Strut &strut() const { return __strut; }

    // Back buffer canvas drawing into the pixmap, presenting copies it onto the window
    std::unique_ptr<Canvas> create_canvas();

    void copy_to_window();

    void set_ewmh();
    void show();

private:

    Client &__client;
    const BarConfig &__config;
    AtomCache __atoms;

    Geometry __geometry;
    Strut __strut;

    xcb_window_t __window = XCB_NONE;
    xcb_pixmap_t __pixmap = XCB_NONE;
    xcb_gcontext_t __gc = XCB_NONE;

    void change_property(uint8_t mode, const AtomRef &property, const AtomRef &type, uint8_t format, uint32_t length, const void *data);
    void set_string(const AtomRef &property, const AtomRef &type, const std::string &value);
    void set_cardinals(const AtomRef &property, const uint32_t *values, uint32_t count);
    void set_atom(uint8_t mode, const AtomRef &property, const AtomRef &value);

    void destroy();

};
