#include "bar.hpp"

#include "canvas.hpp"
#include "client.hpp"
#include "common.hpp"

// C++ includes
#include <cmath>

// Libraries
#include <cairo-xcb.h>

Strut make_strut(bool bottom, uint32_t height, uint32_t x, uint32_t width) {
    Strut strut {};

    if (bottom) {
        strut[3] = height;
        strut[10] = x;
        strut[11] = x + width;
    } else {
        strut[2] = height;
        strut[8] = x;
        strut[9] = x + width;
    }

    return strut;
}

uint32_t opacity_cardinal(double opacity) {
    return (uint32_t) std::llround(opacity * 0xFFFFFFFFu);
}

Bar::Geometry Bar::geometry(const BarConfig &config, int screen_width, int screen_height) {
    Geometry geometry;

    geometry.height = config.height;
    geometry.width = config.width.value_or(screen_width);
    geometry.x = config.x.value_or(0);

    if (config.y) {
        geometry.y = *config.y;
    } else {
        geometry.y = config.bottom ? screen_height - config.height : 0;
    }

    return geometry;
}

Bar::Bar(Client &client, const BarConfig &config) : __client(client), __config(config), __atoms(client) {
    xcb_screen_t *screen = __client.screen();

    __geometry = geometry(__config, screen->width_in_pixels, screen->height_in_pixels);
    __strut = make_strut(__config.bottom, __geometry.height, __geometry.x, __geometry.width);

    try {
        __window = __client.generate_id();

        uint32_t values[] = {
            __client.pixel(__config.background),
            XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_ENTER_WINDOW | XCB_EVENT_MASK_LEAVE_WINDOW | XCB_EVENT_MASK_EXPOSURE,
        };

        __client.check(xcb_create_window_checked(__client.connection(), screen->root_depth, __window, screen->root,
                                                 __geometry.x, __geometry.y, __geometry.width, __geometry.height, 0,
                                                 XCB_WINDOW_CLASS_INPUT_OUTPUT, screen->root_visual,
                                                 XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK, values),
                       "CreateWindow");

        __pixmap = __client.generate_id();
        __client.check(xcb_create_pixmap_checked(__client.connection(), screen->root_depth, __pixmap, screen->root,
                                                 __geometry.width, __geometry.height),
                       "CreatePixmap");

        uint32_t gc_values[] = { screen->black_pixel, screen->white_pixel };

        __gc = __client.generate_id();
        __client.check(xcb_create_gc_checked(__client.connection(), __gc, screen->root,
                                             XCB_GC_FOREGROUND | XCB_GC_BACKGROUND, gc_values),
                       "CreateGC");
    } catch (...) {
        destroy();
        throw;
    }

    infof("Created bar window 0x%x (x: %d, y: %d, width: %d, height: %d)", __window, __geometry.x, __geometry.y, __geometry.width, __geometry.height);
}

Bar::~Bar() {
    destroy();
}

std::unique_ptr<Canvas> Bar::create_canvas() {
    cairo_surface_t *surface = cairo_xcb_surface_create(__client.connection(), __pixmap, __client.visual_type(), __geometry.width, __geometry.height);

    return std::make_unique<Canvas>(__config, surface, __geometry.width, __geometry.height, [this]() {
        copy_to_window();
    });
}

void Bar::copy_to_window() {
    xcb_copy_area(__client.connection(), __pixmap, __window, __gc, 0, 0, 0, 0, __geometry.width, __geometry.height);
}

void Bar::set_ewmh() {
    set_string("_NET_WM_NAME", "UTF8_STRING", name);
    set_string("_NET_WM_ICON_NAME", "UTF8_STRING", name);
    set_string("_NET_WM_CLASS", "UTF8_STRING", name);

    set_string((xcb_atom_t) XCB_ATOM_WM_NAME, (xcb_atom_t) XCB_ATOM_STRING, name);

    // WM_CLASS holds the instance and the class name, each NUL terminated
    std::string wm_class = std::string(name) + '\0' + name + '\0';
    set_string((xcb_atom_t) XCB_ATOM_WM_CLASS, (xcb_atom_t) XCB_ATOM_STRING, wm_class);

    if (__config.opacity != 1.0) {
        uint32_t opacity = opacity_cardinal(__config.opacity);
        set_cardinals("_NET_WM_WINDOW_OPACITY", &opacity, 1);
    }

    set_cardinals("_NET_WM_STRUT_PARTIAL", __strut.data(), 12);
    set_cardinals("_NET_WM_STRUT", __strut.data(), 4);

    set_atom(XCB_PROP_MODE_REPLACE, "_NET_WM_WINDOW_TYPE", "_NET_WM_WINDOW_TYPE_DOCK");

    // Some window managers only pick up state changes one atom at a time
    set_atom(XCB_PROP_MODE_REPLACE, "_NET_WM_STATE", "_NET_WM_STATE_ABOVE");
    set_atom(XCB_PROP_MODE_APPEND, "_NET_WM_STATE", "_NET_WM_STATE_STICKY");

    uint32_t all_desktops = 0xFFFFFFFF;
    set_cardinals("_NET_WM_DESKTOP", &all_desktops, 1);

    tracef("EWMH hints set on window 0x%x", __window);
}

void Bar::show() {
    xcb_map_window(__client.connection(), __window);
    __client.flush();
}

void Bar::change_property(uint8_t mode, const AtomRef &property, const AtomRef &type, uint8_t format, uint32_t length, const void *data) {
    std::string property_name = std::holds_alternative<std::string>(property) ? std::get<std::string>(property) : ::format("atom %u", std::get<xcb_atom_t>(property));

    xcb_atom_t property_atom = __atoms.resolve_ref(property);
    xcb_atom_t type_atom = __atoms.resolve_ref(type);

    xcb_void_cookie_t cookie = xcb_change_property_checked(__client.connection(), mode, __window, property_atom, type_atom, format, length, data);

    try {
        __client.check(cookie, "ChangeProperty");
    } catch (const ProtocolError &error) {
        throw PropertyError(::format("Failed to set %s on window 0x%x: %s", property_name.c_str(), __window, error.what()));
    }
}

void Bar::set_string(const AtomRef &property, const AtomRef &type, const std::string &value) {
    change_property(XCB_PROP_MODE_REPLACE, property, type, 8, value.size(), value.data());
}

void Bar::set_cardinals(const AtomRef &property, const uint32_t *values, uint32_t count) {
    change_property(XCB_PROP_MODE_REPLACE, property, (xcb_atom_t) XCB_ATOM_CARDINAL, 32, count, values);
}

void Bar::set_atom(uint8_t mode, const AtomRef &property, const AtomRef &value) {
    xcb_atom_t atom = __atoms.resolve_ref(value);
    change_property(mode, property, (xcb_atom_t) XCB_ATOM_ATOM, 32, 1, &atom);
}

void Bar::destroy() {
    if (__gc != XCB_NONE) xcb_free_gc(__client.connection(), __gc);
    if (__pixmap != XCB_NONE) xcb_free_pixmap(__client.connection(), __pixmap);
    if (__window != XCB_NONE) xcb_destroy_window(__client.connection(), __window);

    __gc = XCB_NONE;
    __pixmap = XCB_NONE;
    __window = XCB_NONE;
}
