#include "client.hpp"

#include "common.hpp"
#include "config.hpp"

// C++ includes
#include <bit>
#include <cmath>

// C includes
#include <stdlib.h>

ProtocolError::ProtocolError(uint8_t error_code, uint8_t major_code, uint16_t sequence)
    : std::runtime_error(format("X protocol error %u (major opcode %u, sequence %u)", error_code, major_code, sequence)),
      __error_code(error_code), __major_code(major_code), __sequence(sequence) {}

Client::Client(const char *display_name) {
    int screen_number = 0;

    __connection = xcb_connect(display_name, &screen_number);
    if (int error = xcb_connection_has_error(__connection)) {
        xcb_disconnect(__connection);
        throw ConnectionError(format("Failed to connect to the X server, error code: %d", error));
    }

    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(xcb_get_setup(__connection));
    for (int i = 0; i < screen_number && iter.rem; i++) {
        xcb_screen_next(&iter);
    }

    if (!(__screen = iter.data)) {
        xcb_disconnect(__connection);
        throw ConnectionError(format("X server has no screen %d", screen_number));
    }

    if (!(__visual_type = find_visual_type(__screen, __screen->root_visual))) {
        xcb_disconnect(__connection);
        throw ConnectionError("Failed to find the visual type of the root window");
    }

    infof("Connected to X, screen %d (width: %d, height: %d, depth: %d)", screen_number, __screen->width_in_pixels, __screen->height_in_pixels, __screen->root_depth);
}

Client::~Client() {
    xcb_disconnect(__connection);
}

int Client::fd() const {
    return xcb_get_file_descriptor(__connection);
}

uint32_t Client::generate_id() {
    uint32_t id = xcb_generate_id(__connection);
    if (id == (uint32_t) -1) throw ConnectionError("Ran out of X resource ids");
    return id;
}

uint32_t Client::pixel(const Color &color) {
    if (__visual_type->_class == XCB_VISUAL_CLASS_TRUE_COLOR || __visual_type->_class == XCB_VISUAL_CLASS_DIRECT_COLOR) {
        return pack_pixel(color, *__visual_type);
    }

    auto channel = [](double value) -> uint16_t {
        return (uint16_t) std::lround(value * 0xFFFF);
    };

    xcb_alloc_color_cookie_t cookie = xcb_alloc_color(__connection, __screen->default_colormap, channel(color.r), channel(color.g), channel(color.b));
    xcb_generic_error_t *error = nullptr;
    xcb_alloc_color_reply_t *reply = xcb_alloc_color_reply(__connection, cookie, &error);

    if (!reply) {
        ProtocolError protocol_error(error ? error->error_code : 0, error ? error->major_code : 0, error ? error->sequence : 0);
        free(error);
        throw protocol_error;
    }

    uint32_t pixel = reply->pixel;
    free(reply);

    tracef("Allocated pixel 0x%x on a visual of class %u", pixel, __visual_type->_class);

    return pixel;
}

uint32_t Client::pack_pixel(const Color &color, const xcb_visualtype_t &visual) {
    auto channel = [](double value, uint32_t mask) -> uint32_t {
        if (!mask) return 0;

        int shift = std::countr_zero(mask);
        uint32_t max = mask >> shift;

        return ((uint32_t) std::lround(value * max) << shift) & mask;
    };

    return channel(color.r, visual.red_mask) | channel(color.g, visual.green_mask) | channel(color.b, visual.blue_mask);
}

std::optional<Event> Client::poll_event() {
    xcb_generic_event_t *event = xcb_poll_for_event(__connection);

    if (!event) {
        check_connection();
        return std::nullopt;
    }

    uint8_t response_type = event->response_type & ~0x80;

    if (response_type == 0) {
        xcb_generic_error_t *error = (xcb_generic_error_t *) event;
        ProtocolError protocol_error(error->error_code, error->major_code, error->sequence);
        free(event);
        throw protocol_error;
    }

    Event result = OtherEvent { response_type };

    switch (response_type) {
        case XCB_EXPOSE: {
            xcb_expose_event_t *expose = (xcb_expose_event_t *) event;
            result = ExposeEvent { expose->window, expose->count };
            break;
        }
        case XCB_BUTTON_PRESS: {
            xcb_button_press_event_t *press = (xcb_button_press_event_t *) event;
            result = ButtonPressEvent { press->event, press->detail };
            break;
        }
    }

    free(event);
    return result;
}

void Client::check(xcb_void_cookie_t cookie, const char *what) {
    if (xcb_generic_error_t *error = xcb_request_check(__connection, cookie)) {
        ProtocolError protocol_error(error->error_code, error->major_code, error->sequence);
        free(error);
        errorf("%s failed: %s", what, protocol_error.what());
        throw protocol_error;
    }
}

void Client::flush() {
    if (xcb_flush(__connection) <= 0) check_connection();
}

void Client::check_connection() const {
    if (int error = xcb_connection_has_error(__connection)) {
        throw ConnectionError(format("Lost the connection to the X server, error code: %d", error));
    }
}

xcb_visualtype_t *Client::find_visual_type(xcb_screen_t *screen, xcb_visualid_t visual) {
    for (xcb_depth_iterator_t depth = xcb_screen_allowed_depths_iterator(screen); depth.rem; xcb_depth_next(&depth)) {
        for (xcb_visualtype_iterator_t iter = xcb_depth_visuals_iterator(depth.data); iter.rem; xcb_visualtype_next(&iter)) {
            if (iter.data->visual_id == visual) return iter.data;
        }
    }

    return nullptr;
}
