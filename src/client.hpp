#pragma once

// C++ includes
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

// Libraries
#include <xcb/xcb.h>

// Forward declaration
struct Color;

class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(uint8_t error_code, uint8_t major_code, uint16_t sequence);

    uint8_t error_code() const { return __error_code; }
    uint8_t major_code() const { return __major_code; }
    uint16_t sequence() const { return __sequence; }

private:
    uint8_t __error_code;
    uint8_t __major_code;
    uint16_t __sequence;
};

struct ExposeEvent {
    xcb_window_t window;
    uint16_t count;
};

struct ButtonPressEvent {
    xcb_window_t window;
    uint8_t button;
};

struct OtherEvent {
    uint8_t response_type;
};

using Event = std::variant<ExposeEvent, ButtonPressEvent, OtherEvent>;

// Owns the X connection and everything read from its setup
class Client {
public:

    explicit Client(const char *display_name = nullptr);
    ~Client();

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    xcb_connection_t *connection() const { return __connection; }
    xcb_screen_t *screen() const { return __screen; }
    xcb_visualtype_t *visual_type() const { return __visual_type; }

    int fd() const;
    uint32_t generate_id();

    // Pixel value of the color on the root visual
    uint32_t pixel(const Color &color);

    // Scales each channel onto the visual's color masks, only valid for TrueColor and DirectColor visuals
    static uint32_t pack_pixel(const Color &color, const xcb_visualtype_t &visual);

    // Returns std::nullopt when no event is queued, throws ProtocolError on an X error
    std::optional<Event> poll_event();

    // Throws ProtocolError when the checked request failed
    void check(xcb_void_cookie_t cookie, const char *what);

    void flush();

private:

    xcb_connection_t *__connection;
    xcb_screen_t *__screen;
    xcb_visualtype_t *__visual_type;

    void check_connection() const;
    static xcb_visualtype_t *find_visual_type(xcb_screen_t *screen, xcb_visualid_t visual);

};
