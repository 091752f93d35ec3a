#include "config.hpp"

#include "common.hpp"

// C++ includes
#include <cmath>
#include <stdexcept>

// C includes
#include <ctype.h>
#include <errno.h>
#include <getopt.h>
#include <stdlib.h>

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Color Color::parse(const std::string &hex) {
    std::string digits = !hex.empty() && hex[0] == '#' ? hex.substr(1) : hex;

    if (digits.size() != 6) throw std::invalid_argument(format("Invalid color '%s', expected #RRGGBB", hex.c_str()));

    double channels[3];
    for (int i = 0; i < 3; i++) {
        int hi = hex_digit(digits[2 * i]);
        int lo = hex_digit(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument(format("Invalid color '%s', expected #RRGGBB", hex.c_str()));
        channels[i] = (hi * 16 + lo) / 255.0;
    }

    return Color { channels[0], channels[1], channels[2] };
}

uint32_t Color::to_pixel() const {
    auto channel = [](double value) -> uint32_t {
        return (uint32_t) std::lround(value * 255.0) & 0xFF;
    };

    return (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

void BarConfig::validate() const {
    if (height <= 0) throw std::invalid_argument(format("Bar height must be positive, got %d", height));
    if (width && *width <= 0) throw std::invalid_argument(format("Bar width must be positive, got %d", *width));
    if (x && *x < 0) throw std::invalid_argument(format("Bar x must not be negative, got %d", *x));
    if (y && *y < 0) throw std::invalid_argument(format("Bar y must not be negative, got %d", *y));
    if (!(opacity >= 0.0 && opacity <= 1.0)) throw std::invalid_argument(format("Opacity must be within [0, 1], got %g", opacity));
    if (font.empty()) throw std::invalid_argument("Font family must not be empty");
}

static int parse_int(const char *option, const char *value) {
    char *end = nullptr;
    errno = 0;
    long result = strtol(value, &end, 10);

    if (errno || end == value || *end != '\0' || result < INT32_MIN || result > INT32_MAX) {
        throw std::invalid_argument(format("Option --%s expects an integer, got '%s'", option, value));
    }

    return (int) result;
}

static double parse_double(const char *option, const char *value) {
    char *end = nullptr;
    errno = 0;
    double result = strtod(value, &end);

    if (errno || end == value || *end != '\0') {
        throw std::invalid_argument(format("Option --%s expects a number, got '%s'", option, value));
    }

    return result;
}

enum LongOnly {
    OPT_HELP = 0x100,
    OPT_VERSION,
};

static const struct option long_options[] = {
    { "height",     required_argument, nullptr, 'h' },
    { "width",      required_argument, nullptr, 'w' },
    { "x",          required_argument, nullptr, 'x' },
    { "y",          required_argument, nullptr, 'y' },
    { "foreground", required_argument, nullptr, 'F' },
    { "background", required_argument, nullptr, 'B' },
    { "bottom",     no_argument,       nullptr, 'b' },
    { "opacity",    required_argument, nullptr, 'o' },
    { "font",       required_argument, nullptr, 'f' },
    { "fontsize",   required_argument, nullptr, 'S' },
    { "separator",  required_argument, nullptr, 's' },
    { "plain",      no_argument,       nullptr, 'p' },
    { "dismiss",    no_argument,       nullptr, 'd' },
    { "verbose",    no_argument,       nullptr, 'v' },
    { "help",       no_argument,       nullptr, OPT_HELP },
    { "version",    no_argument,       nullptr, OPT_VERSION },
    { nullptr,      0,                 nullptr, 0 },
};

CommandLine CommandLine::parse(int argc, char *const argv[]) {
    CommandLine command_line;
    BarConfig &config = command_line.config;
    bool has_height = false;

    // getopt keeps its cursor in globals, reset it so parse() can be called more than once
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":h:w:x:y:F:B:bo:f:S:s:pdv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                config.height = parse_int("height", optarg);
                has_height = true;
                break;
            case 'w':
                config.width = parse_int("width", optarg);
                break;
            case 'x':
                config.x = parse_int("x", optarg);
                break;
            case 'y':
                config.y = parse_int("y", optarg);
                break;
            case 'F':
                config.foreground = Color::parse(optarg);
                break;
            case 'B':
                config.background = Color::parse(optarg);
                break;
            case 'b':
                config.bottom = true;
                break;
            case 'o':
                config.opacity = parse_double("opacity", optarg);
                break;
            case 'f':
                config.font = optarg;
                break;
            case 'S':
                config.font_size = optarg;
                break;
            case 's':
                config.separator = optarg;
                break;
            case 'p':
                config.mode = BarConfig::Mode::PLAIN;
                break;
            case 'd':
                config.dismiss_on_click = true;
                break;
            case 'v':
                config.verbose = true;
                break;
            case OPT_HELP:
                command_line.action = Action::HELP;
                return command_line;
            case OPT_VERSION:
                command_line.action = Action::VERSION;
                return command_line;
            case ':':
                throw std::invalid_argument(format("Option '%s' requires an argument", argv[optind - 1]));
            default:
                throw std::invalid_argument(format("Unknown option '%s'", argv[optind - 1]));
        }
    }

    if (optind < argc) throw std::invalid_argument(format("Unexpected argument '%s'", argv[optind]));
    if (!has_height) throw std::invalid_argument("Option --height is required");

    config.validate();

    return command_line;
}

const char *usage() {
    return
        "Usage: barney -h HEIGHT [OPTIONS]\n"
        "\n"
        "Reads lines from stdin and draws them into a dock bar.\n"
        "Fields are introduced by ^l, ^c or ^r and may contain Pango markup.\n"
        "\n"
        "  -h, --height N         bar height in pixels (required)\n"
        "  -w, --width N          bar width, makes the bar floating\n"
        "  -x, --x N              horizontal position of a floating bar\n"
        "  -y, --y N              vertical position of a floating bar\n"
        "  -F, --foreground COLOR text color as #RRGGBB (default #FFFFFF)\n"
        "  -B, --background COLOR background color as #RRGGBB (default #000000)\n"
        "  -b, --bottom           dock to the bottom edge of the screen\n"
        "  -o, --opacity F        window opacity within [0, 1] (default 1)\n"
        "  -f, --font NAME        font family (default Sans)\n"
        "  -S, --fontsize SIZE    font size (default 12)\n"
        "  -s, --separator STR    string placed between fields of one alignment\n"
        "  -p, --plain            draw each line as is, without alignment tags\n"
        "  -d, --dismiss          exit when the bar is clicked\n"
        "  -v, --verbose          enable trace logging\n"
        "      --help             show this help\n"
        "      --version          show the version\n";
}
