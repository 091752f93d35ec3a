#pragma once

// C++ includes
#include <cstdint>
#include <optional>
#include <string>

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    // Accepts "#RRGGBB" or "RRGGBB"
    static Color parse(const std::string &hex);

    // Packed as 0xRRGGBB, the layout of a cairo RGB24 pixel
    uint32_t to_pixel() const;
};

struct BarConfig {

    enum class Mode {
        MARKUP,
        PLAIN,
    };

    int height = 0;

    // Set only for a floating bar, otherwise the bar spans the screen edge
    std::optional<int> width;
    std::optional<int> x;
    std::optional<int> y;

    Color foreground { 1.0, 1.0, 1.0 };
    Color background { 0.0, 0.0, 0.0 };

    bool bottom = false;
    double opacity = 1.0;

    std::string font = "Sans";
    std::string font_size = "12";
    std::string separator;

    Mode mode = Mode::MARKUP;
    bool dismiss_on_click = false;
    bool verbose = false;

    bool floating() const { return width.has_value() || x.has_value() || y.has_value(); }

    void validate() const;
};

struct CommandLine {
    enum class Action {
        RUN,
        HELP,
        VERSION,
    };

    Action action = Action::RUN;
    BarConfig config;

    static CommandLine parse(int argc, char *const argv[]);
};

const char *usage();
