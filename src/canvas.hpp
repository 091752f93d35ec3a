#pragma once

#include "config.hpp"
#include "markup.hpp"

// C++ includes
#include <functional>
#include <string>
#include <vector>

// Libraries
#include <cairo.h>
#include <pango/pangocairo.h>

// Horizontal origin of the text, in whole pixels
int align_offset(Alignment alignment, int surface_width, int text_width);

/*
 * Back buffer of the bar.
 *
 * Everything is drawn into the cairo surface given to the constructor, which
 * the canvas takes ownership of. The presenter copies the finished buffer onto
 * the visible window.
 */
class Canvas {
public:

    using Presenter = std::function<void()>;

    Canvas(const BarConfig &config, cairo_surface_t *surface, int width, int height, Presenter presenter);
    ~Canvas();

    Canvas(const Canvas &) = delete;
    Canvas &operator=(const Canvas &) = delete;

    int width() const { return __width; }
    int height() const { return __height; }

    void clear();

    void draw_aligned(const std::vector<std::string> &segments, Alignment alignment);
    void draw(const AlignedSegments &segments);
    void draw_plain(const std::string &line);

    void present() const;

    // Pixel width of the text drawn last
    int last_text_width() const { return __last_text_width; }

private:

    const BarConfig &__config;
    cairo_surface_t *__surface;
    int __width, __height;
    Presenter __presenter;

    cairo_t *__cairo;
    PangoLayout *__layout;
    int __last_text_width = 0;

    void set_content(const std::string &markup);
    void show(Alignment alignment);

};
