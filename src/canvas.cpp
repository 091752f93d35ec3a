#include "canvas.hpp"

#include "common.hpp"

// C++ includes
#include <stdexcept>

int align_offset(Alignment alignment, int surface_width, int text_width) {
    switch (alignment) {
        case Alignment::LEFT:
            return 0;
        case Alignment::CENTER:
            return (surface_width - text_width) / 2;
        case Alignment::RIGHT:
            return surface_width - text_width;
    }

    return 0;
}

Canvas::Canvas(const BarConfig &config, cairo_surface_t *surface, int width, int height, Presenter presenter)
    : __config(config), __surface(surface), __width(width), __height(height), __presenter(std::move(presenter)) {
    if (cairo_status_t status = cairo_surface_status(__surface)) {
        cairo_surface_destroy(__surface);
        throw std::runtime_error(format("Invalid cairo surface: %s", cairo_status_to_string(status)));
    }

    __cairo = cairo_create(__surface);
    if (cairo_status_t status = cairo_status(__cairo)) {
        cairo_destroy(__cairo);
        cairo_surface_destroy(__surface);
        throw std::runtime_error(format("Failed to create a cairo context: %s", cairo_status_to_string(status)));
    }

    // Every paint replaces what was below it, nothing is blended with the previous frame
    cairo_set_operator(__cairo, CAIRO_OPERATOR_SOURCE);

    cairo_font_options_t *options = cairo_font_options_create();
    cairo_font_options_set_antialias(options, CAIRO_ANTIALIAS_SUBPIXEL);

    __layout = pango_cairo_create_layout(__cairo);
    pango_cairo_context_set_font_options(pango_layout_get_context(__layout), options);
    pango_layout_context_changed(__layout);
    cairo_font_options_destroy(options);

    std::string font = __config.font + " " + __config.font_size;
    PangoFontDescription *description = pango_font_description_from_string(font.c_str());
    pango_layout_set_font_description(__layout, description);
    pango_font_description_free(description);

    tracef("Canvas ready (width: %d, height: %d, font: %s)", __width, __height, font.c_str());
}

Canvas::~Canvas() {
    g_object_unref(__layout);
    cairo_destroy(__cairo);
    cairo_surface_destroy(__surface);
}

void Canvas::clear() {
    cairo_save(__cairo);
    cairo_set_source_rgb(__cairo, __config.background.r, __config.background.g, __config.background.b);
    cairo_paint(__cairo);
    cairo_restore(__cairo);
}

void Canvas::draw_aligned(const std::vector<std::string> &segments, Alignment alignment) {
    std::string markup;
    for (size_t i = 0; i < segments.size(); i++) {
        if (i) markup += __config.separator;
        markup += segments[i];
    }

    set_content(markup);
    show(alignment);
}

void Canvas::draw(const AlignedSegments &segments) {
    for (Alignment alignment : { Alignment::LEFT, Alignment::CENTER, Alignment::RIGHT }) {
        if (segments[alignment].empty()) continue;
        draw_aligned(segments[alignment], alignment);
    }
}

void Canvas::draw_plain(const std::string &line) {
    set_content(line);
    show(Alignment::LEFT);
}

void Canvas::present() const {
    __presenter();
}

void Canvas::set_content(const std::string &markup) {
    GError *error = nullptr;

    if (pango_parse_markup(markup.c_str(), markup.size(), 0, nullptr, nullptr, nullptr, &error)) {
        pango_layout_set_markup(__layout, markup.c_str(), markup.size());
        return;
    }

    warnf("Invalid markup '%s' (%s), drawing it as plain text", markup.c_str(), error->message);
    g_error_free(error);

    pango_layout_set_text(__layout, markup.c_str(), markup.size());
}

void Canvas::show(Alignment alignment) {
    cairo_save(__cairo);
    cairo_set_source_rgb(__cairo, __config.foreground.r, __config.foreground.g, __config.foreground.b);

    pango_cairo_update_layout(__cairo, __layout);

    int text_width = 0;
    pango_layout_get_pixel_size(__layout, &text_width, nullptr);
    __last_text_width = text_width;

    int offset = align_offset(alignment, __width, text_width);
    cairo_translate(__cairo, offset, 0);

    tracef("Drawing %s text (width: %d, offset: %d)", alignment_name(alignment), text_width, offset);

    pango_cairo_show_layout(__cairo, __layout);
    cairo_restore(__cairo);

    cairo_surface_flush(__surface);
    present();
}
