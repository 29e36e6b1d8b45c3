#include "layout/FlTextMeasurer.h"

#include <FL/fl_draw.H>

double FlTextMeasurer::advance(const std::string &text, const FontSpec &font) {
    if (text.empty()) {
        return 0.0;
    }
    fl_font(font.face, font.size);
    return fl_width(text.c_str(), static_cast<int>(text.size()));
}

int FlTextMeasurer::lineHeight(const FontSpec &font) {
    fl_font(font.face, font.size);
    return fl_height();
}
