#pragma once

#include "layout/TextMeasurer.h"

/**
 * @brief Text measurement backed by FLTK's font metrics.
 * On X11 the display must be open (fl_open_display) before the first measurement.
 */
class FlTextMeasurer : public WrappingTextMeasurer {
  protected:
    double advance(const std::string &text, const FontSpec &font) override;
    int lineHeight(const FontSpec &font) override;
};
