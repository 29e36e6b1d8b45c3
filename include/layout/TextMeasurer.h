#pragma once

#include <string>
#include <vector>

#include "layout/Geometry.h"
#include "models/StyledText.h"

/**
 * @brief Measures styled text. Results are rounded up to whole pixels.
 */
class TextMeasurer {
  public:
    virtual ~TextMeasurer() = default;

    /**
     * @brief Size of the text wrapped to maxWidth
     * @return {0, 0} for empty text or a maxWidth <= 0
     */
    virtual Size measure(const StyledText &text, int maxWidth) = 0;

    /**
     * @brief Size of the text without wrapping (explicit line breaks still apply)
     */
    virtual Size naturalSize(const StyledText &text) = 0;
};

/**
 * @brief Greedy word wrapping across runs. Subclasses supply glyph metrics.
 *
 * Repeated spaces collapse to one, spaces at the start of a line are dropped and trailing spaces do not
 * count towards the line width. A word wider than the line is broken between code points. Each line is as
 * tall as its tallest run. Token and line buffers are kept between calls.
 */
class WrappingTextMeasurer : public TextMeasurer {
  public:
    Size measure(const StyledText &text, int maxWidth) override;
    Size naturalSize(const StyledText &text) override;

  protected:
    /// Horizontal advance of text set in font
    virtual double advance(const std::string &text, const FontSpec &font) = 0;

    /// Height of one line set in font
    virtual int lineHeight(const FontSpec &font) = 0;

  private:
    struct Token {
        enum class Kind { Word, Space, LineBreak };

        Kind kind = Kind::Word;
        std::string text;
        FontSpec font;
        double width = 0.0;
    };

    struct Line {
        double width = 0.0;
        int height = 0;
    };

    Size layout(const StyledText &text, double maxWidth);
    void tokenize(const StyledText &text);
    void splitLongToken(const Token &token, double maxWidth);

    std::vector<Token> m_tokens;
    std::vector<Token> m_parts;
    std::vector<Line> m_lines;
};
