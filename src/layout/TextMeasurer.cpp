#include "layout/TextMeasurer.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
size_t codePointLength(unsigned char lead) {
    if ((lead & 0x80) == 0) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r'; }
} // namespace

Size WrappingTextMeasurer::measure(const StyledText &text, int maxWidth) {
    if (maxWidth <= 0 || text.empty()) {
        return {0, 0};
    }
    return layout(text, static_cast<double>(maxWidth));
}

Size WrappingTextMeasurer::naturalSize(const StyledText &text) {
    if (text.empty()) {
        return {0, 0};
    }
    return layout(text, std::numeric_limits<double>::infinity());
}

void WrappingTextMeasurer::tokenize(const StyledText &text) {
    m_tokens.clear();

    for (const auto &run : text.runs()) {
        std::string current;

        auto flushCurrent = [&]() {
            if (!current.empty()) {
                m_tokens.push_back(Token{Token::Kind::Word, current, run.font, 0.0});
                current.clear();
            }
        };

        for (char ch : run.text) {
            if (ch == '\n') {
                flushCurrent();
                m_tokens.push_back(Token{Token::Kind::LineBreak, std::string(), run.font, 0.0});
            } else if (isSpace(ch)) {
                flushCurrent();
                if (m_tokens.empty() || m_tokens.back().kind != Token::Kind::Space) {
                    m_tokens.push_back(Token{Token::Kind::Space, " ", run.font, 0.0});
                }
            } else {
                current.push_back(ch);
            }
        }

        flushCurrent();
    }
}

void WrappingTextMeasurer::splitLongToken(const Token &token, double maxWidth) {
    m_parts.clear();

    std::string current;
    size_t pos = 0;
    while (pos < token.text.size()) {
        size_t length = std::min(codePointLength(static_cast<unsigned char>(token.text[pos])), token.text.size() - pos);
        std::string candidate = current + token.text.substr(pos, length);

        if (!current.empty() && advance(candidate, token.font) > maxWidth) {
            m_parts.push_back(Token{Token::Kind::Word, current, token.font, advance(current, token.font)});
            current = token.text.substr(pos, length);
        } else {
            current = std::move(candidate);
        }
        pos += length;
    }

    if (!current.empty()) {
        m_parts.push_back(Token{Token::Kind::Word, current, token.font, advance(current, token.font)});
    }
}

Size WrappingTextMeasurer::layout(const StyledText &text, double maxWidth) {
    tokenize(text);
    m_lines.clear();

    Line currentLine;
    bool lineHasItems = false;
    double trailingSpace = 0.0;
    FontSpec lastFont = text.runs().front().font;

    auto pushLine = [&]() {
        currentLine.width -= trailingSpace;
        m_lines.push_back(currentLine);
        currentLine = Line{};
        lineHasItems = false;
        trailingSpace = 0.0;
    };

    auto place = [&](const Token &token) {
        if (lineHasItems && currentLine.width + token.width > maxWidth) {
            pushLine();
        }
        currentLine.height = std::max(currentLine.height, lineHeight(token.font));
        if (token.kind == Token::Kind::Space && !lineHasItems) {
            return;
        }
        currentLine.width += token.width;
        trailingSpace = token.kind == Token::Kind::Space ? trailingSpace + token.width : 0.0;
        lineHasItems = true;
    };

    for (auto &token : m_tokens) {
        lastFont = token.font;

        if (token.kind == Token::Kind::LineBreak) {
            currentLine.height = std::max(currentLine.height, lineHeight(token.font));
            pushLine();
            continue;
        }

        token.width = advance(token.text, token.font);
        if (token.kind == Token::Kind::Word && token.width > maxWidth) {
            splitLongToken(token, maxWidth);
            for (const auto &part : m_parts) {
                place(part);
            }
            continue;
        }

        place(token);
    }

    if (currentLine.height == 0) {
        currentLine.height = lineHeight(lastFont);
    }
    pushLine();

    double width = 0.0;
    int height = 0;
    for (const auto &line : m_lines) {
        width = std::max(width, line.width);
        height += line.height;
    }

    return {static_cast<int>(std::ceil(std::max(0.0, width))), height};
}
