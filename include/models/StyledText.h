#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <FL/Enumerations.H>
#include <nlohmann/json.hpp>

/**
 * @brief An FLTK face and point size
 */
struct FontSpec {
    Fl_Font face = FL_HELVETICA;
    int size = 14;

    bool operator==(const FontSpec &other) const { return face == other.face && size == other.size; }
    bool operator!=(const FontSpec &other) const { return !(*this == other); }

    /**
     * @brief Parse {"face": "bold", "size": 13}; missing keys keep the fallback values
     */
    static FontSpec fromJson(const nlohmann::json &j, FontSpec fallback = {});
    nlohmann::json toJson() const;
};

struct TextRun {
    std::string text;
    FontSpec font;

    bool operator==(const TextRun &other) const { return text == other.text && font == other.font; }
    bool operator!=(const TextRun &other) const { return !(*this == other); }
};

/**
 * @brief Attributed text: an ordered list of runs, each with its own font
 */
class StyledText {
  public:
    StyledText() = default;
    StyledText(std::string text, FontSpec font);

    /**
     * @brief Deserialize from a plain string (one run in the fallback font) or {"runs": [{"text", "font"}]}
     */
    static StyledText fromJson(const nlohmann::json &j, FontSpec fallback = {});
    nlohmann::json toJson() const;

    void append(std::string text, FontSpec font);

    const std::vector<TextRun> &runs() const { return m_runs; }

    std::string plainText() const;

    /// Length of the text in bytes across all runs
    size_t length() const;
    bool empty() const { return length() == 0; }

    /// Font of the first run, if there is one
    std::optional<FontSpec> leadingFont() const;

    bool operator==(const StyledText &other) const { return m_runs == other.m_runs; }
    bool operator!=(const StyledText &other) const { return !(*this == other); }

  private:
    std::vector<TextRun> m_runs;
};
