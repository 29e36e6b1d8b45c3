#include "models/StyledText.h"

#include "utils/Fonts.h"

FontSpec FontSpec::fromJson(const nlohmann::json &j, FontSpec fallback) {
    FontSpec font = fallback;

    if (j.contains("face") && j["face"].is_string()) {
        font.face = FontRegistry::resolve(j["face"].get<std::string>());
    }

    if (j.contains("size") && j["size"].is_number()) {
        font.size = j["size"].get<int>();
    }

    return font;
}

nlohmann::json FontSpec::toJson() const { return {{"face", FontRegistry::nameOf(face)}, {"size", size}}; }

StyledText::StyledText(std::string text, FontSpec font) { append(std::move(text), font); }

StyledText StyledText::fromJson(const nlohmann::json &j, FontSpec fallback) {
    if (j.is_string()) {
        return StyledText(j.get<std::string>(), fallback);
    }

    StyledText styled;
    if (j.contains("runs") && j["runs"].is_array()) {
        for (const auto &runJson : j["runs"]) {
            std::string text = runJson.at("text").get<std::string>();
            FontSpec font = fallback;
            if (runJson.contains("font") && runJson["font"].is_object()) {
                font = FontSpec::fromJson(runJson["font"], fallback);
            }
            styled.append(std::move(text), font);
        }
    }

    return styled;
}

nlohmann::json StyledText::toJson() const {
    nlohmann::json runs = nlohmann::json::array();
    for (const auto &run : m_runs) {
        runs.push_back({{"text", run.text}, {"font", run.font.toJson()}});
    }
    return {{"runs", runs}};
}

void StyledText::append(std::string text, FontSpec font) {
    if (text.empty()) {
        return;
    }

    if (!m_runs.empty() && m_runs.back().font == font) {
        m_runs.back().text += text;
        return;
    }

    m_runs.push_back(TextRun{std::move(text), font});
}

std::string StyledText::plainText() const {
    std::string text;
    text.reserve(length());
    for (const auto &run : m_runs) {
        text += run.text;
    }
    return text;
}

size_t StyledText::length() const {
    size_t total = 0;
    for (const auto &run : m_runs) {
        total += run.text.size();
    }
    return total;
}

std::optional<FontSpec> StyledText::leadingFont() const {
    if (m_runs.empty()) {
        return std::nullopt;
    }
    return m_runs.front().font;
}
