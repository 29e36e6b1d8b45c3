/**
 * Unit tests for StyledText and FontSpec
 */

#include "models/StyledText.h"
#include "utils/Logger.h"

#include <gtest/gtest.h>

TEST(StyledTextTest, AdjacentRunsWithSameFontMerge) {
    StyledText text("Hello", FontSpec{FL_HELVETICA, 14});
    text.append(", world", FontSpec{FL_HELVETICA, 14});
    text.append("!", FontSpec{FL_HELVETICA_BOLD, 14});
    text.append("", FontSpec{FL_COURIER, 10});

    ASSERT_EQ(text.runs().size(), 2u);
    EXPECT_EQ(text.runs()[0].text, "Hello, world");
    EXPECT_EQ(text.plainText(), "Hello, world!");
    EXPECT_EQ(text.length(), 13u);
}

TEST(StyledTextTest, EmptyTextHasNoLeadingFont) {
    StyledText text;
    EXPECT_TRUE(text.empty());
    EXPECT_FALSE(text.leadingFont().has_value());

    text.append("x", FontSpec{FL_TIMES, 9});
    EXPECT_EQ(text.leadingFont(), (FontSpec{FL_TIMES, 9}));
}

TEST(StyledTextTest, PlainStringUsesFallbackFont) {
    StyledText text = StyledText::fromJson("plain", FontSpec{FL_HELVETICA, 17});
    ASSERT_EQ(text.runs().size(), 1u);
    EXPECT_EQ(text.runs()[0].font.size, 17);
}

TEST(StyledTextTest, RunsWithoutFontUseFallback) {
    nlohmann::json j = {{"runs", {{{"text", "a"}}, {{"text", "b"}, {"font", {{"size", 20}}}}}}};
    StyledText text = StyledText::fromJson(j, FontSpec{FL_HELVETICA_BOLD, 12});

    ASSERT_EQ(text.runs().size(), 2u);
    EXPECT_EQ(text.runs()[0].font, (FontSpec{FL_HELVETICA_BOLD, 12}));
    EXPECT_EQ(text.runs()[1].font, (FontSpec{FL_HELVETICA_BOLD, 20}));
}

TEST(StyledTextTest, JsonFormKeepsRuns) {
    StyledText text("Bold", FontSpec{FL_HELVETICA_BOLD, 13});
    text.append(" body", FontSpec{FL_HELVETICA, 13});
    EXPECT_EQ(StyledText::fromJson(text.toJson()), text);
}

TEST(FontSpecTest, NamedFaces) {
    EXPECT_EQ(FontSpec::fromJson({{"face", "mono"}}).face, FL_COURIER);
    EXPECT_EQ(FontSpec::fromJson({{"face", "bold-italic"}, {"size", 9}}), (FontSpec{FL_HELVETICA_BOLD_ITALIC, 9}));
    EXPECT_EQ(FontSpec{FL_TIMES}.toJson()["face"], "serif");
}

TEST(FontSpecTest, UnknownFaceFallsBackToRegular) {
    Logger::setLevel(Logger::Level::NONE);
    EXPECT_EQ(FontSpec::fromJson({{"face", "papyrus"}}).face, FL_HELVETICA);
    Logger::setLevel(Logger::Level::INFO);
}

TEST(FontSpecTest, NumberedFacesSurviveJson) {
    FontSpec custom{static_cast<Fl_Font>(FL_FREE_FONT + 2), 16};
    nlohmann::json j = custom.toJson();
    EXPECT_EQ(j["face"], "face:" + std::to_string(FL_FREE_FONT + 2));
    EXPECT_EQ(FontSpec::fromJson(j), custom);
}
