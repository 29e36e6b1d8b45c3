/**
 * Unit tests for SizingConfiguration defaults and JSON overlays
 */

#include "layout/SizingConfiguration.h"
#include "utils/Logger.h"

#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>

// ============================================================================
// Defaults
// ============================================================================

TEST(SizingConfigurationTest, SidesMirrorEachOther) {
    SizingConfiguration config;

    EXPECT_EQ(config.incoming.messagePadding, (EdgeInsets{0, 4, 0, 30}));
    EXPECT_EQ(config.outgoing.messagePadding, (EdgeInsets{0, 30, 0, 4}));
    EXPECT_EQ(config.incoming.messageTopLabelAlignment.textAlignment, TextAlignment::Left);
    EXPECT_EQ(config.outgoing.messageTopLabelAlignment.textAlignment, TextAlignment::Right);
    EXPECT_EQ(config.incoming.avatarPosition.vertical, AvatarVerticalPosition::CellBottom);
    EXPECT_EQ(config.incoming.avatarPosition.horizontal, AvatarHorizontalPosition::Natural);
    EXPECT_EQ(&config.styleFor(true), &config.outgoing);
    EXPECT_EQ(config.cacheCapacity, 256u);
}

// ============================================================================
// JSON
// ============================================================================

TEST(SizingConfigurationTest, OverlayKeepsAbsentKeys) {
    nlohmann::json j = {{"incoming",
                         {{"avatar_size", {40, 40}},
                          {"avatar_position", {{"vertical", "message_top"}}},
                          {"message_top_label", {{"alignment", "center"}}}}},
                        {"message_font", {{"size", 15}}},
                        {"cache_capacity", 0}};
    SizingConfiguration config = SizingConfiguration::fromJson(j);

    EXPECT_EQ(config.incoming.avatarSize, (Size{40, 40}));
    EXPECT_EQ(config.incoming.avatarPosition.vertical, AvatarVerticalPosition::MessageTop);
    EXPECT_EQ(config.incoming.avatarPosition.horizontal, AvatarHorizontalPosition::Natural);
    EXPECT_EQ(config.incoming.messageTopLabelAlignment.textAlignment, TextAlignment::Center);
    EXPECT_EQ(config.incoming.messageTopLabelAlignment.textInsets.left, 42);
    EXPECT_EQ(config.messageLabelFont, (FontSpec{FL_HELVETICA, 15}));
    EXPECT_EQ(config.cacheCapacity, 0u);
    EXPECT_EQ(config.outgoing, SenderStyle::outgoingDefaults());
}

TEST(SizingConfigurationTest, UnknownEnumNameIsRejected) {
    nlohmann::json j = {{"outgoing", {{"accessory_position", "somewhere"}}}};
    EXPECT_THROW(SizingConfiguration::fromJson(j), std::invalid_argument);
}

TEST(SizingConfigurationTest, JsonFormReloads) {
    SizingConfiguration config;
    config.avatarLeadingTrailingPadding = 6;
    config.outgoing.accessoryViewPosition = AccessoryPosition::CellBottom;
    config.typingIndicatorHeight = 48;

    EXPECT_EQ(SizingConfiguration::fromJson(config.toJson()), config);
}

TEST(SizingConfigurationTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "threadline_style.json";
    {
        std::ofstream file(path);
        file << R"({"typing_indicator_height": 44, "system_message_padding": [4, 8, 4, 8]})";
    }

    auto config = SizingConfiguration::loadFromFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->typingIndicatorHeight, 44);
    EXPECT_EQ(config->systemMessagePadding, (EdgeInsets{4, 8, 4, 8}));
    std::remove(path.c_str());
}

TEST(SizingConfigurationTest, LoadFailuresReturnNothing) {
    Logger::setLevel(Logger::Level::NONE);

    EXPECT_FALSE(SizingConfiguration::loadFromFile("/nonexistent/threadline.json").has_value());

    const std::string path = ::testing::TempDir() + "threadline_broken.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_FALSE(SizingConfiguration::loadFromFile(path).has_value());
    std::remove(path.c_str());

    Logger::setLevel(Logger::Level::INFO);
}
