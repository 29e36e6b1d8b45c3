#include "layout/SizingConfiguration.h"

#include "utils/Logger.h"

#include <fstream>
#include <stdexcept>

namespace {
constexpr int kCaptionInset = 42;

Size readSize(const nlohmann::json &j) { return {j.at(0).get<int>(), j.at(1).get<int>()}; }

EdgeInsets readInsets(const nlohmann::json &j) {
    return {j.at(0).get<int>(), j.at(1).get<int>(), j.at(2).get<int>(), j.at(3).get<int>()};
}

nlohmann::json writeInsets(const EdgeInsets &insets) {
    return {insets.top, insets.left, insets.bottom, insets.right};
}

template <typename Enum>
Enum readEnum(const nlohmann::json &j, std::optional<Enum> (*parse)(const std::string &), const char *what) {
    std::string name = j.get<std::string>();
    auto value = parse(name);
    if (!value.has_value()) {
        throw std::invalid_argument(std::string("Unknown ") + what + " '" + name + "'");
    }
    return *value;
}

LabelAlignment readLabel(const nlohmann::json &j, LabelAlignment label) {
    if (j.contains("alignment")) {
        label.textAlignment = readEnum(j["alignment"], &textAlignmentFromString, "text alignment");
    }
    if (j.contains("insets")) {
        label.textInsets = readInsets(j["insets"]);
    }
    return label;
}

nlohmann::json writeLabel(const LabelAlignment &label) {
    return {{"alignment", toString(label.textAlignment)}, {"insets", writeInsets(label.textInsets)}};
}

LabelAlignment captionLabel(TextAlignment alignment, EdgeInsets insets) { return LabelAlignment{alignment, insets}; }
} // namespace

SenderStyle SenderStyle::incomingDefaults() {
    SenderStyle style;
    style.messagePadding = {0, 4, 0, 30};
    style.cellBottomLabelAlignment = captionLabel(TextAlignment::Left, {0, kCaptionInset, 0, 0});
    style.messageTopLabelAlignment = captionLabel(TextAlignment::Left, {0, kCaptionInset, 0, 0});
    style.messageBottomLabelAlignment = captionLabel(TextAlignment::Left, {0, kCaptionInset, 0, 0});
    style.attachmentPadding = {0, 18, 7, 14};
    style.messageLabelInsets = {7, 18, 7, 14};
    style.contactLabelInsets = {7, 46, 7, 30};
    return style;
}

SenderStyle SenderStyle::outgoingDefaults() {
    SenderStyle style;
    style.messagePadding = {0, 30, 0, 4};
    style.cellBottomLabelAlignment = captionLabel(TextAlignment::Right, {0, 0, 0, kCaptionInset});
    style.messageTopLabelAlignment = captionLabel(TextAlignment::Right, {0, 0, 0, kCaptionInset});
    style.messageBottomLabelAlignment = captionLabel(TextAlignment::Right, {0, 0, 0, kCaptionInset});
    style.attachmentPadding = {0, 14, 7, 18};
    style.messageLabelInsets = {7, 14, 7, 18};
    style.contactLabelInsets = {7, 41, 7, 35};
    return style;
}

SenderStyle SenderStyle::fromJson(const nlohmann::json &j, const SenderStyle &base) {
    SenderStyle style = base;

    if (j.contains("avatar_size")) {
        style.avatarSize = readSize(j["avatar_size"]);
    }

    if (j.contains("avatar_position")) {
        const auto &position = j["avatar_position"];
        if (position.contains("horizontal")) {
            style.avatarPosition.horizontal =
                readEnum(position["horizontal"], &avatarHorizontalPositionFromString, "avatar horizontal position");
        }
        if (position.contains("vertical")) {
            style.avatarPosition.vertical =
                readEnum(position["vertical"], &avatarVerticalPositionFromString, "avatar vertical position");
        }
    }

    if (j.contains("message_padding")) {
        style.messagePadding = readInsets(j["message_padding"]);
    }

    if (j.contains("cell_top_label")) {
        style.cellTopLabelAlignment = readLabel(j["cell_top_label"], style.cellTopLabelAlignment);
    }
    if (j.contains("cell_bottom_label")) {
        style.cellBottomLabelAlignment = readLabel(j["cell_bottom_label"], style.cellBottomLabelAlignment);
    }
    if (j.contains("message_top_label")) {
        style.messageTopLabelAlignment = readLabel(j["message_top_label"], style.messageTopLabelAlignment);
    }
    if (j.contains("message_bottom_label")) {
        style.messageBottomLabelAlignment = readLabel(j["message_bottom_label"], style.messageBottomLabelAlignment);
    }

    if (j.contains("accessory_size")) {
        style.accessoryViewSize = readSize(j["accessory_size"]);
    }
    if (j.contains("accessory_padding")) {
        const auto &padding = j["accessory_padding"];
        style.accessoryViewPadding = {padding.at(0).get<int>(), padding.at(1).get<int>()};
    }
    if (j.contains("accessory_position")) {
        style.accessoryViewPosition =
            readEnum(j["accessory_position"], &accessoryPositionFromString, "accessory position");
    }

    if (j.contains("attachment_padding")) {
        style.attachmentPadding = readInsets(j["attachment_padding"]);
    }
    if (j.contains("message_label_insets")) {
        style.messageLabelInsets = readInsets(j["message_label_insets"]);
    }
    if (j.contains("contact_label_insets")) {
        style.contactLabelInsets = readInsets(j["contact_label_insets"]);
    }

    return style;
}

nlohmann::json SenderStyle::toJson() const {
    return {{"avatar_size", {avatarSize.width, avatarSize.height}},
            {"avatar_position",
             {{"horizontal", toString(avatarPosition.horizontal)}, {"vertical", toString(avatarPosition.vertical)}}},
            {"message_padding", writeInsets(messagePadding)},
            {"cell_top_label", writeLabel(cellTopLabelAlignment)},
            {"cell_bottom_label", writeLabel(cellBottomLabelAlignment)},
            {"message_top_label", writeLabel(messageTopLabelAlignment)},
            {"message_bottom_label", writeLabel(messageBottomLabelAlignment)},
            {"accessory_size", {accessoryViewSize.width, accessoryViewSize.height}},
            {"accessory_padding", {accessoryViewPadding.left, accessoryViewPadding.right}},
            {"accessory_position", toString(accessoryViewPosition)},
            {"attachment_padding", writeInsets(attachmentPadding)},
            {"message_label_insets", writeInsets(messageLabelInsets)},
            {"contact_label_insets", writeInsets(contactLabelInsets)}};
}

bool SenderStyle::operator==(const SenderStyle &other) const {
    return avatarSize == other.avatarSize && avatarPosition == other.avatarPosition &&
           messagePadding == other.messagePadding && cellTopLabelAlignment == other.cellTopLabelAlignment &&
           cellBottomLabelAlignment == other.cellBottomLabelAlignment &&
           messageTopLabelAlignment == other.messageTopLabelAlignment &&
           messageBottomLabelAlignment == other.messageBottomLabelAlignment &&
           accessoryViewSize == other.accessoryViewSize && accessoryViewPadding == other.accessoryViewPadding &&
           accessoryViewPosition == other.accessoryViewPosition && attachmentPadding == other.attachmentPadding &&
           messageLabelInsets == other.messageLabelInsets && contactLabelInsets == other.contactLabelInsets;
}

SizingConfiguration SizingConfiguration::fromJson(const nlohmann::json &j, const SizingConfiguration &base) {
    SizingConfiguration config = base;

    if (j.contains("incoming")) {
        config.incoming = SenderStyle::fromJson(j["incoming"], config.incoming);
    }
    if (j.contains("outgoing")) {
        config.outgoing = SenderStyle::fromJson(j["outgoing"], config.outgoing);
    }

    if (j.contains("avatar_edge_padding")) {
        config.avatarLeadingTrailingPadding = j["avatar_edge_padding"].get<int>();
    }
    if (j.contains("message_font")) {
        config.messageLabelFont = FontSpec::fromJson(j["message_font"], config.messageLabelFont);
    }
    if (j.contains("contact_font")) {
        config.contactLabelFont = FontSpec::fromJson(j["contact_font"], config.contactLabelFont);
    }

    if (j.contains("link_preview_fonts")) {
        const auto &fonts = j["link_preview_fonts"];
        if (fonts.contains("title")) {
            config.linkPreviewFonts.title = FontSpec::fromJson(fonts["title"], config.linkPreviewFonts.title);
        }
        if (fonts.contains("teaser")) {
            config.linkPreviewFonts.teaser = FontSpec::fromJson(fonts["teaser"], config.linkPreviewFonts.teaser);
        }
        if (fonts.contains("domain")) {
            config.linkPreviewFonts.domain = FontSpec::fromJson(fonts["domain"], config.linkPreviewFonts.domain);
        }
    }

    if (j.contains("system_message_padding")) {
        config.systemMessagePadding = readInsets(j["system_message_padding"]);
    }
    if (j.contains("typing_indicator_height")) {
        config.typingIndicatorHeight = j["typing_indicator_height"].get<int>();
    }
    if (j.contains("cache_capacity")) {
        config.cacheCapacity = j["cache_capacity"].get<size_t>();
    }

    return config;
}

std::optional<SizingConfiguration> SizingConfiguration::loadFromFile(const std::string &path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::log(Logger::Level::ERROR, "SizingConfiguration", "Cannot open style file " + path);
            return std::nullopt;
        }

        nlohmann::json data;
        file >> data;

        if (!data.is_object()) {
            Logger::log(Logger::Level::ERROR, "SizingConfiguration", "Style file " + path + " is not a JSON object");
            return std::nullopt;
        }

        return fromJson(data);
    } catch (const std::exception &e) {
        Logger::log(Logger::Level::ERROR, "SizingConfiguration",
                    "Failed to load style file " + path + ": " + std::string(e.what()));
        return std::nullopt;
    }
}

nlohmann::json SizingConfiguration::toJson() const {
    return {{"incoming", incoming.toJson()},
            {"outgoing", outgoing.toJson()},
            {"avatar_edge_padding", avatarLeadingTrailingPadding},
            {"message_font", messageLabelFont.toJson()},
            {"contact_font", contactLabelFont.toJson()},
            {"link_preview_fonts",
             {{"title", linkPreviewFonts.title.toJson()},
              {"teaser", linkPreviewFonts.teaser.toJson()},
              {"domain", linkPreviewFonts.domain.toJson()}}},
            {"system_message_padding", writeInsets(systemMessagePadding)},
            {"typing_indicator_height", typingIndicatorHeight},
            {"cache_capacity", cacheCapacity}};
}

bool SizingConfiguration::operator==(const SizingConfiguration &other) const {
    return incoming == other.incoming && outgoing == other.outgoing &&
           avatarLeadingTrailingPadding == other.avatarLeadingTrailingPadding &&
           messageLabelFont == other.messageLabelFont && contactLabelFont == other.contactLabelFont &&
           linkPreviewFonts == other.linkPreviewFonts && systemMessagePadding == other.systemMessagePadding &&
           typingIndicatorHeight == other.typingIndicatorHeight && cacheCapacity == other.cacheCapacity;
}
