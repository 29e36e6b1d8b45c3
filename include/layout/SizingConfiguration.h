#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "layout/Geometry.h"
#include "layout/LayoutAttributes.h"
#include "models/StyledText.h"

/**
 * @brief Style defaults applied to one side of the conversation
 */
struct SenderStyle {
    Size avatarSize{30, 30};
    AvatarPosition avatarPosition;
    EdgeInsets messagePadding;

    LabelAlignment cellTopLabelAlignment;
    LabelAlignment cellBottomLabelAlignment;
    LabelAlignment messageTopLabelAlignment;
    LabelAlignment messageBottomLabelAlignment;

    Size accessoryViewSize;
    HorizontalEdgeInsets accessoryViewPadding;
    AccessoryPosition accessoryViewPosition = AccessoryPosition::MessageCenter;

    EdgeInsets attachmentPadding;
    EdgeInsets messageLabelInsets;
    EdgeInsets contactLabelInsets;

    static SenderStyle incomingDefaults();
    static SenderStyle outgoingDefaults();

    /**
     * @brief Overlay the keys present in j onto base
     * @throws nlohmann::json::exception on mistyped values, std::invalid_argument on unknown enum names
     */
    static SenderStyle fromJson(const nlohmann::json &j, const SenderStyle &base);
    nlohmann::json toJson() const;

    bool operator==(const SenderStyle &other) const;
    bool operator!=(const SenderStyle &other) const { return !(*this == other); }
};

/**
 * @brief Everything the size calculators read besides the layout policy: per-sender styles and shared
 * values. Read-only during a layout pass.
 */
struct SizingConfiguration {
    SenderStyle incoming = SenderStyle::incomingDefaults();
    SenderStyle outgoing = SenderStyle::outgoingDefaults();

    int avatarLeadingTrailingPadding = 0;            ///< Fixed gap between the avatar and the cell edge
    FontSpec messageLabelFont{FL_HELVETICA, 17};     ///< Font for plain text and emoji
    FontSpec contactLabelFont{FL_HELVETICA, 17};     ///< Font of the contact display name
    LinkPreviewFonts linkPreviewFonts;               ///< Title, teaser and domain fonts
    EdgeInsets systemMessagePadding{8, 16, 8, 16};   ///< Padding around system captions
    int typingIndicatorHeight = 62;                  ///< Height when the policy has no opinion
    size_t cacheCapacity = 256;                      ///< Attribute cache entries; 0 disables caching

    const SenderStyle &styleFor(bool isMine) const { return isMine ? outgoing : incoming; }

    /**
     * @brief Overlay the keys present in j onto base; absent keys keep base values
     * @throws nlohmann::json::exception on mistyped values, std::invalid_argument on unknown enum names
     */
    static SizingConfiguration fromJson(const nlohmann::json &j, const SizingConfiguration &base = {});

    /**
     * @brief Read a JSON style file and overlay it onto the defaults
     * @return The configuration, or std::nullopt if the file is missing or malformed (the error is logged)
     */
    static std::optional<SizingConfiguration> loadFromFile(const std::string &path);

    nlohmann::json toJson() const;

    bool operator==(const SizingConfiguration &other) const;
    bool operator!=(const SizingConfiguration &other) const { return !(*this == other); }
};
