#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "layout/Geometry.h"
#include "models/StyledText.h"

enum class AvatarVerticalPosition { MessageCenter, MessageTop, MessageBottom, MessageLabelTop, CellTop, CellBottom };

/**
 * @brief Horizontal side of the avatar. Natural is resolved against the sender before layout and never
 * survives into computed attributes.
 */
enum class AvatarHorizontalPosition { CellLeading, CellTrailing, Natural };

struct AvatarPosition {
    AvatarHorizontalPosition horizontal = AvatarHorizontalPosition::Natural;
    AvatarVerticalPosition vertical = AvatarVerticalPosition::CellBottom;

    bool operator==(const AvatarPosition &other) const {
        return horizontal == other.horizontal && vertical == other.vertical;
    }
    bool operator!=(const AvatarPosition &other) const { return !(*this == other); }
};

enum class TextAlignment { Left, Center, Right };

struct LabelAlignment {
    TextAlignment textAlignment = TextAlignment::Center;
    EdgeInsets textInsets;

    bool operator==(const LabelAlignment &other) const {
        return textAlignment == other.textAlignment && textInsets == other.textInsets;
    }
    bool operator!=(const LabelAlignment &other) const { return !(*this == other); }
};

enum class AccessoryPosition { MessageLabelTop, MessageTop, MessageCenter, MessageBottom, CellTop, CellBottom };

struct LinkPreviewFonts {
    FontSpec title{FL_HELVETICA_BOLD, 13};
    FontSpec teaser{FL_HELVETICA, 11};
    FontSpec domain{FL_HELVETICA, 12};

    bool operator==(const LinkPreviewFonts &other) const {
        return title == other.title && teaser == other.teaser && domain == other.domain;
    }
    bool operator!=(const LinkPreviewFonts &other) const { return !(*this == other); }
};

const char *toString(AvatarVerticalPosition position);
const char *toString(AvatarHorizontalPosition position);
const char *toString(TextAlignment alignment);
const char *toString(AccessoryPosition position);

std::optional<AvatarVerticalPosition> avatarVerticalPositionFromString(const std::string &name);
std::optional<AvatarHorizontalPosition> avatarHorizontalPositionFromString(const std::string &name);
std::optional<TextAlignment> textAlignmentFromString(const std::string &name);
std::optional<AccessoryPosition> accessoryPositionFromString(const std::string &name);

/**
 * @brief Computed geometry of one cell. Filled in by a size calculator and read-only afterwards.
 */
struct LayoutAttributes {
    IndexPath indexPath;

    Size avatarSize;
    AvatarPosition avatarPosition;
    int avatarLeadingTrailingPadding = 0;

    Size messageContainerSize;
    EdgeInsets messageContainerPadding;
    FontSpec messageLabelFont;
    EdgeInsets messageLabelInsets;

    LabelAlignment cellTopLabelAlignment;
    Size cellTopLabelSize;

    LabelAlignment cellBottomLabelAlignment;
    Size cellBottomLabelSize;

    LabelAlignment messageTopLabelAlignment;
    Size messageTopLabelSize;

    LabelAlignment messageBottomLabelAlignment;
    Size messageBottomLabelSize;

    Size messageTimeLabelSize;

    Size accessoryViewSize;
    HorizontalEdgeInsets accessoryViewPadding;
    AccessoryPosition accessoryViewPosition = AccessoryPosition::MessageCenter;

    Size attachmentSize;
    EdgeInsets attachmentPadding;

    LinkPreviewFonts linkPreviewFonts;

    bool operator==(const LayoutAttributes &other) const;
    bool operator!=(const LayoutAttributes &other) const { return !(*this == other); }

    nlohmann::json toJson() const;
};
