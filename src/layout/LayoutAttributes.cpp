#include "layout/LayoutAttributes.h"

namespace {
constexpr const char *kAvatarVerticalNames[] = {"message_center",    "message_top", "message_bottom",
                                                "message_label_top", "cell_top",    "cell_bottom"};
constexpr const char *kAvatarHorizontalNames[] = {"leading", "trailing", "natural"};
constexpr const char *kTextAlignmentNames[] = {"left", "center", "right"};
constexpr const char *kAccessoryNames[] = {"message_label_top", "message_top", "message_center",
                                           "message_bottom",    "cell_top",    "cell_bottom"};

template <typename Enum, size_t N>
std::optional<Enum> lookupName(const char *const (&names)[N], const std::string &name) {
    for (size_t i = 0; i < N; ++i) {
        if (name == names[i]) {
            return static_cast<Enum>(i);
        }
    }
    return std::nullopt;
}

nlohmann::json sizeJson(const Size &size) { return {size.width, size.height}; }

nlohmann::json insetsJson(const EdgeInsets &insets) {
    return {insets.top, insets.left, insets.bottom, insets.right};
}

nlohmann::json labelJson(const LabelAlignment &alignment, const Size &size) {
    return {{"alignment", toString(alignment.textAlignment)},
            {"insets", insetsJson(alignment.textInsets)},
            {"size", sizeJson(size)}};
}
} // namespace

const char *toString(AvatarVerticalPosition position) { return kAvatarVerticalNames[static_cast<size_t>(position)]; }

const char *toString(AvatarHorizontalPosition position) {
    return kAvatarHorizontalNames[static_cast<size_t>(position)];
}

const char *toString(TextAlignment alignment) { return kTextAlignmentNames[static_cast<size_t>(alignment)]; }

const char *toString(AccessoryPosition position) { return kAccessoryNames[static_cast<size_t>(position)]; }

std::optional<AvatarVerticalPosition> avatarVerticalPositionFromString(const std::string &name) {
    return lookupName<AvatarVerticalPosition>(kAvatarVerticalNames, name);
}

std::optional<AvatarHorizontalPosition> avatarHorizontalPositionFromString(const std::string &name) {
    return lookupName<AvatarHorizontalPosition>(kAvatarHorizontalNames, name);
}

std::optional<TextAlignment> textAlignmentFromString(const std::string &name) {
    return lookupName<TextAlignment>(kTextAlignmentNames, name);
}

std::optional<AccessoryPosition> accessoryPositionFromString(const std::string &name) {
    return lookupName<AccessoryPosition>(kAccessoryNames, name);
}

bool LayoutAttributes::operator==(const LayoutAttributes &other) const {
    return indexPath == other.indexPath && avatarSize == other.avatarSize &&
           avatarPosition == other.avatarPosition &&
           avatarLeadingTrailingPadding == other.avatarLeadingTrailingPadding &&
           messageContainerSize == other.messageContainerSize &&
           messageContainerPadding == other.messageContainerPadding && messageLabelFont == other.messageLabelFont &&
           messageLabelInsets == other.messageLabelInsets && cellTopLabelAlignment == other.cellTopLabelAlignment &&
           cellTopLabelSize == other.cellTopLabelSize && cellBottomLabelAlignment == other.cellBottomLabelAlignment &&
           cellBottomLabelSize == other.cellBottomLabelSize &&
           messageTopLabelAlignment == other.messageTopLabelAlignment &&
           messageTopLabelSize == other.messageTopLabelSize &&
           messageBottomLabelAlignment == other.messageBottomLabelAlignment &&
           messageBottomLabelSize == other.messageBottomLabelSize &&
           messageTimeLabelSize == other.messageTimeLabelSize && accessoryViewSize == other.accessoryViewSize &&
           accessoryViewPadding == other.accessoryViewPadding &&
           accessoryViewPosition == other.accessoryViewPosition && attachmentSize == other.attachmentSize &&
           attachmentPadding == other.attachmentPadding && linkPreviewFonts == other.linkPreviewFonts;
}

nlohmann::json LayoutAttributes::toJson() const {
    return {{"index_path", {indexPath.section, indexPath.item}},
            {"avatar",
             {{"size", sizeJson(avatarSize)},
              {"horizontal", toString(avatarPosition.horizontal)},
              {"vertical", toString(avatarPosition.vertical)},
              {"edge_padding", avatarLeadingTrailingPadding}}},
            {"message_container",
             {{"size", sizeJson(messageContainerSize)},
              {"padding", insetsJson(messageContainerPadding)},
              {"label_insets", insetsJson(messageLabelInsets)},
              {"label_font", messageLabelFont.toJson()}}},
            {"cell_top_label", labelJson(cellTopLabelAlignment, cellTopLabelSize)},
            {"cell_bottom_label", labelJson(cellBottomLabelAlignment, cellBottomLabelSize)},
            {"message_top_label", labelJson(messageTopLabelAlignment, messageTopLabelSize)},
            {"message_bottom_label", labelJson(messageBottomLabelAlignment, messageBottomLabelSize)},
            {"time_label_size", sizeJson(messageTimeLabelSize)},
            {"accessory",
             {{"size", sizeJson(accessoryViewSize)},
              {"padding", {accessoryViewPadding.left, accessoryViewPadding.right}},
              {"position", toString(accessoryViewPosition)}}},
            {"attachment", {{"size", sizeJson(attachmentSize)}, {"padding", insetsJson(attachmentPadding)}}}};
}
