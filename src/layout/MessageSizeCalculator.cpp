#include "layout/MessageSizeCalculator.h"

#include "utils/Errors.h"

#include <algorithm>

MessageSizeCalculator::MessageSizeCalculator(const LayoutContext &context, std::unique_ptr<ContainerSizer> sizer)
    : m_context(context), m_sizer(std::move(sizer)) {}

const Message &MessageSizeCalculator::messageOf(const Entry &entry) const {
    const Message *message = entry.message();
    if (!message) {
        failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind,
                         "message calculator asked to size entry '" + entry.id() + "'");
    }
    return *message;
}

LayoutAttributes MessageSizeCalculator::computeAttributes(const Entry &entry, const IndexPath &position) const {
    const Message &message = messageOf(entry);
    const SizingConfiguration &config = m_context.configuration();

    LayoutAttributes attributes;
    attributes.indexPath = position;

    attributes.avatarSize = avatarSize(message, position);
    attributes.avatarPosition = avatarPosition(message, position);
    attributes.avatarLeadingTrailingPadding = std::max(0, config.avatarLeadingTrailingPadding);

    attributes.messageContainerPadding = messageContainerPadding(message);
    attributes.messageContainerSize = messageContainerSizeWithAttachments(message, position);
    attributes.messageLabelFont = config.messageLabelFont;

    attributes.cellTopLabelSize = cellTopLabelSize(message, position);
    attributes.cellTopLabelAlignment = cellTopLabelAlignment(message, position);
    attributes.cellBottomLabelSize = cellBottomLabelSize(message, position);
    attributes.cellBottomLabelAlignment = cellBottomLabelAlignment(message, position);
    attributes.messageTopLabelSize = messageTopLabelSize(message, position);
    attributes.messageTopLabelAlignment = messageTopLabelAlignment(message, position);
    attributes.messageBottomLabelSize = messageBottomLabelSize(message, position);
    attributes.messageBottomLabelAlignment = messageBottomLabelAlignment(message, position);

    attributes.messageTimeLabelSize = messageTimeLabelSize(message, position);

    attributes.accessoryViewSize = accessoryViewSize(message, position);
    attributes.accessoryViewPadding = accessoryViewPadding(message);
    attributes.accessoryViewPosition = accessoryViewPosition(message, position);

    attributes.attachmentSize = attachmentViewSize(message, position);
    attributes.attachmentPadding = attachmentPadding(message);

    attributes.linkPreviewFonts = config.linkPreviewFonts;

    m_sizer->decorate(attributes, message, position, *this);
    return attributes;
}

Size MessageSizeCalculator::computeCellSize(const Entry &entry, const IndexPath &position) const {
    const Message &message = messageOf(entry);
    return {m_context.itemWidth(), cellContentHeight(message, position)};
}

int MessageSizeCalculator::cellContentHeight(const Message &message, const IndexPath &position) const {
    const int containerHeight = messageContainerSizeWithAttachments(message, position).height;
    const int cellTopHeight = cellTopLabelSize(message, position).height;
    const int cellBottomHeight = cellBottomLabelSize(message, position).height;
    const int messageTopHeight = messageTopLabelSize(message, position).height;
    const int messageBottomHeight = messageBottomLabelSize(message, position).height;
    const int verticalPadding = messageContainerPadding(message).vertical();
    const int avatarHeight = avatarSize(message, position).height;
    const int accessoryHeight = accessoryViewSize(message, position).height;

    int cellHeight = 0;
    switch (avatarPosition(message, position).vertical) {
    case AvatarVerticalPosition::MessageCenter:
    case AvatarVerticalPosition::CellTop:
    case AvatarVerticalPosition::CellBottom: {
        int total = cellTopHeight + messageTopHeight + containerHeight + verticalPadding + messageBottomHeight +
                    cellBottomHeight;
        cellHeight = std::max(avatarHeight, total);
        break;
    }
    case AvatarVerticalPosition::MessageBottom: {
        // Bottom captions sit below the avatar, everything above competes with it
        int stack = containerHeight + verticalPadding + cellTopHeight + messageTopHeight;
        cellHeight = messageBottomHeight + cellBottomHeight + std::max(stack, avatarHeight);
        break;
    }
    case AvatarVerticalPosition::MessageTop: {
        int stack = containerHeight + verticalPadding + messageBottomHeight + cellBottomHeight;
        cellHeight = cellTopHeight + messageTopHeight + std::max(stack, avatarHeight);
        break;
    }
    case AvatarVerticalPosition::MessageLabelTop: {
        int stack = containerHeight + messageBottomHeight + verticalPadding + messageTopHeight + cellBottomHeight;
        cellHeight = cellTopHeight + std::max(stack, avatarHeight);
        break;
    }
    }

    return std::max(cellHeight, accessoryHeight);
}

Size MessageSizeCalculator::avatarSize(const Message &message, const IndexPath &position) const {
    if (auto size = m_context.policy().avatarSize(message, position)) {
        return size->clamped();
    }
    return m_context.styleFor(message).avatarSize.clamped();
}

AvatarPosition MessageSizeCalculator::avatarPosition(const Message &message, const IndexPath &position) const {
    const bool mine = m_context.isMine(message);

    AvatarPosition resolved = m_context.configuration().styleFor(mine).avatarPosition;
    if (auto custom = m_context.policy().avatarPosition(message, position)) {
        resolved = *custom;
    }

    if (resolved.horizontal == AvatarHorizontalPosition::Natural) {
        resolved.horizontal = mine ? AvatarHorizontalPosition::CellTrailing : AvatarHorizontalPosition::CellLeading;
    }
    return resolved;
}

Size MessageSizeCalculator::labelSize(int height) const { return Size{m_context.itemWidth(), height}.clamped(); }

Size MessageSizeCalculator::cellTopLabelSize(const Message &message, const IndexPath &position) const {
    return labelSize(m_context.policy().cellTopLabelHeight(message, position));
}

Size MessageSizeCalculator::cellBottomLabelSize(const Message &message, const IndexPath &position) const {
    return labelSize(m_context.policy().cellBottomLabelHeight(message, position));
}

Size MessageSizeCalculator::messageTopLabelSize(const Message &message, const IndexPath &position) const {
    return labelSize(m_context.policy().messageTopLabelHeight(message, position));
}

Size MessageSizeCalculator::messageBottomLabelSize(const Message &message, const IndexPath &position) const {
    return labelSize(m_context.policy().messageBottomLabelHeight(message, position));
}

LabelAlignment MessageSizeCalculator::cellTopLabelAlignment(const Message &message, const IndexPath &position) const {
    if (auto alignment = m_context.policy().cellTopLabelAlignment(message, position)) {
        return *alignment;
    }
    return m_context.styleFor(message).cellTopLabelAlignment;
}

LabelAlignment MessageSizeCalculator::cellBottomLabelAlignment(const Message &message,
                                                               const IndexPath &position) const {
    if (auto alignment = m_context.policy().cellBottomLabelAlignment(message, position)) {
        return *alignment;
    }
    return m_context.styleFor(message).cellBottomLabelAlignment;
}

LabelAlignment MessageSizeCalculator::messageTopLabelAlignment(const Message &message,
                                                               const IndexPath &position) const {
    if (auto alignment = m_context.policy().messageTopLabelAlignment(message, position)) {
        return *alignment;
    }
    return m_context.styleFor(message).messageTopLabelAlignment;
}

LabelAlignment MessageSizeCalculator::messageBottomLabelAlignment(const Message &message,
                                                                  const IndexPath &position) const {
    if (auto alignment = m_context.policy().messageBottomLabelAlignment(message, position)) {
        return *alignment;
    }
    return m_context.styleFor(message).messageBottomLabelAlignment;
}

Size MessageSizeCalculator::messageTimeLabelSize(const Message &message, const IndexPath &position) const {
    auto text = m_context.source().timestampLabelText(message, position);
    if (!text.has_value()) {
        return {};
    }
    return m_context.measurer().naturalSize(*text);
}

EdgeInsets MessageSizeCalculator::messageContainerPadding(const Message &message) const {
    return m_context.styleFor(message).messagePadding;
}

int MessageSizeCalculator::messageContainerMaxWidth(const Message &message, const IndexPath &position) const {
    const int avatarWidth = avatarSize(message, position).width;
    const int accessoryWidth = accessoryViewSize(message, position).width;
    const int width = m_context.itemWidth() - avatarWidth - messageContainerPadding(message).horizontal() -
                      accessoryWidth - accessoryViewPadding(message).horizontal() -
                      m_context.configuration().avatarLeadingTrailingPadding;
    return std::max(0, width);
}

Size MessageSizeCalculator::messageContainerSize(const Message &message, const IndexPath &position) const {
    return m_sizer->containerSize(message, position, *this).clamped();
}

Size MessageSizeCalculator::messageContainerSizeWithAttachments(const Message &message,
                                                                const IndexPath &position) const {
    Size size = messageContainerSize(message, position);
    const Size attachment = attachmentViewSize(message, position);
    if (attachment.isZero()) {
        return size;
    }

    size.width = messageContainerMaxWidth(message, position);
    size.height += attachment.height + attachmentPadding(message).vertical();
    return size.clamped();
}

Size MessageSizeCalculator::accessoryViewSize(const Message &message, const IndexPath &position) const {
    if (auto size = m_context.policy().accessoryViewSize(message, position)) {
        return size->clamped();
    }
    return m_context.styleFor(message).accessoryViewSize.clamped();
}

HorizontalEdgeInsets MessageSizeCalculator::accessoryViewPadding(const Message &message) const {
    return m_context.styleFor(message).accessoryViewPadding;
}

AccessoryPosition MessageSizeCalculator::accessoryViewPosition(const Message &message,
                                                               const IndexPath &position) const {
    if (auto anchor = m_context.policy().accessoryViewPosition(message, position)) {
        return *anchor;
    }
    return m_context.styleFor(message).accessoryViewPosition;
}

EdgeInsets MessageSizeCalculator::attachmentPadding(const Message &message) const {
    return m_context.styleFor(message).attachmentPadding;
}

Size MessageSizeCalculator::attachmentViewSize(const Message &message, const IndexPath &position) const {
    const int maxWidth = messageContainerMaxWidth(message, position) - attachmentPadding(message).horizontal();
    if (auto height = m_context.policy().attachmentHeight(message, position, std::max(0, maxWidth))) {
        return Size{maxWidth, *height}.clamped();
    }
    return {};
}
