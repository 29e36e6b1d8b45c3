#include "layout/SystemMessageSizeCalculator.h"

#include "utils/Errors.h"

#include <algorithm>

SystemMessageSizeCalculator::SystemMessageSizeCalculator(const LayoutContext &context) : m_context(context) {}

const SystemKind &SystemMessageSizeCalculator::systemKindOf(const Entry &entry) const {
    const Message *message = entry.message();
    const SystemKind *system = message ? std::get_if<SystemKind>(&message->kind) : nullptr;
    if (!system) {
        failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind,
                         "system calculator asked to size entry '" + entry.id() + "'");
    }
    return *system;
}

Size SystemMessageSizeCalculator::messageContainerSize(const Message &message) const {
    const auto *system = std::get_if<SystemKind>(&message.kind);
    if (!system) {
        failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind,
                         "system calculator asked to size message " + message.id);
    }

    const EdgeInsets padding = m_context.configuration().systemMessagePadding;
    const int maxWidth = m_context.itemWidth() - padding.horizontal();

    Size size = m_context.measurer().measure(system->text, maxWidth);
    size.width = m_context.itemWidth();
    return size;
}

LayoutAttributes SystemMessageSizeCalculator::computeAttributes(const Entry &entry, const IndexPath &position) const {
    const SystemKind &system = systemKindOf(entry);

    LayoutAttributes attributes;
    attributes.indexPath = position;
    attributes.messageContainerSize = messageContainerSize(*entry.message());
    attributes.messageContainerPadding = m_context.configuration().systemMessagePadding;
    attributes.messageLabelFont = system.text.leadingFont().value_or(m_context.configuration().messageLabelFont);
    attributes.linkPreviewFonts = m_context.configuration().linkPreviewFonts;
    return attributes;
}

Size SystemMessageSizeCalculator::computeCellSize(const Entry &entry, const IndexPath &) const {
    systemKindOf(entry);
    const int height =
        messageContainerSize(*entry.message()).height + m_context.configuration().systemMessagePadding.vertical();
    return Size{m_context.itemWidth(), height}.clamped();
}

TypingIndicatorSizeCalculator::TypingIndicatorSizeCalculator(const LayoutContext &context) : m_context(context) {}

Size TypingIndicatorSizeCalculator::computeCellSize(const Entry &entry, const IndexPath &position) const {
    if (!entry.isTypingIndicator()) {
        failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind,
                         "typing indicator calculator asked to size entry '" + entry.id() + "'");
    }

    const int height =
        m_context.policy().typingIndicatorHeight(position).value_or(m_context.configuration().typingIndicatorHeight);
    return Size{m_context.itemWidth(), height}.clamped();
}

LayoutAttributes TypingIndicatorSizeCalculator::computeAttributes(const Entry &entry, const IndexPath &position) const {
    LayoutAttributes attributes;
    attributes.indexPath = position;
    attributes.messageContainerSize = computeCellSize(entry, position);
    attributes.messageLabelFont = m_context.configuration().messageLabelFont;
    attributes.linkPreviewFonts = m_context.configuration().linkPreviewFonts;
    return attributes;
}
