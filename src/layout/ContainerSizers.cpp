#include "layout/ContainerSizers.h"

#include "utils/Errors.h"

#include <algorithm>
#include <cmath>

namespace {
[[noreturn]] void unsupported(const char *sizer, const Message &message) {
    failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind,
                     std::string(sizer) + " cannot size '" + kindName(message.tag()) + "' message " + message.id);
}

Size capWidth(Size size, int maxWidth) {
    size.width = std::min(size.width, maxWidth);
    return size.clamped();
}
} // namespace

StyledText TextContainerSizer::labelText(const Message &message, const SizingConfiguration &config) {
    switch (message.tag()) {
    case MessageKindTag::Text:
        return StyledText(std::get<TextKind>(message.kind).text, config.messageLabelFont);
    case MessageKindTag::Emoji:
        return StyledText(std::get<EmojiKind>(message.kind).text, config.messageLabelFont);
    case MessageKindTag::AttributedText:
        return std::get<AttributedTextKind>(message.kind).text;
    case MessageKindTag::LinkPreview:
        return StyledText(std::get<LinkPreviewKind>(message.kind).text, config.messageLabelFont);
    default:
        unsupported("TextContainerSizer", message);
    }
}

Size TextContainerSizer::containerSize(const Message &message, const IndexPath &position,
                                       const MessageSizeCalculator &calculator) const {
    const LayoutContext &context = calculator.context();
    const EdgeInsets insets = context.styleFor(message).messageLabelInsets;
    const int maxWidth = calculator.messageContainerMaxWidth(message, position) - insets.horizontal();

    const StyledText text = labelText(message, context.configuration());
    Size size = context.measurer().measure(text, maxWidth);

    if (!calculator.attachmentViewSize(message, position).isZero() && text.empty()) {
        size.height = insets.top;
    } else {
        size.height += insets.vertical();
    }
    size.width += insets.horizontal();

    return size;
}

void TextContainerSizer::decorate(LayoutAttributes &attributes, const Message &message, const IndexPath &,
                                  const MessageSizeCalculator &calculator) const {
    const LayoutContext &context = calculator.context();
    attributes.messageLabelInsets = context.styleFor(message).messageLabelInsets;
    attributes.messageLabelFont = context.configuration().messageLabelFont;

    if (message.tag() == MessageKindTag::AttributedText) {
        if (auto font = std::get<AttributedTextKind>(message.kind).text.leadingFont()) {
            attributes.messageLabelFont = *font;
        }
    }
}

Size MediaContainerSizer::containerSize(const Message &message, const IndexPath &position,
                                        const MessageSizeCalculator &calculator) const {
    Size item;
    if (const auto *photo = std::get_if<PhotoKind>(&message.kind)) {
        item = photo->item.size;
    } else if (const auto *video = std::get_if<VideoKind>(&message.kind)) {
        item = video->item.size;
    } else {
        unsupported("MediaContainerSizer", message);
    }

    item = item.clamped();
    const int maxWidth = calculator.messageContainerMaxWidth(message, position);
    if (maxWidth < item.width) {
        const double scaled = static_cast<double>(maxWidth) * item.height / item.width;
        return {maxWidth, static_cast<int>(std::ceil(scaled))};
    }
    return item;
}

Size LocationContainerSizer::containerSize(const Message &message, const IndexPath &position,
                                           const MessageSizeCalculator &calculator) const {
    const auto *location = std::get_if<LocationKind>(&message.kind);
    if (!location) {
        unsupported("LocationContainerSizer", message);
    }
    return capWidth(location->size, calculator.messageContainerMaxWidth(message, position));
}

Size AudioContainerSizer::containerSize(const Message &message, const IndexPath &position,
                                        const MessageSizeCalculator &calculator) const {
    const auto *audio = std::get_if<AudioKind>(&message.kind);
    if (!audio) {
        unsupported("AudioContainerSizer", message);
    }
    return capWidth(audio->size, calculator.messageContainerMaxWidth(message, position));
}

Size ContactContainerSizer::containerSize(const Message &message, const IndexPath &position,
                                          const MessageSizeCalculator &calculator) const {
    const auto *contact = std::get_if<ContactKind>(&message.kind);
    if (!contact) {
        unsupported("ContactContainerSizer", message);
    }

    const LayoutContext &context = calculator.context();
    const EdgeInsets insets = context.styleFor(message).contactLabelInsets;
    const int maxWidth = calculator.messageContainerMaxWidth(message, position);

    const StyledText name(contact->displayName, context.configuration().contactLabelFont);
    const Size label = context.measurer().measure(name, maxWidth - insets.horizontal());
    return {std::min(maxWidth, label.width + insets.horizontal()),
            std::max(kMinimumHeight, label.height + insets.vertical())};
}

void ContactContainerSizer::decorate(LayoutAttributes &attributes, const Message &message, const IndexPath &,
                                     const MessageSizeCalculator &calculator) const {
    const LayoutContext &context = calculator.context();
    attributes.messageLabelInsets = context.styleFor(message).contactLabelInsets;
    attributes.messageLabelFont = context.configuration().contactLabelFont;
}

Size LinkPreviewContainerSizer::containerSize(const Message &message, const IndexPath &position,
                                              const MessageSizeCalculator &calculator) const {
    const auto *preview = std::get_if<LinkPreviewKind>(&message.kind);
    if (!preview) {
        unsupported("LinkPreviewContainerSizer", message);
    }

    const LayoutContext &context = calculator.context();
    const LinkPreviewFonts &fonts = context.configuration().linkPreviewFonts;
    const EdgeInsets insets = context.styleFor(message).messageLabelInsets;
    const int maxWidth = calculator.messageContainerMaxWidth(message, position);

    Size size = m_text.containerSize(message, position, calculator);
    size.width = std::max(size.width, maxWidth);

    const int minHeight = size.height + kImageViewSize;
    const int previewMaxWidth = size.width - (kImageViewSize + kImageViewMargin + insets.horizontal());

    auto addLine = [&](const std::string &text, const FontSpec &font) {
        if (text.empty()) {
            return;
        }
        size.height += context.measurer().measure(StyledText(text, font), previewMaxWidth).height;
    };

    addLine(preview->title.value_or(""), fonts.title);
    addLine(preview->teaser.value_or(""), fonts.teaser);
    addLine(preview->domain(), fonts.domain);

    size.height = std::max(minHeight, size.height) + insets.bottom;
    return size;
}

void LinkPreviewContainerSizer::decorate(LayoutAttributes &attributes, const Message &message,
                                         const IndexPath &position, const MessageSizeCalculator &calculator) const {
    m_text.decorate(attributes, message, position, calculator);
}
