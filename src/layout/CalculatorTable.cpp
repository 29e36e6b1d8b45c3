#include "layout/CalculatorTable.h"

#include "layout/ContainerSizers.h"
#include "layout/SystemMessageSizeCalculator.h"
#include "utils/Errors.h"

CalculatorTable::CalculatorTable(const LayoutContext &context) {
    auto text = std::make_shared<MessageSizeCalculator>(context, std::make_unique<TextContainerSizer>());
    auto media = std::make_shared<MessageSizeCalculator>(context, std::make_unique<MediaContainerSizer>());

    m_calculators[MessageKindTag::Text] = text;
    m_calculators[MessageKindTag::AttributedText] = text;
    m_calculators[MessageKindTag::Emoji] = text;
    m_calculators[MessageKindTag::Photo] = media;
    m_calculators[MessageKindTag::Video] = media;
    m_calculators[MessageKindTag::Location] =
        std::make_shared<MessageSizeCalculator>(context, std::make_unique<LocationContainerSizer>());
    m_calculators[MessageKindTag::Audio] =
        std::make_shared<MessageSizeCalculator>(context, std::make_unique<AudioContainerSizer>());
    m_calculators[MessageKindTag::Contact] =
        std::make_shared<MessageSizeCalculator>(context, std::make_unique<ContactContainerSizer>());
    m_calculators[MessageKindTag::LinkPreview] =
        std::make_shared<MessageSizeCalculator>(context, std::make_unique<LinkPreviewContainerSizer>());
    m_calculators[MessageKindTag::System] = std::make_shared<SystemMessageSizeCalculator>(context);

    m_typingIndicator = std::make_shared<TypingIndicatorSizeCalculator>(context);
}

void CalculatorTable::registerCalculator(MessageKindTag tag, std::shared_ptr<SizeCalculator> calculator) {
    if (!calculator) {
        m_calculators.erase(tag);
        return;
    }
    m_calculators[tag] = std::move(calculator);
}

void CalculatorTable::setTypingIndicatorCalculator(std::shared_ptr<SizeCalculator> calculator) {
    m_typingIndicator = std::move(calculator);
}

const SizeCalculator &CalculatorTable::calculatorFor(const Entry &entry) const {
    if (entry.isTypingIndicator()) {
        if (!m_typingIndicator) {
            failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind,
                             "no calculator for the typing indicator");
        }
        return *m_typingIndicator;
    }

    const MessageKindTag tag = entry.message()->tag();
    auto it = m_calculators.find(tag);
    if (it == m_calculators.end()) {
        std::string detail = std::string("no calculator registered for '") + kindName(tag) + "'";
        if (tag == MessageKindTag::Custom) {
            detail += " (type '" + std::get<CustomKind>(entry.message()->kind).type + "')";
        }
        failPrecondition(PreconditionFailure::Reason::UnsupportedMessageKind, detail + ", message " + entry.id());
    }
    return *it->second;
}
