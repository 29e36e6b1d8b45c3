#include "models/Entry.h"

#include <functional>

Entry::Entry(Kind kind, std::string id, std::optional<Message> message, IndexPath position, Fingerprint fingerprint)
    : m_kind(kind), m_id(std::move(id)), m_message(std::move(message)), m_position(position),
      m_fingerprint(fingerprint) {}

Entry Entry::fromMessage(Message message, IndexPath position) {
    std::string id = message.id;
    Fingerprint fingerprint = message.contentFingerprint();
    return Entry(Kind::Message, std::move(id), std::move(message), position, fingerprint);
}

Entry Entry::typingIndicator(IndexPath position) {
    static const Fingerprint kIndicatorFingerprint = std::hash<std::string>{}(kTypingIndicatorId);
    return Entry(Kind::TypingIndicator, kTypingIndicatorId, std::nullopt, position, kIndicatorFingerprint);
}
