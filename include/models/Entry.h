#pragma once

#include <optional>
#include <string>

#include "layout/Geometry.h"
#include "models/Message.h"

/**
 * @brief One renderable unit of the thread: a message, or the transient typing indicator
 */
class Entry {
  public:
    enum class Kind { Message, TypingIndicator };

    /// Identity shared by every typing indicator entry
    static constexpr const char *kTypingIndicatorId = "__typing_indicator__";

    static Entry fromMessage(Message message, IndexPath position);
    static Entry typingIndicator(IndexPath position);

    Kind kind() const { return m_kind; }
    bool isTypingIndicator() const { return m_kind == Kind::TypingIndicator; }

    /// The wrapped message, nullptr for the typing indicator
    const Message *message() const { return m_message ? &*m_message : nullptr; }

    const std::string &id() const { return m_id; }
    const IndexPath &position() const { return m_position; }

    /**
     * @brief Fingerprint of the wrapped message, computed once at construction.
     * The typing indicator always reports the same value.
     */
    Fingerprint contentFingerprint() const { return m_fingerprint; }

  private:
    Entry(Kind kind, std::string id, std::optional<Message> message, IndexPath position, Fingerprint fingerprint);

    Kind m_kind;
    std::string m_id;
    std::optional<Message> m_message;
    IndexPath m_position;
    Fingerprint m_fingerprint;
};
