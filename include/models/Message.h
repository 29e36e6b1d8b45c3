#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "layout/Geometry.h"
#include "models/StyledText.h"

/**
 * @brief Content fingerprint: equal for messages with equal content, independent of identity comparisons
 */
using Fingerprint = std::size_t;

/**
 * @brief Fold another value into a fingerprint
 */
Fingerprint combineFingerprint(Fingerprint seed, Fingerprint value);

/**
 * @brief Author of a message
 */
struct Sender {
    std::string id;          ///< Stable sender ID
    std::string displayName; ///< Name shown in captions

    static Sender fromJson(const nlohmann::json &j);
    nlohmann::json toJson() const;

    bool operator==(const Sender &other) const { return id == other.id && displayName == other.displayName; }
    bool operator!=(const Sender &other) const { return !(*this == other); }
};

/**
 * @brief A remote image or video with its intrinsic display size
 */
struct MediaItem {
    std::string url;
    Size size;
};

struct TextKind {
    std::string text;
};

struct AttributedTextKind {
    StyledText text;
};

struct EmojiKind {
    std::string text;
};

struct PhotoKind {
    MediaItem item;
};

struct VideoKind {
    MediaItem item;
};

struct LocationKind {
    double latitude = 0.0;
    double longitude = 0.0;
    Size size; ///< Size of the rendered map snapshot
};

struct AudioKind {
    std::string url;
    double durationSecs = 0.0;
    Size size; ///< Size of the player view
};

struct ContactKind {
    std::string displayName;
    std::vector<std::string> phoneNumbers;
    std::vector<std::string> emails;
};

struct LinkPreviewKind {
    std::string text;
    std::string url;
    std::optional<std::string> title;
    std::optional<std::string> teaser;

    /// Host part of the URL, shown as the preview's domain line
    std::string domain() const;
};

/**
 * @brief Host-defined content; sized by a calculator the host registers
 */
struct CustomKind {
    std::string type;
    nlohmann::json payload;
};

/**
 * @brief Non-interactive caption spanning the whole cell (e.g. "Alice joined")
 */
struct SystemKind {
    StyledText text;
};

using MessageKind = std::variant<TextKind, AttributedTextKind, EmojiKind, PhotoKind, VideoKind, LocationKind,
                                 AudioKind, ContactKind, LinkPreviewKind, CustomKind, SystemKind>;

enum class MessageKindTag {
    Text,
    AttributedText,
    Emoji,
    Photo,
    Video,
    Location,
    Audio,
    Contact,
    LinkPreview,
    Custom,
    System
};

MessageKindTag kindTag(const MessageKind &kind);
const char *kindName(MessageKindTag tag);
std::optional<MessageKindTag> kindTagFromName(const std::string &name);

/**
 * @brief One message in a thread. Immutable once handed to the engine; edits arrive as
 * replacement messages that keep the same id.
 */
class Message {
  public:
    /**
     * @brief Deserialize message from JSON
     * @param j Object with "id", "sender", "sent_at", "kind" and the kind's payload keys
     * @param textFont Font used for plain strings inside attributed/system text
     * @throws nlohmann::json::exception on missing keys, std::invalid_argument on an unknown kind
     */
    static Message fromJson(const nlohmann::json &j, FontSpec textFont = {});

    nlohmann::json toJson() const;

    MessageKindTag tag() const { return kindTag(kind); }

    /**
     * @brief Hash of the canonical JSON form; changes whenever any field changes
     */
    Fingerprint contentFingerprint() const;

    /**
     * @brief Full value equality (stricter than sharing an id)
     */
    bool hasSameContent(const Message &other) const;

    std::string id;                                  ///< Identity, stable across edits
    Sender sender;                                   ///< Author
    std::chrono::system_clock::time_point sentAt{}; ///< Send time
    MessageKind kind = TextKind{};                   ///< Payload
};
