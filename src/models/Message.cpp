#include "models/Message.h"

#include "utils/Time.h"

#include <cstdint>
#include <functional>
#include <iterator>
#include <stdexcept>

namespace {
constexpr const char *kKindNames[] = {"text",    "attributed_text", "emoji",        "photo",  "video", "location",
                                      "audio",   "contact",         "link_preview", "custom", "system"};

Size sizeFromJson(const nlohmann::json &j) {
    Size size;
    if (j.contains("width") && j["width"].is_number()) {
        size.width = j["width"].get<int>();
    }
    if (j.contains("height") && j["height"].is_number()) {
        size.height = j["height"].get<int>();
    }
    return size;
}

void sizeToJson(nlohmann::json &j, const Size &size) {
    j["width"] = size.width;
    j["height"] = size.height;
}

std::optional<std::string> optionalString(const nlohmann::json &j, const char *key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> stringList(const nlohmann::json &j, const char *key) {
    std::vector<std::string> values;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto &value : j[key]) {
            values.push_back(value.get<std::string>());
        }
    }
    return values;
}

MessageKind kindFromJson(MessageKindTag tag, const nlohmann::json &j, const FontSpec &textFont) {
    switch (tag) {
    case MessageKindTag::Text:
        return TextKind{j.at("text").get<std::string>()};
    case MessageKindTag::AttributedText:
        return AttributedTextKind{StyledText::fromJson(j.at("text"), textFont)};
    case MessageKindTag::Emoji:
        return EmojiKind{j.at("text").get<std::string>()};
    case MessageKindTag::Photo:
        return PhotoKind{MediaItem{j.value("url", ""), sizeFromJson(j)}};
    case MessageKindTag::Video:
        return VideoKind{MediaItem{j.value("url", ""), sizeFromJson(j)}};
    case MessageKindTag::Location:
        return LocationKind{j.at("latitude").get<double>(), j.at("longitude").get<double>(), sizeFromJson(j)};
    case MessageKindTag::Audio:
        return AudioKind{j.value("url", ""), j.value("duration", 0.0), sizeFromJson(j)};
    case MessageKindTag::Contact:
        return ContactKind{j.at("display_name").get<std::string>(), stringList(j, "phone_numbers"),
                           stringList(j, "emails")};
    case MessageKindTag::LinkPreview:
        return LinkPreviewKind{j.value("text", ""), j.at("url").get<std::string>(), optionalString(j, "title"),
                               optionalString(j, "teaser")};
    case MessageKindTag::Custom:
        return CustomKind{j.at("type").get<std::string>(), j.value("payload", nlohmann::json::object())};
    case MessageKindTag::System:
        return SystemKind{StyledText::fromJson(j.at("text"), textFont)};
    }
    throw std::invalid_argument("Unhandled message kind");
}

struct KindWriter {
    nlohmann::json &j;

    void operator()(const TextKind &kind) const { j["text"] = kind.text; }
    void operator()(const AttributedTextKind &kind) const { j["text"] = kind.text.toJson(); }
    void operator()(const EmojiKind &kind) const { j["text"] = kind.text; }
    void operator()(const PhotoKind &kind) const {
        j["url"] = kind.item.url;
        sizeToJson(j, kind.item.size);
    }
    void operator()(const VideoKind &kind) const {
        j["url"] = kind.item.url;
        sizeToJson(j, kind.item.size);
    }
    void operator()(const LocationKind &kind) const {
        j["latitude"] = kind.latitude;
        j["longitude"] = kind.longitude;
        sizeToJson(j, kind.size);
    }
    void operator()(const AudioKind &kind) const {
        j["url"] = kind.url;
        j["duration"] = kind.durationSecs;
        sizeToJson(j, kind.size);
    }
    void operator()(const ContactKind &kind) const {
        j["display_name"] = kind.displayName;
        j["phone_numbers"] = kind.phoneNumbers;
        j["emails"] = kind.emails;
    }
    void operator()(const LinkPreviewKind &kind) const {
        j["text"] = kind.text;
        j["url"] = kind.url;
        if (kind.title.has_value()) {
            j["title"] = *kind.title;
        }
        if (kind.teaser.has_value()) {
            j["teaser"] = *kind.teaser;
        }
    }
    void operator()(const CustomKind &kind) const {
        j["type"] = kind.type;
        j["payload"] = kind.payload;
    }
    void operator()(const SystemKind &kind) const { j["text"] = kind.text.toJson(); }
};
} // namespace

Fingerprint combineFingerprint(Fingerprint seed, Fingerprint value) {
    constexpr Fingerprint kGolden = static_cast<Fingerprint>(0x9e3779b97f4a7c15ULL);
    return seed ^ (value + kGolden + (seed << 6) + (seed >> 2));
}

namespace {
// Hashes string bytes as stored; dump() would reject text that is not valid UTF-8
Fingerprint hashJson(const nlohmann::json &j) {
    Fingerprint seed = std::hash<int>{}(static_cast<int>(j.type()));
    switch (j.type()) {
    case nlohmann::json::value_t::object:
        for (const auto &item : j.items()) {
            seed = combineFingerprint(seed, std::hash<std::string>{}(item.key()));
            seed = combineFingerprint(seed, hashJson(item.value()));
        }
        break;
    case nlohmann::json::value_t::array:
        for (const auto &value : j) {
            seed = combineFingerprint(seed, hashJson(value));
        }
        break;
    case nlohmann::json::value_t::string:
        seed = combineFingerprint(seed, std::hash<std::string>{}(j.get_ref<const std::string &>()));
        break;
    case nlohmann::json::value_t::boolean:
        seed = combineFingerprint(seed, std::hash<bool>{}(j.get<bool>()));
        break;
    case nlohmann::json::value_t::number_integer:
        seed = combineFingerprint(seed, std::hash<std::int64_t>{}(j.get<std::int64_t>()));
        break;
    case nlohmann::json::value_t::number_unsigned:
        seed = combineFingerprint(seed, std::hash<std::uint64_t>{}(j.get<std::uint64_t>()));
        break;
    case nlohmann::json::value_t::number_float:
        seed = combineFingerprint(seed, std::hash<double>{}(j.get<double>()));
        break;
    default:
        break;
    }
    return seed;
}
} // namespace

Sender Sender::fromJson(const nlohmann::json &j) {
    Sender sender;
    sender.id = j.at("id").get<std::string>();
    if (j.contains("display_name") && j["display_name"].is_string()) {
        sender.displayName = j["display_name"].get<std::string>();
    } else {
        sender.displayName = sender.id;
    }
    return sender;
}

nlohmann::json Sender::toJson() const { return {{"id", id}, {"display_name", displayName}}; }

std::string LinkPreviewKind::domain() const {
    std::string host = url;
    size_t schemeEnd = host.find("://");
    if (schemeEnd != std::string::npos) {
        host = host.substr(schemeEnd + 3);
    }

    size_t pathStart = host.find_first_of("/?#");
    if (pathStart != std::string::npos) {
        host = host.substr(0, pathStart);
    }

    size_t at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }

    size_t port = host.find(':');
    if (port != std::string::npos) {
        host = host.substr(0, port);
    }

    return host;
}

MessageKindTag kindTag(const MessageKind &kind) { return static_cast<MessageKindTag>(kind.index()); }

const char *kindName(MessageKindTag tag) { return kKindNames[static_cast<size_t>(tag)]; }

std::optional<MessageKindTag> kindTagFromName(const std::string &name) {
    for (size_t i = 0; i < std::size(kKindNames); ++i) {
        if (name == kKindNames[i]) {
            return static_cast<MessageKindTag>(i);
        }
    }
    return std::nullopt;
}

Message Message::fromJson(const nlohmann::json &j, FontSpec textFont) {
    Message message;

    message.id = j.at("id").get<std::string>();
    message.sender = Sender::fromJson(j.at("sender"));

    if (j.contains("sent_at") && j["sent_at"].is_string()) {
        auto parsed = TimeUtils::parseISO8601(j["sent_at"].get<std::string>());
        if (parsed.has_value()) {
            message.sentAt = *parsed;
        }
    }

    const std::string kindString = j.at("kind").get<std::string>();
    auto tag = kindTagFromName(kindString);
    if (!tag.has_value()) {
        throw std::invalid_argument("Unknown message kind '" + kindString + "' in message " + message.id);
    }
    message.kind = kindFromJson(*tag, j, textFont);

    return message;
}

nlohmann::json Message::toJson() const {
    nlohmann::json j = {{"id", id},
                        {"sender", sender.toJson()},
                        {"sent_at", TimeUtils::formatISO8601(sentAt)},
                        {"kind", kindName(tag())}};
    std::visit(KindWriter{j}, kind);
    return j;
}

Fingerprint Message::contentFingerprint() const { return hashJson(toJson()); }

bool Message::hasSameContent(const Message &other) const { return toJson() == other.toJson(); }
