/**
 * Unit tests for Message and Entry
 */

#include "models/Entry.h"
#include "models/Message.h"
#include "utils/Time.h"

#include <gtest/gtest.h>

namespace {
nlohmann::json textJson() {
    return {{"id", "m1"},
            {"sender", {{"id", "u-ben"}, {"display_name", "Ben"}}},
            {"sent_at", "2026-03-02T09:14:03Z"},
            {"kind", "text"},
            {"text", "Morning!"}};
}
} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(MessageTest, ParsesTextMessage) {
    Message message = Message::fromJson(textJson());

    EXPECT_EQ(message.id, "m1");
    EXPECT_EQ(message.sender.displayName, "Ben");
    EXPECT_EQ(message.tag(), MessageKindTag::Text);
    EXPECT_EQ(std::get<TextKind>(message.kind).text, "Morning!");
    EXPECT_EQ(TimeUtils::formatClock(message.sentAt), "09:14");
}

TEST(MessageTest, SenderNameDefaultsToId) {
    nlohmann::json j = textJson();
    j["sender"] = {{"id", "u-ben"}};
    EXPECT_EQ(Message::fromJson(j).sender.displayName, "u-ben");
}

TEST(MessageTest, UnknownKindIsRejected) {
    nlohmann::json j = textJson();
    j["kind"] = "hologram";
    EXPECT_THROW(Message::fromJson(j), std::invalid_argument);
}

TEST(MessageTest, MissingIdIsRejected) {
    nlohmann::json j = textJson();
    j.erase("id");
    EXPECT_THROW(Message::fromJson(j), nlohmann::json::exception);
}

TEST(MessageTest, ParsesPayloadKinds) {
    Message photo = Message::fromJson({{"id", "p1"},
                                       {"sender", {{"id", "a"}}},
                                       {"kind", "photo"},
                                       {"url", "https://example.com/a.jpg"},
                                       {"width", 1200},
                                       {"height", 800}});
    EXPECT_EQ(std::get<PhotoKind>(photo.kind).item.size, (Size{1200, 800}));

    Message contact = Message::fromJson({{"id", "c1"},
                                         {"sender", {{"id", "a"}}},
                                         {"kind", "contact"},
                                         {"display_name", "Dana"},
                                         {"emails", {"dana@example.com"}}});
    const auto &card = std::get<ContactKind>(contact.kind);
    EXPECT_EQ(card.displayName, "Dana");
    EXPECT_TRUE(card.phoneNumbers.empty());
    ASSERT_EQ(card.emails.size(), 1u);

    Message custom = Message::fromJson(
        {{"id", "x1"}, {"sender", {{"id", "a"}}}, {"kind", "custom"}, {"type", "poll"}, {"payload", {{"q", "?"}}}});
    EXPECT_EQ(std::get<CustomKind>(custom.kind).type, "poll");
    EXPECT_EQ(std::get<CustomKind>(custom.kind).payload["q"], "?");
}

TEST(MessageTest, SystemTextKeepsRunFonts) {
    nlohmann::json runs = {{"runs",
                            {{{"text", "Chloe"}, {"font", {{"face", "bold"}, {"size", 13}}}},
                             {{"text", " joined"}, {"font", {{"face", "regular"}, {"size", 13}}}}}}};
    Message message = Message::fromJson({{"id", "s1"}, {"sender", {{"id", "system"}}}, {"kind", "system"}, {"text", runs}});

    const StyledText &text = std::get<SystemKind>(message.kind).text;
    ASSERT_EQ(text.runs().size(), 2u);
    EXPECT_EQ(text.runs()[0].font, (FontSpec{FL_HELVETICA_BOLD, 13}));
    EXPECT_EQ(text.plainText(), "Chloe joined");
}

TEST(MessageTest, JsonFormPreservesContent) {
    Message message = Message::fromJson(textJson());
    Message copy = Message::fromJson(message.toJson());
    EXPECT_TRUE(message.hasSameContent(copy));
    EXPECT_EQ(message.contentFingerprint(), copy.contentFingerprint());
}

// ============================================================================
// Kinds and fingerprints
// ============================================================================

TEST(MessageTest, KindNamesMatchTags) {
    EXPECT_STREQ(kindName(MessageKindTag::LinkPreview), "link_preview");
    EXPECT_EQ(kindTagFromName("attributed_text"), MessageKindTag::AttributedText);
    EXPECT_EQ(kindTagFromName("system"), MessageKindTag::System);
    EXPECT_FALSE(kindTagFromName("hologram").has_value());
    EXPECT_EQ(kindTag(MessageKind{AudioKind{}}), MessageKindTag::Audio);
}

TEST(MessageTest, FingerprintTracksContent) {
    Message a = Message::fromJson(textJson());
    Message b = a;
    EXPECT_EQ(a.contentFingerprint(), b.contentFingerprint());

    std::get<TextKind>(b.kind).text = "Morning!!";
    EXPECT_NE(a.contentFingerprint(), b.contentFingerprint());

    Message c = a;
    c.sender.displayName = "Benjamin";
    EXPECT_NE(a.contentFingerprint(), c.contentFingerprint());
    EXPECT_FALSE(a.hasSameContent(c));
}

TEST(MessageTest, FingerprintAcceptsInvalidUtf8) {
    Message latin1 = Message::fromJson(textJson());
    std::get<TextKind>(latin1.kind).text = "caf\xE9";
    Message truncated = latin1;
    std::get<TextKind>(truncated.kind).text = "caf\xC3";

    EXPECT_NO_THROW(latin1.contentFingerprint());
    EXPECT_NO_THROW(truncated.contentFingerprint());
    EXPECT_NE(latin1.contentFingerprint(), truncated.contentFingerprint());
    EXPECT_EQ(Entry::fromMessage(latin1, {0, 0}).contentFingerprint(), latin1.contentFingerprint());
}

TEST(MessageTest, LinkPreviewDomain) {
    LinkPreviewKind preview;
    preview.url = "https://wiki.example.com/retro/2026-03?x=1";
    EXPECT_EQ(preview.domain(), "wiki.example.com");

    preview.url = "http://user@host.example:8080";
    EXPECT_EQ(preview.domain(), "host.example");

    preview.url = "example.org/path";
    EXPECT_EQ(preview.domain(), "example.org");
}

TEST(EntryTest, WrapsMessage) {
    Message message = Message::fromJson(textJson());
    Entry entry = Entry::fromMessage(message, {2, 5});

    EXPECT_EQ(entry.kind(), Entry::Kind::Message);
    EXPECT_EQ(entry.id(), "m1");
    EXPECT_EQ(entry.position(), (IndexPath{2, 5}));
    ASSERT_NE(entry.message(), nullptr);
    EXPECT_EQ(entry.contentFingerprint(), message.contentFingerprint());
}

TEST(EntryTest, TypingIndicatorHasFixedIdentity) {
    Entry first = Entry::typingIndicator({1, 0});
    Entry second = Entry::typingIndicator({4, 0});

    EXPECT_TRUE(first.isTypingIndicator());
    EXPECT_EQ(first.message(), nullptr);
    EXPECT_EQ(first.id(), Entry::kTypingIndicatorId);
    EXPECT_EQ(first.contentFingerprint(), second.contentFingerprint());
}
