/**
 * Unit tests for LayoutEngine: preconditions, caching and vertical placement
 */

#include "layout/LayoutEngine.h"
#include "utils/Errors.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

namespace {

class FixedCalculator : public SizeCalculator {
  public:
    explicit FixedCalculator(int height) : m_height(height) {}

    LayoutAttributes computeAttributes(const Entry &, const IndexPath &position) const override {
        LayoutAttributes attributes;
        attributes.indexPath = position;
        attributes.messageContainerSize = {10, m_height};
        return attributes;
    }
    Size computeCellSize(const Entry &, const IndexPath &) const override { return {10, m_height}; }

  private:
    int m_height;
};

class LayoutEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        bindAll(engine);
        source.sections = {{textMessage("m1", "them", "hello"), textMessage("m2", "me", "world")},
                           {textMessage("m3", "them", "again")}};
        engine.setEntries(entriesFromSource());
    }

    void bindAll(LayoutEngine &target) {
        target.setMessageSource(&source);
        target.setLayoutPolicy(&policy);
        target.setTextMeasurer(&measurer);
        target.setAvailableWidth(300);
    }

    std::vector<Entry> entriesFromSource() const {
        std::vector<Entry> entries;
        for (int section = 0; section < source.sectionCount(); ++section) {
            for (int item = 0; item < source.itemCount(section); ++item) {
                entries.push_back(Entry::fromMessage(source.message({section, item}), {section, item}));
            }
        }
        return entries;
    }

    static PreconditionFailure::Reason reasonOf(const std::function<void()> &call) {
        try {
            call();
        } catch (const PreconditionFailure &e) {
            return e.reason();
        }
        ADD_FAILURE() << "expected PreconditionFailure";
        return PreconditionFailure::Reason::IndexOutOfRange;
    }

    MockMessageSource source;
    MockLayoutPolicy policy;
    FixedAdvanceMeasurer measurer;
    LayoutEngine engine;
};

} // namespace

// ============================================================================
// Preconditions
// ============================================================================

TEST_F(LayoutEngineTest, MissingCollaboratorsAreReported) {
    LayoutEngine bare;
    bare.setEntries(entriesFromSource());
    bare.setLayoutPolicy(&policy);
    bare.setTextMeasurer(&measurer);
    EXPECT_EQ(reasonOf([&] { bare.sizeAt(0); }), PreconditionFailure::Reason::MissingMessageSource);

    bare.setMessageSource(&source);
    bare.setLayoutPolicy(nullptr);
    EXPECT_EQ(reasonOf([&] { bare.sizeAt(0); }), PreconditionFailure::Reason::MissingLayoutPolicy);

    bare.setLayoutPolicy(&policy);
    bare.setTextMeasurer(nullptr);
    EXPECT_EQ(reasonOf([&] { bare.attributesAt(0); }), PreconditionFailure::Reason::MissingTextMeasurer);
}

TEST_F(LayoutEngineTest, IndexOutOfRange) {
    EXPECT_EQ(reasonOf([&] { engine.sizeAt(3); }), PreconditionFailure::Reason::IndexOutOfRange);
}

TEST_F(LayoutEngineTest, CustomKindNeedsRegisteredCalculator) {
    Message poll;
    poll.id = "poll1";
    poll.sender = Sender{"them", "them"};
    poll.kind = CustomKind{"poll", nlohmann::json::object()};
    engine.setEntries({Entry::fromMessage(poll, {0, 0})});

    EXPECT_EQ(reasonOf([&] { engine.sizeAt(0); }), PreconditionFailure::Reason::UnsupportedMessageKind);

    engine.registerCalculator(MessageKindTag::Custom, std::make_shared<FixedCalculator>(90));
    EXPECT_EQ(engine.sizeAt(0), (Size{10, 90}));
}

TEST_F(LayoutEngineTest, RegisteredCalculatorReplacesBuiltIn) {
    engine.registerCalculator(MessageKindTag::Text, std::make_shared<FixedCalculator>(12));
    EXPECT_EQ(engine.sizeAt(1).height, 12);
}

// ============================================================================
// Cache
// ============================================================================

TEST_F(LayoutEngineTest, RepeatedQueriesHitTheCache) {
    Size first = engine.sizeAt(0);
    const int callsAfterFirst = measurer.calls;
    EXPECT_EQ(engine.cache().misses(), 1u);

    EXPECT_EQ(engine.sizeAt(0), first);
    engine.attributesAt(0);
    EXPECT_EQ(engine.cache().hits(), 2u);
    EXPECT_EQ(measurer.calls, callsAfterFirst);
}

TEST_F(LayoutEngineTest, ContentChangeInvalidatesOnlyThatEntry) {
    engine.sizeAt(0);
    engine.sizeAt(1);
    engine.sizeAt(2);

    source.sections[0][0] = textMessage("m1", "them", "hello there, this is a much longer message now");
    engine.setEntries(entriesFromSource());
    const size_t missesBefore = engine.cache().misses();
    const size_t hitsBefore = engine.cache().hits();

    Size resized = engine.sizeAt(0);
    engine.sizeAt(1);
    engine.sizeAt(2);
    EXPECT_EQ(engine.cache().misses() - missesBefore, 1u);
    EXPECT_EQ(engine.cache().hits() - hitsBefore, 2u);
    EXPECT_EQ(resized.height, 21 * 2 + 14);
}

TEST_F(LayoutEngineTest, PositionChangeIsNotServedStale) {
    LayoutAttributes before = engine.attributesAt(2);
    EXPECT_EQ(before.indexPath, (IndexPath{1, 0}));

    // m3 moves into section 0
    source.sections = {{textMessage("m1", "them", "hello"), textMessage("m2", "me", "world"),
                        textMessage("m3", "them", "again")}};
    engine.setEntries(entriesFromSource());
    EXPECT_EQ(engine.attributesAt(2).indexPath, (IndexPath{0, 2}));
}

TEST_F(LayoutEngineTest, PrependedHistoryReusesCachedLayouts) {
    engine.sizeAt(0);
    engine.sizeAt(1);
    engine.sizeAt(2);

    source.sections[0].insert(source.sections[0].begin(), textMessage("m0", "them", "older"));
    engine.setEntries(entriesFromSource());
    const size_t missesBefore = engine.cache().misses();
    const size_t hitsBefore = engine.cache().hits();

    for (size_t index = 0; index < 4; ++index) {
        engine.sizeAt(index);
    }
    EXPECT_EQ(engine.cache().misses() - missesBefore, 1u);
    EXPECT_EQ(engine.cache().hits() - hitsBefore, 3u);
    EXPECT_EQ(engine.attributesAt(1).indexPath, (IndexPath{0, 1}));
}

TEST_F(LayoutEngineTest, PositionDependentPolicyRecomputesMovedEntries) {
    policy.positionDependent = true;
    engine.sizeAt(0);
    engine.sizeAt(1);
    engine.sizeAt(2);

    source.sections[0].insert(source.sections[0].begin(), textMessage("m0", "them", "older"));
    engine.setEntries(entriesFromSource());
    const size_t missesBefore = engine.cache().misses();
    const size_t hitsBefore = engine.cache().hits();

    for (size_t index = 0; index < 4; ++index) {
        engine.sizeAt(index);
    }
    // m3 keeps IndexPath{1, 0}
    EXPECT_EQ(engine.cache().misses() - missesBefore, 3u);
    EXPECT_EQ(engine.cache().hits() - hitsBefore, 1u);
}

TEST_F(LayoutEngineTest, InvalidateAllClearsEverything) {
    engine.sizeAt(0);
    engine.sizeAt(1);
    EXPECT_EQ(engine.cache().size(), 2u);

    engine.invalidateAll();
    EXPECT_EQ(engine.cache().size(), 0u);
    EXPECT_EQ(engine.sizeAt(0).height, 35);
}

TEST_F(LayoutEngineTest, InvalidateDropsOneEntry) {
    engine.sizeAt(0);
    engine.sizeAt(1);
    engine.invalidate("m1");
    EXPECT_FALSE(engine.cache().contains("m1"));
    EXPECT_TRUE(engine.cache().contains("m2"));
}

TEST_F(LayoutEngineTest, WidthChangeInvalidatesOnlyWhenDifferent) {
    engine.sizeAt(0);
    engine.setAvailableWidth(300);
    EXPECT_EQ(engine.cache().size(), 1u);

    engine.setAvailableWidth(200);
    EXPECT_EQ(engine.cache().size(), 0u);
    EXPECT_EQ(engine.sizeAt(0).width, 200);
}

TEST_F(LayoutEngineTest, NonPositiveWidthCollapsesCells) {
    engine.setAvailableWidth(-20);
    EXPECT_EQ(engine.availableWidth(), 0);
    Size size = engine.sizeAt(0);
    EXPECT_EQ(size.width, 0);
    EXPECT_GE(size.height, 0);
}

TEST_F(LayoutEngineTest, ConfigurationChangeRelayouts) {
    EXPECT_EQ(engine.sizeAt(0).height, 35);

    SizingConfiguration config;
    config.messageLabelFont = FontSpec{FL_HELVETICA, 30};
    config.cacheCapacity = 1;
    engine.setConfiguration(config);

    EXPECT_EQ(engine.sizeAt(0).height, 34 + 14);
    engine.sizeAt(1);
    EXPECT_EQ(engine.cache().size(), 1u);
}

TEST_F(LayoutEngineTest, CachedAnswersMatchUncached) {
    policy.cellTopHeight = 12;
    policy.accessory = Size{16, 16};
    source.timestamp = StyledText("12:00", FontSpec{FL_HELVETICA, 11});

    SizingConfiguration uncachedConfig;
    uncachedConfig.cacheCapacity = 0;
    LayoutEngine uncached(uncachedConfig);
    bindAll(uncached);
    uncached.setEntries(entriesFromSource());
    engine.invalidateAll();

    for (int pass = 0; pass < 2; ++pass) {
        for (size_t i = 0; i < engine.entries().size(); ++i) {
            EXPECT_EQ(engine.attributesAt(i), uncached.attributesAt(i)) << "index " << i;
            EXPECT_EQ(engine.sizeAt(i), uncached.sizeAt(i)) << "index " << i;
        }
    }
    EXPECT_EQ(uncached.cache().size(), 0u);
}

// ============================================================================
// Placement
// ============================================================================

TEST_F(LayoutEngineTest, OffsetsIncludeHeadersAndFooters) {
    policy.header = Size{0, 10};
    policy.footer = Size{0, 4};
    engine.invalidateAll();

    EXPECT_EQ(engine.offsetAt(0), 10);
    EXPECT_EQ(engine.offsetAt(1), 45);
    EXPECT_EQ(engine.offsetAt(2), 80 + 4 + 10);
    EXPECT_EQ(engine.contentHeight(), 94 + 35 + 4);
}

TEST_F(LayoutEngineTest, TypingSectionHasNoHeaderOrFooter) {
    policy.header = Size{0, 10};
    policy.footer = Size{0, 4};

    std::vector<Entry> entries = entriesFromSource();
    entries.push_back(Entry::typingIndicator({2, 0}));
    engine.setEntries(entries, 3);

    EXPECT_TRUE(engine.isSectionReservedForTypingIndicator(2));
    EXPECT_FALSE(engine.isSectionReservedForTypingIndicator(1));
    EXPECT_EQ(engine.headerSize(2), (Size{}));
    EXPECT_EQ(engine.headerSize(1), (Size{0, 10}));
    EXPECT_EQ(engine.offsetAt(3), 94 + 35 + 4);
    EXPECT_EQ(engine.contentHeight(), 133 + 62);
}

TEST_F(LayoutEngineTest, EmptySectionsStillContributeSpacing) {
    policy.header = Size{0, 10};
    source.sections = {{textMessage("m1", "them", "hello")}, {}, {textMessage("m3", "them", "again")}};
    engine.setEntries(entriesFromSource(), 3);

    EXPECT_EQ(engine.sectionCount(), 3);
    EXPECT_EQ(engine.offsetAt(1), 10 + 35 + 10 + 10);
}

TEST_F(LayoutEngineTest, VisibleRange) {
    policy.header = Size{0, 10};
    policy.footer = Size{0, 4};
    engine.invalidateAll();

    // Cells occupy [10, 45), [45, 80) and [94, 129)
    auto top = engine.visibleRange(0, 50, 0);
    EXPECT_EQ(top.firstVisible, 0);
    EXPECT_EQ(top.lastVisible, 1);

    auto gap = engine.visibleRange(82, 10, 0);
    EXPECT_TRUE(gap.empty());

    auto padded = engine.visibleRange(0, 50, 100);
    EXPECT_EQ(padded.renderFirst, 0);
    EXPECT_EQ(padded.renderLast, 2);
}

TEST_F(LayoutEngineTest, IndexOfFollowsEntries) {
    EXPECT_EQ(engine.indexOf("m3"), std::optional<size_t>(2));
    EXPECT_FALSE(engine.indexOf("missing").has_value());
    EXPECT_EQ(engine.itemCount(), 3);
    EXPECT_EQ(engine.sectionCount(), 2);
}
