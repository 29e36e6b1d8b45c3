/**
 * Unit tests for MemoryPressureRelay
 */

#include "state/MemoryPressureRelay.h"
#include "layout/LayoutEngine.h"
#include "TestDoubles.h"

#include <FL/Fl.H>

#include <thread>

#include <gtest/gtest.h>

namespace {

class MemoryPressureRelayTest : public ::testing::Test {
  protected:
    void SetUp() override {
        // Fl::awake needs the FLTK lock initialized on the main thread
        Fl::lock();

        engine.setMessageSource(&source);
        engine.setLayoutPolicy(&policy);
        engine.setTextMeasurer(&measurer);
        engine.setAvailableWidth(300);

        source.sections = {{textMessage("m1", "them", "hi"), textMessage("m2", "me", "hello")}};
        engine.setEntries({Entry::fromMessage(source.sections[0][0], {0, 0}),
                           Entry::fromMessage(source.sections[0][1], {0, 1})});
        engine.sizeAt(0);
        engine.sizeAt(1);
    }

    void TearDown() override { Fl::unlock(); }

    MockMessageSource source;
    MockLayoutPolicy policy;
    FixedAdvanceMeasurer measurer;
    LayoutEngine engine;
};

} // namespace

TEST_F(MemoryPressureRelayTest, SignalIsDeferredToTheMainThread) {
    MemoryPressureRelay relay(engine);
    relay.notify();

    EXPECT_TRUE(relay.isPending());
    EXPECT_EQ(engine.cache().size(), 2u);

    relay.handleOnMainThread();
    EXPECT_FALSE(relay.isPending());
    EXPECT_EQ(engine.cache().size(), 0u);
}

TEST_F(MemoryPressureRelayTest, RepeatedSignalsCoalesce) {
    MemoryPressureRelay relay(engine);
    relay.notify();
    relay.notify();
    relay.notify();
    relay.handleOnMainThread();
    EXPECT_EQ(engine.cache().size(), 0u);

    // Nothing is left queued for a second drain
    engine.sizeAt(0);
    relay.handleOnMainThread();
    EXPECT_EQ(engine.cache().size(), 1u);
}

TEST_F(MemoryPressureRelayTest, DrainWithoutSignalKeepsCache) {
    MemoryPressureRelay relay(engine);
    relay.handleOnMainThread();
    EXPECT_EQ(engine.cache().size(), 2u);
}

TEST_F(MemoryPressureRelayTest, NotifyFromWorkerThread) {
    MemoryPressureRelay relay(engine);
    std::thread worker([&relay] { relay.notify(); });
    worker.join();

    EXPECT_TRUE(relay.isPending());
    relay.handleOnMainThread();
    EXPECT_EQ(engine.cache().size(), 0u);

    // Later layout queries rebuild normally
    EXPECT_EQ(engine.sizeAt(1).width, 300);
}
