#include <gtest/gtest.h>
#include "monitor/Reporter.hpp"
#include "monitor/Sampler.hpp"
#include "monitor/SyncState.hpp"
#include "monitor/messages.hpp"
#include "fakes.hpp"

#include <chrono>
#include <memory>

using namespace sw::monitor;
using namespace sw::test;
using namespace std::chrono_literals;

class ReporterTest : public ::testing::Test {
protected:
    static constexpr int64_t ALERT_GROUP = -1001234567890;

    std::shared_ptr<FakeNodeClient> node = std::make_shared<FakeNodeClient>();
    std::shared_ptr<SyncState> state = std::make_shared<SyncState>();
    std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
    Sampler sampler{node, state};
    Reporter reporter{state, notifier, ALERT_GROUP, 5s};

    void sampleWindow(std::initializer_list<FakeNodeClient::Outcome> outcomes) {
        for (const auto& o : outcomes) {
            node->push(o);
            sampler.sample();
        }
    }

    void driveOutOfSync() {
        sampleWindow({FakeNodeClient::syncing(1, 2)});
        ASSERT_EQ(reporter.tick().current, AlertState::OutOfSync);
    }
};

TEST_F(ReporterTest, StartsInSync) {
    EXPECT_EQ(reporter.alertState(), AlertState::InSync);
}

TEST_F(ReporterTest, AllSyncedWindowStaysQuiet) {
    sampleWindow({FakeNodeClient::synced(), FakeNodeClient::synced(), FakeNodeClient::synced(),
                  FakeNodeClient::synced(), FakeNodeClient::synced()});

    const auto d = reporter.tick();
    EXPECT_EQ(d.synced_samples, 5u);
    EXPECT_FALSE(d.transitioned());
    EXPECT_FALSE(d.notified);
    EXPECT_EQ(reporter.alertState(), AlertState::InSync);
    EXPECT_TRUE(notifier->attempts().empty());
}

TEST_F(ReporterTest, SingleSyncedSampleRecovers) {
    driveOutOfSync();

    sampleWindow({FakeNodeClient::syncing(5, 9), FakeNodeClient::failure(), FakeNodeClient::synced()});
    const auto d = reporter.tick();

    EXPECT_EQ(d.synced_samples, 1u);
    EXPECT_EQ(d.previous, AlertState::OutOfSync);
    EXPECT_EQ(d.current, AlertState::InSync);
    EXPECT_TRUE(d.delivered);

    const auto sent = notifier->attempts();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent.back().destination, ALERT_GROUP);
    EXPECT_EQ(sent.back().text, backInSyncMessage());
}

TEST_F(ReporterTest, WindowWithoutSyncedSampleRaisesOutage) {
    sampleWindow({FakeNodeClient::syncing(90, 200), FakeNodeClient::syncing(100, 200)});

    const auto d = reporter.tick();
    EXPECT_EQ(d.synced_samples, 0u);
    EXPECT_EQ(d.current, AlertState::OutOfSync);
    EXPECT_TRUE(d.notified);

    const auto sent = notifier->attempts();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].destination, ALERT_GROUP);
    EXPECT_NE(sent[0].text.find("Current block: 100"), std::string::npos);
    EXPECT_NE(sent[0].text.find("Highest block: 200"), std::string::npos);
    EXPECT_NE(sent[0].text.find("out of sync since 5s\n"), std::string::npos);
}

TEST_F(ReporterTest, SteadyOutageIsNotRepeated) {
    driveOutOfSync();

    for (int i = 0; i < 3; ++i) {
        sampleWindow({FakeNodeClient::syncing(10, 20)});
        const auto d = reporter.tick();
        EXPECT_FALSE(d.transitioned());
        EXPECT_FALSE(d.notified);
    }
    EXPECT_EQ(notifier->attempts().size(), 1u);
    EXPECT_EQ(reporter.alertState(), AlertState::OutOfSync);
}

TEST_F(ReporterTest, CounterIsConsumedEveryTick) {
    sampleWindow({FakeNodeClient::synced(), FakeNodeClient::synced()});
    reporter.tick();
    EXPECT_EQ(state->syncedCount(), 0u);

    // the next window has no synced sample, so the old ones must not carry over
    const auto d = reporter.tick();
    EXPECT_EQ(d.synced_samples, 0u);
    EXPECT_EQ(d.current, AlertState::OutOfSync);
    EXPECT_EQ(state->syncedCount(), 0u);
}

TEST_F(ReporterTest, OnlyFailedSamplesCountAsOutage) {
    sampleWindow({FakeNodeClient::failure(), FakeNodeClient::failure()});

    const auto d = reporter.tick();
    EXPECT_EQ(d.current, AlertState::OutOfSync);

    const auto sent = notifier->attempts();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_NE(sent[0].text.find("Current block: unknown\n"), std::string::npos);
}

TEST_F(ReporterTest, ColdStartTickWithoutSamplesDoesNotFault) {
    Decision d;
    ASSERT_NO_THROW(d = reporter.tick());
    EXPECT_EQ(d.current, AlertState::OutOfSync);
    EXPECT_EQ(notifier->attempts().at(0).text,
              outOfSyncMessage(5s, model::SyncSnapshot{}));
}

TEST_F(ReporterTest, FailedDeliveryStillAdvancesState) {
    notifier->failDeliveries(true);
    sampleWindow({FakeNodeClient::syncing(1, 2)});

    Decision d;
    ASSERT_NO_THROW(d = reporter.tick());
    EXPECT_TRUE(d.notified);
    EXPECT_FALSE(d.delivered);
    EXPECT_EQ(reporter.alertState(), AlertState::OutOfSync);

    // the lost alert is not retried on the next tick
    sampleWindow({FakeNodeClient::syncing(1, 2)});
    EXPECT_FALSE(reporter.tick().notified);
    EXPECT_EQ(notifier->attempts().size(), 1u);
}

TEST_F(ReporterTest, FullCycleSendsExactlyOneMessagePerFlip) {
    driveOutOfSync();
    sampleWindow({FakeNodeClient::synced()});
    reporter.tick();
    sampleWindow({FakeNodeClient::synced(), FakeNodeClient::synced()});
    reporter.tick();
    sampleWindow({FakeNodeClient::syncing(3, 4)});
    reporter.tick();

    const auto sent = notifier->attempts();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_NE(sent[0].text.find("out of sync"), std::string::npos);
    EXPECT_EQ(sent[1].text, backInSyncMessage());
    EXPECT_NE(sent[2].text.find("Current block: 3"), std::string::npos);
}

TEST(ReporterTransitionTest, NextStateDependsOnlyOnWindowCount) {
    EXPECT_EQ(Reporter::nextState(0), AlertState::OutOfSync);
    EXPECT_EQ(Reporter::nextState(1), AlertState::InSync);
    EXPECT_EQ(Reporter::nextState(42), AlertState::InSync);
}
