#include <gtest/gtest.h>
#include "monitor/Sampler.hpp"
#include "monitor/SyncState.hpp"
#include "fakes.hpp"

#include <memory>

using namespace sw::monitor;
using namespace sw::test;
using Status = model::SyncSnapshot::Status;

class SamplerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeNodeClient> node = std::make_shared<FakeNodeClient>();
    std::shared_ptr<SyncState> state = std::make_shared<SyncState>();
    Sampler sampler{node, state};
};

TEST_F(SamplerTest, SyncedSampleIncrementsCounter) {
    node->push(FakeNodeClient::synced());
    sampler.sample();

    EXPECT_EQ(state->syncedCount(), 1u);
    EXPECT_EQ(state->snapshot().status, Status::Synced);
}

TEST_F(SamplerTest, SyncingSampleStoresProgressWithoutCounting) {
    node->push(FakeNodeClient::syncing(100, 200));
    sampler.sample();

    EXPECT_EQ(state->syncedCount(), 0u);
    const auto snap = state->snapshot();
    EXPECT_EQ(snap.status, Status::Syncing);
    EXPECT_EQ(snap.progress.current_block, 100u);
    EXPECT_EQ(snap.progress.highest_block, 200u);
}

TEST_F(SamplerTest, FailedQueryKeepsLastKnownGood) {
    node->push(FakeNodeClient::syncing(100, 200));
    node->push(FakeNodeClient::failure());
    sampler.sample();
    EXPECT_NO_THROW(sampler.sample());

    EXPECT_EQ(node->calls(), 2u);
    EXPECT_EQ(state->syncedCount(), 0u);
    const auto snap = state->snapshot();
    EXPECT_EQ(snap.status, Status::Syncing);
    EXPECT_EQ(snap.progress.current_block, 100u);
}

TEST_F(SamplerTest, FailedQueryBeforeAnySampleLeavesUnknown) {
    node->push(FakeNodeClient::failure());
    sampler.sample();

    EXPECT_EQ(state->syncedCount(), 0u);
    EXPECT_EQ(state->snapshot().status, Status::Unknown);
}

TEST_F(SamplerTest, LatestSyncingSampleWins) {
    node->push(FakeNodeClient::syncing(10, 50));
    node->push(FakeNodeClient::syncing(20, 51));
    sampler.sample();
    sampler.sample();

    EXPECT_EQ(state->snapshot().progress.current_block, 20u);
    EXPECT_EQ(state->snapshot().progress.highest_block, 51u);
}

TEST(SamplerConstructionTest, RejectsMissingCollaborators) {
    EXPECT_THROW(Sampler(nullptr, std::make_shared<SyncState>()), std::invalid_argument);
    EXPECT_THROW(Sampler(std::make_shared<FakeNodeClient>(), nullptr), std::invalid_argument);
}
