// ============================================================================
// JOB TABLE & LIFECYCLE UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <egress/core/jobs/job_table.hpp>
#include <egress/core/jobs/job_state.hpp>
#include <chrono>
#include <thread>
#include <vector>

using namespace Egress;
using namespace std::chrono_literals;

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST(JobLifecycle, AllowedTransitions) {
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::STARTING, EgressStatus::ACTIVE));
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::STARTING, EgressStatus::ENDING));
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::STARTING, EgressStatus::ABORTED));
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::ACTIVE, EgressStatus::ENDING));
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::ACTIVE, EgressStatus::ABORTED));
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::ENDING, EgressStatus::COMPLETE));
    EXPECT_TRUE(JobLifecycle::canTransition(EgressStatus::ENDING, EgressStatus::ABORTED));
}

TEST(JobLifecycle, RejectedTransitions) {
    EXPECT_FALSE(JobLifecycle::canTransition(EgressStatus::STARTING, EgressStatus::COMPLETE));
    EXPECT_FALSE(JobLifecycle::canTransition(EgressStatus::ACTIVE, EgressStatus::STARTING));
    EXPECT_FALSE(JobLifecycle::canTransition(EgressStatus::ACTIVE, EgressStatus::COMPLETE));
    EXPECT_FALSE(JobLifecycle::canTransition(EgressStatus::ENDING, EgressStatus::ACTIVE));

    for (auto terminal : {EgressStatus::COMPLETE, EgressStatus::ABORTED}) {
        for (auto next : {EgressStatus::STARTING, EgressStatus::ACTIVE, EgressStatus::ENDING,
                          EgressStatus::COMPLETE, EgressStatus::ABORTED}) {
            EXPECT_FALSE(JobLifecycle::canTransition(terminal, next));
        }
    }
}

TEST(JobLifecycle, StoppableOnlyBeforeEnding) {
    EXPECT_TRUE(JobLifecycle::isStoppable(EgressStatus::STARTING));
    EXPECT_TRUE(JobLifecycle::isStoppable(EgressStatus::ACTIVE));
    EXPECT_FALSE(JobLifecycle::isStoppable(EgressStatus::ENDING));
    EXPECT_FALSE(JobLifecycle::isStoppable(EgressStatus::COMPLETE));
    EXPECT_FALSE(JobLifecycle::isStoppable(EgressStatus::ABORTED));
}

// ============================================================================
// JOB TABLE
// ============================================================================

class JobTableTest : public ::testing::Test {
protected:
    void addJob(const std::string& id, RequestKind kind = RequestKind::TRACK) {
        EgressInfo info;
        info.egress_id = id;
        info.room_id = "room-1";
        info.kind = kind;
        ASSERT_TRUE(table.insert(info, nullptr));
    }

    JobTable table;
};

TEST_F(JobTableTest, InsertRejectsDuplicateId) {
    addJob("EG_1");
    EgressInfo dup;
    dup.egress_id = "EG_1";
    EXPECT_FALSE(table.insert(dup, nullptr));
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(JobTableTest, ActiveSetsStartedAt) {
    addJob("EG_1");
    auto outcome = table.transition("EG_1", EgressStatus::ACTIVE);
    ASSERT_EQ(outcome.result, TransitionResult::APPLIED);
    EXPECT_EQ(outcome.previous, EgressStatus::STARTING);
    EXPECT_GT(outcome.info.started_at, 0);
    EXPECT_EQ(outcome.info.ended_at, 0);
}

TEST_F(JobTableTest, CompleteSetsEndedAtAfterStartedAt) {
    addJob("EG_1");
    table.transition("EG_1", EgressStatus::ACTIVE);
    table.transition("EG_1", EgressStatus::ENDING);
    auto outcome = table.transition("EG_1", EgressStatus::COMPLETE, "ignored");
    ASSERT_EQ(outcome.result, TransitionResult::APPLIED);
    EXPECT_GE(outcome.info.ended_at, outcome.info.started_at);
    EXPECT_TRUE(outcome.info.error.empty());
}

TEST_F(JobTableTest, AbortedCarriesError) {
    addJob("EG_1");
    auto outcome = table.transition("EG_1", EgressStatus::ABORTED, "encoder crashed");
    ASSERT_EQ(outcome.result, TransitionResult::APPLIED);
    EXPECT_EQ(outcome.info.error, "encoder crashed");
    EXPECT_GT(outcome.info.ended_at, 0);
    EXPECT_EQ(outcome.info.started_at, 0);
}

TEST_F(JobTableTest, RejectedTransitionLeavesJobUnchanged) {
    addJob("EG_1");
    bool called = false;
    auto outcome = table.transition("EG_1", EgressStatus::COMPLETE, "",
                                    [&](const EgressInfo&) { called = true; });
    EXPECT_EQ(outcome.result, TransitionResult::REJECTED);
    EXPECT_FALSE(called);
    EXPECT_EQ(table.get("EG_1")->status, EgressStatus::STARTING);
}

TEST_F(JobTableTest, UnknownIdIsNotFound) {
    auto outcome = table.transition("EG_missing", EgressStatus::ACTIVE);
    EXPECT_EQ(outcome.result, TransitionResult::NOT_FOUND);
    EXPECT_FALSE(table.get("EG_missing").has_value());
}

TEST_F(JobTableTest, CallbackSeesAppliedState) {
    addJob("EG_1");
    std::vector<EgressStatus> seen;
    auto record = [&](const EgressInfo& info) { seen.push_back(info.status); };
    table.transition("EG_1", EgressStatus::ACTIVE, "", record);
    table.transition("EG_1", EgressStatus::ENDING, "", record);
    table.transition("EG_1", EgressStatus::ENDING, "", record);
    table.transition("EG_1", EgressStatus::COMPLETE, "", record);
    EXPECT_EQ(seen, (std::vector<EgressStatus>{EgressStatus::ACTIVE, EgressStatus::ENDING,
                                               EgressStatus::COMPLETE}));
}

TEST_F(JobTableTest, EvictOnlyRemovesTerminalJobs) {
    addJob("EG_1");
    addJob("EG_2");
    table.transition("EG_2", EgressStatus::ABORTED, "x");

    EXPECT_EQ(table.evict("EG_1"), nullptr);
    EXPECT_TRUE(table.get("EG_1").has_value());

    table.evict("EG_2");
    EXPECT_FALSE(table.get("EG_2").has_value());
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(JobTableTest, LiveExcludesTerminal) {
    addJob("EG_1");
    addJob("EG_2");
    table.transition("EG_1", EgressStatus::ABORTED, "x");

    EXPECT_EQ(table.list().size(), 2u);
    auto live = table.live();
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].egress_id, "EG_2");
    EXPECT_EQ(table.liveCount(), 1u);
}

TEST_F(JobTableTest, WaitAllTerminalWakesWhenDrained) {
    addJob("EG_1");
    EXPECT_FALSE(table.waitAllTerminal(20ms));

    std::thread finisher([this]() {
        std::this_thread::sleep_for(30ms);
        table.transition("EG_1", EgressStatus::ABORTED, "done");
    });
    EXPECT_TRUE(table.waitAllTerminal(2000ms));
    finisher.join();
}
