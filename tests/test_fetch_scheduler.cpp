#include <gtest/gtest.h>
#include "fetch/FetchScheduler.hpp"

class FetchSchedulerTest : public ::testing::Test {
protected:
    std::vector<FetchRequest> dispatched;
    FetchScheduler scheduler{2, [this](const FetchRequest& r) { dispatched.push_back(r); }};

    static FetchRequest children(const std::string& id) {
        return {id, FetchKind::Children};
    }
};

TEST_F(FetchSchedulerTest, DispatchesUpToCapacity) {
    EXPECT_EQ(scheduler.submit(children("a")), FetchScheduler::SubmitResult::Dispatched);
    EXPECT_EQ(scheduler.submit(children("b")), FetchScheduler::SubmitResult::Dispatched);
    EXPECT_EQ(scheduler.submit(children("c")), FetchScheduler::SubmitResult::Queued);

    EXPECT_EQ(dispatched.size(), 2u);
    EXPECT_EQ(scheduler.inFlightCount(), 2u);
    EXPECT_EQ(scheduler.queuedCount(), 1u);
}

TEST_F(FetchSchedulerTest, DuplicateSubmitIsAlreadyPending) {
    scheduler.submit(children("a"));
    auto before = scheduler.outstandingCount();

    EXPECT_EQ(scheduler.submit(children("a")), FetchScheduler::SubmitResult::AlreadyPending);
    EXPECT_EQ(scheduler.outstandingCount(), before);
    EXPECT_EQ(dispatched.size(), 1u);
}

TEST_F(FetchSchedulerTest, DuplicateOfQueuedRequestIsAlreadyPending) {
    scheduler.submit(children("a"));
    scheduler.submit(children("b"));
    scheduler.submit(children("c"));

    EXPECT_EQ(scheduler.submit(children("c")), FetchScheduler::SubmitResult::AlreadyPending);
    EXPECT_EQ(scheduler.queuedCount(), 1u);
}

TEST_F(FetchSchedulerTest, SameTargetDifferentKindIsDistinct) {
    scheduler.submit({"t1", FetchKind::Art});
    EXPECT_EQ(scheduler.submit({"t1", FetchKind::Lyrics}),
              FetchScheduler::SubmitResult::Dispatched);
}

TEST_F(FetchSchedulerTest, CompletionDispatchesQueuedInOrder) {
    scheduler.submit(children("a"));
    scheduler.submit(children("b"));
    scheduler.submit(children("c"));
    scheduler.submit(children("d"));

    auto done = scheduler.complete(children("a"), std::vector<CatalogNode>{});
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->request, children("a"));

    ASSERT_EQ(dispatched.size(), 3u);
    EXPECT_EQ(dispatched[2], children("c"));

    scheduler.complete(children("b"), FetchFailure{"boom"});
    ASSERT_EQ(dispatched.size(), 4u);
    EXPECT_EQ(dispatched[3], children("d"));
    EXPECT_EQ(scheduler.queuedCount(), 0u);
}

TEST_F(FetchSchedulerTest, ResubmitAfterFailureIsAccepted) {
    scheduler.submit(children("a"));
    auto done = scheduler.complete(children("a"), FetchFailure{"timeout"});
    ASSERT_TRUE(done.has_value());
    EXPECT_FALSE(fetchSucceeded(done->result));
    EXPECT_FALSE(scheduler.isPending(children("a")));

    EXPECT_EQ(scheduler.submit(children("a")), FetchScheduler::SubmitResult::Dispatched);
}

TEST_F(FetchSchedulerTest, UnknownCompletionIsDropped) {
    EXPECT_FALSE(scheduler.complete(children("x"), FetchFailure{"?"}).has_value());
}

TEST_F(FetchSchedulerTest, AbandonForgetsEverything) {
    scheduler.submit(children("a"));
    scheduler.submit(children("b"));
    scheduler.submit(children("c"));

    scheduler.abandon();
    EXPECT_EQ(scheduler.outstandingCount(), 0u);

    // Late result for abandoned work is not applied
    EXPECT_FALSE(scheduler.complete(children("a"), std::vector<CatalogNode>{}).has_value());
    EXPECT_EQ(dispatched.size(), 2u);
}

TEST(FetchSchedulerCapacityTest, ZeroCapacityMeansOne) {
    FetchScheduler s(0);
    EXPECT_EQ(s.maxConcurrent(), 1u);
    EXPECT_EQ(s.submit({"a", FetchKind::Children}), FetchScheduler::SubmitResult::Dispatched);
    EXPECT_EQ(s.submit({"b", FetchKind::Children}), FetchScheduler::SubmitResult::Queued);
}

TEST(FetchSchedulerCapacityTest, NeverHoldsDuplicatePairs) {
    FetchScheduler s(1);
    const std::vector<FetchRequest> reqs = {
        {"a", FetchKind::Children}, {"a", FetchKind::Children}, {"b", FetchKind::Art},
        {"a", FetchKind::Children}, {"b", FetchKind::Art}, {"b", FetchKind::Lyrics},
    };
    for (auto& r : reqs) s.submit(r);
    EXPECT_EQ(s.outstandingCount(), 3u);
}
