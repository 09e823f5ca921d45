// =============================================================================
// qzbulk - Exit Status Aggregation Property Tests
// =============================================================================
// The run status is the most severe status reported by the controller, any
// worker or the archive writer: -1 > 100 > 2 > 1 > 0, independent of the
// order in which reports arrive.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <vector>

#include "qzb/common/types.h"

namespace qzb::test {

namespace gen {

rc::Gen<ExitStatus> exitStatus() {
    return rc::gen::element(ExitStatus::kInterrupted, ExitStatus::kSuccess,
                            ExitStatus::kTransferFailed, ExitStatus::kFatal,
                            ExitStatus::kNoClient);
}

}  // namespace gen

// =============================================================================
// Unit Tests
// =============================================================================

TEST(ExitStatusTest, Priority) {
    EXPECT_EQ(aggregate(ExitStatus::kSuccess, ExitStatus::kTransferFailed),
              ExitStatus::kTransferFailed);
    EXPECT_EQ(aggregate(ExitStatus::kTransferFailed, ExitStatus::kFatal), ExitStatus::kFatal);
    EXPECT_EQ(aggregate(ExitStatus::kFatal, ExitStatus::kNoClient), ExitStatus::kNoClient);
    EXPECT_EQ(aggregate(ExitStatus::kNoClient, ExitStatus::kInterrupted),
              ExitStatus::kInterrupted);
}

TEST(ExitStatusTest, EmptySetIsSuccess) {
    std::vector<ExitStatus> none;
    EXPECT_EQ(aggregateAll(none), ExitStatus::kSuccess);
}

TEST(ExitStatusTest, ProcessExitCodes) {
    EXPECT_EQ(toExitCode(ExitStatus::kSuccess), 0);
    EXPECT_EQ(toExitCode(ExitStatus::kTransferFailed), 1);
    EXPECT_EQ(toExitCode(ExitStatus::kFatal), 2);
    EXPECT_EQ(toExitCode(ExitStatus::kNoClient), 100);
    EXPECT_EQ(toExitCode(ExitStatus::kInterrupted), -1);
}

TEST(ExitStatusTest, MixedReports) {
    EXPECT_EQ(aggregateAll({ExitStatus::kSuccess, ExitStatus::kNoClient, ExitStatus::kFatal,
                            ExitStatus::kTransferFailed}),
              ExitStatus::kNoClient);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(ExitStatusProperty, AggregateIsCommutative, ()) {
    const auto a = *gen::exitStatus();
    const auto b = *gen::exitStatus();
    RC_ASSERT(aggregate(a, b) == aggregate(b, a));
}

RC_GTEST_PROP(ExitStatusProperty, AggregateIsAssociative, ()) {
    const auto a = *gen::exitStatus();
    const auto b = *gen::exitStatus();
    const auto c = *gen::exitStatus();
    RC_ASSERT(aggregate(aggregate(a, b), c) == aggregate(a, aggregate(b, c)));
}

RC_GTEST_PROP(ExitStatusProperty, AggregateIsIdempotent, ()) {
    const auto a = *gen::exitStatus();
    RC_ASSERT(aggregate(a, a) == a);
}

RC_GTEST_PROP(ExitStatusProperty, InterruptAbsorbsEverything, ()) {
    const auto statuses = *rc::gen::container<std::vector<ExitStatus>>(gen::exitStatus());
    std::vector<ExitStatus> withInterrupt = statuses;
    withInterrupt.push_back(ExitStatus::kInterrupted);
    RC_ASSERT(aggregateAll(withInterrupt) == ExitStatus::kInterrupted);
}

RC_GTEST_PROP(ExitStatusProperty, ResultIsMostSevereAndOrderIndependent, ()) {
    auto statuses = *rc::gen::nonEmpty(rc::gen::container<std::vector<ExitStatus>>(gen::exitStatus()));
    const ExitStatus folded = aggregateAll(statuses);

    const auto mostSevere = *std::max_element(
        statuses.begin(), statuses.end(),
        [](ExitStatus a, ExitStatus b) { return severity(a) < severity(b); });
    RC_ASSERT(folded == mostSevere);

    std::reverse(statuses.begin(), statuses.end());
    RC_ASSERT(aggregateAll(statuses) == folded);
}

}  // namespace qzb::test
