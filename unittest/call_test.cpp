// ============================================================================
// CALL LIFECYCLE UNIT TESTS
// ============================================================================
// Pending -> Active -> Completed | Failed | Cancelled, deadlines, worker pool
// ============================================================================

#include <gtest/gtest.h>
#include <streamrpc/core/calls/call.hpp>
#include <streamrpc/core/errors/rpc_error.hpp>
#include <streamrpc/core/utils/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace StreamRpc;

// ============================================================================
// STATE MACHINE
// ============================================================================

TEST(Call, StartsPendingWithUniqueId) {
    Call a(CallKind::Unary, "/svc/A");
    Call b(CallKind::ServerStream, "/svc/B");

    EXPECT_EQ(a.state(), CallState::Pending);
    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(b.kind(), CallKind::ServerStream);
    EXPECT_EQ(b.method(), "/svc/B");
    EXPECT_FALSE(a.isTerminal());
}

TEST(Call, NormalCompletion) {
    Call call(CallKind::Unary, "/svc/A");
    EXPECT_TRUE(call.activate());
    EXPECT_EQ(call.state(), CallState::Active);
    EXPECT_TRUE(call.complete());
    EXPECT_EQ(call.state(), CallState::Completed);
    EXPECT_TRUE(call.isTerminal());
    EXPECT_FALSE(call.error().has_value());
}

TEST(Call, TerminalStatesAreSticky) {
    Call call(CallKind::Unary, "/svc/A");
    call.activate();
    ASSERT_TRUE(call.fail(ErrorCode::ProcessingFailure));

    EXPECT_FALSE(call.complete());
    EXPECT_FALSE(call.cancel());
    EXPECT_FALSE(call.fail(ErrorCode::Timeout));
    EXPECT_FALSE(call.activate());

    EXPECT_EQ(call.state(), CallState::Failed);
    EXPECT_EQ(call.error(), ErrorCode::ProcessingFailure);
}

TEST(Call, CancelFromPendingPreventsActivation) {
    Call call(CallKind::ServerStream, "/svc/B");
    EXPECT_TRUE(call.cancel());
    EXPECT_TRUE(call.isCancelled());
    EXPECT_FALSE(call.activate());
}

TEST(Call, CompleteRequiresActive) {
    Call call(CallKind::Unary, "/svc/A");
    EXPECT_FALSE(call.complete());
    EXPECT_EQ(call.state(), CallState::Pending);
}

// ============================================================================
// DEADLINES
// ============================================================================

TEST(Call, BudgetCountsFromAdmission) {
    Call call(CallKind::Unary, "/svc/A");
    EXPECT_FALSE(call.deadline().has_value());
    EXPECT_EQ(call.deadlineAfter(std::chrono::seconds(3)), call.admittedAt() + std::chrono::seconds(3));
    EXPECT_LE(call.admittedAt(), Call::Clock::now());
}

TEST(Call, BudgetIsCappedByDeadline) {
    auto deadline = Call::Clock::now() + std::chrono::milliseconds(100);
    Call call(CallKind::Unary, "/svc/A", deadline);
    EXPECT_EQ(call.deadlineAfter(std::chrono::seconds(10)), deadline);
    EXPECT_EQ(call.deadlineAfter(std::chrono::milliseconds(1)), call.admittedAt() + std::chrono::milliseconds(1));
}

TEST(Call, ExpireOnlyFromPending) {
    Call queued(CallKind::Unary, "/svc/A");
    EXPECT_TRUE(queued.expire());
    EXPECT_EQ(queued.state(), CallState::Failed);
    EXPECT_EQ(queued.error(), ErrorCode::Timeout);
    EXPECT_FALSE(queued.activate());
    EXPECT_FALSE(queued.expire());

    Call running(CallKind::Unary, "/svc/A");
    ASSERT_TRUE(running.activate());
    EXPECT_FALSE(running.expire());
    EXPECT_EQ(running.state(), CallState::Active);
}

TEST(Call, FailFromPendingRecordsCode) {
    Call call(CallKind::Unary, "/svc/A");
    EXPECT_TRUE(call.fail(ErrorCode::InvalidRequest));
    EXPECT_EQ(call.error(), ErrorCode::InvalidRequest);
    EXPECT_FALSE(call.isCancelled());
}

// ============================================================================
// ERROR TAXONOMY
// ============================================================================

TEST(RpcError, CarriesCode) {
    RpcError error(ErrorCode::StreamProducerFailure, "source broke");
    EXPECT_EQ(error.code(), ErrorCode::StreamProducerFailure);
    EXPECT_STREQ(error.what(), "source broke");
}

TEST(RpcError, SessionLimitIsASessionError) {
    SessionLimitError error("full");
    const RpcError& base = error;
    EXPECT_EQ(base.code(), ErrorCode::SessionError);
}

// ============================================================================
// THREAD POOL
// ============================================================================

TEST(ThreadPool, RunsSubmittedTasks) {
    ThreadPool pool(4);
    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.submit([&done] { done.fetch_add(1); }));
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 100);
}

TEST(ThreadPool, RefusesTasksAfterShutdown) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_FALSE(pool.submit([] {}));
}

TEST(ThreadPool, ShutdownIsIdempotent) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_NO_THROW(pool.shutdown());
    EXPECT_EQ(pool.size(), 2u);
}
