// ============================================================================
// METRICS AND METHOD REGISTRY UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <streamrpc/core/admission/method_registry.hpp>
#include <streamrpc/core/metrics/registry.hpp>

using namespace StreamRpc;

// ============================================================================
// METRIC REGISTRY
// ============================================================================

TEST(MetricRegistry, SameNameSameCounters) {
    auto& registry = MetricRegistry::getInstance();
    Metrics& a = registry.getMetrics("unit-test-service");
    Metrics& b = registry.getMetrics("unit-test-service");
    EXPECT_EQ(&a, &b);
}

TEST(MetricRegistry, SnapshotReflectsCounters) {
    auto& registry = MetricRegistry::getInstance();
    registry.reset();

    Metrics& m = registry.getMetrics(MetricNames::PAYMENT);
    m.total_calls_started.fetch_add(3);
    m.total_calls_completed.fetch_add(2);
    m.total_calls_failed.fetch_add(1);

    auto snap = registry.getSnapshot(MetricNames::PAYMENT);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->total_calls_started, 3u);
    EXPECT_EQ(snap->total_calls_completed, 2u);
    EXPECT_EQ(snap->total_calls_failed, 1u);
}

TEST(MetricRegistry, UnknownNameHasNoSnapshot) {
    EXPECT_FALSE(MetricRegistry::getInstance().getSnapshot("never-registered").has_value());
}

TEST(MetricRegistry, LatencyTracksTotalAndMax) {
    auto& registry = MetricRegistry::getInstance();
    registry.reset();

    Metrics& m = registry.getMetrics(MetricNames::HISTORY);
    registry.recordLatency(MetricNames::HISTORY, 1000);
    registry.recordLatency(MetricNames::HISTORY, 5000);
    registry.recordLatency(MetricNames::HISTORY, 3000);
    m.total_calls_completed.fetch_add(3);

    auto snap = registry.getSnapshot(MetricNames::HISTORY);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->total_processing_time_ns, 9000u);
    EXPECT_EQ(snap->max_processing_time_ns, 5000u);
    EXPECT_EQ(snap->get_avg_latency_ns(), 3000u);
}

TEST(MetricRegistry, ResetZeroesEverything) {
    auto& registry = MetricRegistry::getInstance();
    registry.getMetrics(MetricNames::CHAT).total_messages_sent.fetch_add(7);
    registry.reset();
    auto snap = registry.getSnapshot(MetricNames::CHAT);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->total_messages_sent, 0u);
    EXPECT_EQ(snap->get_avg_latency_ns(), 0u);
}

// ============================================================================
// METHOD REGISTRY
// ============================================================================

TEST(MethodRegistry, DefaultsResolveEveryCallKind) {
    const auto& registry = MethodRegistry::defaults();
    EXPECT_EQ(registry.entries().size(), 3u);
    EXPECT_EQ(registry.resolve(Routes::PROCESS_PAYMENT), CallKind::Unary);
    EXPECT_EQ(registry.resolve(Routes::TRANSACTION_HISTORY), CallKind::ServerStream);
    EXPECT_EQ(registry.resolve(Routes::CHAT), CallKind::BidiStream);
}

TEST(MethodRegistry, UnknownRouteDoesNotResolve) {
    const auto& registry = MethodRegistry::defaults();
    EXPECT_FALSE(registry.resolve("/streamrpc.v1.PaymentService/Refund").has_value());
    EXPECT_EQ(registry.find(""), nullptr);
}

TEST(MethodRegistry, EntryCarriesMetricName) {
    const auto* entry = MethodRegistry::defaults().find(Routes::CHAT);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->metricName, MetricNames::CHAT);
}

TEST(MethodRegistry, DuplicateRouteIsRejected) {
    MethodRegistry registry;
    EXPECT_TRUE(registry.add("/svc/A", CallKind::Unary, MetricNames::PAYMENT));
    EXPECT_FALSE(registry.add("/svc/A", CallKind::BidiStream, MetricNames::CHAT));
    EXPECT_EQ(registry.resolve("/svc/A"), CallKind::Unary);
}
