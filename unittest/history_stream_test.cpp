// ============================================================================
// HISTORY STREAM UNIT TESTS
// ============================================================================
// Server-stream handler over the in-memory transaction store
// ============================================================================

#include <gtest/gtest.h>
#include <streamrpc/core/history/history_stream.hpp>
#include <streamrpc/core/history/in_memory_transaction_store.hpp>
#include "test_support.hpp"

#include <stdexcept>
#include <thread>

using namespace StreamRpc;
using StreamRpc::testing::CollectingSink;

namespace {

TransactionRecord makeRecord(const std::string& id, const std::string& account, int64_t amount) {
    TransactionRecord record;
    record.transaction_id = id;
    record.account_id = account;
    record.amount = amount;
    record.currency = "USD";
    record.timestamp_ms = 1000;
    return record;
}

// Yields `good` records, then throws
class FailingSource : public TransactionSource {
public:
    explicit FailingSource(size_t good) : good_(good) {}

    std::unique_ptr<TransactionCursor> open(const std::string& accountId) override {
        class Cursor : public TransactionCursor {
        public:
            Cursor(std::string account, size_t good) : account_(std::move(account)), good_(good) {}
            std::optional<TransactionRecord> next() override {
                if (served_ >= good_) {
                    throw std::runtime_error("storage connection lost");
                }
                ++served_;
                return makeRecord("f" + std::to_string(served_), account_, 1);
            }
        private:
            std::string account_;
            size_t good_;
            size_t served_ = 0;
        };
        return std::make_unique<Cursor>(accountId, good_);
    }
    const char* name() const override { return "FailingSource"; }

private:
    size_t good_;
};

class UnavailableSource : public TransactionSource {
public:
    std::unique_ptr<TransactionCursor> open(const std::string&) override {
        throw std::runtime_error("source offline");
    }
    const char* name() const override { return "UnavailableSource"; }
};

ErrorCode streamError(HistoryStreamHandler& handler, Call& call, const HistoryRequest& request,
                      RecordSink& sink) {
    try {
        handler.stream(call, request, sink);
    } catch (const RpcError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected RpcError";
    return ErrorCode::ProcessingFailure;
}

HistoryRequest requestFor(const std::string& account, uint32_t limit = 0) {
    HistoryRequest request;
    request.account_id = account;
    request.limit = limit;
    return request;
}

} // anonymous namespace

// ============================================================================
// STORE LOADING
// ============================================================================

TEST(InMemoryTransactionStore, LoadsCsvAndSkipsMalformedLines) {
    InMemoryTransactionStore store;
    ASSERT_TRUE(store.loadFromFile("unittest/data/transactions.csv"));

    EXPECT_EQ(store.recordCount("A1"), 3u);
    EXPECT_EQ(store.recordCount("C3"), 1u);
    EXPECT_EQ(store.recordCount("Z9"), 0u);
    EXPECT_EQ(store.accountCount(), 2u);
}

TEST(InMemoryTransactionStore, MissingFileReportsFailure) {
    InMemoryTransactionStore store;
    EXPECT_FALSE(store.loadFromFile("unittest/data/does_not_exist.csv"));
    EXPECT_EQ(store.accountCount(), 0u);
}

TEST(InMemoryTransactionStore, OpenCursorIsASnapshot) {
    InMemoryTransactionStore store;
    store.add(makeRecord("t1", "A1", 1));
    auto cursor = store.open("A1");

    store.add(makeRecord("t2", "A1", 2));

    ASSERT_TRUE(cursor->next().has_value());
    EXPECT_FALSE(cursor->next().has_value());
    EXPECT_EQ(store.recordCount("A1"), 2u);
}

// ============================================================================
// STREAMING
// ============================================================================

TEST(HistoryStream, StreamsAccountRecordsInSourceOrder) {
    InMemoryTransactionStore store;
    ASSERT_TRUE(store.loadFromFile("unittest/data/transactions.csv"));
    HistoryStreamHandler handler(store);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    call.activate();
    EXPECT_EQ(handler.stream(call, requestFor("A1"), sink), 3u);

    ASSERT_EQ(sink.records.size(), 3u);
    EXPECT_EQ(sink.records[0].transaction_id, "t1");
    EXPECT_EQ(sink.records[1].transaction_id, "t2");
    EXPECT_EQ(sink.records[1].amount, -40);
    EXPECT_EQ(sink.records[1].description, "second, with comma");
    EXPECT_EQ(sink.records[2].transaction_id, "t3");
}

TEST(HistoryStream, UnknownAccountIsAnEmptyStream) {
    InMemoryTransactionStore store;
    HistoryStreamHandler handler(store);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    EXPECT_EQ(handler.stream(call, requestFor("nobody"), sink), 0u);
    EXPECT_TRUE(sink.records.empty());
}

TEST(HistoryStream, EmptyAccountIsInvalid) {
    InMemoryTransactionStore store;
    HistoryStreamHandler handler(store);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    EXPECT_EQ(streamError(handler, call, requestFor(""), sink), ErrorCode::InvalidRequest);
}

TEST(HistoryStream, LimitCapsRecordCount) {
    InMemoryTransactionStore store;
    for (int i = 0; i < 10; ++i) {
        store.add(makeRecord("t" + std::to_string(i), "A1", i));
    }
    HistoryStreamHandler handler(store);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    EXPECT_EQ(handler.stream(call, requestFor("A1", 4), sink), 4u);
    EXPECT_EQ(sink.records.back().transaction_id, "t3");
}

TEST(HistoryStream, RepeatedCallsRequeryFromScratch) {
    InMemoryTransactionStore store;
    store.add(makeRecord("t1", "A1", 1));
    HistoryStreamHandler handler(store);

    CollectingSink first;
    Call call1(CallKind::ServerStream, "/history");
    handler.stream(call1, requestFor("A1"), first);

    store.add(makeRecord("t2", "A1", 2));

    CollectingSink second;
    Call call2(CallKind::ServerStream, "/history");
    handler.stream(call2, requestFor("A1"), second);

    EXPECT_EQ(first.records.size(), 1u);
    EXPECT_EQ(second.records.size(), 2u);
}

// ============================================================================
// FAILURES
// ============================================================================

TEST(HistoryStream, SourceFailureEndsStreamAfterPartialRecords) {
    FailingSource source(2);
    HistoryStreamHandler handler(source);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    EXPECT_EQ(streamError(handler, call, requestFor("A1"), sink), ErrorCode::StreamProducerFailure);
    EXPECT_EQ(sink.records.size(), 2u);
}

TEST(HistoryStream, UnavailableSourceIsProducerFailure) {
    UnavailableSource source;
    HistoryStreamHandler handler(source);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    EXPECT_EQ(streamError(handler, call, requestFor("A1"), sink), ErrorCode::StreamProducerFailure);
    EXPECT_TRUE(sink.records.empty());
}

TEST(HistoryStream, RefusingSinkCancelsStream) {
    InMemoryTransactionStore store;
    for (int i = 0; i < 5; ++i) {
        store.add(makeRecord("t" + std::to_string(i), "A1", i));
    }
    HistoryStreamHandler handler(store);
    CollectingSink sink(2);

    Call call(CallKind::ServerStream, "/history");
    EXPECT_EQ(streamError(handler, call, requestFor("A1"), sink), ErrorCode::Cancelled);
    EXPECT_EQ(sink.records.size(), 2u);
}

TEST(HistoryStream, CancellationStopsProduction) {
    InMemoryTransactionStore store;
    for (int i = 0; i < 100; ++i) {
        store.add(makeRecord("t" + std::to_string(i), "A1", i));
    }
    HistoryStreamHandler handler(store);
    CollectingSink sink;

    Call call(CallKind::ServerStream, "/history");
    call.activate();
    sink.onWrite = [&call](const TransactionRecord& record) {
        if (record.transaction_id == "t9") {
            call.cancel();
        }
    };

    EXPECT_EQ(streamError(handler, call, requestFor("A1"), sink), ErrorCode::Cancelled);
    EXPECT_EQ(sink.records.size(), 10u);
}
