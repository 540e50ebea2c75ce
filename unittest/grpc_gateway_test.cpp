// ============================================================================
// GRPC GATEWAY LOOPBACK TESTS
// ============================================================================
// Full server on 127.0.0.1 with an ephemeral port, driven through RpcClient
// ============================================================================

#include <gtest/gtest.h>
#include <streamrpc/core/admission/method_registry.hpp>
#include <streamrpc/core/chat/session_manager.hpp>
#include <streamrpc/core/history/history_stream.hpp>
#include <streamrpc/core/history/in_memory_transaction_store.hpp>
#include <streamrpc/core/payment/payment_gateway.hpp>
#include <streamrpc/core/payment/payment_handler.hpp>
#include <streamrpc/core/utils/thread_pool.hpp>
#include <streamrpc/microservice/codec.hpp>
#include <streamrpc/microservice/grpc_gateway.hpp>
#include <streamrpc/microservice/rpc_client.hpp>
#include "test_support.hpp"

#include <grpcpp/generic/generic_stub.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace StreamRpc;
using namespace streamrpc::microservice;
using StreamRpc::testing::waitUntil;

namespace {

SessionManager::Options chatOptions(size_t maxSessions = 16) {
    SessionManager::Options options;
    options.outboundQueueDepth = 8;
    options.maxSessions = maxSessions;
    options.maxMessageBytes = 512;
    options.maxPendingPerSource = 64;
    options.drainTimeout = std::chrono::milliseconds(2000);
    return options;
}

// Every server-side component wired up the way main() does it
class LoopbackServer {
public:
    explicit LoopbackServer(SessionManager::Options options = chatOptions(), size_t callWorkers = 4,
                            std::chrono::milliseconds paymentTimeout = std::chrono::milliseconds(2000))
        : paymentGateway_(1000, std::chrono::milliseconds(0)),
          paymentExecutor_(2),
          callPool_(callWorkers),
          payment_(paymentGateway_, paymentExecutor_, paymentOptions(paymentTimeout)),
          history_(store_),
          sessions_(options) {
        store_.loadFromFile("unittest/data/transactions.csv");

        GrpcConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.shutdown_grace = std::chrono::milliseconds(1000);
        gateway_ = std::make_unique<GrpcGateway>(
            config, ServiceHandlers{payment_, history_, sessions_, callPool_});
    }

    ~LoopbackServer() {
        gateway_->stop();
        callPool_.shutdown();
        paymentExecutor_.shutdown();
    }

    bool start() { return gateway_->start(); }

    std::string target() const {
        return "127.0.0.1:" + std::to_string(gateway_->selected_port());
    }

    RpcClient client() {
        return RpcClient(RpcClient::makeChannel(target()));
    }

    SessionManager& sessions() { return sessions_; }
    ThreadPool& callPool() { return callPool_; }
    GrpcGateway& gateway() { return *gateway_; }

private:
    static PaymentHandler::Options paymentOptions(std::chrono::milliseconds timeout) {
        PaymentHandler::Options options;
        options.timeout = timeout;
        options.maxAmount = 100000;
        return options;
    }

    InMemoryTransactionStore store_;
    SimulatedPaymentGateway paymentGateway_;
    ThreadPool paymentExecutor_;
    ThreadPool callPool_;
    PaymentHandler payment_;
    HistoryStreamHandler history_;
    SessionManager sessions_;
    std::unique_ptr<GrpcGateway> gateway_;
};

// Holds one call-pool worker until released
class WorkerBlocker {
public:
    explicit WorkerBlocker(ThreadPool& pool) {
        auto released = released_.get_future().share();
        submitted_ = pool.submit([released] { released.wait(); });
    }
    ~WorkerBlocker() { release(); }
    bool submitted() const { return submitted_; }
    void release() {
        if (!done_) {
            done_ = true;
            released_.set_value();
        }
    }

private:
    std::promise<void> released_;
    bool submitted_ = false;
    bool done_ = false;
};

PaymentRequest smallPayment() {
    PaymentRequest request;
    request.payer_account = "A1";
    request.amount = 100;
    request.currency = "USD";
    return request;
}

bool nextOk(grpc::CompletionQueue& cq) {
    void* tag = nullptr;
    bool ok = false;
    return cq.Next(&tag, &ok) && ok;
}

} // anonymous namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST(GrpcGateway, StartsOnEphemeralPortAndStops) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    EXPECT_TRUE(server.gateway().is_running());
    EXPECT_GT(server.gateway().selected_port(), 0);
    EXPECT_EQ(server.gateway().get_address(),
              "127.0.0.1:" + std::to_string(server.gateway().selected_port()));

    server.gateway().stop();
    EXPECT_FALSE(server.gateway().is_running());
}

// ============================================================================
// UNARY
// ============================================================================

TEST(GrpcGateway, PaymentApproved) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    PaymentRequest request;
    request.payer_account = "A1";
    request.amount = 100;
    request.currency = "USD";

    PaymentResponse response = client.processPayment(request);
    EXPECT_EQ(response.status, PaymentStatus::APPROVED);
    EXPECT_FALSE(response.payment_id.empty());
    EXPECT_GT(response.processed_at_ms, 0);
}

TEST(GrpcGateway, PaymentAboveApprovalLimitIsDeclined) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    PaymentRequest request;
    request.payer_account = "A1";
    request.amount = 5000;
    request.currency = "EUR";
    EXPECT_EQ(client.processPayment(request).status, PaymentStatus::DECLINED);
}

TEST(GrpcGateway, InvalidPaymentIsInvalidArgument) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    PaymentRequest request;
    request.payer_account = "A1";
    request.amount = -1;
    request.currency = "USD";

    try {
        client.processPayment(request);
        FAIL() << "negative amount must be rejected";
    } catch (const ClientCallError& e) {
        EXPECT_EQ(e.statusCode(), grpc::StatusCode::INVALID_ARGUMENT);
        EXPECT_EQ(e.code(), ErrorCode::InvalidRequest);
    }
}

TEST(GrpcGateway, UndecodablePayloadIsInvalidArgument) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    const std::string garbage("\xff\xff\xff\xff", 4);
    grpc::Slice slice(garbage);
    grpc::ByteBuffer request(&slice, 1);
    grpc::ByteBuffer response;

    grpc::Status status = client.callUnary(std::string(Routes::PROCESS_PAYMENT), request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(GrpcGateway, PaymentWithoutRequestMessageIsInvalidArgument) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());

    grpc::GenericStub stub(RpcClient::makeChannel(server.target()));
    grpc::ClientContext ctx;
    grpc::CompletionQueue cq;
    auto call = stub.PrepareCall(&ctx, std::string(Routes::PROCESS_PAYMENT), &cq);
    ASSERT_TRUE(call);

    // Half-close straight away: the server never sees a request
    call->StartCall(reinterpret_cast<void*>(1));
    EXPECT_TRUE(nextOk(cq));
    call->WritesDone(reinterpret_cast<void*>(2));
    nextOk(cq);

    grpc::Status status;
    call->Finish(&status, reinterpret_cast<void*>(3));
    EXPECT_TRUE(nextOk(cq));
    cq.Shutdown();
    void* tag = nullptr;
    bool ok = false;
    while (cq.Next(&tag, &ok)) {
    }

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(GrpcGateway, PaymentTimesOutWhileWorkersAreBusy) {
    LoopbackServer server(chatOptions(), 1, std::chrono::milliseconds(200));
    ASSERT_TRUE(server.start());
    WorkerBlocker blocker(server.callPool());
    ASSERT_TRUE(blocker.submitted());

    // No client deadline: only the server's own budget can end the call
    RpcClient client = server.client();
    auto start = std::chrono::steady_clock::now();
    try {
        client.processPayment(smallPayment());
        FAIL() << "payment queued behind a busy pool must time out";
    } catch (const ClientCallError& e) {
        EXPECT_EQ(e.statusCode(), grpc::StatusCode::DEADLINE_EXCEEDED);
        EXPECT_EQ(e.code(), ErrorCode::Timeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

    // Once a worker frees up, later payments go through normally
    blocker.release();
    EXPECT_EQ(client.processPayment(smallPayment()).status, PaymentStatus::APPROVED);
}

TEST(GrpcGateway, UnknownMethodIsUnimplemented) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    grpc::ByteBuffer request = codec::toByteBuffer(streamrpc::v1::PaymentRequest());
    grpc::ByteBuffer response;
    grpc::Status status = client.callUnary("/streamrpc.v1.PaymentService/Refund", request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNIMPLEMENTED);
}

// ============================================================================
// SERVER STREAM
// ============================================================================

TEST(GrpcGateway, HistoryStreamsRecordsInOrder) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    HistoryRequest request;
    request.account_id = "A1";
    auto records = client.getTransactionHistory(request);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].transaction_id, "t1");
    EXPECT_EQ(records[1].description, "second, with comma");
    EXPECT_EQ(records[2].transaction_id, "t3");
}

TEST(GrpcGateway, HistoryForUnknownAccountIsEmptyAndOk) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    HistoryRequest request;
    request.account_id = "nobody";
    EXPECT_TRUE(client.getTransactionHistory(request).empty());
}

TEST(GrpcGateway, HistoryWithoutAccountIsInvalidArgument) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    size_t received = 0;
    grpc::Status status = client.getTransactionHistory(HistoryRequest{}, [&](const TransactionRecord&) {
        ++received;
        return true;
    });
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(received, 0u);
}

TEST(GrpcGateway, HistoryClientCanStopEarly) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    HistoryRequest request;
    request.account_id = "A1";
    size_t received = 0;
    grpc::Status status = client.getTransactionHistory(request, [&](const TransactionRecord&) {
        return ++received < 1;
    });
    EXPECT_EQ(status.error_code(), grpc::StatusCode::CANCELLED);
    EXPECT_EQ(received, 1u);
}

// ============================================================================
// BIDI CHAT
// ============================================================================

TEST(GrpcGateway, ChatBroadcastsToOtherClients) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    auto alice = client.openChat();
    auto bob = client.openChat();
    auto carol = client.openChat();
    ASSERT_TRUE(waitUntil([&] { return server.sessions().sessionCount() == 3; }));

    ASSERT_TRUE(alice->send("alice", "hello"));

    for (auto* receiver : {bob.get(), carol.get()}) {
        auto message = receiver->receive(std::chrono::milliseconds(2000));
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(message->sender, "alice");
        EXPECT_EQ(message->text, "hello");
        EXPECT_EQ(message->sequence, 1u);
        EXPECT_NE(message->session_id, 0u);
    }
    EXPECT_FALSE(alice->receive(std::chrono::milliseconds(100)).has_value());

    EXPECT_TRUE(alice->finish().ok());
    EXPECT_TRUE(bob->finish().ok());
    EXPECT_TRUE(carol->finish().ok());
}

TEST(GrpcGateway, ChatKeepsPerSenderOrder) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    auto sender = client.openChat();
    auto receiver = client.openChat();
    ASSERT_TRUE(waitUntil([&] { return server.sessions().sessionCount() == 2; }));

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(sender->send("s", std::to_string(i)));
    }
    for (int i = 0; i < 20; ++i) {
        auto message = receiver->receive(std::chrono::milliseconds(2000));
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(message->text, std::to_string(i));
        EXPECT_EQ(message->sequence, static_cast<uint64_t>(i + 1));
    }
}

TEST(GrpcGateway, ChatHalfCloseEndsCleanly) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    auto chat = client.openChat();
    ASSERT_TRUE(waitUntil([&] { return server.sessions().sessionCount() == 1; }));

    ASSERT_TRUE(chat->closeSend());
    EXPECT_TRUE(chat->finish().ok());
    EXPECT_TRUE(waitUntil([&] { return server.sessions().sessionCount() == 0; }));
}

TEST(GrpcGateway, ChatBeyondSessionLimitIsResourceExhausted) {
    LoopbackServer server(chatOptions(1));
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    auto first = client.openChat();
    ASSERT_TRUE(waitUntil([&] { return server.sessions().sessionCount() == 1; }));

    auto second = client.openChat();
    grpc::Status status = second->finish();
    EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(server.sessions().sessionCount(), 1u);
}

TEST(GrpcGateway, StopCancelsOpenChats) {
    LoopbackServer server;
    ASSERT_TRUE(server.start());
    RpcClient client = server.client();

    auto chat = client.openChat();
    ASSERT_TRUE(waitUntil([&] { return server.sessions().sessionCount() == 1; }));

    server.gateway().stop();
    EXPECT_EQ(chat->finish().error_code(), grpc::StatusCode::CANCELLED);
}

// ============================================================================
// STATUS MAPPING
// ============================================================================

TEST(Codec, ErrorCodesMapToStatusCodes) {
    EXPECT_EQ(codec::toStatusCode(ErrorCode::InvalidRequest), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(codec::toStatusCode(ErrorCode::ProcessingFailure), grpc::StatusCode::ABORTED);
    EXPECT_EQ(codec::toStatusCode(ErrorCode::StreamProducerFailure), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(codec::toStatusCode(ErrorCode::SessionError), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(codec::toStatusCode(ErrorCode::Timeout), grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(codec::toStatusCode(ErrorCode::Cancelled), grpc::StatusCode::CANCELLED);
}

TEST(Codec, StatusCodesMapBack) {
    for (auto code : {ErrorCode::InvalidRequest, ErrorCode::ProcessingFailure,
                      ErrorCode::StreamProducerFailure, ErrorCode::SessionError,
                      ErrorCode::Timeout, ErrorCode::Cancelled}) {
        EXPECT_EQ(codec::toErrorCode(codec::toStatusCode(code)), code);
    }
    EXPECT_FALSE(codec::toErrorCode(grpc::StatusCode::OK).has_value());
    EXPECT_FALSE(codec::toErrorCode(grpc::StatusCode::UNIMPLEMENTED).has_value());
}

TEST(Codec, SessionLimitIsResourceExhausted) {
    grpc::Status status = codec::toStatus(SessionLimitError("full"));
    EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(status.error_message(), "full");
}

TEST(Codec, CleanCloseIsOk) {
    EXPECT_TRUE(codec::toStatus(std::nullopt, "drained").ok());
    EXPECT_EQ(codec::toStatus(ErrorCode::Timeout, "drain").error_code(),
              grpc::StatusCode::DEADLINE_EXCEEDED);
}

TEST(Codec, UnknownPaymentStatusIsRejected) {
    streamrpc::v1::PaymentResponse response;
    response.set_payment_id("p1");
    response.set_status("pending");
    EXPECT_THROW(codec::fromProto(response), RpcError);

    response.set_status("approved");
    EXPECT_EQ(codec::fromProto(response).status, PaymentStatus::APPROVED);
}

TEST(Codec, ByteBufferCarriesChatMessage) {
    ChatMessage message;
    message.session_id = 7;
    message.sender = "alice";
    message.text = "hi";
    message.sequence = 3;
    message.timestamp_ms = 1234;

    streamrpc::v1::ChatMessage decoded;
    ASSERT_TRUE(codec::fromByteBuffer(codec::toByteBuffer(codec::toProto(message)), decoded));
    ChatMessage back = codec::fromProto(decoded);
    EXPECT_EQ(back.session_id, 7u);
    EXPECT_EQ(back.sender, "alice");
    EXPECT_EQ(back.sequence, 3u);
}
