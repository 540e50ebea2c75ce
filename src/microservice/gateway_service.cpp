#include <streamrpc/microservice/gateway_service.hpp>
#include <streamrpc/microservice/codec.hpp>
#include <streamrpc/microservice/grpc_chat_stream.hpp>

#include <streamrpc/core/history/history_stream.hpp>
#include <streamrpc/core/metrics/registry.hpp>
#include <streamrpc/core/payment/payment_handler.hpp>
#include <streamrpc/core/utils/clock.hpp>
#include <streamrpc/core/utils/thread_pool.hpp>

#include <grpcpp/alarm.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace streamrpc::microservice {

using StreamRpc::Call;
using StreamRpc::CallKind;
using StreamRpc::ErrorCode;
using StreamRpc::RpcError;

namespace {

// gRPC reports "no deadline" as a far-future time point
std::optional<Call::Clock::time_point> steadyDeadline(const grpc::GenericCallbackServerContext& ctx) {
    auto left = ctx.deadline() - std::chrono::system_clock::now();
    if (left > std::chrono::hours(24 * 365)) {
        return std::nullopt;
    }
    return Call::Clock::now() + std::chrono::duration_cast<Call::Clock::duration>(left);
}

/**
 * @brief Base reactor for calls that read one request and run as a pool task
 *
 * Reads the request, hands execute() to the call pool, then finishes with
 * the single response (if any) or the mapped error status.
 *
 * The reactor is reference counted: gRPC's OnDone, a queued pool task and a
 * pending alarm each hold one reference, and the last one deletes it.
 */
class PooledCallReactor : public grpc::ServerGenericBidiReactor {
public:
    PooledCallReactor(grpc::GenericCallbackServerContext* ctx, ServiceHandlers& handlers,
                      CallKind kind, std::string_view metricName)
        : handlers_(handlers),
          call_(kind, ctx->method(), steadyDeadline(*ctx)),
          metrics_(StreamRpc::MetricRegistry::getInstance().getMetrics(metricName)),
          metric_name_(metricName),
          peer_(ctx->peer()),
          started_ns_(StreamRpc::Clock::now_ns()),
          ctx_(ctx) {
        metrics_.total_calls_started.fetch_add(1, std::memory_order_relaxed);
        metrics_.active_calls.fetch_add(1, std::memory_order_relaxed);
        StartRead(&request_);
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            // A cancelled call also ends the read; a bare half-close does not
            if (call_.isCancelled() || ctx_->IsCancelled()) {
                call_.cancel();
                complete(grpc::Status(grpc::StatusCode::CANCELLED, "call ended before a request arrived"));
            } else {
                call_.fail(ErrorCode::InvalidRequest);
                complete(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request message missing"));
            }
            return;
        }
        metrics_.total_messages_received.fetch_add(1, std::memory_order_relaxed);
        refs_.fetch_add(1, std::memory_order_relaxed);
        if (!handlers_.callPool.submit([this] { run(); unref(); })) {
            unref();
            call_.fail(ErrorCode::Cancelled);
            complete(grpc::Status(grpc::StatusCode::UNAVAILABLE, "server is shutting down"));
        }
    }

    void OnCancel() override {
        if (call_.cancel()) {
            spdlog::info("[{}] call {} from {} cancelled by client", metric_name_, call_.id(), peer_);
        }
    }

    void OnDone() override {
        unref();
    }

protected:
    /**
     * @brief Fail the call with DEADLINE_EXCEEDED if no pool thread has
     *        started it by the given time
     */
    void armQueueDeadline(Call::Clock::time_point deadline) {
        auto wallDeadline = std::chrono::system_clock::now() +
            std::chrono::duration_cast<std::chrono::system_clock::duration>(deadline - Call::Clock::now());
        refs_.fetch_add(1, std::memory_order_relaxed);
        alarm_armed_ = true;
        queue_alarm_.Set(wallDeadline, [this](bool fired) {
            if (fired && call_.expire()) {
                spdlog::warn("[{}] call {} from {} expired waiting for a worker ({} queued)",
                             metric_name_, call_.id(), peer_, handlers_.callPool.getPendingTasks());
                complete(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED,
                                      "call timed out waiting for a worker"));
            }
            unref();
        });
    }

    /**
     * @brief Run the handler on a pool thread
     * @return Status for a clean end; throw RpcError for a failure
     */
    virtual grpc::Status execute(const grpc::ByteBuffer& request) = 0;

    template<typename Message>
    void decodeRequest(const grpc::ByteBuffer& buffer, Message& message) {
        if (!codec::fromByteBuffer(buffer, message)) {
            throw RpcError(ErrorCode::InvalidRequest,
                           "malformed " + message.GetTypeName());
        }
    }

    ServiceHandlers& handlers_;
    Call call_;
    StreamRpc::Metrics& metrics_;
    std::optional<grpc::ByteBuffer> response_;    // single reply for unary calls

private:
    void unref() {
        if (refs_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            delete this;
        }
    }

    void run() {
        if (!call_.activate() && !call_.isCancelled()) {
            return;  // expired in the queue, status already sent
        }
        grpc::Status status;
        try {
            if (call_.isCancelled()) {
                throw RpcError(ErrorCode::Cancelled, "call cancelled before it started");
            }
            status = execute(request_);
            call_.complete();
        } catch (const RpcError& e) {
            if (e.code() == ErrorCode::Cancelled) {
                call_.cancel();
            } else {
                call_.fail(e.code());
            }
            status = codec::toStatus(e);
            spdlog::warn("[{}] call {} from {} failed: {}", metric_name_, call_.id(), peer_, e.what());
        } catch (const std::exception& e) {
            call_.fail(ErrorCode::ProcessingFailure);
            status = grpc::Status(grpc::StatusCode::INTERNAL, e.what());
            spdlog::error("[{}] call {} from {} raised: {}", metric_name_, call_.id(), peer_, e.what());
        }
        complete(status);
    }

    // Exactly one terminal operation per call
    void complete(const grpc::Status& status) {
        if (completed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        if (alarm_armed_) {
            queue_alarm_.Cancel();
        }
        uint64_t elapsed = StreamRpc::Clock::now_ns() - started_ns_;
        StreamRpc::MetricRegistry::getInstance().recordLatency(metric_name_, elapsed);
        metrics_.active_calls.fetch_sub(1, std::memory_order_relaxed);
        if (status.ok()) {
            metrics_.total_calls_completed.fetch_add(1, std::memory_order_relaxed);
        } else if (status.error_code() == grpc::StatusCode::CANCELLED) {
            metrics_.total_calls_cancelled.fetch_add(1, std::memory_order_relaxed);
        } else {
            metrics_.total_calls_failed.fetch_add(1, std::memory_order_relaxed);
        }

        if (status.ok() && response_) {
            metrics_.total_messages_sent.fetch_add(1, std::memory_order_relaxed);
            StartWriteAndFinish(&*response_, grpc::WriteOptions(), status);
        } else {
            Finish(status);
        }
    }

    const std::string_view metric_name_;
    const std::string peer_;
    const uint64_t started_ns_;
    grpc::ByteBuffer request_;
    grpc::GenericCallbackServerContext* const ctx_;
    grpc::Alarm queue_alarm_;
    bool alarm_armed_ = false;     // set in the constructor only
    std::atomic<int> refs_{1};
    std::atomic<bool> completed_{false};
};

// ============================================================================
// Unary: ProcessPayment
// ============================================================================

class PaymentCallReactor : public PooledCallReactor {
public:
    PaymentCallReactor(grpc::GenericCallbackServerContext* ctx, ServiceHandlers& handlers)
        : PooledCallReactor(ctx, handlers, CallKind::Unary, StreamRpc::MetricNames::PAYMENT) {
        armQueueDeadline(handlers_.payment.deadlineFor(call_));
    }

protected:
    grpc::Status execute(const grpc::ByteBuffer& request) override {
        v1::PaymentRequest proto;
        decodeRequest(request, proto);

        StreamRpc::PaymentResponse result = handlers_.payment.process(call_, codec::fromProto(proto));
        response_ = codec::toByteBuffer(codec::toProto(result));
        return grpc::Status::OK;
    }
};

// ============================================================================
// Server stream: GetTransactionHistory
// ============================================================================

class HistoryCallReactor : public PooledCallReactor, private StreamRpc::RecordSink {
public:
    HistoryCallReactor(grpc::GenericCallbackServerContext* ctx, ServiceHandlers& handlers)
        : PooledCallReactor(ctx, handlers, CallKind::ServerStream, StreamRpc::MetricNames::HISTORY) {}

    void OnWriteDone(bool ok) override {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            write_pending_ = false;
            write_ok_ = ok;
        }
        write_cv_.notify_one();
    }

    void OnCancel() override {
        PooledCallReactor::OnCancel();
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            cancelled_ = true;
        }
        write_cv_.notify_one();
    }

protected:
    grpc::Status execute(const grpc::ByteBuffer& request) override {
        v1::HistoryRequest proto;
        decodeRequest(request, proto);

        size_t sent = handlers_.history.stream(call_, codec::fromProto(proto), *this);
        spdlog::debug("[TransactionHistoryService] call {} finished after {} records", call_.id(), sent);
        return grpc::Status::OK;
    }

private:
    // Blocks until the transport took the record
    bool write(const StreamRpc::TransactionRecord& record) override {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (cancelled_) {
                return false;
            }
            write_pending_ = true;
        }
        out_ = codec::toByteBuffer(codec::toProto(record));
        StartWrite(&out_);

        std::unique_lock<std::mutex> lock(write_mutex_);
        write_cv_.wait(lock, [this] { return !write_pending_ || cancelled_; });
        if (write_pending_ || !write_ok_) {
            return false;
        }
        metrics_.total_messages_sent.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    grpc::ByteBuffer out_;
    std::mutex write_mutex_;
    std::condition_variable write_cv_;
    bool write_pending_ = false;
    bool write_ok_ = false;
    bool cancelled_ = false;
};

} // anonymous namespace

// ============================================================================
// GatewayService
// ============================================================================

GatewayService::GatewayService(ServiceHandlers handlers, const StreamRpc::MethodRegistry& registry)
    : handlers_(handlers), registry_(registry) {
}

grpc::ServerGenericBidiReactor* GatewayService::CreateReactor(grpc::GenericCallbackServerContext* ctx) {
    std::optional<CallKind> kind = registry_.resolve(ctx->method());
    if (!kind) {
        spdlog::warn("[Gateway] Unknown method '{}' from {}", ctx->method(), ctx->peer());
        // Base implementation finishes with UNIMPLEMENTED
        return grpc::CallbackGenericService::CreateReactor(ctx);
    }

    spdlog::debug("[Gateway] {} call {} from {}", Call::toString(*kind), ctx->method(), ctx->peer());
    switch (*kind) {
        case CallKind::Unary:
            return new PaymentCallReactor(ctx, handlers_);
        case CallKind::ServerStream:
            return new HistoryCallReactor(ctx, handlers_);
        case CallKind::BidiStream:
            return new ChatCallReactor(ctx, handlers_.sessions);
    }
    return grpc::CallbackGenericService::CreateReactor(ctx);
}

} // namespace streamrpc::microservice
