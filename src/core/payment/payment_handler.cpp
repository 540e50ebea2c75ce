#include <streamrpc/core/payment/payment_handler.hpp>
#include <streamrpc/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <future>
#include <memory>

namespace StreamRpc {

namespace {

// Attempt phases; the executor and the waiting handler race on Queued
enum AttemptPhase : int {
    kQueued = 0,
    kCommitting = 1,
    kAbandoned = 2
};

struct Attempt {
    std::atomic<int> phase{kQueued};
    std::promise<GatewayDecision> promise;
};

constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);

// Queued -> Abandoned; false means the attempt already reached the gateway
bool abandon(Attempt& attempt) {
    int expected = kQueued;
    return attempt.phase.compare_exchange_strong(expected, kAbandoned, std::memory_order_acq_rel);
}

} // anonymous namespace

PaymentHandler::PaymentHandler(PaymentGateway& gateway, ThreadPool& executor, Options options)
    : gateway_(gateway), executor_(executor), options_(std::move(options)) {
    spdlog::info("[PaymentHandler] gateway={} timeout={}ms currencies={}", gateway_.name(),
                 options_.timeout.count(), options_.currencies.size());
}

void PaymentHandler::validate(const PaymentRequest& request) const {
    if (request.payer_account.empty()) {
        throw RpcError(ErrorCode::InvalidRequest, "payer_account is required");
    }
    if (request.amount <= 0) {
        throw RpcError(ErrorCode::InvalidRequest, "amount must be positive");
    }
    if (request.amount > options_.maxAmount) {
        throw RpcError(ErrorCode::InvalidRequest,
                       "amount exceeds maximum of " + std::to_string(options_.maxAmount));
    }
    bool wellFormed = request.currency.size() == 3 &&
        std::all_of(request.currency.begin(), request.currency.end(),
                    [](unsigned char c) { return std::isupper(c) != 0; });
    if (!wellFormed) {
        throw RpcError(ErrorCode::InvalidRequest, "currency must be a 3-letter ISO code");
    }
    if (std::find(options_.currencies.begin(), options_.currencies.end(), request.currency) ==
        options_.currencies.end()) {
        throw RpcError(ErrorCode::InvalidRequest, "unsupported currency " + request.currency);
    }
}

PaymentResponse PaymentHandler::process(Call& call, const PaymentRequest& request) {
    validate(request);

    // The budget runs from admission, so time spent waiting for a worker counts
    const auto deadline = deadlineFor(call);
    if (Call::Clock::now() >= deadline) {
        spdlog::warn("[PaymentHandler] call {} spent its {}ms budget before processing started",
                     call.id(), options_.timeout.count());
        throw RpcError(ErrorCode::Timeout, "payment timed out waiting for a worker");
    }

    const std::string paymentId = nextPaymentId();
    auto attempt = std::make_shared<Attempt>();
    std::future<GatewayDecision> decisionFuture = attempt->promise.get_future();
    PaymentGateway* gateway = &gateway_;

    bool queued = executor_.submit([attempt, gateway, paymentId, request]() {
        int expected = kQueued;
        if (!attempt->phase.compare_exchange_strong(expected, kCommitting, std::memory_order_acq_rel)) {
            return;  // caller gave up before the attempt started
        }
        try {
            attempt->promise.set_value(gateway->authorize(paymentId, request));
        } catch (...) {
            attempt->promise.set_exception(std::current_exception());
        }
    });
    if (!queued) {
        throw RpcError(ErrorCode::Cancelled, "payment executor is shut down");
    }

    while (decisionFuture.wait_for(kCancelPollInterval) != std::future_status::ready) {
        if (call.isCancelled() && abandon(*attempt)) {
            spdlog::info("[PaymentHandler] {} cancelled before reaching the gateway", paymentId);
            throw RpcError(ErrorCode::Cancelled, "payment " + paymentId + " cancelled");
        }
        if (Call::Clock::now() >= deadline) {
            if (abandon(*attempt)) {
                spdlog::warn("[PaymentHandler] {} timed out after {}ms, attempt abandoned",
                             paymentId, options_.timeout.count());
                throw RpcError(ErrorCode::Timeout, "payment " + paymentId + " timed out");
            }
            // Already committing: the outcome must be reported, not left pending
            spdlog::warn("[PaymentHandler] {} passed its deadline while committing, awaiting outcome",
                         paymentId);
            decisionFuture.wait();
            break;
        }
    }

    GatewayDecision decision;
    try {
        decision = decisionFuture.get();
    } catch (const RpcError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[PaymentHandler] {} gateway failure: {}", paymentId, e.what());
        throw RpcError(ErrorCode::ProcessingFailure, e.what());
    }

    PaymentResponse response;
    response.payment_id = paymentId;
    response.status = decision.status;
    response.message = decision.message;
    response.processed_at_ms = Clock::wall_ms();

    spdlog::info("[PaymentHandler] {} {} {} ref='{}' -> {}", paymentId, request.amount,
                 request.currency, request.reference, toString(response.status));
    return response;
}

Call::Clock::time_point PaymentHandler::deadlineFor(const Call& call) const {
    return call.deadlineAfter(std::chrono::duration_cast<Call::Clock::duration>(options_.timeout));
}

std::string PaymentHandler::nextPaymentId() {
    uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return "pay-" + std::to_string(Clock::wall_ms()) + "-" + std::to_string(seq);
}

} // namespace StreamRpc
