#include <streamrpc/core/payment/payment_gateway.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace StreamRpc {

SimulatedPaymentGateway::SimulatedPaymentGateway(int64_t approvalLimit,
                                                 std::chrono::milliseconds processingDelay)
    : approvalLimit_(approvalLimit), processingDelay_(processingDelay) {
}

GatewayDecision SimulatedPaymentGateway::authorize(const std::string& paymentId,
                                                   const PaymentRequest& request) {
    attempts_.fetch_add(1, std::memory_order_relaxed);
    if (processingDelay_.count() > 0) {
        std::this_thread::sleep_for(processingDelay_);
    }

    GatewayDecision decision;
    if (request.amount <= approvalLimit_) {
        decision.status = PaymentStatus::APPROVED;
        decision.message = "approved";
    } else {
        decision.status = PaymentStatus::DECLINED;
        decision.message = "amount exceeds approval limit";
    }
    spdlog::debug("[{}] {} {} {} -> {}", name(), paymentId, request.amount, request.currency,
                  toString(decision.status));
    return decision;
}

} // namespace StreamRpc
