#pragma once
#include <streamrpc/core/payment/payment_types.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace StreamRpc {

struct GatewayDecision {
    PaymentStatus status = PaymentStatus::DECLINED;
    std::string message;
};

/**
 * @class PaymentGateway
 * @brief External system performing the actual payment attempt.
 *
 * authorize() is the one externally observable side effect of a unary
 * payment call. Implementations throw on infrastructure failure.
 */
class PaymentGateway {
public:
    virtual ~PaymentGateway() = default;
    virtual GatewayDecision authorize(const std::string& paymentId, const PaymentRequest& request) = 0;
    virtual const char* name() const = 0;
};

using PaymentGatewayPtr = std::shared_ptr<PaymentGateway>;

/**
 * @class SimulatedPaymentGateway
 * @brief In-process gateway: approves up to a limit, declines above it.
 */
class SimulatedPaymentGateway : public PaymentGateway {
public:
    SimulatedPaymentGateway(int64_t approvalLimit, std::chrono::milliseconds processingDelay);

    GatewayDecision authorize(const std::string& paymentId, const PaymentRequest& request) override;
    const char* name() const override { return "SimulatedPaymentGateway"; }

    uint64_t attempts() const { return attempts_.load(std::memory_order_relaxed); }

private:
    const int64_t approvalLimit_;
    const std::chrono::milliseconds processingDelay_;
    std::atomic<uint64_t> attempts_{0};
};

} // namespace StreamRpc
