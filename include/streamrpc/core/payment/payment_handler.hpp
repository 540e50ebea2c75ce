#pragma once
#include <streamrpc/core/calls/call.hpp>
#include <streamrpc/core/payment/payment_gateway.hpp>
#include <streamrpc/core/payment/payment_types.hpp>
#include <streamrpc/core/utils/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace StreamRpc {

/**
 * @class PaymentHandler
 * @brief Unary call handler: one PaymentRequest in, one PaymentResponse out.
 *
 * The gateway attempt runs on a dedicated executor so the handler can bound
 * how long the caller waits. An attempt that has not started when the
 * deadline passes is abandoned and never reaches the gateway; one that has
 * started is awaited, so no payment is left in flight behind a Timeout.
 * The timeout is counted from the call's admission, not from when a worker
 * picks it up.
 * There is no internal retry.
 */
class PaymentHandler {
public:
    struct Options {
        std::chrono::milliseconds timeout{2000};
        int64_t maxAmount = 1'000'000'00;
        std::vector<std::string> currencies{"USD", "EUR", "GBP"};
    };

    PaymentHandler(PaymentGateway& gateway, ThreadPool& executor, Options options);

    /**
     * @brief Validate and process one payment
     * @throws RpcError InvalidRequest, ProcessingFailure, Timeout or Cancelled
     */
    PaymentResponse process(Call& call, const PaymentRequest& request);

    /**
     * @throws RpcError(InvalidRequest) describing the first violated rule
     */
    void validate(const PaymentRequest& request) const;

    // Admission time plus the processing timeout, capped by the call deadline
    Call::Clock::time_point deadlineFor(const Call& call) const;

private:
    std::string nextPaymentId();

    PaymentGateway& gateway_;
    ThreadPool& executor_;
    const Options options_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace StreamRpc
