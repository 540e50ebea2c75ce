#pragma once
#include <cstdint>
#include <string>

namespace StreamRpc {

enum class PaymentStatus : uint8_t {
    APPROVED = 0,
    DECLINED = 1
};

inline const char* toString(PaymentStatus status) {
    return status == PaymentStatus::APPROVED ? "approved" : "declined";
}

/**
 * Amounts are integer minor units (cents for USD).
 */
struct PaymentRequest {
    std::string payer_account;
    int64_t amount = 0;
    std::string currency;
    std::string reference;   // free-form caller reference, echoed in logs
};

struct PaymentResponse {
    std::string payment_id;
    PaymentStatus status = PaymentStatus::DECLINED;
    std::string message;
    int64_t processed_at_ms = 0;
};

} // namespace StreamRpc
