#pragma once
#include <cstdint>
#include <string>

namespace StreamRpc {

struct TransactionRecord {
    std::string transaction_id;
    std::string account_id;
    int64_t amount = 0;          // minor units, negative for debits
    std::string currency;
    std::string description;
    int64_t timestamp_ms = 0;
};

struct HistoryRequest {
    std::string account_id;
    uint32_t limit = 0;          // 0 = no limit
};

} // namespace StreamRpc
