#pragma once
#include <streamrpc/core/history/transaction_record.hpp>
#include <memory>
#include <optional>
#include <string>

namespace StreamRpc {

/**
 * @brief Forward-only, non-restartable read over one account's history
 *
 * next() returns std::nullopt once the source is exhausted and throws if
 * the source fails mid-sequence.
 */
class TransactionCursor {
public:
    virtual ~TransactionCursor() = default;
    virtual std::optional<TransactionRecord> next() = 0;
};

/**
 * @brief External data source of transaction history, read-only for handlers
 */
class TransactionSource {
public:
    virtual ~TransactionSource() = default;

    // A new cursor per call; each call re-queries from scratch
    virtual std::unique_ptr<TransactionCursor> open(const std::string& accountId) = 0;
    virtual const char* name() const = 0;
};

} // namespace StreamRpc
