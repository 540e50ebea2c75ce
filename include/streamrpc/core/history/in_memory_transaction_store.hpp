#pragma once
#include <streamrpc/core/history/transaction_source.hpp>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace StreamRpc {

/**
 * @class InMemoryTransactionStore
 * @brief TransactionSource backed by per-account vectors, loaded from CSV.
 *
 * File format, one record per line, '#' starts a comment:
 *   transaction_id,account_id,amount,currency,timestamp_ms,description
 *
 * Cursors iterate an immutable snapshot, so appends made while a stream is
 * in progress are only visible to later calls.
 */
class InMemoryTransactionStore : public TransactionSource {
public:
    InMemoryTransactionStore() = default;

    bool loadFromFile(const std::string& path);
    void add(const TransactionRecord& record);
    size_t recordCount(const std::string& accountId) const;
    size_t accountCount() const;

    std::unique_ptr<TransactionCursor> open(const std::string& accountId) override;
    const char* name() const override { return "InMemoryTransactionStore"; }

private:
    using RecordList = std::vector<TransactionRecord>;

    mutable std::shared_mutex share_mutex;
    std::unordered_map<std::string, std::shared_ptr<const RecordList>> table_;
};

} // namespace StreamRpc
