#include <streamrpc/core/history/in_memory_transaction_store.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace StreamRpc {

namespace {

class SnapshotCursor : public TransactionCursor {
public:
    explicit SnapshotCursor(std::shared_ptr<const std::vector<TransactionRecord>> records)
        : records_(std::move(records)) {}

    std::optional<TransactionRecord> next() override {
        if (!records_ || index_ >= records_->size()) {
            return std::nullopt;
        }
        return (*records_)[index_++];
    }

private:
    std::shared_ptr<const std::vector<TransactionRecord>> records_;
    size_t index_ = 0;
};

void trim(std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { s.clear(); return; }
    s = s.substr(a, b - a + 1);
}

// Splits the first (count - 1) fields on ','; the last field keeps any commas
std::vector<std::string> splitFields(const std::string& line, size_t count) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() + 1 < count) {
        size_t pos = line.find(',', start);
        if (pos == std::string::npos) break;
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    fields.push_back(line.substr(start));
    for (auto& f : fields) trim(f);
    return fields;
}

} // anonymous namespace

bool InMemoryTransactionStore::loadFromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) return false;

    std::unordered_map<std::string, RecordList> loaded;
    std::string line;
    size_t lineNo = 0;
    size_t total = 0;
    while (std::getline(ifs, line)) {
        ++lineNo;
        auto posc = line.find('#');
        if (posc != std::string::npos) line = line.substr(0, posc);
        trim(line);
        if (line.empty()) continue;

        auto fields = splitFields(line, 6);
        if (fields.size() != 6 || fields[0].empty() || fields[1].empty()) {
            spdlog::warn("[{}] {}:{} malformed record, skipped", name(), path, lineNo);
            continue;
        }

        TransactionRecord record;
        record.transaction_id = fields[0];
        record.account_id = fields[1];
        record.currency = fields[3];
        record.description = fields[5];
        try {
            record.amount = std::stoll(fields[2]);
            record.timestamp_ms = std::stoll(fields[4]);
        } catch (const std::exception&) {
            spdlog::warn("[{}] {}:{} non-numeric amount or timestamp, skipped", name(), path, lineNo);
            continue;
        }
        loaded[record.account_id].push_back(std::move(record));
        ++total;
    }

    {
        std::unique_lock lock(share_mutex);
        for (auto& [account, records] : loaded) {
            auto merged = std::make_shared<RecordList>();
            auto it = table_.find(account);
            if (it != table_.end() && it->second) {
                *merged = *it->second;
            }
            merged->insert(merged->end(), records.begin(), records.end());
            table_[account] = std::move(merged);
        }
    }
    spdlog::info("Loaded {} transactions for {} accounts from {}", total, loaded.size(), path);
    return true;
}

void InMemoryTransactionStore::add(const TransactionRecord& record) {
    std::unique_lock lock(share_mutex);
    auto merged = std::make_shared<RecordList>();
    auto it = table_.find(record.account_id);
    if (it != table_.end() && it->second) {
        *merged = *it->second;
    }
    merged->push_back(record);
    table_[record.account_id] = std::move(merged);
}

size_t InMemoryTransactionStore::recordCount(const std::string& accountId) const {
    std::shared_lock lock(share_mutex);
    auto it = table_.find(accountId);
    return (it != table_.end() && it->second) ? it->second->size() : 0;
}

size_t InMemoryTransactionStore::accountCount() const {
    std::shared_lock lock(share_mutex);
    return table_.size();
}

std::unique_ptr<TransactionCursor> InMemoryTransactionStore::open(const std::string& accountId) {
    std::shared_ptr<const RecordList> snapshot;
    {
        std::shared_lock lock(share_mutex);
        auto it = table_.find(accountId);
        if (it != table_.end()) {
            snapshot = it->second;
        }
    }
    return std::make_unique<SnapshotCursor>(std::move(snapshot));
}

} // namespace StreamRpc
