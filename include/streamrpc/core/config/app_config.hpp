#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace StreamRpc {
namespace AppConfig {

struct TlsConfig {
    bool enable = false;
    std::string certPath;
    std::string keyPath;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 50051;
    size_t callWorkers = 8;
    size_t maxMessageSize = 4 * 1024 * 1024;  // 4MB
    TlsConfig tls;
};

struct PaymentConfig {
    uint32_t timeoutMs = 2000;
    int64_t maxAmount = 1'000'000'00;       // minor units
    int64_t approvalLimit = 10'000'00;      // above this the simulated gateway declines
    uint32_t processingDelayMs = 0;
    std::vector<std::string> currencies{"USD", "EUR", "GBP"};
};

struct HistoryConfig {
    std::string dataPath = "config/transactions.csv";
};

struct ChatConfig {
    size_t outboundQueueDepth = 32;
    size_t maxSessions = 1024;
    size_t maxMessageBytes = 4096;
    size_t maxPendingPerSource = 256;    // deferred messages per source before a destination is dropped
    uint32_t drainTimeoutMs = 5000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    ServerConfig server;
    PaymentConfig payment;
    HistoryConfig history;
    ChatConfig chat;
    LoggingConfig logging;
};

} // namespace AppConfig
} // namespace StreamRpc
