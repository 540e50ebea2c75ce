#include <streamrpc/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <stdexcept>

namespace StreamRpc {

namespace {

YAML::Node requireNode(const YAML::Node& parent, const std::string& key, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template<typename T>
T readValue(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for config field " + path + ": " + e.what());
    }
}

template<typename T>
void readOptional(const YAML::Node& parent, const std::string& key, const std::string& path, T& out) {
    const YAML::Node node = parent[key];
    if (node && !node.IsNull()) {
        out = readValue<T>(node, path);
    }
}

void requireRange(int64_t value, int64_t lo, int64_t hi, const std::string& path) {
    if (value < lo || value > hi) {
        throw std::runtime_error("Invalid value for config field " + path + ": " +
                                 std::to_string(value) + " (expected " + std::to_string(lo) +
                                 ".." + std::to_string(hi) + ")");
    }
}

bool isCurrencyCode(const std::string& code) {
    return code.size() == 3 && std::all_of(code.begin(), code.end(), [](unsigned char c) {
        return std::isupper(c) != 0;
    });
}

void parseServer(const YAML::Node& node, AppConfig::ServerConfig& server) {
    readOptional(node, "host", "server.host", server.host);

    int64_t port = readValue<int64_t>(requireNode(node, "port", "server.port"), "server.port");
    requireRange(port, 0, 65535, "server.port");
    server.port = static_cast<uint16_t>(port);

    int64_t workers = static_cast<int64_t>(server.callWorkers);
    readOptional(node, "call_workers", "server.call_workers", workers);
    requireRange(workers, 1, 1024, "server.call_workers");
    server.callWorkers = static_cast<size_t>(workers);

    int64_t maxMessage = static_cast<int64_t>(server.maxMessageSize);
    readOptional(node, "max_message_size", "server.max_message_size", maxMessage);
    requireRange(maxMessage, 1024, 64 * 1024 * 1024, "server.max_message_size");
    server.maxMessageSize = static_cast<size_t>(maxMessage);

    const YAML::Node tls = node["tls"];
    if (tls && tls.IsMap()) {
        readOptional(tls, "enable", "server.tls.enable", server.tls.enable);
        readOptional(tls, "cert_path", "server.tls.cert_path", server.tls.certPath);
        readOptional(tls, "key_path", "server.tls.key_path", server.tls.keyPath);
        if (server.tls.enable && (server.tls.certPath.empty() || server.tls.keyPath.empty())) {
            throw std::runtime_error("server.tls.enable requires cert_path and key_path");
        }
    }
}

void parsePayment(const YAML::Node& node, AppConfig::PaymentConfig& payment) {
    int64_t timeout = payment.timeoutMs;
    readOptional(node, "timeout_ms", "payment.timeout_ms", timeout);
    requireRange(timeout, 1, 600'000, "payment.timeout_ms");
    payment.timeoutMs = static_cast<uint32_t>(timeout);

    readOptional(node, "max_amount", "payment.max_amount", payment.maxAmount);
    requireRange(payment.maxAmount, 1, INT64_MAX, "payment.max_amount");

    readOptional(node, "approval_limit", "payment.approval_limit", payment.approvalLimit);
    requireRange(payment.approvalLimit, 0, INT64_MAX, "payment.approval_limit");

    int64_t delay = payment.processingDelayMs;
    readOptional(node, "processing_delay_ms", "payment.processing_delay_ms", delay);
    requireRange(delay, 0, 600'000, "payment.processing_delay_ms");
    payment.processingDelayMs = static_cast<uint32_t>(delay);

    readOptional(node, "currencies", "payment.currencies", payment.currencies);
    if (payment.currencies.empty()) {
        throw std::runtime_error("Invalid value for config field payment.currencies: empty list");
    }
    for (const auto& code : payment.currencies) {
        if (!isCurrencyCode(code)) {
            throw std::runtime_error("Invalid value for config field payment.currencies: '" + code + "'");
        }
    }
}

void parseChat(const YAML::Node& node, AppConfig::ChatConfig& chat) {
    int64_t depth = static_cast<int64_t>(chat.outboundQueueDepth);
    readOptional(node, "outbound_queue_depth", "chat.outbound_queue_depth", depth);
    requireRange(depth, 1, 1'000'000, "chat.outbound_queue_depth");
    chat.outboundQueueDepth = static_cast<size_t>(depth);

    int64_t maxSessions = static_cast<int64_t>(chat.maxSessions);
    readOptional(node, "max_sessions", "chat.max_sessions", maxSessions);
    requireRange(maxSessions, 1, 1'000'000, "chat.max_sessions");
    chat.maxSessions = static_cast<size_t>(maxSessions);

    int64_t maxBytes = static_cast<int64_t>(chat.maxMessageBytes);
    readOptional(node, "max_message_bytes", "chat.max_message_bytes", maxBytes);
    requireRange(maxBytes, 1, 16 * 1024 * 1024, "chat.max_message_bytes");
    chat.maxMessageBytes = static_cast<size_t>(maxBytes);

    int64_t pending = static_cast<int64_t>(chat.maxPendingPerSource);
    readOptional(node, "max_pending_per_source", "chat.max_pending_per_source", pending);
    requireRange(pending, 1, 1'000'000, "chat.max_pending_per_source");
    chat.maxPendingPerSource = static_cast<size_t>(pending);

    int64_t drain = chat.drainTimeoutMs;
    readOptional(node, "drain_timeout_ms", "chat.drain_timeout_ms", drain);
    requireRange(drain, 0, 600'000, "chat.drain_timeout_ms");
    chat.drainTimeoutMs = static_cast<uint32_t>(drain);
}

void parseLogging(const YAML::Node& node, AppConfig::LoggingConfig& logging) {
    readOptional(node, "level", "logging.level", logging.level);
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(std::begin(kLevels), std::end(kLevels), logging.level) == std::end(kLevels)) {
        throw std::runtime_error("Invalid value for config field logging.level: '" + logging.level + "'");
    }
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping: " + filepath);
    }

    AppConfig::AppConfiguration config;
    config.app_name = readValue<std::string>(requireNode(root, "app_name", "app_name"), "app_name");
    config.version = readValue<std::string>(requireNode(root, "version", "version"), "version");

    parseServer(requireNode(root, "server", "server"), config.server);

    if (const YAML::Node payment = root["payment"]) {
        parsePayment(payment, config.payment);
    }
    if (const YAML::Node history = root["history"]) {
        readOptional(history, "data_path", "history.data_path", config.history.dataPath);
    }
    if (const YAML::Node chat = root["chat"]) {
        parseChat(chat, config.chat);
    }
    if (const YAML::Node logging = root["logging"]) {
        parseLogging(logging, config.logging);
    }

    spdlog::debug("Loaded config {} v{} (port {}, queue depth {})", config.app_name,
                  config.version, config.server.port, config.chat.outboundQueueDepth);
    return config;
}

} // namespace StreamRpc
