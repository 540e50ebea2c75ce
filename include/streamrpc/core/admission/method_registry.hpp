#pragma once
#include <streamrpc/core/calls/call.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StreamRpc {

// Fully-qualified gRPC method routes served by this process
namespace Routes {
    constexpr std::string_view PROCESS_PAYMENT = "/streamrpc.v1.PaymentService/ProcessPayment";
    constexpr std::string_view TRANSACTION_HISTORY = "/streamrpc.v1.TransactionHistoryService/GetTransactionHistory";
    constexpr std::string_view CHAT = "/streamrpc.v1.ChatService/Chat";
}

/**
 * @class MethodRegistry
 * @brief Maps a method route to the call kind that serves it.
 *
 * Only BidiStream routes get a session; the other kinds run as plain tasks.
 */
class MethodRegistry {
public:
    struct Entry {
        std::string route;
        CallKind kind;
        std::string_view metricName;
    };

    // Registry preloaded with the three service routes
    static const MethodRegistry& defaults();

    MethodRegistry() = default;

    /**
     * @return false if the route is already registered
     */
    bool add(std::string route, CallKind kind, std::string_view metricName);

    std::optional<CallKind> resolve(std::string_view route) const;
    const Entry* find(std::string_view route) const;
    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};

} // namespace StreamRpc
