#include <streamrpc/core/admission/method_registry.hpp>
#include <streamrpc/core/metrics/registry.hpp>

namespace StreamRpc {

const MethodRegistry& MethodRegistry::defaults() {
    static const MethodRegistry registry = [] {
        MethodRegistry r;
        r.add(std::string(Routes::PROCESS_PAYMENT), CallKind::Unary, MetricNames::PAYMENT);
        r.add(std::string(Routes::TRANSACTION_HISTORY), CallKind::ServerStream, MetricNames::HISTORY);
        r.add(std::string(Routes::CHAT), CallKind::BidiStream, MetricNames::CHAT);
        return r;
    }();
    return registry;
}

bool MethodRegistry::add(std::string route, CallKind kind, std::string_view metricName) {
    if (find(route) != nullptr) {
        return false;
    }
    entries_.push_back(Entry{std::move(route), kind, metricName});
    return true;
}

std::optional<CallKind> MethodRegistry::resolve(std::string_view route) const {
    const Entry* entry = find(route);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->kind;
}

const MethodRegistry::Entry* MethodRegistry::find(std::string_view route) const {
    for (const auto& entry : entries_) {
        if (entry.route == route) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace StreamRpc
