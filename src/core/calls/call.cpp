#include <streamrpc/core/calls/call.hpp>
#include <spdlog/spdlog.h>

namespace StreamRpc {

std::atomic<uint64_t> Call::next_id_{1};

Call::Call(CallKind kind, std::string method, std::optional<Clock::time_point> deadline)
    : id_(next_id_.fetch_add(1, std::memory_order_relaxed)),
      kind_(kind),
      method_(std::move(method)),
      deadline_(deadline),
      admitted_at_(Clock::now()) {
}

bool Call::isTerminal() const {
    CallState s = state();
    return s == CallState::Completed || s == CallState::Failed || s == CallState::Cancelled;
}

bool Call::activate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_relaxed) != CallState::Pending) {
        return false;
    }
    state_.store(CallState::Active, std::memory_order_release);
    return true;
}

bool Call::complete() {
    return transition(CallState::Completed, false);
}

bool Call::fail(ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    CallState current = state_.load(std::memory_order_relaxed);
    if (current != CallState::Pending && current != CallState::Active) {
        return false;
    }
    error_ = code;
    state_.store(CallState::Failed, std::memory_order_release);
    spdlog::debug("[Call {}] {} -> Failed ({})", id_, toString(current), StreamRpc::toString(code));
    return true;
}

bool Call::cancel() {
    return transition(CallState::Cancelled, true);
}

bool Call::expire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_relaxed) != CallState::Pending) {
        return false;
    }
    error_ = ErrorCode::Timeout;
    state_.store(CallState::Failed, std::memory_order_release);
    spdlog::debug("[Call {}] Pending -> Failed (expired before start)", id_);
    return true;
}

std::optional<ErrorCode> Call::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

Call::Clock::time_point Call::deadlineAfter(Clock::duration budget) const {
    Clock::time_point byBudget = admitted_at_ + budget;
    if (deadline_ && *deadline_ < byBudget) {
        return *deadline_;
    }
    return byBudget;
}

bool Call::transition(CallState target, bool allowFromPending) {
    std::lock_guard<std::mutex> lock(mutex_);
    CallState current = state_.load(std::memory_order_relaxed);
    bool allowed = current == CallState::Active ||
                   (allowFromPending && current == CallState::Pending);
    if (!allowed) {
        return false;
    }
    state_.store(target, std::memory_order_release);
    spdlog::debug("[Call {}] {} -> {}", id_, toString(current), toString(target));
    return true;
}

const char* Call::toString(CallKind kind) {
    switch (kind) {
        case CallKind::Unary:        return "unary";
        case CallKind::ServerStream: return "server-stream";
        case CallKind::BidiStream:   return "bidi-stream";
        default:                     return "unknown";
    }
}

const char* Call::toString(CallState state) {
    switch (state) {
        case CallState::Pending:   return "PENDING";
        case CallState::Active:    return "ACTIVE";
        case CallState::Completed: return "COMPLETED";
        case CallState::Failed:    return "FAILED";
        case CallState::Cancelled: return "CANCELLED";
        default:                   return "UNKNOWN";
    }
}

} // namespace StreamRpc
