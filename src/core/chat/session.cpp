#include <streamrpc/core/chat/session.hpp>
#include <spdlog/spdlog.h>

namespace StreamRpc {

Session::Session(uint64_t id, std::shared_ptr<ChatStream> stream, size_t outboundDepth)
    : id_(id),
      stream_(std::move(stream)),
      peer_(stream_ ? stream_->peer() : std::string("unknown")),
      outbound_(outboundDepth) {
}

Session::~Session() {
    spdlog::debug("[Session {}] released", id_);
}

bool Session::beginDraining() {
    SessionState expected = SessionState::OPEN;
    return state_.compare_exchange_strong(expected, SessionState::DRAINING,
                                          std::memory_order_acq_rel);
}

bool Session::markClosed(std::optional<ErrorCode> reason) {
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        SessionState previous = state_.exchange(SessionState::CLOSED, std::memory_order_acq_rel);
        if (previous == SessionState::CLOSED) {
            return false;
        }
        close_reason_ = reason;
    }
    closed_cv_.notify_all();
    return true;
}

std::optional<ErrorCode> Session::closeReason() const {
    std::lock_guard<std::mutex> lock(close_mutex_);
    return close_reason_;
}

bool Session::waitClosed(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(close_mutex_);
    return closed_cv_.wait_for(lock, timeout, [this] { return isClosed(); });
}

Session::OfferResult Session::offer(uint64_t sourceId, const ChatMessagePtr& message, size_t maxDeferred) {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    if (outbound_.closed()) {
        return OfferResult::CLOSED;
    }

    auto it = deferred_.find(sourceId);
    if (it != deferred_.end()) {
        if (it->second.size() >= maxDeferred) {
            return OfferResult::OVERFLOW;
        }
        it->second.push_back(message);
        ++deferred_count_;
        return OfferResult::DEFERRED;
    }

    switch (outbound_.tryPush(message)) {
        case BoundedQueue<ChatMessagePtr>::PushResult::OK:
            return OfferResult::QUEUED;
        case BoundedQueue<ChatMessagePtr>::PushResult::CLOSED:
            return OfferResult::CLOSED;
        case BoundedQueue<ChatMessagePtr>::PushResult::FULL:
        default:
            break;
    }
    if (maxDeferred == 0) {
        return OfferResult::OVERFLOW;
    }
    deferred_[sourceId].push_back(message);
    deferred_order_.push_back(sourceId);
    ++deferred_count_;
    return OfferResult::DEFERRED;
}

void Session::refill() {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    while (!deferred_order_.empty()) {
        uint64_t sourceId = deferred_order_.front();
        auto& pending = deferred_[sourceId];
        if (outbound_.tryPush(pending.front()) != BoundedQueue<ChatMessagePtr>::PushResult::OK) {
            return;
        }
        pending.pop_front();
        --deferred_count_;
        deferred_order_.pop_front();
        if (pending.empty()) {
            deferred_.erase(sourceId);
        } else {
            deferred_order_.push_back(sourceId);   // round-robin across sources
        }
    }
}

std::optional<ChatMessagePtr> Session::takeDeferred() {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    if (deferred_order_.empty()) {
        return std::nullopt;
    }
    uint64_t sourceId = deferred_order_.front();
    deferred_order_.pop_front();
    auto& pending = deferred_[sourceId];
    ChatMessagePtr message = pending.front();
    pending.pop_front();
    --deferred_count_;
    if (pending.empty()) {
        deferred_.erase(sourceId);
    } else {
        deferred_order_.push_back(sourceId);
    }
    return message;
}

size_t Session::clearDeferred() {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    size_t dropped = deferred_count_;
    deferred_.clear();
    deferred_order_.clear();
    deferred_count_ = 0;
    return dropped;
}

size_t Session::deferredCount() const {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    return deferred_count_;
}

const char* Session::toString(SessionState state) {
    switch (state) {
        case SessionState::OPEN:     return "OPEN";
        case SessionState::DRAINING: return "DRAINING";
        case SessionState::CLOSED:   return "CLOSED";
        default:                     return "UNKNOWN";
    }
}

} // namespace StreamRpc
