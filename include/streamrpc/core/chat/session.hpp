#pragma once
#include <streamrpc/core/chat/chat_message.hpp>
#include <streamrpc/core/chat/chat_stream.hpp>
#include <streamrpc/core/queues/bounded_queue.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

namespace StreamRpc {

/**
 * Session lifecycle: OPEN -> DRAINING -> CLOSED
 *
 * CLOSED is reachable from every state and is entered exactly once.
 */
enum class SessionState : uint8_t {
    OPEN = 0,       // reading and receiving broadcasts
    DRAINING = 1,   // client half-closed, flushing queued messages
    CLOSED = 2
};

/**
 * @class Session
 * @brief One bidirectional chat call: transport port + bounded outbound queue.
 *
 * The outbound queue is written only by offer() and refill() and read only
 * by the session's writer loop. The inbound side is the transport read path,
 * consumed only by the session's reader loop.
 *
 * When the outbound queue is full, messages wait in a deferred list kept per
 * source session. Once a source has deferred messages, its later messages
 * queue behind them, so each source's messages reach this session in order.
 */
class Session {
public:
    enum class OfferResult : uint8_t {
        QUEUED,     // placed in the outbound queue
        DEFERRED,   // queue full, parked in the source's deferred list
        OVERFLOW,   // source's deferred list at its limit, message not taken
        CLOSED      // session no longer accepts messages
    };

    Session(uint64_t id, std::shared_ptr<ChatStream> stream, size_t outboundDepth);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    uint64_t id() const { return id_; }
    const std::string& peer() const { return peer_; }
    ChatStream& stream() { return *stream_; }
    BoundedQueue<ChatMessagePtr>& outbound() { return outbound_; }

    SessionState state() const {
        return state_.load(std::memory_order_acquire);
    }
    bool isOpen() const { return state() == SessionState::OPEN; }
    bool isClosed() const { return state() == SessionState::CLOSED; }

    // OPEN -> DRAINING; false from any other state
    bool beginDraining();

    // any -> CLOSED; true only for the call that performed the transition
    bool markClosed(std::optional<ErrorCode> reason);

    std::optional<ErrorCode> closeReason() const;

    /**
     * @brief Wait until the session is CLOSED
     * @return true if closed, false on timeout
     */
    bool waitClosed(std::chrono::milliseconds timeout) const;

    /**
     * @brief Hand a message from sourceId to this session without blocking
     * @param maxDeferred limit on messages parked for one source
     */
    OfferResult offer(uint64_t sourceId, const ChatMessagePtr& message, size_t maxDeferred);

    // Move deferred messages into the outbound queue while it has room
    void refill();

    // Next deferred message once the outbound queue is closed and empty
    std::optional<ChatMessagePtr> takeDeferred();

    // Drop every deferred message, returns how many were discarded
    size_t clearDeferred();

    size_t deferredCount() const;

    uint64_t nextSequence() {
        return sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    static const char* toString(SessionState state);

private:
    const uint64_t id_;
    const std::shared_ptr<ChatStream> stream_;
    const std::string peer_;
    BoundedQueue<ChatMessagePtr> outbound_;

    std::atomic<SessionState> state_{SessionState::OPEN};
    std::atomic<uint64_t> sequence_{0};

    // Per-source FIFOs; deferred_order_ lists sources with deferred messages, oldest first
    mutable std::mutex deferred_mutex_;
    std::unordered_map<uint64_t, std::deque<ChatMessagePtr>> deferred_;
    std::deque<uint64_t> deferred_order_;
    size_t deferred_count_ = 0;

    mutable std::mutex close_mutex_;
    mutable std::condition_variable closed_cv_;
    std::optional<ErrorCode> close_reason_;
};

using SessionPtr = std::shared_ptr<Session>;

} // namespace StreamRpc
