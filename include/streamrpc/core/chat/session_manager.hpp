#pragma once
#include <streamrpc/core/chat/session.hpp>
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace StreamRpc {

/**
 * @class SessionManager
 * @brief Owns every bidirectional chat session and fans messages out.
 *
 * Each admitted session gets a reader thread (transport -> broadcast) and a
 * writer thread (outbound queue -> transport). The registry of sessions is
 * the only state shared across sessions; it is mutated under one mutex and
 * broadcasts iterate a snapshot of it.
 *
 * Backpressure: every destination has a bounded outbound queue. A broadcast
 * never waits. A destination whose queue is full keeps the message on that
 * source's deferred list, and its writer moves deferred messages into the
 * queue as space frees up, so only the one source -> destination path lags
 * and per-source order is preserved. A destination that lets
 * maxPendingPerSource messages from one source pile up is closed as
 * unresponsive with SessionError.
 */
class SessionManager {
public:
    struct Options {
        size_t outboundQueueDepth = 32;
        size_t maxSessions = 1024;
        size_t maxMessageBytes = 4096;
        size_t maxPendingPerSource = 256;
        std::chrono::milliseconds drainTimeout{5000};   // 0 = wait indefinitely
    };

    struct Stats {
        uint64_t admitted;
        uint64_t closed;
        uint64_t active;
        uint64_t messagesAccepted;     // inbound messages broadcast
        uint64_t messagesDelivered;    // copies handed to destination queues
        uint64_t backpressureWaits;    // deliveries deferred on a full destination
        uint64_t unresponsiveClosed;   // destinations closed for exceeding maxPendingPerSource
    };

    explicit SessionManager(Options options);
    ~SessionManager() noexcept;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Register a new OPEN session for a bidi call and start its loops
     * @throws SessionLimitError when the session limit is reached,
     *         RpcError(Cancelled) after shutdown(),
     *         RpcError(SessionError) if the session threads cannot start
     */
    SessionPtr admit(std::shared_ptr<ChatStream> stream);

    /**
     * @brief Deliver message to every other OPEN session without blocking
     * @return Number of destinations that queued or deferred the message
     */
    size_t broadcast(const SessionPtr& source, const ChatMessage& message);

    /**
     * @brief Close a session; idempotent
     * @param reason empty for a clean close
     * @return true if this call closed it, false if it was already closed
     */
    bool close(uint64_t sessionId, std::optional<ErrorCode> reason, const std::string& detail);

    // Stop admitting, close every session as Cancelled, join all session threads
    void shutdown();

    size_t sessionCount() const;
    std::vector<uint64_t> openSessionIds() const;
    SessionPtr find(uint64_t sessionId) const;
    Stats stats() const;
    const Options& options() const { return options_; }

private:
    struct SessionWorker {
        SessionPtr session;
        std::thread reader;
        std::thread writer;
        std::atomic<int> running{2};
    };

    void readLoop(SessionPtr session, SessionWorker* worker);
    void writeLoop(SessionPtr session, SessionWorker* worker);
    void beginDrain(const SessionPtr& session);
    void cleanupFinishedWorkers();
    void joinAllWorkers();

    const Options options_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<uint64_t, SessionPtr> sessions_;
    uint64_t next_session_id_ = 1;
    bool accepting_ = true;

    std::mutex workers_mutex_;
    std::list<std::unique_ptr<SessionWorker>> workers_;

    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> closed_{0};
    std::atomic<uint64_t> messages_accepted_{0};
    std::atomic<uint64_t> messages_delivered_{0};
    std::atomic<uint64_t> backpressure_waits_{0};
    std::atomic<uint64_t> unresponsive_closed_{0};
};

} // namespace StreamRpc
