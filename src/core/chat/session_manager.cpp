#include <streamrpc/core/chat/session_manager.hpp>
#include <streamrpc/core/metrics/registry.hpp>
#include <streamrpc/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace StreamRpc {

SessionManager::SessionManager(Options options) : options_(options) {
    spdlog::info("[SessionManager] Initialized (queue depth {}, max sessions {}, pending per source {}, drain {}ms)",
                 options_.outboundQueueDepth, options_.maxSessions,
                 options_.maxPendingPerSource, options_.drainTimeout.count());
}

SessionManager::~SessionManager() noexcept {
    spdlog::info("[DESTRUCTOR] SessionManager being destroyed...");
    shutdown();
    spdlog::info("[DESTRUCTOR] SessionManager destroyed successfully");
}

SessionPtr SessionManager::admit(std::shared_ptr<ChatStream> stream) {
    if (!stream) {
        throw RpcError(ErrorCode::SessionError, "no transport stream");
    }
    cleanupFinishedWorkers();

    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (!accepting_) {
            throw RpcError(ErrorCode::Cancelled, "server is shutting down");
        }
        if (sessions_.size() >= options_.maxSessions) {
            spdlog::warn("[SessionManager] Rejecting {}: session limit {} reached",
                         stream->peer(), options_.maxSessions);
            throw SessionLimitError("session limit of " + std::to_string(options_.maxSessions) + " reached");
        }
        session = std::make_shared<Session>(next_session_id_++, std::move(stream),
                                            options_.outboundQueueDepth);
        sessions_.emplace(session->id(), session);
    }

    admitted_.fetch_add(1, std::memory_order_relaxed);
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::CHAT);
    metrics.total_calls_started.fetch_add(1, std::memory_order_relaxed);
    metrics.active_calls.fetch_add(1, std::memory_order_relaxed);

    auto worker = std::make_unique<SessionWorker>();
    SessionWorker* workerPtr = worker.get();
    worker->session = session;
    try {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        worker->reader = std::thread(&SessionManager::readLoop, this, session, workerPtr);
        worker->writer = std::thread(&SessionManager::writeLoop, this, session, workerPtr);
        workers_.push_back(std::move(worker));
    } catch (const std::system_error& e) {
        spdlog::error("[SessionManager] Session {} could not start its threads: {}", session->id(), e.what());
        // Unregister and finish the stream so a started reader returns
        close(session->id(), ErrorCode::SessionError, "session threads unavailable");
        if (worker->reader.joinable()) {
            worker->reader.join();
        }
        throw RpcError(ErrorCode::SessionError, std::string("cannot start session: ") + e.what());
    }

    spdlog::info("[SessionManager] Session {} opened for {} ({} active)", session->id(),
                 session->peer(), sessionCount());
    return session;
}

size_t SessionManager::broadcast(const SessionPtr& source, const ChatMessage& message) {
    auto shared = std::make_shared<const ChatMessage>(message);

    std::vector<SessionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        targets.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            if (id != source->id() && session->isOpen()) {
                targets.push_back(session);
            }
        }
    }

    // Never waits: a full destination parks the message on its own
    // source -> destination path and the writer moves it up later.
    size_t delivered = 0;
    size_t deferred = 0;
    std::vector<SessionPtr> unresponsive;
    for (const auto& target : targets) {
        switch (target->offer(source->id(), shared, options_.maxPendingPerSource)) {
            case Session::OfferResult::QUEUED:
                ++delivered;
                break;
            case Session::OfferResult::DEFERRED:
                ++delivered;
                ++deferred;
                break;
            case Session::OfferResult::OVERFLOW:
                unresponsive.push_back(target);
                break;
            case Session::OfferResult::CLOSED:
                break;  // destination left between snapshot and offer
        }
    }

    if (deferred > 0) {
        backpressure_waits_.fetch_add(deferred, std::memory_order_relaxed);
        MetricRegistry::getInstance().getMetrics(MetricNames::CHAT)
            .total_backpressure_waits.fetch_add(deferred, std::memory_order_relaxed);
        spdlog::debug("[BACKPRESSURE] Session {} message {} deferred for {} full destination(s)",
                      source->id(), message.sequence, deferred);
    }

    for (const auto& target : unresponsive) {
        if (close(target->id(), ErrorCode::SessionError,
                  "unresponsive: " + std::to_string(options_.maxPendingPerSource) +
                  " messages pending from session " + std::to_string(source->id()))) {
            unresponsive_closed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    messages_accepted_.fetch_add(1, std::memory_order_relaxed);
    messages_delivered_.fetch_add(delivered, std::memory_order_relaxed);
    return delivered;
}

bool SessionManager::close(uint64_t sessionId, std::optional<ErrorCode> reason, const std::string& detail) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        if (!session->markClosed(reason)) {
            return false;
        }
        sessions_.erase(it);
    }

    size_t discarded = session->outbound().clear();
    session->outbound().close();
    discarded += session->clearDeferred();
    session->stream().finish(reason, detail);

    closed_.fetch_add(1, std::memory_order_relaxed);
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::CHAT);
    metrics.active_calls.fetch_sub(1, std::memory_order_relaxed);
    if (!reason) {
        metrics.total_calls_completed.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[SessionManager] Session {} closed ({})", sessionId, detail);
    } else if (*reason == ErrorCode::Cancelled) {
        metrics.total_calls_cancelled.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[SessionManager] Session {} cancelled: {}", sessionId, detail);
    } else {
        metrics.total_calls_failed.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[SessionManager] Session {} closed with {}: {}", sessionId,
                     toString(*reason), detail);
    }
    if (discarded > 0) {
        spdlog::warn("[SessionManager] Session {} discarded {} undelivered message(s)",
                     sessionId, discarded);
    }
    return true;
}

void SessionManager::shutdown() {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        accepting_ = false;
        ids.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            ids.push_back(id);
        }
    }

    if (!ids.empty()) {
        spdlog::info("[SessionManager] Shutting down {} session(s)", ids.size());
    }
    for (uint64_t id : ids) {
        close(id, ErrorCode::Cancelled, "server shutting down");
    }
    joinAllWorkers();
}

size_t SessionManager::sessionCount() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.size();
}

std::vector<uint64_t> SessionManager::openSessionIds() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<uint64_t> ids;
    for (const auto& [id, session] : sessions_) {
        if (session->isOpen()) {
            ids.push_back(id);
        }
    }
    return ids;
}

SessionPtr SessionManager::find(uint64_t sessionId) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second : nullptr;
}

SessionManager::Stats SessionManager::stats() const {
    Stats s{};
    s.admitted = admitted_.load(std::memory_order_relaxed);
    s.closed = closed_.load(std::memory_order_relaxed);
    s.active = sessionCount();
    s.messagesAccepted = messages_accepted_.load(std::memory_order_relaxed);
    s.messagesDelivered = messages_delivered_.load(std::memory_order_relaxed);
    s.backpressureWaits = backpressure_waits_.load(std::memory_order_relaxed);
    s.unresponsiveClosed = unresponsive_closed_.load(std::memory_order_relaxed);
    return s;
}

// ============================================================================
// Session loops
// ============================================================================

void SessionManager::readLoop(SessionPtr session, SessionWorker* worker) {
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::CHAT);

    while (!session->isClosed()) {
        ChatMessage message;
        ReadStatus status = session->stream().read(message);

        if (status == ReadStatus::END_OF_STREAM) {
            beginDrain(session);
            break;
        }
        if (status == ReadStatus::CANCELLED) {
            close(session->id(), ErrorCode::Cancelled, "call cancelled by peer");
            break;
        }
        if (status == ReadStatus::FAILED) {
            close(session->id(), ErrorCode::SessionError, "inbound read failed");
            break;
        }
        if (!session->isOpen()) {
            break;
        }

        metrics.total_messages_received.fetch_add(1, std::memory_order_relaxed);

        if (message.text.size() > options_.maxMessageBytes) {
            close(session->id(), ErrorCode::SessionError,
                  "message of " + std::to_string(message.text.size()) + " bytes exceeds limit of " +
                  std::to_string(options_.maxMessageBytes));
            break;
        }
        if (message.text.empty()) {
            spdlog::warn("[SessionManager] Session {} sent an empty message, not broadcast", session->id());
            continue;
        }

        message.session_id = session->id();
        message.sequence = session->nextSequence();
        message.timestamp_ms = Clock::wall_ms();
        broadcast(session, message);
    }

    // Drain watchdog: a half-closed session that cannot flush is forced closed
    if (session->state() == SessionState::DRAINING) {
        if (options_.drainTimeout.count() > 0) {
            if (!session->waitClosed(options_.drainTimeout)) {
                close(session->id(), ErrorCode::Timeout, "drain timed out");
            }
        }
    }

    worker->running.fetch_sub(1, std::memory_order_acq_rel);
}

void SessionManager::writeLoop(SessionPtr session, SessionWorker* worker) {
    auto& metrics = MetricRegistry::getInstance().getMetrics(MetricNames::CHAT);

    while (true) {
        std::optional<ChatMessagePtr> item = session->outbound().pop();
        if (item) {
            session->refill();
        } else {
            // Queue closed and empty; a draining session still owes its deferred messages
            item = session->takeDeferred();
            if (!item) {
                break;
            }
        }
        if (session->isClosed()) {
            break;
        }
        if (!session->stream().write(**item)) {
            close(session->id(), ErrorCode::SessionError, "outbound write failed");
            break;
        }
        metrics.total_messages_sent.fetch_add(1, std::memory_order_relaxed);
    }

    if (session->state() == SessionState::DRAINING) {
        close(session->id(), std::nullopt, "drained after client half-close");
    }

    worker->running.fetch_sub(1, std::memory_order_acq_rel);
}

void SessionManager::beginDrain(const SessionPtr& session) {
    if (!session->beginDraining()) {
        return;
    }
    // Stop accepting new deliveries; the writer flushes what is queued
    size_t queued = session->outbound().size() + session->deferredCount();
    session->outbound().close();
    spdlog::info("[SessionManager] Session {} draining ({} queued)", session->id(), queued);
}

// ============================================================================
// Worker thread bookkeeping
// ============================================================================

void SessionManager::cleanupFinishedWorkers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if ((*it)->running.load(std::memory_order_acquire) == 0) {
            if ((*it)->reader.joinable()) (*it)->reader.join();
            if ((*it)->writer.joinable()) (*it)->writer.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void SessionManager::joinAllWorkers() {
    std::list<std::unique_ptr<SessionWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker->reader.joinable()) worker->reader.join();
        if (worker->writer.joinable()) worker->writer.join();
    }
}

} // namespace StreamRpc
