#pragma once
#include <streamrpc/core/errors/rpc_error.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace StreamRpc {

enum class CallKind : uint8_t {
    Unary = 0,
    ServerStream = 1,
    BidiStream = 2
};

/**
 * Call lifecycle: Pending -> Active -> Completed | Failed | Cancelled
 *
 * Terminal states are sticky. Cancellation may also happen straight from
 * Pending (client gone before a worker picked the call up).
 */
enum class CallState : uint8_t {
    Pending = 0,
    Active = 1,
    Completed = 2,
    Failed = 3,
    Cancelled = 4
};

/**
 * @class Call
 * @brief One RPC invocation, owned by the transport reactor that accepted it.
 *
 * Handlers read the cancellation flag and the deadline at their suspension
 * points; the reactor drives the terminal transition.
 */
class Call {
public:
    using Clock = std::chrono::steady_clock;

    Call(CallKind kind, std::string method,
         std::optional<Clock::time_point> deadline = std::nullopt);

    Call(const Call&) = delete;
    Call& operator=(const Call&) = delete;

    uint64_t id() const { return id_; }
    CallKind kind() const { return kind_; }
    const std::string& method() const { return method_; }
    std::optional<Clock::time_point> deadline() const { return deadline_; }
    Clock::time_point admittedAt() const { return admitted_at_; }

    CallState state() const {
        return state_.load(std::memory_order_acquire);
    }

    bool isCancelled() const {
        return state() == CallState::Cancelled;
    }

    bool isTerminal() const;

    /**
     * @return true if the transition happened, false if the call was not in
     *         a state that allows it (e.g. already terminal)
     */
    bool activate();
    bool complete();
    bool fail(ErrorCode code);
    bool cancel();

    // Pending -> Failed(Timeout): the call never got a worker before its deadline
    bool expire();

    /**
     * @brief Error code recorded by fail(), empty otherwise
     */
    std::optional<ErrorCode> error() const;

    /**
     * @brief Deadline for a processing budget counted from admission,
     *        capped by the call deadline
     */
    Clock::time_point deadlineAfter(Clock::duration budget) const;

    static const char* toString(CallKind kind);
    static const char* toString(CallState state);

private:
    bool transition(CallState target, bool allowFromPending);

    const uint64_t id_;
    const CallKind kind_;
    const std::string method_;
    const std::optional<Clock::time_point> deadline_;
    const Clock::time_point admitted_at_;

    mutable std::mutex mutex_;  // serializes transitions
    std::atomic<CallState> state_{CallState::Pending};
    std::optional<ErrorCode> error_;

    static std::atomic<uint64_t> next_id_;
};

} // namespace StreamRpc
