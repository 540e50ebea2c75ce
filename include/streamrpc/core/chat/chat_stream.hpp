#pragma once
#include <streamrpc/core/chat/chat_message.hpp>
#include <streamrpc/core/errors/rpc_error.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace StreamRpc {

enum class ReadStatus : uint8_t {
    MESSAGE = 0,        // out was filled
    END_OF_STREAM = 1,  // client closed its send side
    CANCELLED = 2,      // call cancelled or connection lost
    FAILED = 3          // transport or decode failure
};

/**
 * @class ChatStream
 * @brief Transport port of one bidirectional call, as seen by a Session.
 *
 * read() and write() block; the session runs one reader and one writer,
 * never two of the same kind concurrently. finish() may be called from any
 * thread, must be idempotent, and must unblock pending read()/write().
 */
class ChatStream {
public:
    virtual ~ChatStream() = default;

    virtual ReadStatus read(ChatMessage& out) = 0;

    // Returns once the transport accepted the message; false if it never will
    virtual bool write(const ChatMessage& message) = 0;

    // Terminal status: empty error means a clean end of call
    virtual void finish(std::optional<ErrorCode> error, const std::string& detail) = 0;

    virtual std::string peer() const = 0;
};

} // namespace StreamRpc
