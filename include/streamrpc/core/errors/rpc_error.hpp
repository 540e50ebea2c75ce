#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace StreamRpc {

/**
 * Error taxonomy shared by every call kind.
 * Call-scoped codes surface to that call's caller only; SessionError
 * never leaves the session it was raised on.
 */
enum class ErrorCode : uint8_t {
    InvalidRequest = 0,         // malformed or unacceptable input, never retried
    ProcessingFailure = 1,      // domain failure during unary processing
    StreamProducerFailure = 2,  // server-stream source failed mid-sequence
    SessionError = 3,           // bidi inbound/outbound path failed
    Timeout = 4,                // bounded operation exceeded its deadline
    Cancelled = 5               // caller or server cancelled in-flight work
};

const char* toString(ErrorCode code);

/**
 * @class RpcError
 * @brief Exception carrying an ErrorCode through the handler layers.
 *
 * Handlers throw it, the gateway catches it at the call boundary and turns
 * it into a terminal status.
 */
class RpcError : public std::runtime_error {
public:
    RpcError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Session admission refused because the session limit is reached.
 *
 * A SessionError for the core; the gateway reports it as resource exhaustion.
 */
class SessionLimitError : public RpcError {
public:
    explicit SessionLimitError(const std::string& message)
        : RpcError(ErrorCode::SessionError, message) {}
};

} // namespace StreamRpc
