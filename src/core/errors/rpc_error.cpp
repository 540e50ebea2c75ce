#include <streamrpc/core/errors/rpc_error.hpp>

namespace StreamRpc {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:        return "InvalidRequest";
        case ErrorCode::ProcessingFailure:     return "ProcessingFailure";
        case ErrorCode::StreamProducerFailure: return "StreamProducerFailure";
        case ErrorCode::SessionError:          return "SessionError";
        case ErrorCode::Timeout:               return "Timeout";
        case ErrorCode::Cancelled:             return "Cancelled";
        default:                               return "Unknown";
    }
}

RpcError::RpcError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(toString(code)) + ": " + message), code_(code) {
}

} // namespace StreamRpc
