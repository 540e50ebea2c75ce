/**
 * @file codec.hpp
 * @brief Wire codec: grpc::ByteBuffer <-> protobuf messages <-> core structs
 *
 * Shared by the server reactors and the client library. Also owns the
 * mapping between core error codes and gRPC status codes.
 */

#pragma once

#include <streamrpc/core/chat/chat_message.hpp>
#include <streamrpc/core/errors/rpc_error.hpp>
#include <streamrpc/core/history/transaction_record.hpp>
#include <streamrpc/core/payment/payment_types.hpp>

#include "streamrpc/v1/chat.pb.h"
#include "streamrpc/v1/history.pb.h"
#include "streamrpc/v1/payment.pb.h"

#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/status.h>

#include <optional>
#include <string>

namespace streamrpc::microservice::codec {

// ============================================================================
// Framing
// ============================================================================

grpc::ByteBuffer toByteBuffer(const google::protobuf::MessageLite& message);

/**
 * @return false if the payload is not a valid encoding of message's type
 */
bool fromByteBuffer(const grpc::ByteBuffer& buffer, google::protobuf::MessageLite& message);

// ============================================================================
// Domain mapping
// ============================================================================

v1::PaymentRequest toProto(const StreamRpc::PaymentRequest& request);
v1::PaymentResponse toProto(const StreamRpc::PaymentResponse& response);
v1::HistoryRequest toProto(const StreamRpc::HistoryRequest& request);
v1::TransactionRecord toProto(const StreamRpc::TransactionRecord& record);
v1::ChatMessage toProto(const StreamRpc::ChatMessage& message);

StreamRpc::PaymentRequest fromProto(const v1::PaymentRequest& request);
StreamRpc::HistoryRequest fromProto(const v1::HistoryRequest& request);
StreamRpc::TransactionRecord fromProto(const v1::TransactionRecord& record);
StreamRpc::ChatMessage fromProto(const v1::ChatMessage& message);

/**
 * @throws StreamRpc::RpcError(ProcessingFailure) on an unknown status string
 */
StreamRpc::PaymentResponse fromProto(const v1::PaymentResponse& response);

std::optional<StreamRpc::PaymentStatus> parsePaymentStatus(const std::string& status);

// ============================================================================
// Status mapping
// ============================================================================

grpc::StatusCode toStatusCode(StreamRpc::ErrorCode code);
grpc::Status toStatus(const StreamRpc::RpcError& error);

// Empty code -> OK
grpc::Status toStatus(std::optional<StreamRpc::ErrorCode> code, const std::string& detail);

// Inverse of toStatusCode, used by the client; OK and unmapped codes -> nullopt
std::optional<StreamRpc::ErrorCode> toErrorCode(grpc::StatusCode code);

} // namespace streamrpc::microservice::codec
