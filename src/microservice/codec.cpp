#include <streamrpc/microservice/codec.hpp>

#include <vector>

namespace streamrpc::microservice::codec {

using StreamRpc::ErrorCode;

grpc::ByteBuffer toByteBuffer(const google::protobuf::MessageLite& message) {
    std::string payload = message.SerializeAsString();
    grpc::Slice slice(payload);
    return grpc::ByteBuffer(&slice, 1);
}

bool fromByteBuffer(const grpc::ByteBuffer& buffer, google::protobuf::MessageLite& message) {
    std::vector<grpc::Slice> slices;
    if (!buffer.Dump(&slices).ok()) {
        return false;
    }

    if (slices.size() == 1) {
        return message.ParseFromArray(slices[0].begin(), static_cast<int>(slices[0].size()));
    }

    std::string payload;
    payload.reserve(buffer.Length());
    for (const auto& slice : slices) {
        payload.append(reinterpret_cast<const char*>(slice.begin()), slice.size());
    }
    return message.ParseFromString(payload);
}

// ============================================================================
// Payment
// ============================================================================

v1::PaymentRequest toProto(const StreamRpc::PaymentRequest& request) {
    v1::PaymentRequest out;
    out.set_payer_account(request.payer_account);
    out.set_amount(request.amount);
    out.set_currency(request.currency);
    out.set_reference(request.reference);
    return out;
}

v1::PaymentResponse toProto(const StreamRpc::PaymentResponse& response) {
    v1::PaymentResponse out;
    out.set_payment_id(response.payment_id);
    out.set_status(StreamRpc::toString(response.status));
    out.set_message(response.message);
    out.set_processed_at_ms(response.processed_at_ms);
    return out;
}

StreamRpc::PaymentRequest fromProto(const v1::PaymentRequest& request) {
    StreamRpc::PaymentRequest out;
    out.payer_account = request.payer_account();
    out.amount = request.amount();
    out.currency = request.currency();
    out.reference = request.reference();
    return out;
}

StreamRpc::PaymentResponse fromProto(const v1::PaymentResponse& response) {
    auto status = parsePaymentStatus(response.status());
    if (!status) {
        throw StreamRpc::RpcError(ErrorCode::ProcessingFailure,
                                  "unknown payment status '" + response.status() + "'");
    }
    StreamRpc::PaymentResponse out;
    out.payment_id = response.payment_id();
    out.status = *status;
    out.message = response.message();
    out.processed_at_ms = response.processed_at_ms();
    return out;
}

std::optional<StreamRpc::PaymentStatus> parsePaymentStatus(const std::string& status) {
    if (status == StreamRpc::toString(StreamRpc::PaymentStatus::APPROVED)) {
        return StreamRpc::PaymentStatus::APPROVED;
    }
    if (status == StreamRpc::toString(StreamRpc::PaymentStatus::DECLINED)) {
        return StreamRpc::PaymentStatus::DECLINED;
    }
    return std::nullopt;
}

// ============================================================================
// History
// ============================================================================

v1::HistoryRequest toProto(const StreamRpc::HistoryRequest& request) {
    v1::HistoryRequest out;
    out.set_account_id(request.account_id);
    out.set_limit(request.limit);
    return out;
}

v1::TransactionRecord toProto(const StreamRpc::TransactionRecord& record) {
    v1::TransactionRecord out;
    out.set_transaction_id(record.transaction_id);
    out.set_account_id(record.account_id);
    out.set_amount(record.amount);
    out.set_currency(record.currency);
    out.set_description(record.description);
    out.set_timestamp_ms(record.timestamp_ms);
    return out;
}

StreamRpc::HistoryRequest fromProto(const v1::HistoryRequest& request) {
    StreamRpc::HistoryRequest out;
    out.account_id = request.account_id();
    out.limit = request.limit();
    return out;
}

StreamRpc::TransactionRecord fromProto(const v1::TransactionRecord& record) {
    StreamRpc::TransactionRecord out;
    out.transaction_id = record.transaction_id();
    out.account_id = record.account_id();
    out.amount = record.amount();
    out.currency = record.currency();
    out.description = record.description();
    out.timestamp_ms = record.timestamp_ms();
    return out;
}

// ============================================================================
// Chat
// ============================================================================

v1::ChatMessage toProto(const StreamRpc::ChatMessage& message) {
    v1::ChatMessage out;
    out.set_session_id(message.session_id);
    out.set_sender(message.sender);
    out.set_text(message.text);
    out.set_sequence(message.sequence);
    out.set_timestamp_ms(message.timestamp_ms);
    return out;
}

StreamRpc::ChatMessage fromProto(const v1::ChatMessage& message) {
    StreamRpc::ChatMessage out;
    out.session_id = message.session_id();
    out.sender = message.sender();
    out.text = message.text();
    out.sequence = message.sequence();
    out.timestamp_ms = message.timestamp_ms();
    return out;
}

// ============================================================================
// Status mapping
// ============================================================================

grpc::StatusCode toStatusCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:        return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorCode::ProcessingFailure:     return grpc::StatusCode::ABORTED;
        case ErrorCode::StreamProducerFailure: return grpc::StatusCode::INTERNAL;
        case ErrorCode::SessionError:          return grpc::StatusCode::UNAVAILABLE;
        case ErrorCode::Timeout:               return grpc::StatusCode::DEADLINE_EXCEEDED;
        case ErrorCode::Cancelled:             return grpc::StatusCode::CANCELLED;
        default:                               return grpc::StatusCode::UNKNOWN;
    }
}

grpc::Status toStatus(const StreamRpc::RpcError& error) {
    if (dynamic_cast<const StreamRpc::SessionLimitError*>(&error) != nullptr) {
        return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, error.what());
    }
    return grpc::Status(toStatusCode(error.code()), error.what());
}

grpc::Status toStatus(std::optional<ErrorCode> code, const std::string& detail) {
    if (!code) {
        return grpc::Status::OK;
    }
    return grpc::Status(toStatusCode(*code), std::string(StreamRpc::toString(*code)) + ": " + detail);
}

std::optional<ErrorCode> toErrorCode(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::INVALID_ARGUMENT:   return ErrorCode::InvalidRequest;
        case grpc::StatusCode::ABORTED:            return ErrorCode::ProcessingFailure;
        case grpc::StatusCode::INTERNAL:           return ErrorCode::StreamProducerFailure;
        case grpc::StatusCode::UNAVAILABLE:        return ErrorCode::SessionError;
        case grpc::StatusCode::RESOURCE_EXHAUSTED: return ErrorCode::SessionError;
        case grpc::StatusCode::DEADLINE_EXCEEDED:  return ErrorCode::Timeout;
        case grpc::StatusCode::CANCELLED:          return ErrorCode::Cancelled;
        default:                                   return std::nullopt;
    }
}

} // namespace streamrpc::microservice::codec
