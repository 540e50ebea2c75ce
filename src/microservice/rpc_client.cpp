#include <streamrpc/microservice/rpc_client.hpp>
#include <streamrpc/microservice/codec.hpp>

#include <streamrpc/core/admission/method_registry.hpp>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace streamrpc::microservice {

using StreamRpc::ErrorCode;

namespace {

void* tagOf(int op) {
    return reinterpret_cast<void*>(static_cast<intptr_t>(op) + 1);
}

int opOf(void* tag) {
    return static_cast<int>(reinterpret_cast<intptr_t>(tag) - 1);
}

// One operation at a time on a private queue
bool awaitNext(grpc::CompletionQueue& cq) {
    void* tag = nullptr;
    bool ok = false;
    if (!cq.Next(&tag, &ok)) {
        return false;
    }
    return ok;
}

void drainQueue(grpc::CompletionQueue& cq) {
    cq.Shutdown();
    void* tag = nullptr;
    bool ok = false;
    while (cq.Next(&tag, &ok)) {
    }
}

} // anonymous namespace

ClientCallError::ClientCallError(const grpc::Status& status)
    : StreamRpc::RpcError(codec::toErrorCode(status.error_code()).value_or(ErrorCode::ProcessingFailure),
                          status.error_message()),
      status_code_(status.error_code()) {
}

// ============================================================================
// ChatClient
// ============================================================================

ChatClient::ChatClient(grpc::GenericStub& stub, std::chrono::milliseconds deadline) {
    if (deadline.count() > 0) {
        ctx_.set_deadline(std::chrono::system_clock::now() + deadline);
    }
    stream_ = stub.PrepareCall(&ctx_, std::string(StreamRpc::Routes::CHAT), &cq_);
    if (!stream_) {
        broken_ = true;
        ended_ = true;
        return;
    }
    issue(START);
    stream_->StartCall(tagOf(START));
    auto started = await(START, std::chrono::system_clock::time_point::max());
    if (!started.value_or(false)) {
        broken_ = true;
    }
}

ChatClient::~ChatClient() {
    if (stream_ && !finished_) {
        ctx_.TryCancel();
        finish(std::chrono::milliseconds(1000));
    }
    drainQueue(cq_);
}

void ChatClient::issue(Op op) {
    issued_[op] = true;
    done_[op] = false;
}

std::optional<bool> ChatClient::await(Op op, std::chrono::system_clock::time_point deadline) {
    while (!done_[op]) {
        void* tag = nullptr;
        bool ok = false;
        grpc::CompletionQueue::NextStatus st = cq_.AsyncNext(&tag, &ok, deadline);
        if (st == grpc::CompletionQueue::TIMEOUT) {
            return std::nullopt;
        }
        if (st == grpc::CompletionQueue::SHUTDOWN) {
            return false;
        }
        int completed = opOf(tag);
        done_[completed] = true;
        ok_[completed] = ok;
    }
    issued_[op] = false;
    done_[op] = false;
    return ok_[op];
}

bool ChatClient::send(const std::string& sender, const std::string& text) {
    if (broken_ || send_closed_) {
        return false;
    }
    StreamRpc::ChatMessage message;
    message.sender = sender;
    message.text = text;
    out_ = codec::toByteBuffer(codec::toProto(message));

    issue(WRITE);
    stream_->Write(out_, tagOf(WRITE));
    if (!await(WRITE, std::chrono::system_clock::time_point::max()).value_or(false)) {
        broken_ = true;
        return false;
    }
    return true;
}

std::optional<StreamRpc::ChatMessage> ChatClient::receive(std::chrono::milliseconds timeout) {
    if (!stream_ || ended_) {
        return std::nullopt;
    }
    if (!issued_[READ]) {
        issue(READ);
        stream_->Read(&in_, tagOf(READ));
    }

    auto ok = await(READ, std::chrono::system_clock::now() + timeout);
    if (!ok) {
        return std::nullopt;  // still pending, picked up by the next receive
    }
    if (!*ok) {
        ended_ = true;
        return std::nullopt;
    }

    v1::ChatMessage proto;
    if (!codec::fromByteBuffer(in_, proto)) {
        spdlog::warn("[ChatClient] Undecodable ChatMessage from server");
        return std::nullopt;
    }
    return codec::fromProto(proto);
}

bool ChatClient::closeSend() {
    if (broken_ || send_closed_) {
        return !broken_;
    }
    send_closed_ = true;
    issue(WRITES_DONE);
    stream_->WritesDone(tagOf(WRITES_DONE));
    return await(WRITES_DONE, std::chrono::system_clock::time_point::max()).value_or(false);
}

grpc::Status ChatClient::finish(std::chrono::milliseconds timeout) {
    if (finished_) {
        return status_;
    }
    if (!stream_) {
        finished_ = true;
        status_ = grpc::Status(grpc::StatusCode::UNAVAILABLE, "call could not be created");
        return status_;
    }

    closeSend();

    auto deadline = std::chrono::system_clock::now() + timeout;
    while (!ended_) {
        if (!issued_[READ]) {
            issue(READ);
            stream_->Read(&in_, tagOf(READ));
        }
        auto ok = await(READ, deadline);
        if (!ok) {
            spdlog::warn("[ChatClient] Server did not end the chat stream in time, cancelling");
            ctx_.TryCancel();
            deadline = std::chrono::system_clock::time_point::max();
            continue;
        }
        if (!*ok) {
            ended_ = true;
        }
    }

    issue(FINISH);
    stream_->Finish(&status_, tagOf(FINISH));
    await(FINISH, std::chrono::system_clock::time_point::max());
    finished_ = true;
    return status_;
}

void ChatClient::cancel() {
    ctx_.TryCancel();
}

// ============================================================================
// RpcClient
// ============================================================================

std::shared_ptr<grpc::Channel> RpcClient::makeChannel(const std::string& target, const std::string& caPath) {
    if (caPath.empty()) {
        return grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
    }
    std::ifstream file(caPath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open CA file: " + caPath);
    }
    std::ostringstream pem;
    pem << file.rdbuf();

    grpc::SslCredentialsOptions options;
    options.pem_root_certs = pem.str();
    return grpc::CreateChannel(target, grpc::SslCredentials(options));
}

RpcClient::RpcClient(std::shared_ptr<grpc::Channel> channel)
    : channel_(channel), stub_(std::move(channel)) {
}

void RpcClient::applyDeadline(grpc::ClientContext& ctx) const {
    if (deadline_.count() > 0) {
        ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
    }
}

grpc::Status RpcClient::callUnary(const std::string& method, const grpc::ByteBuffer& request,
                                  grpc::ByteBuffer* response) {
    grpc::ClientContext ctx;
    applyDeadline(ctx);
    grpc::CompletionQueue cq;
    grpc::Status status;

    auto call = stub_.PrepareUnaryCall(&ctx, method, request, &cq);
    if (!call) {
        drainQueue(cq);
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "call could not be created");
    }
    call->StartCall();
    call->Finish(response, &status, tagOf(0));
    awaitNext(cq);
    drainQueue(cq);
    return status;
}

StreamRpc::PaymentResponse RpcClient::processPayment(const StreamRpc::PaymentRequest& request) {
    grpc::ByteBuffer response;
    grpc::Status status = callUnary(std::string(StreamRpc::Routes::PROCESS_PAYMENT),
                                    codec::toByteBuffer(codec::toProto(request)), &response);
    if (!status.ok()) {
        throw ClientCallError(status);
    }

    v1::PaymentResponse proto;
    if (!codec::fromByteBuffer(response, proto)) {
        throw StreamRpc::RpcError(ErrorCode::ProcessingFailure, "malformed PaymentResponse");
    }
    return codec::fromProto(proto);
}

grpc::Status RpcClient::getTransactionHistory(
        const StreamRpc::HistoryRequest& request,
        const std::function<bool(const StreamRpc::TransactionRecord&)>& onRecord) {
    grpc::ClientContext ctx;
    applyDeadline(ctx);
    grpc::CompletionQueue cq;
    grpc::Status status;

    auto stream = stub_.PrepareCall(&ctx, std::string(StreamRpc::Routes::TRANSACTION_HISTORY), &cq);
    if (!stream) {
        drainQueue(cq);
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "call could not be created");
    }

    stream->StartCall(tagOf(0));
    bool ok = awaitNext(cq);
    if (ok) {
        grpc::ByteBuffer out = codec::toByteBuffer(codec::toProto(request));
        stream->Write(out, tagOf(0));
        ok = awaitNext(cq);
    }
    if (ok) {
        stream->WritesDone(tagOf(0));
        awaitNext(cq);
    }

    // Reads fail once the server finished the stream
    while (ok) {
        grpc::ByteBuffer in;
        stream->Read(&in, tagOf(0));
        if (!awaitNext(cq)) {
            break;
        }
        v1::TransactionRecord proto;
        if (!codec::fromByteBuffer(in, proto)) {
            spdlog::warn("[RpcClient] Undecodable TransactionRecord, cancelling history call");
            ctx.TryCancel();
            ok = false;
            break;
        }
        if (!onRecord(codec::fromProto(proto))) {
            ctx.TryCancel();
            ok = false;
        }
    }

    // After a cancel the server may still have frames queued
    if (!ok) {
        grpc::ByteBuffer discard;
        do {
            stream->Read(&discard, tagOf(0));
        } while (awaitNext(cq));
    }

    stream->Finish(&status, tagOf(0));
    awaitNext(cq);
    drainQueue(cq);
    return status;
}

std::vector<StreamRpc::TransactionRecord> RpcClient::getTransactionHistory(const StreamRpc::HistoryRequest& request) {
    std::vector<StreamRpc::TransactionRecord> records;
    grpc::Status status = getTransactionHistory(request, [&records](const StreamRpc::TransactionRecord& record) {
        records.push_back(record);
        return true;
    });
    if (!status.ok()) {
        throw ClientCallError(status);
    }
    return records;
}

std::unique_ptr<ChatClient> RpcClient::openChat() {
    return std::make_unique<ChatClient>(stub_, deadline_);
}

} // namespace streamrpc::microservice
