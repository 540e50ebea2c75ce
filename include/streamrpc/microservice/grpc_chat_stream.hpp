#pragma once

#include <streamrpc/core/chat/chat_stream.hpp>
#include <streamrpc/core/chat/session_manager.hpp>

#include <grpcpp/generic/async_generic_service.h>

#include <condition_variable>
#include <memory>
#include <mutex>

namespace streamrpc::microservice {

/**
 * @class GrpcChatStream
 * @brief ChatStream over a callback bidi reactor.
 *
 * read() and write() start one reactor operation and block the calling
 * session thread until its reaction arrives. The object may outlive the
 * reactor: once finish() has run no further reactor operation is started,
 * and the reactor is only destroyed after its Finish completed.
 */
class GrpcChatStream : public StreamRpc::ChatStream {
public:
    GrpcChatStream(grpc::ServerGenericBidiReactor* reactor, grpc::GenericCallbackServerContext* ctx);

    StreamRpc::ReadStatus read(StreamRpc::ChatMessage& out) override;
    bool write(const StreamRpc::ChatMessage& message) override;
    void finish(std::optional<StreamRpc::ErrorCode> error, const std::string& detail) override;
    std::string peer() const override { return peer_; }

    // Idempotent; the first status wins
    void finishWithStatus(const grpc::Status& status);

    // Reactions forwarded by the owning reactor
    void onReadDone(bool ok);
    void onWriteDone(bool ok);
    void onCancel();
    void onDone();

private:
    grpc::ServerGenericBidiReactor* reactor_;
    grpc::GenericCallbackServerContext* ctx_;
    const std::string peer_;

    grpc::ByteBuffer in_;
    grpc::ByteBuffer out_;

    // Held while starting an operation so finish() cannot interleave
    std::mutex start_mutex_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool read_pending_ = false;
    bool read_ok_ = false;
    bool write_pending_ = false;
    bool write_ok_ = false;
    bool cancelled_ = false;
    bool finished_ = false;
};

/**
 * @class ChatCallReactor
 * @brief Reactor for one bidi chat call; admits it as a session on creation
 */
class ChatCallReactor : public grpc::ServerGenericBidiReactor {
public:
    ChatCallReactor(grpc::GenericCallbackServerContext* ctx, StreamRpc::SessionManager& sessions);

    void OnReadDone(bool ok) override;
    void OnWriteDone(bool ok) override;
    void OnCancel() override;
    void OnDone() override;

private:
    std::shared_ptr<GrpcChatStream> stream_;
};

} // namespace streamrpc::microservice
