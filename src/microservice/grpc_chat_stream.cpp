#include <streamrpc/microservice/grpc_chat_stream.hpp>
#include <streamrpc/microservice/codec.hpp>

#include <spdlog/spdlog.h>

namespace streamrpc::microservice {

using StreamRpc::ReadStatus;

GrpcChatStream::GrpcChatStream(grpc::ServerGenericBidiReactor* reactor,
                               grpc::GenericCallbackServerContext* ctx)
    : reactor_(reactor), ctx_(ctx), peer_(ctx->peer()) {
}

ReadStatus GrpcChatStream::read(StreamRpc::ChatMessage& out) {
    {
        std::lock_guard<std::mutex> gate(start_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_ || cancelled_) {
                return ReadStatus::CANCELLED;
            }
            read_pending_ = true;
        }
        reactor_->StartRead(&in_);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !read_pending_ || cancelled_ || finished_; });
    if (read_pending_) {
        return ReadStatus::CANCELLED;
    }
    if (!read_ok_) {
        return cancelled_ ? ReadStatus::CANCELLED : ReadStatus::END_OF_STREAM;
    }
    lock.unlock();

    v1::ChatMessage proto;
    if (!codec::fromByteBuffer(in_, proto)) {
        spdlog::warn("[ChatStream] {} sent an undecodable ChatMessage", peer_);
        return ReadStatus::FAILED;
    }
    out = codec::fromProto(proto);
    return ReadStatus::MESSAGE;
}

bool GrpcChatStream::write(const StreamRpc::ChatMessage& message) {
    {
        std::lock_guard<std::mutex> gate(start_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_ || cancelled_) {
                return false;
            }
            write_pending_ = true;
        }
        out_ = codec::toByteBuffer(codec::toProto(message));
        reactor_->StartWrite(&out_);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !write_pending_ || cancelled_ || finished_; });
    return !write_pending_ && write_ok_;
}

void GrpcChatStream::finish(std::optional<StreamRpc::ErrorCode> error, const std::string& detail) {
    finishWithStatus(codec::toStatus(error, detail));
}

void GrpcChatStream::finishWithStatus(const grpc::Status& status) {
    bool writeOutstanding;
    {
        std::lock_guard<std::mutex> gate(start_mutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        writeOutstanding = write_pending_;
    }
    cv_.notify_all();

    // A write stuck on flow control would hold the status back forever
    if (writeOutstanding) {
        ctx_->TryCancel();
    }
    reactor_->Finish(status);
}

void GrpcChatStream::onReadDone(bool ok) {
    bool cancelled = !ok && ctx_->IsCancelled();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        read_pending_ = false;
        read_ok_ = ok;
        if (cancelled) {
            cancelled_ = true;
        }
    }
    cv_.notify_all();
}

void GrpcChatStream::onWriteDone(bool ok) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        write_pending_ = false;
        write_ok_ = ok;
    }
    cv_.notify_all();
}

void GrpcChatStream::onCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void GrpcChatStream::onDone() {
    std::lock_guard<std::mutex> gate(start_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    reactor_ = nullptr;
    ctx_ = nullptr;
    finished_ = true;
}

// ============================================================================
// ChatCallReactor
// ============================================================================

ChatCallReactor::ChatCallReactor(grpc::GenericCallbackServerContext* ctx,
                                 StreamRpc::SessionManager& sessions)
    : stream_(std::make_shared<GrpcChatStream>(this, ctx)) {
    try {
        sessions.admit(stream_);
    } catch (const StreamRpc::RpcError& e) {
        spdlog::warn("[ChatService] Refused {}: {}", stream_->peer(), e.what());
        stream_->finishWithStatus(codec::toStatus(e));
    } catch (const std::exception& e) {
        spdlog::error("[ChatService] Could not admit {}: {}", stream_->peer(), e.what());
        stream_->finishWithStatus(grpc::Status(grpc::StatusCode::INTERNAL, e.what()));
    }
}

void ChatCallReactor::OnReadDone(bool ok) {
    stream_->onReadDone(ok);
}

void ChatCallReactor::OnWriteDone(bool ok) {
    stream_->onWriteDone(ok);
}

void ChatCallReactor::OnCancel() {
    stream_->onCancel();
}

void ChatCallReactor::OnDone() {
    stream_->onDone();
    delete this;
}

} // namespace streamrpc::microservice
