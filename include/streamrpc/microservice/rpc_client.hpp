/**
 * @file rpc_client.hpp
 * @brief Blocking client for the three StreamRpcCore services
 *
 * Built on grpc::GenericStub with one completion queue per call, so it needs
 * no generated service stubs. Used by the demo client and the loopback tests.
 */

#pragma once

#include <streamrpc/core/chat/chat_message.hpp>
#include <streamrpc/core/errors/rpc_error.hpp>
#include <streamrpc/core/history/transaction_record.hpp>
#include <streamrpc/core/payment/payment_types.hpp>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/completion_queue.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/support/status.h>

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamrpc::microservice {

/**
 * @brief Failure reported by the server, with the raw gRPC status code
 *
 * code() is the core error the status maps back to; statuses without a
 * mapping surface as ProcessingFailure.
 */
class ClientCallError : public StreamRpc::RpcError {
public:
    explicit ClientCallError(const grpc::Status& status);

    grpc::StatusCode statusCode() const noexcept { return status_code_; }

private:
    grpc::StatusCode status_code_;
};

/**
 * @class ChatClient
 * @brief One open Chat call; not thread-safe, drive it from one thread
 */
class ChatClient {
public:
    ChatClient(grpc::GenericStub& stub, std::chrono::milliseconds deadline);
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    // false once the call is broken or the send side was closed
    bool send(const std::string& sender, const std::string& text);

    /**
     * @brief Wait up to timeout for the next broadcast
     * @return nullopt on timeout or once the server ended the stream
     */
    std::optional<StreamRpc::ChatMessage> receive(std::chrono::milliseconds timeout);

    // Half-close: no more sends, broadcasts still arrive
    bool closeSend();

    // True once the server ended its side of the stream
    bool ended() const { return ended_; }

    /**
     * @brief Half-close, drain the rest of the stream and collect the status
     *
     * Messages still in flight are discarded. If the server does not end the
     * stream within timeout the call is cancelled.
     */
    grpc::Status finish(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    void cancel();

private:
    enum Op : int { START = 0, READ, WRITE, WRITES_DONE, FINISH, OP_COUNT };

    void issue(Op op);
    std::optional<bool> await(Op op, std::chrono::system_clock::time_point deadline);

    grpc::ClientContext ctx_;
    grpc::CompletionQueue cq_;
    std::unique_ptr<grpc::GenericClientAsyncReaderWriter> stream_;

    grpc::ByteBuffer in_;
    grpc::ByteBuffer out_;
    grpc::Status status_;

    std::array<bool, OP_COUNT> issued_{};
    std::array<bool, OP_COUNT> done_{};
    std::array<bool, OP_COUNT> ok_{};

    bool broken_ = false;
    bool send_closed_ = false;
    bool ended_ = false;
    bool finished_ = false;
};

/**
 * @class RpcClient
 * @brief Synchronous facade over the payment, history and chat routes
 */
class RpcClient {
public:
    /**
     * @param caPath PEM root certificates; empty for a plaintext channel
     */
    static std::shared_ptr<grpc::Channel> makeChannel(const std::string& target,
                                                      const std::string& caPath = "");

    explicit RpcClient(std::shared_ptr<grpc::Channel> channel);

    // Per-call deadline; zero means none
    void setDeadline(std::chrono::milliseconds deadline) { deadline_ = deadline; }

    /**
     * @throws ClientCallError on a non-OK status
     */
    StreamRpc::PaymentResponse processPayment(const StreamRpc::PaymentRequest& request);

    /**
     * @brief Stream history, handing each record to onRecord as it arrives
     *
     * Returning false from onRecord cancels the call.
     * @return Terminal status of the call
     */
    grpc::Status getTransactionHistory(const StreamRpc::HistoryRequest& request,
                                       const std::function<bool(const StreamRpc::TransactionRecord&)>& onRecord);

    /**
     * @throws ClientCallError on a non-OK status
     */
    std::vector<StreamRpc::TransactionRecord> getTransactionHistory(const StreamRpc::HistoryRequest& request);

    std::unique_ptr<ChatClient> openChat();

    // One request, at most one response, on any route
    grpc::Status callUnary(const std::string& method, const grpc::ByteBuffer& request,
                           grpc::ByteBuffer* response);

private:
    void applyDeadline(grpc::ClientContext& ctx) const;

    std::shared_ptr<grpc::Channel> channel_;
    grpc::GenericStub stub_;
    std::chrono::milliseconds deadline_{0};
};

} // namespace streamrpc::microservice
