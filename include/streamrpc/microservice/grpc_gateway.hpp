/**
 * @file grpc_gateway.hpp
 * @brief gRPC Gateway for StreamRpcCore
 *
 * Serves the payment, transaction-history and chat services over one
 * HTTP/2 listener. Each RPC is a logical stream on the shared connection.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace StreamRpc {
class PaymentHandler;
class HistoryStreamHandler;
class SessionManager;
class ThreadPool;
class MethodRegistry;
}

namespace streamrpc::microservice {

/**
 * @brief gRPC Gateway configuration
 */
struct GrpcConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 50051;                          // 0 = pick a free port
    bool enable_tls = false;
    std::string cert_path;
    std::string key_path;
    size_t max_message_size = 4 * 1024 * 1024;      // 4MB
    std::chrono::milliseconds shutdown_grace{5000};
};

/**
 * @brief Handlers the gateway dispatches to; owned by the caller and
 * required to outlive the gateway
 */
struct ServiceHandlers {
    StreamRpc::PaymentHandler& payment;
    StreamRpc::HistoryStreamHandler& history;
    StreamRpc::SessionManager& sessions;
    StreamRpc::ThreadPool& callPool;     // runs unary and server-stream calls
};

/**
 * @brief gRPC Gateway for StreamRpcCore
 *
 * Routes every call by method name:
 * - unary and server-stream calls run as tasks on the call pool
 * - bidi chat calls are admitted as sessions
 * - unknown methods finish with UNIMPLEMENTED
 */
class GrpcGateway {
public:
    GrpcGateway(const GrpcConfig& config, ServiceHandlers handlers);
    ~GrpcGateway();

    // Non-copyable
    GrpcGateway(const GrpcGateway&) = delete;
    GrpcGateway& operator=(const GrpcGateway&) = delete;

    /**
     * @brief Start the gRPC server
     * @return true if started successfully
     */
    bool start();

    /**
     * @brief Stop the gRPC server gracefully
     *
     * Closes every chat session with CANCELLED, then gives in-flight unary
     * and server-stream calls the shutdown grace period before cancelling them.
     */
    void stop();

    /**
     * @brief Check if server is running
     */
    bool is_running() const;

    /**
     * @brief Get server address (with the bound port once started)
     */
    std::string get_address() const;

    /**
     * @brief Port actually bound, 0 before start()
     */
    int selected_port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace streamrpc::microservice
