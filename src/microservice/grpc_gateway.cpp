/**
 * @file grpc_gateway.cpp
 * @brief gRPC Gateway implementation
 */

#include <streamrpc/microservice/grpc_gateway.hpp>
#include <streamrpc/microservice/gateway_service.hpp>

#include <streamrpc/core/chat/session_manager.hpp>

#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace streamrpc::microservice {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open TLS file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::shared_ptr<grpc::ServerCredentials> makeCredentials(const GrpcConfig& config) {
    if (!config.enable_tls) {
        return grpc::InsecureServerCredentials();
    }
    grpc::SslServerCredentialsOptions options;
    options.pem_key_cert_pairs.push_back({readFile(config.key_path), readFile(config.cert_path)});
    return grpc::SslServerCredentials(options);
}

} // anonymous namespace

struct GrpcGateway::Impl {
    GrpcConfig config;
    ServiceHandlers handlers;
    std::unique_ptr<GatewayService> service;
    std::unique_ptr<grpc::Server> server;
    int selected_port = 0;
    bool running = false;

    Impl(const GrpcConfig& cfg, ServiceHandlers h) : config(cfg), handlers(h) {}
};

GrpcGateway::GrpcGateway(const GrpcConfig& config, ServiceHandlers handlers)
    : impl_(std::make_unique<Impl>(config, handlers)) {
}

GrpcGateway::~GrpcGateway() {
    stop();
}

bool GrpcGateway::start() {
    if (impl_->running) {
        return true;
    }

    const std::string address = impl_->config.host + ":" + std::to_string(impl_->config.port);
    spdlog::info("Starting gRPC Gateway on {} (tls {})", address,
                 impl_->config.enable_tls ? "on" : "off");

    std::shared_ptr<grpc::ServerCredentials> credentials;
    try {
        credentials = makeCredentials(impl_->config);
    } catch (const std::exception& e) {
        spdlog::error("gRPC Gateway credentials failed: {}", e.what());
        return false;
    }

    impl_->service = std::make_unique<GatewayService>(impl_->handlers,
                                                      StreamRpc::MethodRegistry::defaults());

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, credentials, &impl_->selected_port);
    builder.RegisterCallbackGenericService(impl_->service.get());
    builder.SetMaxReceiveMessageSize(static_cast<int>(impl_->config.max_message_size));
    builder.SetMaxSendMessageSize(static_cast<int>(impl_->config.max_message_size));

    impl_->server = builder.BuildAndStart();
    if (!impl_->server || impl_->selected_port == 0) {
        spdlog::error("gRPC Gateway failed to bind {}", address);
        impl_->server.reset();
        return false;
    }

    impl_->running = true;
    spdlog::info("gRPC Gateway listening on {}", get_address());
    return true;
}

void GrpcGateway::stop() {
    if (!impl_->running) {
        return;
    }

    spdlog::info("Stopping gRPC Gateway");

    // Sessions never end on their own; close them first so Shutdown
    // only waits for unary and server-stream calls
    impl_->handlers.sessions.shutdown();

    auto deadline = std::chrono::system_clock::now() + impl_->config.shutdown_grace;
    impl_->server->Shutdown(deadline);
    impl_->server->Wait();
    impl_->server.reset();
    impl_->running = false;
    spdlog::info("gRPC Gateway stopped");
}

bool GrpcGateway::is_running() const {
    return impl_->running;
}

std::string GrpcGateway::get_address() const {
    int port = impl_->selected_port != 0 ? impl_->selected_port : impl_->config.port;
    return impl_->config.host + ":" + std::to_string(port);
}

int GrpcGateway::selected_port() const {
    return impl_->selected_port;
}

} // namespace streamrpc::microservice
