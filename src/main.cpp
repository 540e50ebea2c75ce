#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <stdexcept>

#include <streamrpc/core/config/loader.hpp>
#include <streamrpc/core/chat/session_manager.hpp>
#include <streamrpc/core/history/history_stream.hpp>
#include <streamrpc/core/history/in_memory_transaction_store.hpp>
#include <streamrpc/core/metrics/registry.hpp>
#include <streamrpc/core/payment/payment_gateway.hpp>
#include <streamrpc/core/payment/payment_handler.hpp>
#include <streamrpc/core/utils/thread_pool.hpp>
#include <streamrpc/microservice/grpc_gateway.hpp>

using namespace StreamRpc;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("StreamRpcCore v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: the gateway goes first, the
    // handlers it dispatches to after it
    std::unique_ptr<InMemoryTransactionStore> transactionStore;
    std::unique_ptr<SimulatedPaymentGateway> paymentGateway;
    std::unique_ptr<ThreadPool> paymentExecutor;
    std::unique_ptr<ThreadPool> callPool;
    std::unique_ptr<PaymentHandler> paymentHandler;
    std::unique_ptr<HistoryStreamHandler> historyHandler;
    std::unique_ptr<SessionManager> sessionManager;

    std::unique_ptr<streamrpc::microservice::GrpcGateway> gateway;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    // Transaction history source
    c.transactionStore = std::make_unique<InMemoryTransactionStore>();
    if (!c.transactionStore->loadFromFile(config.history.dataPath)) {
        spdlog::warn("Transaction data not found at {}, history starts empty", config.history.dataPath);
    }

    // Payments: attempts run on their own executor so a full call pool
    // can never starve them
    c.paymentGateway = std::make_unique<SimulatedPaymentGateway>(
        config.payment.approvalLimit,
        std::chrono::milliseconds(config.payment.processingDelayMs)
    );
    c.paymentExecutor = std::make_unique<ThreadPool>(config.server.callWorkers);
    c.callPool = std::make_unique<ThreadPool>(config.server.callWorkers);

    PaymentHandler::Options paymentOptions;
    paymentOptions.timeout = std::chrono::milliseconds(config.payment.timeoutMs);
    paymentOptions.maxAmount = config.payment.maxAmount;
    paymentOptions.currencies = config.payment.currencies;
    c.paymentHandler = std::make_unique<PaymentHandler>(*c.paymentGateway, *c.paymentExecutor, paymentOptions);

    c.historyHandler = std::make_unique<HistoryStreamHandler>(*c.transactionStore);

    // Chat sessions
    SessionManager::Options chatOptions;
    chatOptions.outboundQueueDepth = config.chat.outboundQueueDepth;
    chatOptions.maxSessions = config.chat.maxSessions;
    chatOptions.maxMessageBytes = config.chat.maxMessageBytes;
    chatOptions.maxPendingPerSource = config.chat.maxPendingPerSource;
    chatOptions.drainTimeout = std::chrono::milliseconds(config.chat.drainTimeoutMs);
    c.sessionManager = std::make_unique<SessionManager>(chatOptions);

    // Transport
    streamrpc::microservice::GrpcConfig grpcConfig;
    grpcConfig.host = config.server.host;
    grpcConfig.port = config.server.port;
    grpcConfig.enable_tls = config.server.tls.enable;
    grpcConfig.cert_path = config.server.tls.certPath;
    grpcConfig.key_path = config.server.tls.keyPath;
    grpcConfig.max_message_size = config.server.maxMessageSize;

    c.gateway = std::make_unique<streamrpc::microservice::GrpcGateway>(
        grpcConfig,
        streamrpc::microservice::ServiceHandlers{
            *c.paymentHandler, *c.historyHandler, *c.sessionManager, *c.callPool});

    spdlog::info("Loaded {} transaction account(s), {} call worker(s)",
                 c.transactionStore->accountCount(), config.server.callWorkers);
    return c;
}

static void startComponents(Components& c) {
    spdlog::info("Starting components...");

    if (!c.gateway->start()) {
        throw std::runtime_error("gRPC gateway failed to start");
    }

    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.gateway) c.gateway->stop();
    if (c.callPool) c.callPool->shutdown();
    if (c.paymentExecutor) c.paymentExecutor->shutdown();
    if (c.sessionManager) c.sessionManager->shutdown();

    MetricRegistry::getInstance().logSummary();
    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        // Load configuration
        auto config = loadConfiguration(argc, argv);
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::info("Configuration loaded successfully ({} v{})", config.app_name, config.version);

        // Initialize all components
        auto components = initializeComponents(config);

        // Start all components
        startComponents(components);

        spdlog::info("StreamRpcCore listening on {}. Press Ctrl+C to shutdown.",
                     components.gateway->get_address());

        // Main loop
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Shutdown signal received");

        // Graceful shutdown
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("StreamRpcCore terminated gracefully");
    return EXIT_SUCCESS;
}
