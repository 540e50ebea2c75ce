#include <spdlog/spdlog.h>
#include <streamrpc/microservice/rpc_client.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using streamrpc::microservice::ClientCallError;
using streamrpc::microservice::RpcClient;

// ============================================================================
// Usage
// ============================================================================

static void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--target host:port] [--ca ca.pem] [--deadline-ms N] <command>\n"
              << "Commands:\n"
              << "  pay <account> <amount_minor_units> <currency> [reference]\n"
              << "  history <account> [limit]\n"
              << "  chat <name> [--listen-ms N] [message...]\n";
}

struct ClientOptions {
    std::string target = "127.0.0.1:50051";
    std::string caPath;
    long deadlineMs = 0;
    std::vector<std::string> args;
};

static bool parseOptions(int argc, char* argv[], ClientOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--target" || arg == "--ca" || arg == "--deadline-ms") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--target") options.target = value;
            else if (arg == "--ca") options.caPath = value;
            else options.deadlineMs = std::stol(value);
        } else {
            options.args.push_back(arg);
        }
    }
    return !options.args.empty();
}

// ============================================================================
// Commands
// ============================================================================

static int runPay(RpcClient& client, const std::vector<std::string>& args) {
    if (args.size() < 4) {
        return -1;
    }
    StreamRpc::PaymentRequest request;
    request.payer_account = args[1];
    request.amount = std::stoll(args[2]);
    request.currency = args[3];
    request.reference = args.size() > 4 ? args[4] : "";

    StreamRpc::PaymentResponse response = client.processPayment(request);
    spdlog::info("Payment {} {} ({}) at {}", response.payment_id, StreamRpc::toString(response.status),
                 response.message, response.processed_at_ms);
    return EXIT_SUCCESS;
}

static int runHistory(RpcClient& client, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return -1;
    }
    StreamRpc::HistoryRequest request;
    request.account_id = args[1];
    request.limit = args.size() > 2 ? static_cast<uint32_t>(std::stoul(args[2])) : 0;

    size_t count = 0;
    grpc::Status status = client.getTransactionHistory(request, [&count](const StreamRpc::TransactionRecord& r) {
        ++count;
        spdlog::info("{} {} {} {} '{}' @{}", r.transaction_id, r.account_id, r.amount, r.currency,
                     r.description, r.timestamp_ms);
        return true;
    });
    if (!status.ok()) {
        throw ClientCallError(status);
    }
    spdlog::info("{} record(s) received", count);
    return EXIT_SUCCESS;
}

static int runChat(RpcClient& client, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return -1;
    }
    const std::string name = args[1];
    long listenMs = 2000;
    std::vector<std::string> messages;
    for (size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--listen-ms" && i + 1 < args.size()) {
            listenMs = std::stol(args[++i]);
        } else {
            messages.push_back(args[i]);
        }
    }

    auto chat = client.openChat();
    for (const auto& text : messages) {
        if (!chat->send(name, text)) {
            spdlog::error("Chat stream broke while sending");
            break;
        }
    }

    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(listenMs);
    while (std::chrono::steady_clock::now() < until && !chat->ended()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - std::chrono::steady_clock::now());
        if (auto message = chat->receive(left)) {
            spdlog::info("[session {} #{}] {}: {}", message->session_id, message->sequence,
                         message->sender, message->text);
        }
    }

    grpc::Status status = chat->finish();
    if (!status.ok()) {
        throw ClientCallError(status);
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    ClientOptions options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        RpcClient client(RpcClient::makeChannel(options.target, options.caPath));
        client.setDeadline(std::chrono::milliseconds(options.deadlineMs));

        const std::string& command = options.args[0];
        int rc = -1;
        if (command == "pay") rc = runPay(client, options.args);
        else if (command == "history") rc = runHistory(client, options.args);
        else if (command == "chat") rc = runChat(client, options.args);

        if (rc < 0) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        return rc;
    } catch (const ClientCallError& e) {
        spdlog::error("Call failed with status {}: {}", static_cast<int>(e.statusCode()), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
    }
    return EXIT_FAILURE;
}
