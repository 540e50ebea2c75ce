#include <streamrpc/core/history/history_stream.hpp>
#include <spdlog/spdlog.h>

namespace StreamRpc {

HistoryStreamHandler::HistoryStreamHandler(TransactionSource& source) : source_(source) {
}

size_t HistoryStreamHandler::stream(Call& call, const HistoryRequest& request, RecordSink& sink) {
    if (request.account_id.empty()) {
        throw RpcError(ErrorCode::InvalidRequest, "account_id is required");
    }

    std::unique_ptr<TransactionCursor> cursor;
    try {
        cursor = source_.open(request.account_id);
    } catch (const std::exception& e) {
        spdlog::error("[HistoryStream] call {} failed to open {} for '{}': {}", call.id(),
                      source_.name(), request.account_id, e.what());
        throw RpcError(ErrorCode::StreamProducerFailure, e.what());
    }
    if (!cursor) {
        throw RpcError(ErrorCode::StreamProducerFailure, "source returned no cursor");
    }

    size_t sent = 0;
    while (request.limit == 0 || sent < request.limit) {
        if (call.isCancelled()) {
            spdlog::info("[HistoryStream] call {} cancelled after {} records", call.id(), sent);
            throw RpcError(ErrorCode::Cancelled, "history stream cancelled");
        }

        std::optional<TransactionRecord> record;
        try {
            record = cursor->next();
        } catch (const std::exception& e) {
            spdlog::error("[HistoryStream] call {} source failed after {} records: {}",
                          call.id(), sent, e.what());
            throw RpcError(ErrorCode::StreamProducerFailure,
                           "source failed after " + std::to_string(sent) + " records: " + e.what());
        }
        if (!record) {
            break;  // source exhausted
        }

        if (!sink.write(*record)) {
            spdlog::info("[HistoryStream] call {} peer stopped receiving after {} records",
                         call.id(), sent);
            throw RpcError(ErrorCode::Cancelled, "client stopped receiving");
        }
        ++sent;
    }

    spdlog::debug("[HistoryStream] call {} streamed {} records for '{}'", call.id(), sent,
                  request.account_id);
    return sent;
}

} // namespace StreamRpc
