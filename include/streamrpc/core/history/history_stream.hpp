#pragma once
#include <streamrpc/core/calls/call.hpp>
#include <streamrpc/core/history/transaction_source.hpp>

namespace StreamRpc {

/**
 * @brief Outbound side of a server-stream call
 *
 * write() returns once the transport has accepted the record, so a slow
 * reader suspends the producer. It returns false when the peer is gone.
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;
    virtual bool write(const TransactionRecord& record) = 0;
};

/**
 * @class HistoryStreamHandler
 * @brief Server-stream handler for transaction history.
 *
 * Records are pulled from a fresh cursor one at a time and written in source
 * order; the next record is only pulled after the sink accepted the previous
 * one. A cursor failure ends the stream with StreamProducerFailure after the
 * records already sent, never with a silent short stream.
 */
class HistoryStreamHandler {
public:
    explicit HistoryStreamHandler(TransactionSource& source);

    /**
     * @return Number of records written
     * @throws RpcError InvalidRequest, StreamProducerFailure or Cancelled
     */
    size_t stream(Call& call, const HistoryRequest& request, RecordSink& sink);

private:
    TransactionSource& source_;
};

} // namespace StreamRpc
