#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace StreamRpc {

/**
 * Clients fill sender and text; the session manager stamps the rest
 * when the message is accepted.
 */
struct ChatMessage {
    uint64_t session_id = 0;   // source session
    std::string sender;
    std::string text;
    uint64_t sequence = 0;     // per-source, starts at 1
    int64_t timestamp_ms = 0;
};

// One immutable copy shared by every destination queue
using ChatMessagePtr = std::shared_ptr<const ChatMessage>;

} // namespace StreamRpc
