#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "protocol/Message.hpp"

// Bounded per-connection send queue.
//
// Below the soft limit every message is queued. At the soft limit the oldest
// non-critical message makes room; if none is left, a non-critical message is
// dropped and a critical one is queued anyway. Replies carrying a request_id
// count as critical. Past the hard limit the queue reports
// HARD_LIMIT_EXCEEDED and the connection must be closed.
class OutboundQueue {
public:
    enum class PushResult {
        QUEUED,
        DROPPED_OLDEST,
        DROPPED_INCOMING,
        HARD_LIMIT_EXCEEDED
    };

    OutboundQueue(size_t softLimit, size_t hardLimit);

    PushResult Push(const Message& message);
    PushResult Push(MessageType type, std::string text);

    std::optional<std::string> Pop();

    size_t Size() const;
    bool Empty() const;
    uint64_t GetDroppedCount() const;
    void Clear();

private:
    PushResult PushEntry(MessageType type, bool critical, std::string text);

    struct Entry {
        MessageType type;
        bool critical;
        std::string text;
    };

    size_t softLimit_;
    size_t hardLimit_;

    mutable std::mutex mutex_;
    std::deque<Entry> entries_;
    uint64_t dropped_ = 0;
};
