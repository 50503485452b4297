#include "network/OutboundQueue.hpp"
#include "logging/Logger.hpp"
#include <algorithm>

OutboundQueue::OutboundQueue(size_t softLimit, size_t hardLimit)
    : softLimit_(std::max<size_t>(1, softLimit)),
      hardLimit_(std::max(hardLimit, std::max<size_t>(1, softLimit))) {
}

OutboundQueue::PushResult OutboundQueue::Push(const Message& message) {
    return PushEntry(message.type, IsCritical(message.type) || message.HasRequestId(), message.Serialize());
}

OutboundQueue::PushResult OutboundQueue::Push(MessageType type, std::string text) {
    return PushEntry(type, IsCritical(type), std::move(text));
}

OutboundQueue::PushResult OutboundQueue::PushEntry(MessageType type, bool critical, std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.size() < softLimit_) {
        entries_.push_back(Entry{type, critical, std::move(text)});
        return PushResult::QUEUED;
    }

    auto victim = std::find_if(entries_.begin(), entries_.end(),
                               [](const Entry& entry) { return !entry.critical; });
    if (victim != entries_.end()) {
        Logger::Trace("Outbound queue full, dropping queued {}", ToString(victim->type));
        entries_.erase(victim);
        ++dropped_;
        entries_.push_back(Entry{type, critical, std::move(text)});
        return PushResult::DROPPED_OLDEST;
    }

    if (!critical) {
        ++dropped_;
        return PushResult::DROPPED_INCOMING;
    }

    if (entries_.size() >= hardLimit_) {
        return PushResult::HARD_LIMIT_EXCEEDED;
    }

    entries_.push_back(Entry{type, critical, std::move(text)});
    return PushResult::QUEUED;
}

std::optional<std::string> OutboundQueue::Pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return std::nullopt;
    }
    std::string text = std::move(entries_.front().text);
    entries_.pop_front();
    return text;
}

size_t OutboundQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool OutboundQueue::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

uint64_t OutboundQueue::GetDroppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void OutboundQueue::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}
