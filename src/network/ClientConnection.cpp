#include "network/ClientConnection.hpp"
#include "logging/Logger.hpp"

ClientConnection::ClientConnection(uint64_t connectionId, size_t queueSize, size_t hardLimit)
    : queue_(queueSize, hardLimit),
      connectionId_(connectionId),
      connectedAt_(Clock::now()) {
}

void ClientConnection::Send(const Message& message) {
    if (!open_) {
        return;
    }

    switch (queue_.Push(message)) {
        case OutboundQueue::PushResult::HARD_LIMIT_EXCEEDED:
            Logger::Warn("Connection {} outbound queue overflowed ({} pending), closing",
                         connectionId_, queue_.Size());
            Close("outbound queue overflow");
            return;
        case OutboundQueue::PushResult::DROPPED_OLDEST:
        case OutboundQueue::PushResult::DROPPED_INCOMING:
            Logger::Debug("Connection {} is slow, dropped a non-critical message ({} total)",
                          connectionId_, queue_.GetDroppedCount());
            break;
        case OutboundQueue::PushResult::QUEUED:
            break;
    }

    Flush();
}

void ClientConnection::Bind(const std::shared_ptr<PlayerSession>& player) {
    std::lock_guard<std::mutex> lock(playerMutex_);
    player_ = player;
}

void ClientConnection::Unbind() {
    std::lock_guard<std::mutex> lock(playerMutex_);
    player_.reset();
}

std::shared_ptr<PlayerSession> ClientConnection::GetPlayer() const {
    std::lock_guard<std::mutex> lock(playerMutex_);
    return player_;
}

bool ClientConnection::IsAuthenticated() const {
    std::lock_guard<std::mutex> lock(playerMutex_);
    return player_ != nullptr;
}
