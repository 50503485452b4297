#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "auth/AuthManager.hpp"
#include "network/OutboundQueue.hpp"
#include "protocol/Message.hpp"

// One client socket as seen by the gateway. Transports derive from it and
// drain the outbound queue in Flush().
class ClientConnection : public std::enable_shared_from_this<ClientConnection> {
public:
    using Pointer = std::shared_ptr<ClientConnection>;

    ClientConnection(uint64_t connectionId, size_t queueSize, size_t hardLimit);
    virtual ~ClientConnection() = default;

    uint64_t GetId() const { return connectionId_; }
    Clock::time_point GetConnectedAt() const { return connectedAt_; }

    // Queues the message and asks the transport to flush. Closes the
    // connection when the queue overflows.
    void Send(const Message& message);

    virtual void Close(const std::string& reason) = 0;
    virtual std::string GetRemoteAddress() const = 0;
    bool IsOpen() const { return open_; }

    // =============== Identity ===============
    void Bind(const std::shared_ptr<PlayerSession>& player);
    void Unbind();
    std::shared_ptr<PlayerSession> GetPlayer() const;
    bool IsAuthenticated() const;

    const OutboundQueue& GetQueue() const { return queue_; }

protected:
    virtual void Flush() = 0;

    OutboundQueue queue_;
    std::atomic<bool> open_{true};

private:
    uint64_t connectionId_;
    Clock::time_point connectedAt_;

    mutable std::mutex playerMutex_;
    std::shared_ptr<PlayerSession> player_;
};
