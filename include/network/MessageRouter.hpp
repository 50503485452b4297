#pragma once

#include <functional>
#include <map>
#include <string>

#include "network/ClientConnection.hpp"
#include "protocol/Message.hpp"

// Registered dispatch table: message type -> handler.
class MessageRouter {
public:
    using Handler = std::function<void(const ClientConnection::Pointer&, const Message&)>;

    void RegisterHandler(MessageType type, Handler handler, bool requiresAuth = true);
    void UnregisterHandler(MessageType type);

    bool HasHandler(MessageType type) const;
    bool RequiresAuth(MessageType type) const;

    // Throws ProtocolError UNKNOWN_MESSAGE_TYPE or NOT_AUTHENTICATED.
    void Dispatch(const ClientConnection::Pointer& connection, const Message& message) const;

private:
    struct Route {
        Handler handler;
        bool requiresAuth;
    };

    std::map<MessageType, Route> routes_;
};
