#include "network/MessageRouter.hpp"
#include "logging/Logger.hpp"

void MessageRouter::RegisterHandler(MessageType type, Handler handler, bool requiresAuth) {
    if (routes_.count(type)) {
        Logger::Warn("Replacing handler for message type {}", ToString(type));
    }
    routes_[type] = Route{std::move(handler), requiresAuth};
    Logger::Debug("Registered handler for {}", ToString(type));
}

void MessageRouter::UnregisterHandler(MessageType type) {
    routes_.erase(type);
}

bool MessageRouter::HasHandler(MessageType type) const {
    return routes_.find(type) != routes_.end();
}

bool MessageRouter::RequiresAuth(MessageType type) const {
    auto it = routes_.find(type);
    return it == routes_.end() || it->second.requiresAuth;
}

void MessageRouter::Dispatch(const ClientConnection::Pointer& connection, const Message& message) const {
    auto it = routes_.find(message.type);
    if (it == routes_.end()) {
        throw ProtocolError(ErrorCode::UNKNOWN_MESSAGE_TYPE,
                            std::string("No handler for ") + ToString(message.type));
    }

    if (it->second.requiresAuth && !connection->IsAuthenticated()) {
        throw ProtocolError(ErrorCode::NOT_AUTHENTICATED, "Authenticate first");
    }

    Logger::Trace("Connection {} -> {}", connection->GetId(), ToString(message.type));
    it->second.handler(connection, message);
}
