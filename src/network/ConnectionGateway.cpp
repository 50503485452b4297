#include "network/ConnectionGateway.hpp"
#include "logging/Logger.hpp"
#include <functional>
#include <mutex>
#include <vector>

namespace {

// Optional string field; throws when present with the wrong type.
std::string OptionalString(const nlohmann::json& payload, const char* key) {
    if (!payload.contains(key) || payload[key].is_null()) {
        return "";
    }
    if (!payload[key].is_string()) {
        throw ProtocolError(ErrorCode::INVALID_PAYLOAD, std::string(key) + " must be a string");
    }
    return payload[key].get<std::string>();
}

std::string RequiredString(const nlohmann::json& payload, const char* key) {
    std::string value = OptionalString(payload, key);
    if (value.empty()) {
        throw ProtocolError(ErrorCode::INVALID_PAYLOAD, std::string("Missing ") + key);
    }
    return value;
}

} // namespace

// =============== ConnectionGateway Implementation ===============

ConnectionGateway::ConnectionGateway(const ServerSettings& settings, GameRules rules)
    : settings_(settings),
      auth_(settings.tokenExpiry),
      sessions_(settings, std::move(rules), *this) {
    RegisterHandlers();
    Logger::Info("ConnectionGateway initialized");
}

ConnectionGateway::~ConnectionGateway() {
    Logger::Debug("ConnectionGateway destroyed");
}

void ConnectionGateway::RegisterHandlers() {
    using namespace std::placeholders;

    router_.RegisterHandler(MessageType::AUTH,
        std::bind(&ConnectionGateway::HandleAuth, this, _1, _2), false);
    router_.RegisterHandler(MessageType::RECONNECT,
        std::bind(&ConnectionGateway::HandleReconnect, this, _1, _2), false);
    router_.RegisterHandler(MessageType::PING,
        std::bind(&ConnectionGateway::HandlePing, this, _1, _2), false);

    router_.RegisterHandler(MessageType::CREATE_GAME,
        std::bind(&ConnectionGateway::HandleCreateGame, this, _1, _2));
    router_.RegisterHandler(MessageType::JOIN_GAME,
        std::bind(&ConnectionGateway::HandleJoinGame, this, _1, _2));
    router_.RegisterHandler(MessageType::LEAVE_GAME,
        std::bind(&ConnectionGateway::HandleLeaveGame, this, _1, _2));
    router_.RegisterHandler(MessageType::READY,
        std::bind(&ConnectionGateway::HandleReady, this, _1, _2));
    router_.RegisterHandler(MessageType::ACTION,
        std::bind(&ConnectionGateway::HandleAction, this, _1, _2));
    router_.RegisterHandler(MessageType::CHAT,
        std::bind(&ConnectionGateway::HandleChat, this, _1, _2));
    router_.RegisterHandler(MessageType::RESYNC,
        std::bind(&ConnectionGateway::HandleResync, this, _1, _2));
    router_.RegisterHandler(MessageType::LIST_GAMES,
        std::bind(&ConnectionGateway::HandleListGames, this, _1, _2));
}

// =============== Connection Lifecycle ===============

bool ConnectionGateway::OnOpen(const ClientConnection::Pointer& connection) {
    if (shuttingDown_) {
        connection->Close("server shutting down");
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(connectionsMutex_);
        if (static_cast<int>(connections_.size()) >= settings_.maxConnections) {
            lock.unlock();
            Logger::Warn("Refusing connection {} from {}: limit of {} reached",
                         connection->GetId(), connection->GetRemoteAddress(), settings_.maxConnections);
            connection->Send(Message::Error(ErrorCode::INTERNAL_ERROR, "Server is full"));
            connection->Close("server full");
            return false;
        }
        connections_[connection->GetId()] = connection;
    }

    Logger::Info("Connection {} opened from {}", connection->GetId(), connection->GetRemoteAddress());
    return true;
}

void ConnectionGateway::OnText(const ClientConnection::Pointer& connection, const std::string& text) {
    nlohmann::json requestId;

    try {
        if (text.size() > settings_.maxMessageSize) {
            throw ProtocolError(ErrorCode::INVALID_PAYLOAD, "Message too large");
        }

        Message message = Message::Parse(text);
        requestId = message.requestId;
        router_.Dispatch(connection, message);

    } catch (const AuthError& e) {
        Logger::Debug("Connection {} auth failure: {}", connection->GetId(), e.what());
        connection->Send(Message::AuthFailure(e.GetReason(), e.what()).WithRequestId(requestId));
    } catch (const GameError& e) {
        Logger::Debug("Connection {} request failed: {} ({})", connection->GetId(), e.GetReason(), e.what());
        connection->Send(Message::Error(e).WithRequestId(requestId));
    } catch (const nlohmann::json::exception& e) {
        Logger::Debug("Connection {} sent an unusable payload: {}", connection->GetId(), e.what());
        connection->Send(Message::Error(ErrorCode::INVALID_PAYLOAD, "Invalid payload").WithRequestId(requestId));
    } catch (const std::exception& e) {
        Logger::Error("Unexpected error handling message from connection {}: {}", connection->GetId(), e.what());
        connection->Send(Message::Error(ErrorCode::INTERNAL_ERROR, "Internal server error").WithRequestId(requestId));
    }
}

void ConnectionGateway::OnClose(const ClientConnection::Pointer& connection, Clock::time_point now) {
    auto player = connection->GetPlayer();
    bool wasBound = false;

    {
        std::unique_lock<std::shared_mutex> lock(connectionsMutex_);
        connections_.erase(connection->GetId());
        if (player) {
            auto it = playerConnections_.find(player->playerId);
            if (it != playerConnections_.end() && it->second == connection->GetId()) {
                playerConnections_.erase(it);
                wasBound = true;
            }
        }
    }

    Logger::Info("Connection {} closed", connection->GetId());

    // A connection replaced by a reconnect no longer speaks for its player.
    if (!wasBound || shuttingDown_) {
        return;
    }

    sessions_.HandleDisconnect(player, now);
    if (!player->InGame()) {
        auth_.MarkDisconnected(player->playerId, now + settings_.disconnectDeadline);
    }
}

void ConnectionGateway::Sweep(Clock::time_point now) {
    std::vector<ClientConnection::Pointer> stale;
    {
        std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
        for (const auto& [id, connection] : connections_) {
            if (!connection->IsAuthenticated() && now - connection->GetConnectedAt() > settings_.authTimeout) {
                stale.push_back(connection);
            }
        }
    }

    for (const auto& connection : stale) {
        Logger::Info("Connection {} did not authenticate in time", connection->GetId());
        connection->Send(Message::Error(ErrorCode::NOT_AUTHENTICATED, "Authentication timed out"));
        connection->Close("authentication timeout");
    }

    sessions_.Sweep(now);
    auth_.CleanupExpired(now);
}

void ConnectionGateway::Shutdown(const std::string& reason) {
    if (shuttingDown_.exchange(true)) {
        return;
    }

    Logger::Info("Gateway shutting down: {}", reason);
    sessions_.EndAll(reason);

    std::vector<ClientConnection::Pointer> open;
    {
        std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
        for (const auto& [id, connection] : connections_) {
            open.push_back(connection);
        }
    }
    for (const auto& connection : open) {
        connection->Close(reason);
    }
}

void ConnectionGateway::SendToPlayer(const std::string& playerId, const Message& message) {
    auto connection = FindConnectionOf(playerId);
    if (!connection) {
        Logger::Trace("No connection for player {}, dropping {}", playerId, ToString(message.type));
        return;
    }
    connection->Send(message);
}

size_t ConnectionGateway::GetConnectionCount() const {
    std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
    return connections_.size();
}

ClientConnection::Pointer ConnectionGateway::FindConnectionOf(const std::string& playerId) const {
    std::shared_lock<std::shared_mutex> lock(connectionsMutex_);
    auto it = playerConnections_.find(playerId);
    if (it == playerConnections_.end()) {
        return nullptr;
    }
    auto connection = connections_.find(it->second);
    return connection == connections_.end() ? nullptr : connection->second;
}

void ConnectionGateway::BindPlayer(const ClientConnection::Pointer& connection,
                                   const std::shared_ptr<PlayerSession>& player) {
    ClientConnection::Pointer replaced;
    {
        std::unique_lock<std::shared_mutex> lock(connectionsMutex_);
        auto it = playerConnections_.find(player->playerId);
        if (it != playerConnections_.end() && it->second != connection->GetId()) {
            auto old = connections_.find(it->second);
            if (old != connections_.end()) {
                replaced = old->second;
            }
        }
        playerConnections_[player->playerId] = connection->GetId();
    }
    connection->Bind(player);

    if (replaced) {
        Logger::Info("Player {} moved from connection {} to {}", player->playerId,
                     replaced->GetId(), connection->GetId());
        replaced->Unbind();
        replaced->Send(Message::System("Signed in from another connection", "warning"));
        replaced->Close("replaced by a newer connection");
    }
}

std::shared_ptr<PlayerSession> ConnectionGateway::RequirePlayer(const ClientConnection::Pointer& connection) const {
    auto player = connection->GetPlayer();
    if (!player) {
        throw ProtocolError(ErrorCode::NOT_AUTHENTICATED, "Authenticate first");
    }
    return player;
}

GameSession::Pointer ConnectionGateway::RequireSession(const PlayerSession& player) const {
    auto session = sessions_.GetSessionOf(player);
    if (!session) {
        throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in a game");
    }
    return session;
}

// =============== Handlers ===============

void ConnectionGateway::HandleAuth(const ClientConnection::Pointer& connection, const Message& message) {
    if (connection->IsAuthenticated()) {
        throw AuthError(ErrorCode::ALREADY_AUTHENTICATED, "Connection is already authenticated");
    }

    const auto& payload = message.payload;
    if (!payload.contains("display_name") || !payload["display_name"].is_string()) {
        throw AuthError(ErrorCode::INVALID_NAME, "display_name is required");
    }

    auto player = auth_.CreateSession(payload["display_name"].get<std::string>());
    BindPlayer(connection, player);

    connection->Send(Message::AuthSuccess(player->playerId, player->token, player->displayName)
                         .WithRequestId(message.requestId));
}

void ConnectionGateway::HandleReconnect(const ClientConnection::Pointer& connection, const Message& message) {
    const auto& payload = message.payload;
    if (!payload.contains("token") || !payload["token"].is_string()) {
        throw AuthError(ErrorCode::INVALID_TOKEN, "token is required");
    }
    const std::string sessionId = OptionalString(payload, "session_id");

    auto player = auth_.VerifyToken(payload["token"].get<std::string>());
    auto current = connection->GetPlayer();
    if (current && current->playerId != player->playerId) {
        throw AuthError(ErrorCode::ALREADY_AUTHENTICATED, "Connection is bound to another player");
    }

    BindPlayer(connection, player);
    connection->Send(Message::AuthSuccess(player->playerId, player->token, player->displayName)
                         .WithRequestId(message.requestId));

    if (!sessionId.empty() || player->InGame()) {
        try {
            sessions_.Reconnect(player, sessionId);
        } catch (const SessionError&) {
            if (!player->InGame()) {
                auth_.MarkConnected(player->playerId);
            }
            throw;
        }
    }

    if (!player->InGame()) {
        auth_.MarkConnected(player->playerId);
    }
}

void ConnectionGateway::HandleCreateGame(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    const auto& payload = message.payload;

    std::optional<size_t> maxPlayers;
    if (payload.contains("max_players") && !payload["max_players"].is_null()) {
        if (!payload["max_players"].is_number_integer() || payload["max_players"].get<int64_t>() < 1) {
            throw ProtocolError(ErrorCode::INVALID_PAYLOAD, "max_players must be a positive integer");
        }
        maxPlayers = payload["max_players"].get<size_t>();
    }

    auto session = sessions_.CreateGame(player, OptionalString(payload, "game_name"), maxPlayers);

    Message reply = Message::System("Created game " + session->GetName());
    reply.payload["session_id"] = session->GetId();
    connection->Send(reply.WithRequestId(message.requestId));
}

void ConnectionGateway::HandleJoinGame(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    const std::string sessionId = RequiredString(message.payload, "session_id");

    auto session = sessions_.JoinGame(sessionId, player);

    Message reply = Message::System("Joined game " + session->GetName());
    reply.payload["session_id"] = session->GetId();
    connection->Send(reply.WithRequestId(message.requestId));
}

void ConnectionGateway::HandleLeaveGame(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    auto session = RequireSession(*player);

    sessions_.LeaveGame(player);

    Message reply = Message::System("Left game " + session->GetName());
    reply.payload["session_id"] = session->GetId();
    connection->Send(reply.WithRequestId(message.requestId));
}

void ConnectionGateway::HandleReady(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    auto session = RequireSession(*player);

    bool ready = true;
    if (message.payload.contains("ready")) {
        if (!message.payload["ready"].is_boolean()) {
            throw ProtocolError(ErrorCode::INVALID_PAYLOAD, "ready must be a boolean");
        }
        ready = message.payload["ready"].get<bool>();
    }

    session->SetReady(player->playerId, ready, message.requestId);
}

void ConnectionGateway::HandleAction(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    auto session = RequireSession(*player);
    const auto& payload = message.payload;

    ActionEnvelope envelope;
    envelope.playerId = player->playerId;
    envelope.actionType = RequiredString(payload, "action_type");
    if (payload.contains("params") && !payload["params"].is_null()) {
        if (!payload["params"].is_object()) {
            throw ProtocolError(ErrorCode::INVALID_PAYLOAD, "params must be an object");
        }
        envelope.params = payload["params"];
    }
    envelope.requestId = message.requestId;
    envelope.receivedAt = Clock::now();

    session->SubmitAction(std::move(envelope));
}

void ConnectionGateway::HandleChat(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    auto session = RequireSession(*player);
    session->PostChat(player->playerId, RequiredString(message.payload, "text"));
}

void ConnectionGateway::HandleResync(const ClientConnection::Pointer& connection, const Message& message) {
    auto player = RequirePlayer(connection);
    auto session = RequireSession(*player);
    Logger::Debug("Player {} requested a full state", player->playerId);
    session->SendFullState(player->playerId, message.requestId);
}

void ConnectionGateway::HandleListGames(const ClientConnection::Pointer& connection, const Message& message) {
    connection->Send(Message::GameList(sessions_.ListJoinable()).WithRequestId(message.requestId));
}

void ConnectionGateway::HandlePing(const ClientConnection::Pointer& connection, const Message& message) {
    connection->Send(Message::Pong().WithRequestId(message.requestId));
}
