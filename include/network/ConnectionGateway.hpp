#pragma once

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "auth/AuthManager.hpp"
#include "config/ServerSettings.hpp"
#include "network/ClientConnection.hpp"
#include "network/MessageRouter.hpp"
#include "session/SessionManager.hpp"

// Transport-independent front door. Authenticates connections, routes
// their messages and delivers session output to whichever connection is
// bound to a player.
class ConnectionGateway : public SessionOutbox {
public:
    ConnectionGateway(const ServerSettings& settings, GameRules rules);
    ~ConnectionGateway() override;

    // Returns false when the connection was refused.
    bool OnOpen(const ClientConnection::Pointer& connection);
    void OnText(const ClientConnection::Pointer& connection, const std::string& text);
    void OnClose(const ClientConnection::Pointer& connection, Clock::time_point now = Clock::now());

    // Auth timeouts, session expiry and teardown, stale tokens.
    void Sweep(Clock::time_point now = Clock::now());

    void Shutdown(const std::string& reason);

    void SendToPlayer(const std::string& playerId, const Message& message) override;

    size_t GetConnectionCount() const;
    ClientConnection::Pointer FindConnectionOf(const std::string& playerId) const;

    AuthManager& GetAuthManager() { return auth_; }
    SessionManager& GetSessionManager() { return sessions_; }

private:
    void RegisterHandlers();

    // =============== Handlers ===============
    void HandleAuth(const ClientConnection::Pointer& connection, const Message& message);
    void HandleReconnect(const ClientConnection::Pointer& connection, const Message& message);
    void HandleCreateGame(const ClientConnection::Pointer& connection, const Message& message);
    void HandleJoinGame(const ClientConnection::Pointer& connection, const Message& message);
    void HandleLeaveGame(const ClientConnection::Pointer& connection, const Message& message);
    void HandleReady(const ClientConnection::Pointer& connection, const Message& message);
    void HandleAction(const ClientConnection::Pointer& connection, const Message& message);
    void HandleChat(const ClientConnection::Pointer& connection, const Message& message);
    void HandleResync(const ClientConnection::Pointer& connection, const Message& message);
    void HandleListGames(const ClientConnection::Pointer& connection, const Message& message);
    void HandlePing(const ClientConnection::Pointer& connection, const Message& message);

    void BindPlayer(const ClientConnection::Pointer& connection, const std::shared_ptr<PlayerSession>& player);
    std::shared_ptr<PlayerSession> RequirePlayer(const ClientConnection::Pointer& connection) const;
    GameSession::Pointer RequireSession(const PlayerSession& player) const;

    ServerSettings settings_;
    AuthManager auth_;
    SessionManager sessions_;
    MessageRouter router_;

    mutable std::shared_mutex connectionsMutex_;
    std::unordered_map<uint64_t, ClientConnection::Pointer> connections_;
    std::unordered_map<std::string, uint64_t> playerConnections_;

    std::atomic<bool> shuttingDown_{false};
};
