#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/ServerSettings.hpp"
#include "session/GameSession.hpp"

// Registry of live game sessions. Routes create/join/leave/reconnect and
// tears sessions down once their grace period is over.
class SessionManager {
public:
    SessionManager(const ServerSettings& settings, GameRules rules, SessionOutbox& outbox);

    // Owner auto-joins. Throws SessionError INVALID_STATE when the owner is
    // already in a live game.
    GameSession::Pointer CreateGame(const std::shared_ptr<PlayerSession>& owner,
                                    const std::string& name = "",
                                    std::optional<size_t> maxPlayers = std::nullopt,
                                    Clock::time_point now = Clock::now());

    // Former members are routed to Reconnect.
    GameSession::Pointer JoinGame(const std::string& sessionId,
                                  const std::shared_ptr<PlayerSession>& player,
                                  Clock::time_point now = Clock::now());

    void LeaveGame(const std::shared_ptr<PlayerSession>& player, Clock::time_point now = Clock::now());

    // An empty sessionId means the player's current game.
    GameSession::Pointer Reconnect(const std::shared_ptr<PlayerSession>& player,
                                   const std::string& sessionId = "",
                                   Clock::time_point now = Clock::now());

    void HandleDisconnect(const std::shared_ptr<PlayerSession>& player, Clock::time_point now = Clock::now());

    std::vector<nlohmann::json> ListJoinable() const;

    // Expires overdue disconnects and tears down finished sessions.
    // Returns the number of sessions removed.
    size_t Sweep(Clock::time_point now = Clock::now());

    void EndAll(const std::string& reason);

    GameSession::Pointer FindSession(const std::string& sessionId) const;
    GameSession::Pointer GetSessionOf(const PlayerSession& player) const;
    size_t GetSessionCount() const;

private:
    // Drops the player's slot in a game they no longer play in. Throws
    // SessionError INVALID_STATE while they are still connected to it.
    void ReleaseCurrentGame(const std::shared_ptr<PlayerSession>& player,
                            const GameSession::Pointer& target, Clock::time_point now);
    std::string GenerateSessionId();
    std::vector<GameSession::Pointer> GetAllSessions() const;

    SessionSettings sessionSettings_;
    GameRules rules_;
    SessionOutbox& outbox_;

    mutable std::mutex mutex_;
    std::map<std::string, GameSession::Pointer> sessions_;
    uint64_t nextSessionNumber_ = 1;
};
