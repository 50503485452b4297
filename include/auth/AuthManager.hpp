#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

class GameSession;

using Clock = std::chrono::steady_clock;

// Identity of one authenticated player, independent of any socket.
struct PlayerSession {
    std::string token;
    std::string playerId;
    std::string displayName;

    std::weak_ptr<GameSession> game;
    std::string gameId;

    bool connected = true;
    std::optional<Clock::time_point> disconnectDeadline;

    Clock::time_point createdAt;
    Clock::time_point lastSeen;

    bool InGame() const { return !gameId.empty(); }
};

class AuthManager {
public:
    static constexpr size_t MAX_NAME_LENGTH = 24;

    explicit AuthManager(std::chrono::seconds tokenExpiry = std::chrono::hours(24));

    // Throws AuthError INVALID_NAME.
    std::shared_ptr<PlayerSession> CreateSession(const std::string& displayName,
                                                 Clock::time_point now = Clock::now());

    // Throws AuthError INVALID_TOKEN or TOKEN_EXPIRED.
    std::shared_ptr<PlayerSession> VerifyToken(const std::string& token,
                                               Clock::time_point now = Clock::now());

    std::shared_ptr<PlayerSession> FindByPlayer(const std::string& playerId) const;

    void MarkDisconnected(const std::string& playerId, Clock::time_point deadline);
    void MarkConnected(const std::string& playerId, Clock::time_point now = Clock::now());

    void Invalidate(const std::string& token);

    // Drops disconnected sessions that are not in a game and whose token expired.
    size_t CleanupExpired(Clock::time_point now = Clock::now());

    size_t GetSessionCount() const;

    static bool IsValidDisplayName(const std::string& name);

private:
    std::string GenerateToken();
    std::string GeneratePlayerId();

    std::chrono::seconds tokenExpiry_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PlayerSession>> byToken_;
    std::unordered_map<std::string, std::shared_ptr<PlayerSession>> byPlayer_;

    std::mt19937_64 rng_;
    uint64_t nextPlayerNumber_ = 1;
};
