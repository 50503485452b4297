#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "auth/AuthManager.hpp"
#include "game/GameState.hpp"
#include "game/MapGenerator.hpp"
#include "game/TurnSystem.hpp"
#include "protocol/ActionCodec.hpp"
#include "protocol/Message.hpp"
#include "sync/StateSynchronizer.hpp"

enum class SessionStatus {
    LOBBY,
    ACTIVE,
    ENDED
};

const char* ToString(SessionStatus status);

struct RoundState {
    uint32_t roundNumber = 1;
    uint32_t actionsTaken = 0;
    uint32_t maxActions = 4;
    std::set<std::string> readySet;
    std::set<std::string> passedSet;
};

struct RosterEntry {
    std::shared_ptr<PlayerSession> player;
    std::string entityId;
};

struct ActionEnvelope {
    uint64_t sequenceId = 0;
    std::string playerId;
    std::string actionType;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json requestId;
    Clock::time_point receivedAt = Clock::now();
};

// Factories for the game collaborators a session owns.
struct GameRules {
    std::function<std::unique_ptr<GameState>()> createState;
    std::function<std::unique_ptr<MapGenerator>()> createMapGenerator;
    std::function<std::unique_ptr<TurnSystem>()> createTurnSystem;
    std::shared_ptr<const ActionCodec> codec;
};

struct SessionSettings {
    size_t maxPlayers = 4;
    uint32_t maxActionsPerRound = 4;
    std::chrono::seconds disconnectDeadline{120};
    std::chrono::seconds gracePeriod{60};
    size_t chatLogSize = 50;
    uint32_t worldSeed = 0;  // 0 picks a random seed per game
};

// Where a session delivers its messages. Implementations must not call back
// into the session.
class SessionOutbox {
public:
    virtual ~SessionOutbox() = default;
    virtual void SendToPlayer(const std::string& playerId, const Message& message) = 0;
};

class GameSession : public std::enable_shared_from_this<GameSession> {
public:
    using Pointer = std::shared_ptr<GameSession>;

    static constexpr const char* PASS_ACTION = "pass";
    static constexpr size_t ROUND_LOG_SIZE = 100;
    static constexpr size_t MAX_CHAT_LENGTH = 256;  // code points

    GameSession(std::string sessionId, std::string name, SessionSettings settings,
                GameRules rules, SessionOutbox& outbox);

    // =============== Roster ===============
    // Throws SessionError SESSION_FULL, INVALID_STATE or ALREADY_IN_SESSION.
    void AddPlayer(const std::shared_ptr<PlayerSession>& player, Clock::time_point now = Clock::now());

    // LOBBY and ENDED drop the slot. ACTIVE keeps a connected player's slot
    // until the disconnect deadline; a disconnected player forfeits it.
    void RemovePlayer(const std::string& playerId, Clock::time_point now = Clock::now());

    void HandleDisconnect(const std::string& playerId, Clock::time_point now = Clock::now());

    // Throws SessionError RECONNECT_EXPIRED when no reserved slot is left.
    void Reconnect(const std::shared_ptr<PlayerSession>& player, Clock::time_point now = Clock::now());

    // Drops disconnected slots past their deadline; returns how many.
    size_t ExpireDisconnected(Clock::time_point now = Clock::now());

    // Clears the game binding of every remaining member, used on teardown.
    void ReleaseMembers();

    // =============== Lobby ===============
    void SetReady(const std::string& playerId, bool ready, const nlohmann::json& requestId = nullptr);

    // =============== Active ===============
    // Queued and applied strictly in submission order. Rejections go to the
    // originator through the outbox.
    void SubmitAction(ActionEnvelope envelope);

    void PostChat(const std::string& playerId, const std::string& text);

    // Sends the current snapshot to one player.
    void SendFullState(const std::string& playerId, const nlohmann::json& requestId = nullptr);

    // Ends the game without a winner, e.g. on server shutdown.
    void ForceEnd(const std::string& reason, Clock::time_point now = Clock::now());

    // =============== Queries ===============
    const std::string& GetId() const { return sessionId_; }
    const std::string& GetName() const { return name_; }
    SessionStatus GetStatus() const;
    size_t GetPlayerCount() const;
    size_t GetMaxPlayers() const { return settings_.maxPlayers; }
    bool HasMember(const std::string& playerId) const;
    bool IsMemberConnected(const std::string& playerId) const;
    std::string GetEntityId(const std::string& playerId) const;

    RoundState GetRoundState() const;
    StateSnapshot GetSnapshot() const;
    uint64_t GetRevision() const;
    uint32_t GetSeed() const;
    std::vector<ActionEnvelope> GetRoundLog() const;
    nlohmann::json GetChatLog() const;

    // Only for inspection; mutation goes through SubmitAction.
    const GameState* GetState() const { return state_.get(); }

    bool ShouldTearDown(Clock::time_point now) const;

    // Lobby listing entry.
    nlohmann::json Summary() const;

private:
    RosterEntry* FindEntry(const std::string& playerId);
    const RosterEntry* FindEntry(const std::string& playerId) const;

    void DrainActions();
    void ProcessEnvelope(const ActionEnvelope& envelope);
    void HandlePass(const ActionEnvelope& envelope);
    bool AllConnectedPassed() const;

    void StartGame(Clock::time_point now);
    void CompleteRound(Clock::time_point now);
    void EndGame(bool victory, const std::string& reason, Clock::time_point now);
    void MarkCorrupted(const std::string& what, Clock::time_point now);
    void CheckGameOver(Clock::time_point now);

    size_t ExpireDisconnectedLocked(Clock::time_point now);
    void RemoveEntry(const std::string& playerId, const std::string& reason, Clock::time_point now);
    void CheckEmpty(Clock::time_point now);

    nlohmann::json BuildMeta() const;
    nlohmann::json Publish();
    // Publishes the next revision and sends its delta to connected members.
    void PublishChange(Clock::time_point now, const std::vector<std::string>& events = {},
                       const std::string& originatorId = "",
                       const nlohmann::json& requestId = nullptr,
                       const std::string& exceptPlayerId = "");
    void Broadcast(const Message& message, const std::string& exceptPlayerId = "");
    void SendState(const std::string& playerId, const nlohmann::json& requestId = nullptr);
    void SendError(const std::string& playerId, const GameError& error, const nlohmann::json& requestId);

    std::string sessionId_;
    std::string name_;
    SessionSettings settings_;
    GameRules rules_;
    SessionOutbox& outbox_;

    mutable std::mutex mutex_;
    SessionStatus status_ = SessionStatus::LOBBY;
    std::vector<RosterEntry> roster_;
    RoundState round_;

    std::unique_ptr<GameState> state_;
    std::unique_ptr<MapGenerator> mapGenerator_;
    std::unique_ptr<TurnSystem> turnSystem_;
    uint32_t seed_ = 0;
    bool victory_ = false;
    std::optional<Clock::time_point> teardownAt_;

    StateSynchronizer synchronizer_;
    std::deque<ActionEnvelope> roundLog_;
    std::deque<nlohmann::json> chatLog_;

    // FIFO action pipeline, drained by whichever caller finds it idle.
    std::mutex queueMutex_;
    std::deque<ActionEnvelope> pending_;
    bool draining_ = false;
    uint64_t nextSequenceId_ = 1;
};
