#include "session/GameSession.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>

namespace {

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

// Code points in a UTF-8 string; continuation bytes are not counted.
size_t Utf8Length(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

} // namespace

const char* ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::LOBBY:  return "lobby";
        case SessionStatus::ACTIVE: return "active";
        case SessionStatus::ENDED:  return "ended";
    }
    return "unknown";
}

// =============== GameSession Implementation ===============

GameSession::GameSession(std::string sessionId, std::string name, SessionSettings settings,
                         GameRules rules, SessionOutbox& outbox)
    : sessionId_(std::move(sessionId)),
      name_(std::move(name)),
      settings_(settings),
      rules_(std::move(rules)),
      outbox_(outbox) {

    if (!rules_.createState || !rules_.createMapGenerator || !rules_.createTurnSystem || !rules_.codec) {
        throw std::invalid_argument("GameSession requires complete game rules");
    }

    settings_.maxPlayers = std::max<size_t>(1, settings_.maxPlayers);
    settings_.maxActionsPerRound = std::max<uint32_t>(1, settings_.maxActionsPerRound);
    round_.maxActions = settings_.maxActionsPerRound;

    Publish();

    Logger::Info("GameSession {} '{}' created (max {} players, {} actions per round)",
                 sessionId_, name_, settings_.maxPlayers, settings_.maxActionsPerRound);
}

// =============== Roster ===============

void GameSession::AddPlayer(const std::shared_ptr<PlayerSession>& player, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (FindEntry(player->playerId)) {
        throw SessionError(ErrorCode::ALREADY_IN_SESSION, "Already in this game");
    }
    if (status_ != SessionStatus::LOBBY) {
        throw SessionError(ErrorCode::INVALID_STATE,
                           std::string("Cannot join a game that is ") + ToString(status_));
    }
    if (roster_.size() >= settings_.maxPlayers) {
        throw SessionError(ErrorCode::SESSION_FULL, "Game is full");
    }

    roster_.push_back(RosterEntry{player, ""});
    player->game = weak_from_this();
    player->gameId = sessionId_;
    player->connected = true;
    player->disconnectDeadline.reset();

    Logger::Info("Player {} joined session {} ({}/{})", player->playerId, sessionId_,
                 roster_.size(), settings_.maxPlayers);

    Broadcast(Message::PlayerJoined(player->playerId, player->displayName), player->playerId);
    PublishChange(now, {}, "", nullptr, player->playerId);
    SendState(player->playerId);
}

void GameSession::RemovePlayer(const std::string& playerId, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    RosterEntry* entry = FindEntry(playerId);
    if (!entry) {
        throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in this game");
    }

    if (status_ == SessionStatus::ACTIVE && entry->player->connected) {
        // The slot and entity stay reserved until the deadline. Leaving again forfeits it.
        auto player = entry->player;
        player->connected = false;
        player->disconnectDeadline = now + settings_.disconnectDeadline;
        round_.passedSet.erase(playerId);

        Logger::Info("Player {} left active session {}, slot held until deadline", playerId, sessionId_);
        Broadcast(Message::PlayerLeft(playerId, player->displayName, "left"));
        PublishChange(now);
        if (status_ == SessionStatus::ACTIVE && !round_.passedSet.empty() && AllConnectedPassed()) {
            CompleteRound(now);
        }
        return;
    }

    RemoveEntry(playerId, "left", now);
    CheckEmpty(now);
}

void GameSession::HandleDisconnect(const std::string& playerId, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    RosterEntry* entry = FindEntry(playerId);
    if (!entry || !entry->player->connected) {
        return;
    }

    entry->player->connected = false;
    entry->player->disconnectDeadline = now + settings_.disconnectDeadline;
    if (status_ == SessionStatus::LOBBY) {
        round_.readySet.erase(playerId);
    }
    round_.passedSet.erase(playerId);

    Logger::Info("Player {} disconnected from session {} ({}s to reconnect)", playerId, sessionId_,
                 settings_.disconnectDeadline.count());

    Broadcast(Message::PlayerLeft(playerId, entry->player->displayName, "disconnected"));
    PublishChange(now);

    if (status_ == SessionStatus::ACTIVE && !round_.passedSet.empty() && AllConnectedPassed()) {
        CompleteRound(now);
    }
}

void GameSession::Reconnect(const std::shared_ptr<PlayerSession>& player, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    RosterEntry* entry = FindEntry(player->playerId);
    if (!entry) {
        throw SessionError(ErrorCode::RECONNECT_EXPIRED, "No reserved slot in this game");
    }

    if (!entry->player->connected) {
        if (entry->player->disconnectDeadline && now > *entry->player->disconnectDeadline) {
            Logger::Info("Player {} reconnected to session {} after the deadline", player->playerId, sessionId_);
            RemoveEntry(player->playerId, "timeout", now);
            CheckEmpty(now);
            throw SessionError(ErrorCode::RECONNECT_EXPIRED, "Reconnect deadline has passed");
        }

        entry->player = player;
        player->connected = true;
        player->disconnectDeadline.reset();
        player->game = weak_from_this();
        player->gameId = sessionId_;

        Logger::Info("Player {} reconnected to session {}", player->playerId, sessionId_);
        Broadcast(Message::PlayerJoined(player->playerId, player->displayName), player->playerId);
        PublishChange(now, {}, "", nullptr, player->playerId);
    }

    SendState(player->playerId);
}

size_t GameSession::ExpireDisconnected(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ExpireDisconnectedLocked(now);
}

size_t GameSession::ExpireDisconnectedLocked(Clock::time_point now) {
    std::vector<std::string> expired;
    for (const auto& entry : roster_) {
        const auto& player = entry.player;
        if (!player->connected && player->disconnectDeadline && now > *player->disconnectDeadline) {
            expired.push_back(player->playerId);
        }
    }

    for (const auto& playerId : expired) {
        Logger::Info("Player {} missed the reconnect deadline in session {}", playerId, sessionId_);
        RemoveEntry(playerId, "timeout", now);
    }
    if (!expired.empty()) {
        CheckEmpty(now);
    }
    return expired.size();
}

void GameSession::ReleaseMembers() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : roster_) {
        if (entry.player->gameId == sessionId_) {
            entry.player->gameId.clear();
            entry.player->game.reset();
        }
    }
}

void GameSession::RemoveEntry(const std::string& playerId, const std::string& reason,
                              Clock::time_point now) {
    auto it = std::find_if(roster_.begin(), roster_.end(), [&playerId](const RosterEntry& entry) {
        return entry.player->playerId == playerId;
    });
    if (it == roster_.end()) {
        return;
    }

    auto player = it->player;
    bool hadEntity = !it->entityId.empty();
    roster_.erase(it);
    round_.readySet.erase(playerId);
    round_.passedSet.erase(playerId);

    if (player->gameId == sessionId_) {
        player->gameId.clear();
        player->game.reset();
    }

    if (hadEntity && state_) {
        try {
            state_->RemovePlayer(playerId);
        } catch (const std::exception& e) {
            MarkCorrupted(e.what(), now);
            return;
        }
    }

    Broadcast(Message::PlayerLeft(playerId, player->displayName, reason));
    PublishChange(now);
}

void GameSession::CheckEmpty(Clock::time_point now) {
    if (status_ == SessionStatus::ENDED) {
        return;
    }
    if (roster_.empty()) {
        if (status_ == SessionStatus::ACTIVE) {
            EndGame(false, "abandoned", now);
        } else {
            status_ = SessionStatus::ENDED;
            teardownAt_ = now + settings_.gracePeriod;
            Logger::Info("Session {} is empty, scheduled for teardown", sessionId_);
        }
        return;
    }

    // A departure can leave only ready players behind.
    if (status_ == SessionStatus::LOBBY && round_.readySet.size() == roster_.size()) {
        StartGame(now);
    }
}

// =============== Lobby ===============

void GameSession::SetReady(const std::string& playerId, bool ready, const nlohmann::json& requestId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!FindEntry(playerId)) {
        throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in this game");
    }
    if (status_ != SessionStatus::LOBBY) {
        throw SessionError(ErrorCode::INVALID_STATE, "Ready is only accepted in the lobby");
    }

    if (ready) {
        round_.readySet.insert(playerId);
    } else {
        round_.readySet.erase(playerId);
    }

    Logger::Debug("Player {} ready={} in session {} ({}/{})", playerId, ready, sessionId_,
                  round_.readySet.size(), roster_.size());

    Clock::time_point now = Clock::now();
    PublishChange(now, {}, playerId, requestId);

    if (status_ == SessionStatus::LOBBY && !roster_.empty() && round_.readySet.size() == roster_.size()) {
        StartGame(now);
    }
}

void GameSession::StartGame(Clock::time_point now) {
    try {
        state_ = rules_.createState();
        mapGenerator_ = rules_.createMapGenerator();
        turnSystem_ = rules_.createTurnSystem();

        seed_ = settings_.worldSeed;
        if (seed_ == 0) {
            seed_ = std::random_device{}();
        }

        DungeonMap map = mapGenerator_->Generate(seed_);
        state_->Initialize(map, seed_);

        std::vector<Coord> spawns = mapGenerator_->FindSpawnPositions(roster_.size());
        if (spawns.size() < roster_.size()) {
            throw std::runtime_error("Map generator returned too few spawn positions");
        }
        for (size_t i = 0; i < roster_.size(); ++i) {
            auto& entry = roster_[i];
            entry.entityId = state_->AddPlayer(entry.player->playerId, entry.player->displayName, spawns[i]);
        }
    } catch (const std::exception& e) {
        Logger::Error("Session {} failed to start: {}", sessionId_, e.what());
        MarkCorrupted(e.what(), now);
        return;
    }

    status_ = SessionStatus::ACTIVE;
    round_.roundNumber = 1;
    round_.actionsTaken = 0;
    round_.passedSet.clear();

    try {
        Publish();
    } catch (const std::exception& e) {
        MarkCorrupted(e.what(), now);
        return;
    }

    nlohmann::json players = nlohmann::json::array();
    for (const auto& entry : roster_) {
        players.push_back({
            {"player_id", entry.player->playerId},
            {"name", entry.player->displayName},
            {"entity_id", entry.entityId}
        });
    }

    Logger::Info("Session {} started with {} players (seed {})", sessionId_, roster_.size(), seed_);

    Broadcast(Message::GameStart(sessionId_, players, seed_));
    for (const auto& entry : roster_) {
        if (entry.player->connected) {
            SendState(entry.player->playerId);
        }
    }
}

// =============== Action Pipeline ===============

void GameSession::SubmitAction(ActionEnvelope envelope) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        envelope.sequenceId = nextSequenceId_++;
        pending_.push_back(std::move(envelope));
        if (draining_) {
            return;
        }
        draining_ = true;
    }
    DrainActions();
}

void GameSession::DrainActions() {
    // Releases the drainer role if processing throws.
    struct DrainGuard {
        GameSession& session;
        bool released = false;
        ~DrainGuard() {
            if (!released) {
                std::lock_guard<std::mutex> lock(session.queueMutex_);
                session.draining_ = false;
            }
        }
    } guard{*this};

    while (true) {
        ActionEnvelope next;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (pending_.empty()) {
                draining_ = false;
                guard.released = true;
                return;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ProcessEnvelope(next);
    }
}

void GameSession::ProcessEnvelope(const ActionEnvelope& envelope) {
    const Clock::time_point now = envelope.receivedAt;
    RosterEntry* entry = nullptr;
    std::unique_ptr<GameAction> action;

    try {
        if (status_ != SessionStatus::ACTIVE) {
            throw ActionError(ErrorCode::GAME_NOT_ACTIVE, "Game is not active");
        }
        entry = FindEntry(envelope.playerId);
        if (!entry) {
            throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in this game");
        }
        if (!entry->player->connected) {
            throw ActionError(ErrorCode::PLAYER_UNAVAILABLE, "Player is disconnected");
        }
        const GameEntity* actor = state_->GetPlayer(envelope.playerId);
        if (!actor || !actor->IsAlive()) {
            throw ActionError(ErrorCode::PLAYER_UNAVAILABLE, "Player has no living character");
        }

        if (envelope.actionType == PASS_ACTION) {
            HandlePass(envelope);
            return;
        }

        if (round_.actionsTaken >= round_.maxActions) {
            throw ActionError(ErrorCode::BUDGET_EXHAUSTED, "No actions left this round");
        }

        action = rules_.codec->Decode(envelope.actionType, envelope.params);
    } catch (const GameError& e) {
        SendError(envelope.playerId, e, envelope.requestId);
        return;
    } catch (const std::exception& e) {
        MarkCorrupted(e.what(), now);
        return;
    }

    Outcome outcome;
    try {
        ActionContext context{*state_, envelope.playerId, entry->entityId};
        if (!action->Validate(context)) {
            SendError(envelope.playerId,
                      ActionError(ErrorCode::INVALID_ACTION, envelope.actionType + " is not possible now"),
                      envelope.requestId);
            return;
        }
        outcome = state_->Apply(*action, context);
    } catch (const GameError& e) {
        SendError(envelope.playerId, e, envelope.requestId);
        return;
    } catch (const std::exception& e) {
        MarkCorrupted(e.what(), now);
        return;
    }

    if (!outcome.success) {
        SendError(envelope.playerId, ActionError(ErrorCode::INVALID_ACTION, outcome.message),
                  envelope.requestId);
        return;
    }

    ++round_.actionsTaken;
    round_.passedSet.erase(envelope.playerId);
    roundLog_.push_back(envelope);
    while (roundLog_.size() > ROUND_LOG_SIZE) {
        roundLog_.pop_front();
    }

    Logger::Debug("Session {} applied #{} {} from {} ({}/{} this round)", sessionId_,
                  envelope.sequenceId, envelope.actionType, envelope.playerId,
                  round_.actionsTaken, round_.maxActions);

    PublishChange(now, outcome.events, envelope.playerId, envelope.requestId);

    CheckGameOver(now);
    if (status_ == SessionStatus::ACTIVE && round_.actionsTaken >= round_.maxActions) {
        CompleteRound(now);
    }
}

void GameSession::HandlePass(const ActionEnvelope& envelope) {
    const Clock::time_point now = envelope.receivedAt;
    round_.passedSet.insert(envelope.playerId);

    Logger::Debug("Player {} passes round {} in session {}", envelope.playerId,
                  round_.roundNumber, sessionId_);

    PublishChange(now, {}, envelope.playerId, envelope.requestId);
    if (status_ == SessionStatus::ACTIVE && AllConnectedPassed()) {
        CompleteRound(now);
    }
}

bool GameSession::AllConnectedPassed() const {
    size_t eligible = 0;
    for (const auto& entry : roster_) {
        if (!entry.player->connected) {
            continue;
        }
        const GameEntity* entity = state_ ? state_->GetPlayer(entry.player->playerId) : nullptr;
        if (!entity || !entity->IsAlive()) {
            continue;
        }
        ++eligible;
        if (!round_.passedSet.count(entry.player->playerId)) {
            return false;
        }
    }
    return eligible > 0;
}

void GameSession::CompleteRound(Clock::time_point now) {
    // Expired slots leave before the environment acts.
    ExpireDisconnectedLocked(now);
    if (status_ != SessionStatus::ACTIVE) {
        return;
    }

    TurnContext context{*state_, round_.roundNumber, {}};
    try {
        turnSystem_->ProcessRound(context);
    } catch (const std::exception& e) {
        MarkCorrupted(e.what(), now);
        return;
    }

    Logger::Debug("Session {} completed round {} ({} environment events)", sessionId_,
                  round_.roundNumber, context.events.size());

    ++round_.roundNumber;
    round_.actionsTaken = 0;
    round_.passedSet.clear();

    PublishChange(now, context.events);
    CheckGameOver(now);
}

void GameSession::CheckGameOver(Clock::time_point now) {
    if (status_ != SessionStatus::ACTIVE || !state_) {
        return;
    }

    bool over = false;
    bool victory = false;
    try {
        over = state_->IsGameOver();
        victory = over && state_->IsVictory();
    } catch (const std::exception& e) {
        MarkCorrupted(e.what(), now);
        return;
    }

    if (over) {
        EndGame(victory, victory ? "victory" : "defeat", now);
    }
}

void GameSession::EndGame(bool victory, const std::string& reason, Clock::time_point now) {
    if (status_ == SessionStatus::ENDED) {
        return;
    }

    status_ = SessionStatus::ENDED;
    victory_ = victory;
    teardownAt_ = now + settings_.gracePeriod;

    try {
        Publish();
    } catch (const std::exception& e) {
        Logger::Error("Session {} could not capture final state: {}", sessionId_, e.what());
    }

    for (const auto& entry : roster_) {
        if (entry.player->connected) {
            SendState(entry.player->playerId);
        }
    }
    Broadcast(Message::GameEnd(sessionId_, victory, reason));

    Logger::Info("Session {} ended ({}) after {} rounds", sessionId_, reason, round_.roundNumber);
}

void GameSession::MarkCorrupted(const std::string& what, Clock::time_point now) {
    Logger::Error("Session {} game state failure: {}", sessionId_, what);
    if (status_ == SessionStatus::ENDED) {
        return;
    }
    Broadcast(Message::System("The game hit an internal error and has ended", "error"));
    EndGame(false, "internal_error", now);
}

void GameSession::ForceEnd(const std::string& reason, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == SessionStatus::ENDED) {
        return;
    }
    Broadcast(Message::System("Game ended: " + reason, "warning"));
    EndGame(false, reason, now);
}

// =============== Chat ===============

void GameSession::PostChat(const std::string& playerId, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    const RosterEntry* entry = FindEntry(playerId);
    if (!entry) {
        throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in this game");
    }

    std::string trimmed = Trim(text);
    if (trimmed.empty() || Utf8Length(trimmed) > MAX_CHAT_LENGTH) {
        throw ProtocolError(ErrorCode::INVALID_PAYLOAD, "Chat text must be 1-256 characters");
    }

    Message message = Message::ChatMessage(playerId, entry->player->displayName, trimmed);
    chatLog_.push_back(message.payload);
    while (chatLog_.size() > settings_.chatLogSize) {
        chatLog_.pop_front();
    }

    Broadcast(message);
}

// =============== Synchronization ===============

nlohmann::json GameSession::BuildMeta() const {
    nlohmann::json meta = nlohmann::json::object();
    if (state_ && status_ != SessionStatus::LOBBY) {
        nlohmann::json world = state_->Describe();
        if (world.is_object()) {
            for (const auto& [key, value] : world.items()) {
                meta[key] = value;
            }
        }
    }

    nlohmann::json roster = nlohmann::json::array();
    for (const auto& entry : roster_) {
        roster.push_back({
            {"player_id", entry.player->playerId},
            {"name", entry.player->displayName},
            {"entity_id", entry.entityId},
            {"connected", entry.player->connected}
        });
    }

    meta["session_id"] = sessionId_;
    meta["name"] = name_;
    meta["status"] = ToString(status_);
    meta["max_players"] = settings_.maxPlayers;
    meta["round_number"] = round_.roundNumber;
    meta["actions_taken"] = round_.actionsTaken;
    meta["max_actions"] = round_.maxActions;
    meta["ready"] = round_.readySet;
    meta["passed"] = round_.passedSet;
    meta["roster"] = roster;
    meta["game_over"] = status_ == SessionStatus::ENDED;
    meta["victory"] = victory_;
    return meta;
}

nlohmann::json GameSession::Publish() {
    return synchronizer_.Publish(synchronizer_.Capture(state_.get(), BuildMeta()));
}

void GameSession::PublishChange(Clock::time_point now, const std::vector<std::string>& events,
                                const std::string& originatorId, const nlohmann::json& requestId,
                                const std::string& exceptPlayerId) {
    nlohmann::json delta;
    try {
        delta = Publish();
    } catch (const std::exception& e) {
        MarkCorrupted(e.what(), now);
        return;
    }
    if (!events.empty()) {
        delta["events"] = events;
    }

    Message message = Message::Delta(delta);
    for (const auto& entry : roster_) {
        const std::string& playerId = entry.player->playerId;
        if (!entry.player->connected || playerId == exceptPlayerId) {
            continue;
        }
        if (playerId == originatorId && !requestId.is_null()) {
            outbox_.SendToPlayer(playerId, message.WithRequestId(requestId));
        } else {
            outbox_.SendToPlayer(playerId, message);
        }
    }
}

void GameSession::Broadcast(const Message& message, const std::string& exceptPlayerId) {
    for (const auto& entry : roster_) {
        if (entry.player->connected && entry.player->playerId != exceptPlayerId) {
            outbox_.SendToPlayer(entry.player->playerId, message);
        }
    }
}

void GameSession::SendState(const std::string& playerId, const nlohmann::json& requestId) {
    nlohmann::json chat = nlohmann::json::array();
    for (const auto& line : chatLog_) {
        chat.push_back(line);
    }
    Message message = Message::State(synchronizer_.GetCurrent().ToJson(),
                                     status_ == SessionStatus::ENDED, chat);
    outbox_.SendToPlayer(playerId, message.WithRequestId(requestId));
}

void GameSession::SendError(const std::string& playerId, const GameError& error,
                            const nlohmann::json& requestId) {
    Logger::Debug("Session {} rejected request from {}: {} ({})", sessionId_, playerId,
                  error.GetReason(), error.what());
    outbox_.SendToPlayer(playerId, Message::Error(error).WithRequestId(requestId));
}

void GameSession::SendFullState(const std::string& playerId, const nlohmann::json& requestId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!FindEntry(playerId)) {
        throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in this game");
    }
    SendState(playerId, requestId);
}

// =============== Queries ===============

RosterEntry* GameSession::FindEntry(const std::string& playerId) {
    for (auto& entry : roster_) {
        if (entry.player->playerId == playerId) {
            return &entry;
        }
    }
    return nullptr;
}

const RosterEntry* GameSession::FindEntry(const std::string& playerId) const {
    for (const auto& entry : roster_) {
        if (entry.player->playerId == playerId) {
            return &entry;
        }
    }
    return nullptr;
}

SessionStatus GameSession::GetStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

size_t GameSession::GetPlayerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roster_.size();
}

bool GameSession::HasMember(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindEntry(playerId) != nullptr;
}

bool GameSession::IsMemberConnected(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const RosterEntry* entry = FindEntry(playerId);
    return entry && entry->player->connected;
}

std::string GameSession::GetEntityId(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const RosterEntry* entry = FindEntry(playerId);
    return entry ? entry->entityId : std::string();
}

RoundState GameSession::GetRoundState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_;
}

StateSnapshot GameSession::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return synchronizer_.GetCurrent();
}

uint64_t GameSession::GetRevision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return synchronizer_.GetRevision();
}

uint32_t GameSession::GetSeed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seed_;
}

std::vector<ActionEnvelope> GameSession::GetRoundLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ActionEnvelope>(roundLog_.begin(), roundLog_.end());
}

nlohmann::json GameSession::GetChatLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json chat = nlohmann::json::array();
    for (const auto& line : chatLog_) {
        chat.push_back(line);
    }
    return chat;
}

bool GameSession::ShouldTearDown(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return teardownAt_ && now >= *teardownAt_;
}

nlohmann::json GameSession::Summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"session_id", sessionId_},
        {"name", name_},
        {"players", roster_.size()},
        {"max_players", settings_.maxPlayers},
        {"status", ToString(status_)}
    };
}
