#include "session/SessionManager.hpp"
#include "logging/Logger.hpp"
#include <algorithm>

SessionManager::SessionManager(const ServerSettings& settings, GameRules rules, SessionOutbox& outbox)
    : rules_(std::move(rules)),
      outbox_(outbox) {
    sessionSettings_.maxPlayers = settings.maxPlayersPerSession;
    sessionSettings_.maxActionsPerRound = settings.maxActionsPerRound;
    sessionSettings_.disconnectDeadline = settings.disconnectDeadline;
    sessionSettings_.gracePeriod = settings.sessionGracePeriod;
    sessionSettings_.chatLogSize = settings.chatLogSize;
    sessionSettings_.worldSeed = settings.worldSeed;
}

GameSession::Pointer SessionManager::CreateGame(const std::shared_ptr<PlayerSession>& owner,
                                                const std::string& name,
                                                std::optional<size_t> maxPlayers,
                                                Clock::time_point now) {
    ReleaseCurrentGame(owner, nullptr, now);

    SessionSettings settings = sessionSettings_;
    if (maxPlayers) {
        settings.maxPlayers = std::clamp<size_t>(*maxPlayers, 1, sessionSettings_.maxPlayers);
    }

    std::string sessionId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessionId = GenerateSessionId();
    }
    std::string gameName = name.empty() ? owner->displayName + "'s game" : name;

    auto session = std::make_shared<GameSession>(sessionId, gameName, settings, rules_, outbox_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[sessionId] = session;
    }

    session->AddPlayer(owner, now);
    return session;
}

GameSession::Pointer SessionManager::JoinGame(const std::string& sessionId,
                                              const std::shared_ptr<PlayerSession>& player,
                                              Clock::time_point now) {
    auto session = FindSession(sessionId);
    if (!session) {
        throw SessionError(ErrorCode::SESSION_NOT_FOUND, "No game with id " + sessionId);
    }

    if (session->GetStatus() == SessionStatus::ENDED) {
        throw SessionError(ErrorCode::INVALID_STATE, "That game has ended");
    }

    if (session->HasMember(player->playerId)) {
        session->Reconnect(player, now);
        return session;
    }

    ReleaseCurrentGame(player, session, now);
    session->AddPlayer(player, now);
    return session;
}

void SessionManager::LeaveGame(const std::shared_ptr<PlayerSession>& player, Clock::time_point now) {
    auto session = GetSessionOf(*player);
    if (!session) {
        throw SessionError(ErrorCode::NOT_IN_SESSION, "Not in a game");
    }
    session->RemovePlayer(player->playerId, now);
    Logger::Debug("Player {} left session {}", player->playerId, session->GetId());
}

GameSession::Pointer SessionManager::Reconnect(const std::shared_ptr<PlayerSession>& player,
                                               const std::string& sessionId,
                                               Clock::time_point now) {
    const std::string targetId = sessionId.empty() ? player->gameId : sessionId;
    if (targetId.empty()) {
        throw SessionError(ErrorCode::RECONNECT_EXPIRED, "No game to return to");
    }

    auto session = FindSession(targetId);
    if (!session) {
        throw SessionError(ErrorCode::RECONNECT_EXPIRED, "That game no longer exists");
    }

    session->Reconnect(player, now);
    return session;
}

void SessionManager::HandleDisconnect(const std::shared_ptr<PlayerSession>& player, Clock::time_point now) {
    if (auto session = GetSessionOf(*player)) {
        session->HandleDisconnect(player->playerId, now);
    }
}

std::vector<nlohmann::json> SessionManager::ListJoinable() const {
    std::vector<nlohmann::json> games;
    for (const auto& session : GetAllSessions()) {
        if (session->GetStatus() == SessionStatus::LOBBY &&
            session->GetPlayerCount() < session->GetMaxPlayers()) {
            games.push_back(session->Summary());
        }
    }
    return games;
}

size_t SessionManager::Sweep(Clock::time_point now) {
    std::vector<GameSession::Pointer> finished;
    for (const auto& session : GetAllSessions()) {
        session->ExpireDisconnected(now);
        if (session->ShouldTearDown(now)) {
            finished.push_back(session);
        }
    }

    for (const auto& session : finished) {
        session->ReleaseMembers();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(session->GetId());
        }
        Logger::Info("Session {} torn down", session->GetId());
    }
    return finished.size();
}

void SessionManager::EndAll(const std::string& reason) {
    for (const auto& session : GetAllSessions()) {
        session->ForceEnd(reason);
    }
}

GameSession::Pointer SessionManager::FindSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second;
}

GameSession::Pointer SessionManager::GetSessionOf(const PlayerSession& player) const {
    if (auto session = player.game.lock()) {
        return session;
    }
    if (player.gameId.empty()) {
        return nullptr;
    }
    return FindSession(player.gameId);
}

size_t SessionManager::GetSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionManager::ReleaseCurrentGame(const std::shared_ptr<PlayerSession>& player,
                                        const GameSession::Pointer& target,
                                        Clock::time_point now) {
    auto current = GetSessionOf(*player);
    if (!current || current == target) {
        return;
    }
    if (current->GetStatus() != SessionStatus::ENDED && current->IsMemberConnected(player->playerId)) {
        throw SessionError(ErrorCode::INVALID_STATE, "Leave your current game first");
    }
    // Finished games and abandoned slots do not hold their players.
    if (current->HasMember(player->playerId)) {
        current->RemovePlayer(player->playerId, now);
    }
    player->gameId.clear();
    player->game.reset();
}

std::string SessionManager::GenerateSessionId() {
    return "game-" + std::to_string(nextSessionNumber_++);
}

std::vector<GameSession::Pointer> SessionManager::GetAllSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GameSession::Pointer> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}
