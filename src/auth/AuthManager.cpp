#include "auth/AuthManager.hpp"
#include "errors/GameError.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

AuthManager::AuthManager(std::chrono::seconds tokenExpiry)
    : tokenExpiry_(tokenExpiry),
      rng_(std::random_device{}()) {
}

bool AuthManager::IsValidDisplayName(const std::string& name) {
    if (name.empty() || name.size() > MAX_NAME_LENGTH) {
        return false;
    }
    bool allowed = std::all_of(name.begin(), name.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == ' ' || c == '_' || c == '-';
    });
    if (!allowed) {
        return false;
    }
    return std::any_of(name.begin(), name.end(), [](char c) { return c != ' '; });
}

std::shared_ptr<PlayerSession> AuthManager::CreateSession(const std::string& displayName,
                                                          Clock::time_point now) {
    if (!IsValidDisplayName(displayName)) {
        throw AuthError(ErrorCode::INVALID_NAME,
                        "Display name must be 1-24 characters of letters, digits, space, _ or -");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto session = std::make_shared<PlayerSession>();
    session->token = GenerateToken();
    session->playerId = GeneratePlayerId();
    session->displayName = displayName;
    session->createdAt = now;
    session->lastSeen = now;

    byToken_[session->token] = session;
    byPlayer_[session->playerId] = session;

    Logger::Info("Player {} authenticated as '{}'", session->playerId, displayName);
    return session;
}

std::shared_ptr<PlayerSession> AuthManager::VerifyToken(const std::string& token,
                                                        Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = byToken_.find(token);
    if (it == byToken_.end()) {
        throw AuthError(ErrorCode::INVALID_TOKEN, "Unknown session token");
    }

    auto& session = it->second;
    if (!session->InGame() && now - session->lastSeen > tokenExpiry_) {
        throw AuthError(ErrorCode::TOKEN_EXPIRED, "Session token expired");
    }

    session->lastSeen = now;
    return session;
}

std::shared_ptr<PlayerSession> AuthManager::FindByPlayer(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byPlayer_.find(playerId);
    return it == byPlayer_.end() ? nullptr : it->second;
}

void AuthManager::MarkDisconnected(const std::string& playerId, Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byPlayer_.find(playerId);
    if (it == byPlayer_.end()) {
        return;
    }
    it->second->connected = false;
    it->second->disconnectDeadline = deadline;
    Logger::Debug("Player {} marked disconnected", playerId);
}

void AuthManager::MarkConnected(const std::string& playerId, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byPlayer_.find(playerId);
    if (it == byPlayer_.end()) {
        return;
    }
    it->second->connected = true;
    it->second->disconnectDeadline.reset();
    it->second->lastSeen = now;
}

void AuthManager::Invalidate(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byToken_.find(token);
    if (it == byToken_.end()) {
        return;
    }
    byPlayer_.erase(it->second->playerId);
    byToken_.erase(it);
}

size_t AuthManager::CleanupExpired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = byToken_.begin(); it != byToken_.end();) {
        const auto& session = it->second;
        if (!session->connected && !session->InGame() && now - session->lastSeen > tokenExpiry_) {
            byPlayer_.erase(session->playerId);
            it = byToken_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        Logger::Debug("Cleaned up {} expired player sessions", removed);
    }
    return removed;
}

size_t AuthManager::GetSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return byToken_.size();
}

std::string AuthManager::GenerateToken() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 4; ++i) {
        oss << std::setw(16) << rng_();
    }
    return oss.str();
}

std::string AuthManager::GeneratePlayerId() {
    return "p" + std::to_string(nextPlayerNumber_++);
}
