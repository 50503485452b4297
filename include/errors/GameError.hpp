#pragma once

#include <stdexcept>
#include <string>

enum class ErrorCategory {
    PROTOCOL,
    AUTH,
    SESSION,
    ACTION,
    SYNC,
    INTERNAL
};

enum class ErrorCode {
    // Protocol
    MALFORMED_FRAME,
    UNKNOWN_MESSAGE_TYPE,
    INVALID_PAYLOAD,
    NOT_AUTHENTICATED,
    // Auth
    INVALID_NAME,
    INVALID_TOKEN,
    TOKEN_EXPIRED,
    ALREADY_AUTHENTICATED,
    // Session
    SESSION_NOT_FOUND,
    SESSION_FULL,
    INVALID_STATE,
    RECONNECT_EXPIRED,
    NOT_IN_SESSION,
    ALREADY_IN_SESSION,
    // Action
    UNKNOWN_ACTION,
    INVALID_ACTION,
    INVALID_PARAMS,
    BUDGET_EXHAUSTED,
    PLAYER_UNAVAILABLE,
    GAME_NOT_ACTIVE,
    // Sync
    STALE_REVISION,
    // Internal
    INTERNAL_ERROR
};

// Wire reason string, e.g. "session_full".
const char* ToString(ErrorCode code);
const char* ToString(ErrorCategory category);
ErrorCategory CategoryOf(ErrorCode code);

class GameError : public std::runtime_error {
public:
    GameError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode GetCode() const { return code_; }
    ErrorCategory GetCategory() const { return CategoryOf(code_); }
    const char* GetReason() const { return ToString(code_); }

private:
    ErrorCode code_;
};

class ProtocolError : public GameError {
public:
    using GameError::GameError;
};

class AuthError : public GameError {
public:
    using GameError::GameError;
};

class SessionError : public GameError {
public:
    using GameError::GameError;
};

class ActionError : public GameError {
public:
    using GameError::GameError;
};

class SyncError : public GameError {
public:
    using GameError::GameError;
};
