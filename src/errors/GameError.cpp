#include "errors/GameError.hpp"

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_FRAME:       return "malformed_frame";
        case ErrorCode::UNKNOWN_MESSAGE_TYPE:  return "unknown_message_type";
        case ErrorCode::INVALID_PAYLOAD:       return "invalid_payload";
        case ErrorCode::NOT_AUTHENTICATED:     return "not_authenticated";
        case ErrorCode::INVALID_NAME:          return "invalid_name";
        case ErrorCode::INVALID_TOKEN:         return "invalid_token";
        case ErrorCode::TOKEN_EXPIRED:         return "token_expired";
        case ErrorCode::ALREADY_AUTHENTICATED: return "already_authenticated";
        case ErrorCode::SESSION_NOT_FOUND:     return "session_not_found";
        case ErrorCode::SESSION_FULL:          return "session_full";
        case ErrorCode::INVALID_STATE:         return "invalid_state";
        case ErrorCode::RECONNECT_EXPIRED:     return "reconnect_expired";
        case ErrorCode::NOT_IN_SESSION:        return "not_in_session";
        case ErrorCode::ALREADY_IN_SESSION:    return "already_in_session";
        case ErrorCode::UNKNOWN_ACTION:        return "unknown_action";
        case ErrorCode::INVALID_ACTION:        return "invalid_action";
        case ErrorCode::INVALID_PARAMS:        return "invalid_params";
        case ErrorCode::BUDGET_EXHAUSTED:      return "budget_exhausted";
        case ErrorCode::PLAYER_UNAVAILABLE:    return "player_unavailable";
        case ErrorCode::GAME_NOT_ACTIVE:       return "game_not_active";
        case ErrorCode::STALE_REVISION:        return "stale_revision";
        case ErrorCode::INTERNAL_ERROR:        return "internal_error";
    }
    return "internal_error";
}

const char* ToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::PROTOCOL: return "protocol";
        case ErrorCategory::AUTH:     return "auth";
        case ErrorCategory::SESSION:  return "session";
        case ErrorCategory::ACTION:   return "action";
        case ErrorCategory::SYNC:     return "sync";
        case ErrorCategory::INTERNAL: return "internal";
    }
    return "internal";
}

ErrorCategory CategoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_FRAME:
        case ErrorCode::UNKNOWN_MESSAGE_TYPE:
        case ErrorCode::INVALID_PAYLOAD:
        case ErrorCode::NOT_AUTHENTICATED:
            return ErrorCategory::PROTOCOL;
        case ErrorCode::INVALID_NAME:
        case ErrorCode::INVALID_TOKEN:
        case ErrorCode::TOKEN_EXPIRED:
        case ErrorCode::ALREADY_AUTHENTICATED:
            return ErrorCategory::AUTH;
        case ErrorCode::SESSION_NOT_FOUND:
        case ErrorCode::SESSION_FULL:
        case ErrorCode::INVALID_STATE:
        case ErrorCode::RECONNECT_EXPIRED:
        case ErrorCode::NOT_IN_SESSION:
        case ErrorCode::ALREADY_IN_SESSION:
            return ErrorCategory::SESSION;
        case ErrorCode::UNKNOWN_ACTION:
        case ErrorCode::INVALID_ACTION:
        case ErrorCode::INVALID_PARAMS:
        case ErrorCode::BUDGET_EXHAUSTED:
        case ErrorCode::PLAYER_UNAVAILABLE:
        case ErrorCode::GAME_NOT_ACTIVE:
            return ErrorCategory::ACTION;
        case ErrorCode::STALE_REVISION:
            return ErrorCategory::SYNC;
        case ErrorCode::INTERNAL_ERROR:
            return ErrorCategory::INTERNAL;
    }
    return ErrorCategory::INTERNAL;
}
