#include "protocol/Message.hpp"
#include <array>
#include <chrono>
#include <utility>

namespace {

struct TypeName {
    MessageType type;
    const char* name;
};

constexpr std::array<TypeName, 24> kTypeNames = {{
    {MessageType::AUTH, "auth"},
    {MessageType::CREATE_GAME, "create_game"},
    {MessageType::JOIN_GAME, "join_game"},
    {MessageType::LEAVE_GAME, "leave_game"},
    {MessageType::READY, "ready"},
    {MessageType::ACTION, "action"},
    {MessageType::CHAT, "chat"},
    {MessageType::RECONNECT, "reconnect"},
    {MessageType::RESYNC, "resync"},
    {MessageType::LIST_GAMES, "list_games"},
    {MessageType::PING, "ping"},
    {MessageType::AUTH_SUCCESS, "auth_success"},
    {MessageType::AUTH_FAILURE, "auth_failure"},
    {MessageType::STATE, "state"},
    {MessageType::DELTA, "delta"},
    {MessageType::SYSTEM, "system"},
    {MessageType::ERROR, "error"},
    {MessageType::CHAT_MESSAGE, "chat_message"},
    {MessageType::PLAYER_JOINED, "player_joined"},
    {MessageType::PLAYER_LEFT, "player_left"},
    {MessageType::GAME_START, "game_start"},
    {MessageType::GAME_END, "game_end"},
    {MessageType::GAME_LIST, "game_list"},
    {MessageType::PONG, "pong"},
}};

} // namespace

int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* ToString(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<MessageType> ParseMessageType(const std::string& type) {
    for (const auto& entry : kTypeNames) {
        if (type == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

bool IsClientMessage(MessageType type) {
    switch (type) {
        case MessageType::AUTH:
        case MessageType::CREATE_GAME:
        case MessageType::JOIN_GAME:
        case MessageType::LEAVE_GAME:
        case MessageType::READY:
        case MessageType::ACTION:
        case MessageType::CHAT:
        case MessageType::RECONNECT:
        case MessageType::RESYNC:
        case MessageType::LIST_GAMES:
        case MessageType::PING:
            return true;
        default:
            return false;
    }
}

bool IsCritical(MessageType type) {
    switch (type) {
        case MessageType::CHAT_MESSAGE:
        case MessageType::SYSTEM:
        case MessageType::PONG:
        case MessageType::GAME_LIST:
            return false;
        default:
            return true;
    }
}

Message Message::WithRequestId(const nlohmann::json& request) const {
    Message copy = *this;
    copy.requestId = request;
    return copy;
}

nlohmann::json Message::ToJson() const {
    nlohmann::json json = {
        {"type", ToString(type)},
        {"payload", payload},
        {"timestamp", NowMillis()}
    };
    if (HasRequestId()) {
        json["request_id"] = requestId;
    }
    return json;
}

std::string Message::Serialize() const {
    return ToJson().dump();
}

Message Message::Parse(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        throw ProtocolError(ErrorCode::MALFORMED_FRAME, "Invalid JSON format");
    }
    return FromJson(json);
}

Message Message::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ProtocolError(ErrorCode::MALFORMED_FRAME, "Message must be a JSON object");
    }
    if (!json.contains("type") || !json["type"].is_string()) {
        throw ProtocolError(ErrorCode::MALFORMED_FRAME, "Invalid message format: missing 'type' field");
    }

    Message message;
    if (json.contains("request_id")) {
        const auto& request = json["request_id"];
        if (!request.is_string() && !request.is_number_integer() && !request.is_null()) {
            throw ProtocolError(ErrorCode::MALFORMED_FRAME, "request_id must be a string or integer");
        }
        message.requestId = request;
    }

    const std::string typeName = json["type"].get<std::string>();
    auto type = ParseMessageType(typeName);
    if (!type || !IsClientMessage(*type)) {
        throw ProtocolError(ErrorCode::UNKNOWN_MESSAGE_TYPE, "Unknown message type: " + typeName);
    }
    message.type = *type;

    if (json.contains("payload") && !json["payload"].is_null()) {
        if (!json["payload"].is_object()) {
            throw ProtocolError(ErrorCode::MALFORMED_FRAME, "payload must be an object");
        }
        message.payload = json["payload"];
    }
    return message;
}

Message Message::AuthSuccess(const std::string& playerId, const std::string& token,
                             const std::string& displayName) {
    return Message(MessageType::AUTH_SUCCESS, {
        {"player_id", playerId},
        {"token", token},
        {"display_name", displayName}
    });
}

Message Message::AuthFailure(const std::string& reason, const std::string& message) {
    return Message(MessageType::AUTH_FAILURE, {
        {"reason", reason},
        {"message", message}
    });
}

Message Message::State(const nlohmann::json& snapshot, bool gameOver, const nlohmann::json& chat) {
    return Message(MessageType::STATE, {
        {"snapshot", snapshot},
        {"game_over", gameOver},
        {"chat", chat}
    });
}

Message Message::Delta(const nlohmann::json& delta) {
    return Message(MessageType::DELTA, delta);
}

Message Message::System(const std::string& message, const std::string& level) {
    return Message(MessageType::SYSTEM, {
        {"message", message},
        {"level", level}
    });
}

Message Message::Error(const GameError& error) {
    return Message(MessageType::ERROR, {
        {"reason", error.GetReason()},
        {"category", ToString(error.GetCategory())},
        {"message", error.what()}
    });
}

Message Message::Error(ErrorCode code, const std::string& message) {
    return Message(MessageType::ERROR, {
        {"reason", ToString(code)},
        {"category", ToString(CategoryOf(code))},
        {"message", message}
    });
}

Message Message::ChatMessage(const std::string& playerId, const std::string& playerName,
                             const std::string& text) {
    return Message(MessageType::CHAT_MESSAGE, {
        {"player_id", playerId},
        {"player_name", playerName},
        {"message", text}
    });
}

Message Message::PlayerJoined(const std::string& playerId, const std::string& playerName) {
    return Message(MessageType::PLAYER_JOINED, {
        {"player_id", playerId},
        {"player_name", playerName}
    });
}

Message Message::PlayerLeft(const std::string& playerId, const std::string& playerName,
                            const std::string& reason) {
    return Message(MessageType::PLAYER_LEFT, {
        {"player_id", playerId},
        {"player_name", playerName},
        {"reason", reason}
    });
}

Message Message::GameStart(const std::string& sessionId, const nlohmann::json& players, uint32_t seed) {
    return Message(MessageType::GAME_START, {
        {"session_id", sessionId},
        {"players", players},
        {"seed", seed}
    });
}

Message Message::GameEnd(const std::string& sessionId, bool victory, const std::string& reason) {
    return Message(MessageType::GAME_END, {
        {"session_id", sessionId},
        {"victory", victory},
        {"reason", reason}
    });
}

Message Message::GameList(const std::vector<nlohmann::json>& games) {
    return Message(MessageType::GAME_LIST, {
        {"games", games}
    });
}

Message Message::Pong() {
    return Message(MessageType::PONG, {
        {"server_time", NowMillis()}
    });
}
