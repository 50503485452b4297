#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors/GameError.hpp"

enum class MessageType {
    // Client -> Server
    AUTH,
    CREATE_GAME,
    JOIN_GAME,
    LEAVE_GAME,
    READY,
    ACTION,
    CHAT,
    RECONNECT,
    RESYNC,
    LIST_GAMES,
    PING,

    // Server -> Client
    AUTH_SUCCESS,
    AUTH_FAILURE,
    STATE,
    DELTA,
    SYSTEM,
    ERROR,
    CHAT_MESSAGE,
    PLAYER_JOINED,
    PLAYER_LEFT,
    GAME_START,
    GAME_END,
    GAME_LIST,
    PONG
};

const char* ToString(MessageType type);
std::optional<MessageType> ParseMessageType(const std::string& type);
bool IsClientMessage(MessageType type);

// Critical messages are never dropped from an outbound queue.
bool IsCritical(MessageType type);

// Wire envelope: {"type", "payload", "request_id"?, "timestamp"?}
struct Message {
    MessageType type = MessageType::SYSTEM;
    nlohmann::json payload = nlohmann::json::object();
    nlohmann::json requestId;  // null when absent

    Message() = default;
    Message(MessageType messageType, nlohmann::json messagePayload, nlohmann::json request = nullptr)
        : type(messageType), payload(std::move(messagePayload)), requestId(std::move(request)) {}

    bool HasRequestId() const { return !requestId.is_null(); }
    Message WithRequestId(const nlohmann::json& request) const;

    nlohmann::json ToJson() const;
    std::string Serialize() const;

    // Throws ProtocolError for malformed frames or unknown types.
    static Message Parse(const std::string& text);
    static Message FromJson(const nlohmann::json& json);

    // Server message builders
    static Message AuthSuccess(const std::string& playerId, const std::string& token,
                               const std::string& displayName);
    static Message AuthFailure(const std::string& reason, const std::string& message);
    static Message State(const nlohmann::json& snapshot, bool gameOver = false,
                         const nlohmann::json& chat = nlohmann::json::array());
    static Message Delta(const nlohmann::json& delta);
    static Message System(const std::string& message, const std::string& level = "info");
    static Message Error(const GameError& error);
    static Message Error(ErrorCode code, const std::string& message);
    static Message ChatMessage(const std::string& playerId, const std::string& playerName,
                               const std::string& text);
    static Message PlayerJoined(const std::string& playerId, const std::string& playerName);
    static Message PlayerLeft(const std::string& playerId, const std::string& playerName,
                              const std::string& reason);
    static Message GameStart(const std::string& sessionId, const nlohmann::json& players,
                             uint32_t seed);
    static Message GameEnd(const std::string& sessionId, bool victory, const std::string& reason);
    static Message GameList(const std::vector<nlohmann::json>& games);
    static Message Pong();
};

int64_t NowMillis();
