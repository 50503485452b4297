#include <gtest/gtest.h>

#include "protocol/Message.hpp"
#include "TestSupport.hpp"

using testing_support::CaptureCode;

TEST(MessageTest, ParsesClientEnvelope) {
    Message message = Message::Parse(R"({"type":"join_game","payload":{"session_id":"game-1"},"request_id":7})");

    EXPECT_EQ(message.type, MessageType::JOIN_GAME);
    EXPECT_EQ(message.payload["session_id"], "game-1");
    ASSERT_TRUE(message.HasRequestId());
    EXPECT_EQ(message.requestId, 7);
}

TEST(MessageTest, MissingPayloadBecomesEmptyObject) {
    Message message = Message::Parse(R"({"type":"ping"})");

    EXPECT_EQ(message.type, MessageType::PING);
    EXPECT_TRUE(message.payload.is_object());
    EXPECT_TRUE(message.payload.empty());
    EXPECT_FALSE(message.HasRequestId());
}

TEST(MessageTest, RejectsMalformedFrames) {
    EXPECT_EQ(CaptureCode([] { Message::Parse("not json"); }), ErrorCode::MALFORMED_FRAME);
    EXPECT_EQ(CaptureCode([] { Message::Parse("[1,2,3]"); }), ErrorCode::MALFORMED_FRAME);
    EXPECT_EQ(CaptureCode([] { Message::Parse(R"({"payload":{}})"); }), ErrorCode::MALFORMED_FRAME);
    EXPECT_EQ(CaptureCode([] { Message::Parse(R"({"type":"ping","payload":[]})"); }),
              ErrorCode::MALFORMED_FRAME);
    EXPECT_EQ(CaptureCode([] { Message::Parse(R"({"type":"ping","request_id":{"a":1}})"); }),
              ErrorCode::MALFORMED_FRAME);
}

TEST(MessageTest, RejectsUnknownAndServerOnlyTypes) {
    EXPECT_EQ(CaptureCode([] { Message::Parse(R"({"type":"teleport"})"); }),
              ErrorCode::UNKNOWN_MESSAGE_TYPE);
    EXPECT_EQ(CaptureCode([] { Message::Parse(R"({"type":"delta","payload":{}})"); }),
              ErrorCode::UNKNOWN_MESSAGE_TYPE);
}

TEST(MessageTest, SerializesWithRequestIdEcho) {
    Message reply = Message::Pong().WithRequestId("abc");
    auto json = nlohmann::json::parse(reply.Serialize());

    EXPECT_EQ(json["type"], "pong");
    EXPECT_EQ(json["request_id"], "abc");
    EXPECT_TRUE(json.contains("timestamp"));
    EXPECT_TRUE(json["payload"].contains("server_time"));
}

TEST(MessageTest, ErrorCarriesReasonAndCategory) {
    Message error = Message::Error(SessionError(ErrorCode::SESSION_FULL, "Game is full"));

    EXPECT_EQ(error.type, MessageType::ERROR);
    EXPECT_EQ(error.payload["reason"], "session_full");
    EXPECT_EQ(error.payload["category"], "session");
    EXPECT_EQ(error.payload["message"], "Game is full");
}

TEST(MessageTest, OnlyAdvisoryMessagesAreDroppable) {
    EXPECT_TRUE(IsCritical(MessageType::STATE));
    EXPECT_TRUE(IsCritical(MessageType::DELTA));
    EXPECT_TRUE(IsCritical(MessageType::ERROR));
    EXPECT_TRUE(IsCritical(MessageType::GAME_END));
    EXPECT_FALSE(IsCritical(MessageType::CHAT_MESSAGE));
    EXPECT_FALSE(IsCritical(MessageType::SYSTEM));
    EXPECT_FALSE(IsCritical(MessageType::PONG));
}
