#include <gtest/gtest.h>

#include "game/DungeonRules.hpp"
#include "session/SessionManager.hpp"
#include "TestSupport.hpp"

using testing_support::CaptureCode;
using testing_support::MakePlayer;
using testing_support::RecordingOutbox;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.maxPlayersPerSession = 2;
        settings.maxActionsPerRound = 4;
        settings.sessionGracePeriod = std::chrono::seconds(60);
        settings.worldSeed = 99;
        manager = std::make_unique<SessionManager>(settings, MakeDungeonRules(), outbox);

        alice = MakePlayer("p1", "Alice");
        bob = MakePlayer("p2", "Bob");
        carol = MakePlayer("p3", "Carol");
    }

    ServerSettings settings;
    RecordingOutbox outbox;
    std::unique_ptr<SessionManager> manager;
    std::shared_ptr<PlayerSession> alice;
    std::shared_ptr<PlayerSession> bob;
    std::shared_ptr<PlayerSession> carol;
};

TEST_F(SessionManagerTest, CreateGameSeatsTheOwner) {
    auto session = manager->CreateGame(alice);

    EXPECT_EQ(session->GetId(), "game-1");
    EXPECT_EQ(session->GetName(), "Alice's game");
    EXPECT_TRUE(session->HasMember("p1"));
    EXPECT_EQ(manager->GetSessionOf(*alice), session);
    EXPECT_EQ(manager->FindSession("game-1"), session);

    auto second = manager->CreateGame(bob, "Crypt Run");
    EXPECT_EQ(second->GetId(), "game-2");
    EXPECT_EQ(second->GetName(), "Crypt Run");
    EXPECT_EQ(manager->GetSessionCount(), 2u);
}

TEST_F(SessionManagerTest, MaxPlayersIsClampedToServerLimit) {
    auto session = manager->CreateGame(alice, "", 10);
    EXPECT_EQ(session->GetMaxPlayers(), 2u);

    auto solo = manager->CreateGame(bob, "", 1);
    EXPECT_EQ(solo->GetMaxPlayers(), 1u);
}

TEST_F(SessionManagerTest, JoinErrors) {
    EXPECT_EQ(CaptureCode([&] { manager->JoinGame("game-404", bob); }), ErrorCode::SESSION_NOT_FOUND);

    auto session = manager->CreateGame(alice);
    manager->JoinGame(session->GetId(), bob);
    EXPECT_EQ(CaptureCode([&] { manager->JoinGame(session->GetId(), carol); }), ErrorCode::SESSION_FULL);
}

TEST_F(SessionManagerTest, LateJoinIsRejected) {
    auto session = manager->CreateGame(alice, "", 2);
    manager->JoinGame(session->GetId(), bob);
    session->SetReady("p1", true);
    session->SetReady("p2", true);
    ASSERT_EQ(session->GetStatus(), SessionStatus::ACTIVE);

    manager->LeaveGame(bob);
    EXPECT_EQ(CaptureCode([&] { manager->JoinGame(session->GetId(), carol); }), ErrorCode::INVALID_STATE);
}

TEST_F(SessionManagerTest, ConnectedPlayersMustLeaveBeforeSwitching) {
    auto first = manager->CreateGame(alice);
    auto second = manager->CreateGame(bob);

    EXPECT_EQ(CaptureCode([&] { manager->JoinGame(second->GetId(), alice); }), ErrorCode::INVALID_STATE);
    EXPECT_EQ(CaptureCode([&] { manager->CreateGame(alice); }), ErrorCode::INVALID_STATE);

    manager->LeaveGame(alice);
    EXPECT_TRUE(alice->gameId.empty());
    manager->JoinGame(second->GetId(), alice);
    EXPECT_EQ(manager->GetSessionOf(*alice), second);
}

TEST_F(SessionManagerTest, LeavingAnActiveGameHoldsTheSlotUntilReplaced) {
    auto session = manager->CreateGame(alice);
    manager->JoinGame(session->GetId(), bob);
    session->SetReady("p1", true);
    session->SetReady("p2", true);

    manager->LeaveGame(bob);
    EXPECT_TRUE(session->HasMember("p2"));
    EXPECT_FALSE(session->IsMemberConnected("p2"));
    EXPECT_EQ(bob->gameId, session->GetId());

    // Rejoining the same game is a reconnect.
    manager->JoinGame(session->GetId(), bob);
    EXPECT_TRUE(session->IsMemberConnected("p2"));

    // Joining elsewhere forfeits the held slot.
    manager->LeaveGame(bob);
    auto other = manager->CreateGame(carol);
    manager->JoinGame(other->GetId(), bob);
    EXPECT_FALSE(session->HasMember("p2"));
    EXPECT_EQ(manager->GetSessionOf(*bob), other);
}

TEST_F(SessionManagerTest, LeaveWithoutGameIsAnError) {
    EXPECT_EQ(CaptureCode([&] { manager->LeaveGame(alice); }), ErrorCode::NOT_IN_SESSION);
}

TEST_F(SessionManagerTest, ReconnectNeedsALiveGame) {
    EXPECT_EQ(CaptureCode([&] { manager->Reconnect(alice); }), ErrorCode::RECONNECT_EXPIRED);
    EXPECT_EQ(CaptureCode([&] { manager->Reconnect(alice, "game-9"); }), ErrorCode::RECONNECT_EXPIRED);

    auto session = manager->CreateGame(alice);
    manager->HandleDisconnect(alice);
    EXPECT_FALSE(session->IsMemberConnected("p1"));

    EXPECT_EQ(manager->Reconnect(alice), session);
    EXPECT_TRUE(session->IsMemberConnected("p1"));
}

TEST_F(SessionManagerTest, ListJoinableShowsOpenLobbiesOnly) {
    auto open = manager->CreateGame(alice);
    auto full = manager->CreateGame(bob);
    manager->JoinGame(full->GetId(), carol);

    auto games = manager->ListJoinable();
    ASSERT_EQ(games.size(), 1u);
    EXPECT_EQ(games[0]["session_id"], open->GetId());
    EXPECT_EQ(games[0]["status"], "lobby");
}

TEST_F(SessionManagerTest, SweepTearsDownFinishedSessions) {
    const auto start = Clock::now();
    auto session = manager->CreateGame(alice, "", std::nullopt, start);
    manager->LeaveGame(alice, start);
    ASSERT_EQ(session->GetStatus(), SessionStatus::ENDED);

    EXPECT_EQ(manager->Sweep(start + std::chrono::seconds(30)), 0u);
    EXPECT_EQ(manager->GetSessionCount(), 1u);

    EXPECT_EQ(manager->Sweep(start + std::chrono::seconds(61)), 1u);
    EXPECT_EQ(manager->GetSessionCount(), 0u);
    EXPECT_EQ(manager->FindSession(session->GetId()), nullptr);
}

TEST_F(SessionManagerTest, EndAllEndsEverySession) {
    auto first = manager->CreateGame(alice);
    auto second = manager->CreateGame(bob);
    manager->EndAll("maintenance");

    EXPECT_EQ(first->GetStatus(), SessionStatus::ENDED);
    EXPECT_EQ(second->GetStatus(), SessionStatus::ENDED);
    EXPECT_EQ(outbox.For("p1", MessageType::GAME_END).size(), 1u);
}
