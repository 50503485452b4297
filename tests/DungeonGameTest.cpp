#include <gtest/gtest.h>
#include <set>

#include "game/DungeonActions.hpp"
#include "game/DungeonMapGenerator.hpp"
#include "game/DungeonState.hpp"
#include "game/MonsterTurnSystem.hpp"
#include "TestSupport.hpp"

using testing_support::OpenRoom;

// =============== Map Generation ===============

TEST(DungeonMapGeneratorTest, SameSeedSameMap) {
    DungeonMapGenerator first;
    DungeonMapGenerator second;

    DungeonMap a = first.Generate(1234);
    DungeonMap b = second.Generate(1234);

    EXPECT_EQ(a.ToRows(), b.ToRows());
    ASSERT_FALSE(a.GetRooms().empty());
    EXPECT_EQ(first.FindSpawnPositions(4), second.FindSpawnPositions(4));
}

TEST(DungeonMapGeneratorTest, RoomsAreCarvedInsideBorder) {
    DungeonMapGenerator generator;
    DungeonMap map = generator.Generate(99);

    EXPECT_EQ(map.GetWidth(), 60);
    EXPECT_EQ(map.GetHeight(), 30);
    for (const Room& room : map.GetRooms()) {
        EXPECT_GE(room.x, 1);
        EXPECT_GE(room.y, 1);
        EXPECT_LE(room.x + room.width, map.GetWidth() - 1);
        EXPECT_LE(room.y + room.height, map.GetHeight() - 1);
        EXPECT_TRUE(map.IsWalkable(room.Center()));
    }
    for (int x = 0; x < map.GetWidth(); ++x) {
        EXPECT_FALSE(map.IsWalkable(Coord{x, 0}));
    }
}

TEST(DungeonMapGeneratorTest, SpawnPositionsAreDistinctFloor) {
    DungeonMapGenerator generator;
    DungeonMap map = generator.Generate(7);
    auto spawns = generator.FindSpawnPositions(4);

    ASSERT_EQ(spawns.size(), 4u);
    std::set<Coord> unique(spawns.begin(), spawns.end());
    EXPECT_EQ(unique.size(), 4u);
    for (const Coord& spawn : spawns) {
        EXPECT_TRUE(map.IsWalkable(spawn));
    }
}

TEST(DungeonMapGeneratorTest, SpawnBeforeGenerateIsAnError) {
    DungeonMapGenerator generator;
    EXPECT_THROW(generator.FindSpawnPositions(1), std::logic_error);
}

TEST(DungeonMapGeneratorTest, TinyMapFallsBackToOneRoom) {
    DungeonGenerationConfig config;
    config.width = 6;
    config.height = 5;
    config.minRoomSize = 8;
    config.maxRoomSize = 9;
    DungeonMapGenerator generator(config);

    DungeonMap map = generator.Generate(1);
    ASSERT_EQ(map.GetRooms().size(), 1u);
    EXPECT_EQ(generator.FindSpawnPositions(2).size(), 2u);
    EXPECT_THROW(generator.FindSpawnPositions(100), std::runtime_error);
}

// =============== State ===============

TEST(DungeonStateTest, InitializePopulatesAllButFirstRoom) {
    DungeonMapGenerator generator;
    DungeonMap map = generator.Generate(5);
    DungeonState state;
    state.Initialize(map, 5);

    const Room& startRoom = map.GetRooms().front();
    for (const GameEntity* entity : state.GetEntities()) {
        EXPECT_NE(entity->GetType(), EntityType::PLAYER);
        EXPECT_FALSE(startRoom.Contains(entity->GetPosition())) << entity->GetId();
        EXPECT_TRUE(map.IsWalkable(entity->GetPosition()));
    }
    EXPECT_FALSE(state.IsGameOver());
}

TEST(DungeonStateTest, SameSeedSameEntities) {
    DungeonMapGenerator generator;
    DungeonMap map = generator.Generate(21);

    DungeonState a;
    DungeonState b;
    a.Initialize(map, 21);
    b.Initialize(map, 21);

    auto left = a.GetEntities();
    auto right = b.GetEntities();
    ASSERT_EQ(left.size(), right.size());
    for (size_t i = 0; i < left.size(); ++i) {
        EXPECT_EQ(left[i]->Serialize(), right[i]->Serialize());
    }
}

TEST(DungeonStateTest, AddPlayerBeforeInitializeIsAnError) {
    DungeonState state;
    EXPECT_THROW(state.AddPlayer("p1", "Alice", Coord{1, 1}), std::logic_error);
}

TEST(DungeonStateTest, PlayersAreTrackedByOwner) {
    DungeonState state;
    state.Initialize(OpenRoom(5, 5), 1);

    std::string entityId = state.AddPlayer("p1", "Alice", Coord{2, 2});
    const GameEntity* player = state.GetPlayer("p1");
    ASSERT_NE(player, nullptr);
    EXPECT_EQ(player->GetId(), entityId);
    EXPECT_EQ(player->GetOwnerId(), "p1");
    EXPECT_EQ(player->GetHp(), DungeonState::PLAYER_HP);
    EXPECT_EQ(state.BlockerAt(Coord{2, 2}), player);

    EXPECT_EQ(state.AddPlayer("p1", "Alice", Coord{3, 3}), entityId);

    state.RemovePlayer("p1");
    EXPECT_EQ(state.GetPlayer("p1"), nullptr);
    EXPECT_EQ(state.FindEntity(entityId), nullptr);
}

// =============== Actions ===============

class DungeonActionTest : public ::testing::Test {
protected:
    void SetUp() override {
        state.Initialize(OpenRoom(6, 6), 3);
        playerEntity = state.AddPlayer("p1", "Alice", Coord{2, 2});
    }

    ActionContext Context() { return ActionContext{state, "p1", playerEntity}; }

    DungeonState state;
    std::string playerEntity;
};

TEST_F(DungeonActionTest, MoveOntoFloor) {
    MoveAction move(1, 0);
    auto context = Context();
    ASSERT_TRUE(move.Validate(context));

    Outcome outcome = state.Apply(move, context);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(state.GetPlayer("p1")->GetPosition(), (Coord{3, 2}));
    EXPECT_FALSE(outcome.events.empty());
}

TEST_F(DungeonActionTest, MoveIntoWallOrMonsterIsInvalid) {
    state.FindEntity(playerEntity)->SetPosition(Coord{1, 1});
    auto context = Context();

    MoveAction intoWall(-1, 0);
    EXPECT_FALSE(intoWall.Validate(context));
    Outcome outcome = state.Apply(intoWall, context);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(state.GetPlayer("p1")->GetPosition(), (Coord{1, 1}));

    state.SpawnMonster("rat", Coord{2, 1});
    MoveAction intoMonster(1, 0);
    EXPECT_FALSE(intoMonster.Validate(context));
}

TEST_F(DungeonActionTest, AttackUntilMonsterDiesWinsTheGame) {
    GameEntity& monster = state.SpawnMonster("goblin", Coord{3, 3});
    const std::string monsterId = monster.GetId();
    auto context = Context();

    AttackAction attack(monsterId);
    ASSERT_TRUE(attack.Validate(context));

    Outcome first = state.Apply(attack, context);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(state.FindEntity(monsterId)->GetHp(), DungeonState::MONSTER_HP - DungeonState::PLAYER_ATTACK);
    EXPECT_FALSE(state.IsVictory());

    Outcome second = state.Apply(attack, context);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(state.FindEntity(monsterId), nullptr);
    EXPECT_TRUE(state.IsVictory());
    EXPECT_TRUE(state.IsGameOver());
}

TEST_F(DungeonActionTest, AttackOutOfReachIsInvalid) {
    GameEntity& monster = state.SpawnMonster("goblin", Coord{5, 5});
    AttackAction attack(monster.GetId());
    EXPECT_FALSE(attack.Validate(Context()));

    AttackAction nobody("monster-999");
    EXPECT_FALSE(nobody.Validate(Context()));
}

TEST_F(DungeonActionTest, PickupMovesItemIntoInventory) {
    auto context = Context();
    PickupAction pickup;
    EXPECT_FALSE(pickup.Validate(context));

    const std::string itemId = state.SpawnItem("potion", Coord{3, 2}).GetId();
    EXPECT_EQ(state.BlockerAt(Coord{3, 2}), nullptr);

    MoveAction step(1, 0);
    ASSERT_TRUE(state.Apply(step, context).success);
    ASSERT_TRUE(pickup.Validate(context));

    Outcome outcome = state.Apply(pickup, context);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(state.FindEntity(itemId), nullptr);
    ASSERT_EQ(state.GetPlayer("p1")->GetInventory().size(), 1u);
    EXPECT_EQ(state.GetPlayer("p1")->GetInventory()[0], "potion");
    EXPECT_FALSE(pickup.Validate(context));
}

TEST_F(DungeonActionTest, DeadPlayersCannotAct) {
    state.FindEntity(playerEntity)->ApplyDamage(100);
    WaitAction wait;
    EXPECT_FALSE(wait.Validate(Context()));
    EXPECT_TRUE(state.IsGameOver());
    EXPECT_FALSE(state.IsVictory());
}

// =============== Monster Turns ===============

TEST(MonsterTurnSystemTest, AdjacentMonsterAttacks) {
    DungeonState state;
    state.Initialize(OpenRoom(6, 6), 1);
    state.AddPlayer("p1", "Alice", Coord{2, 2});
    state.SpawnMonster("rat", Coord{3, 3});

    MonsterTurnSystem turns;
    TurnContext context{state, 1, {}};
    turns.ProcessRound(context);

    EXPECT_EQ(state.GetPlayer("p1")->GetHp(), DungeonState::PLAYER_HP - DungeonState::MONSTER_ATTACK);
    ASSERT_EQ(context.events.size(), 1u);
    EXPECT_EQ(context.events[0], "rat hits Alice for 2");
    EXPECT_EQ(state.GetTurnCount(), 1u);
}

TEST(MonsterTurnSystemTest, DistantMonsterStepsCloser) {
    DungeonState state;
    state.Initialize(OpenRoom(8, 8), 1);
    state.AddPlayer("p1", "Alice", Coord{1, 1});
    GameEntity& monster = state.SpawnMonster("skeleton", Coord{6, 6});

    MonsterTurnSystem turns;
    TurnContext context{state, 1, {}};
    turns.ProcessRound(context);

    EXPECT_EQ(monster.GetPosition(), (Coord{5, 5}));
    EXPECT_TRUE(context.events.empty());
    EXPECT_EQ(state.GetPlayer("p1")->GetHp(), DungeonState::PLAYER_HP);
}

TEST(MonsterTurnSystemTest, MonstersIgnorePlayersOutOfSight) {
    DungeonState state;
    state.Initialize(OpenRoom(20, 3), 1);
    state.AddPlayer("p1", "Alice", Coord{1, 1});
    GameEntity& monster = state.SpawnMonster("rat", Coord{1 + MonsterTurnSystem::SIGHT_RANGE + 1, 1});

    MonsterTurnSystem turns;
    TurnContext context{state, 1, {}};
    turns.ProcessRound(context);

    EXPECT_EQ(monster.GetPosition(), (Coord{1 + MonsterTurnSystem::SIGHT_RANGE + 1, 1}));
}

TEST(MonsterTurnSystemTest, KillingLastPlayerEndsTheGame) {
    DungeonState state;
    state.Initialize(OpenRoom(4, 4), 1);
    std::string entityId = state.AddPlayer("p1", "Alice", Coord{1, 1});
    state.FindEntity(entityId)->SetHp(2);
    state.SpawnMonster("goblin", Coord{2, 1});

    MonsterTurnSystem turns;
    TurnContext context{state, 1, {}};
    turns.ProcessRound(context);

    EXPECT_FALSE(state.GetPlayer("p1")->IsAlive());
    ASSERT_EQ(context.events.size(), 2u);
    EXPECT_EQ(context.events[1], "Alice falls");
    EXPECT_TRUE(state.IsGameOver());
    EXPECT_FALSE(state.IsVictory());
}
