#include <gtest/gtest.h>

#include "game/DungeonMapGenerator.hpp"
#include "game/DungeonState.hpp"
#include "sync/StateSynchronizer.hpp"
#include "TestSupport.hpp"

using testing_support::CaptureCode;

namespace {

StateSnapshot MakeSnapshot(uint64_t revision) {
    StateSnapshot snapshot;
    snapshot.revision = revision;
    snapshot.meta = {{"round_number", 1}, {"status", "active"}};
    snapshot.entities["player-1"] = {{"x", 1}, {"y", 1}, {"hp", 20}};
    snapshot.entities["monster-2"] = {{"x", 5}, {"y", 5}, {"hp", 6}};
    return snapshot;
}

} // namespace

TEST(StateSynchronizerTest, DeltaAppliesToPreviousRevision) {
    StateSnapshot before = MakeSnapshot(3);

    StateSnapshot after = before;
    after.revision = 4;
    after.meta["round_number"] = 2;
    after.meta.erase("status");
    after.entities["player-1"]["x"] = 2;
    after.entities["player-1"].erase("hp");
    after.entities.erase("monster-2");
    after.entities["item-3"] = {{"x", 2}, {"y", 1}};

    nlohmann::json delta = StateSynchronizer::ComputeDelta(before, after);
    EXPECT_EQ(delta["base_revision"], 3);
    EXPECT_EQ(delta["new_revision"], 4);
    EXPECT_FALSE(StateSynchronizer::IsEmptyDelta(delta));

    StateSnapshot rebuilt = StateSynchronizer::ApplyDelta(before, delta);
    EXPECT_EQ(rebuilt, after);
}

TEST(StateSynchronizerTest, UnchangedEntitiesAreOmitted) {
    StateSnapshot before = MakeSnapshot(1);
    StateSnapshot after = before;
    after.revision = 2;
    after.entities["player-1"]["hp"] = 18;

    nlohmann::json delta = StateSynchronizer::ComputeDelta(before, after);
    ASSERT_EQ(delta["entities"].size(), 1u);
    EXPECT_EQ(delta["entities"][0]["id"], "player-1");
    EXPECT_EQ(delta["entities"][0]["fields"], nlohmann::json({{"hp", 18}}));
    EXPECT_TRUE(delta["meta"].empty());
}

TEST(StateSynchronizerTest, StaleBaseIsRejected) {
    StateSnapshot before = MakeSnapshot(5);
    StateSnapshot after = before;
    after.revision = 6;
    nlohmann::json delta = StateSynchronizer::ComputeDelta(before, after);

    StateSnapshot older = MakeSnapshot(4);
    EXPECT_EQ(CaptureCode([&] { StateSynchronizer::ApplyDelta(older, delta); }),
              ErrorCode::STALE_REVISION);
}

TEST(StateSynchronizerTest, PublishNumbersRevisionsConsecutively) {
    StateSynchronizer synchronizer;
    EXPECT_EQ(synchronizer.GetRevision(), 0u);

    StateSnapshot tracked = synchronizer.GetCurrent();
    for (uint64_t i = 1; i <= 3; ++i) {
        StateSnapshot next;
        next.meta = {{"round_number", i}};
        nlohmann::json delta = synchronizer.Publish(next);

        EXPECT_EQ(delta["base_revision"], i - 1);
        EXPECT_EQ(delta["new_revision"], i);
        tracked = StateSynchronizer::ApplyDelta(tracked, delta);
    }
    EXPECT_EQ(synchronizer.GetRevision(), 3u);
    EXPECT_EQ(tracked, synchronizer.GetCurrent());
}

TEST(StateSynchronizerTest, CaptureStripsDisplayFields) {
    DungeonMapGenerator generator;
    DungeonState state;
    state.Initialize(generator.Generate(11), 11);
    auto spawns = generator.FindSpawnPositions(1);
    std::string entityId = state.AddPlayer("p1", "Alice", spawns[0]);

    ASSERT_TRUE(state.FindEntity(entityId)->Serialize().contains("display"));

    StateSynchronizer synchronizer;
    StateSnapshot snapshot = synchronizer.Capture(state, nlohmann::json::object());

    ASSERT_EQ(snapshot.entities.count(entityId), 1u);
    const auto& record = snapshot.entities.at(entityId);
    EXPECT_FALSE(record.contains("display"));
    EXPECT_EQ(record["x"], spawns[0].x);
    EXPECT_EQ(record["hp"], DungeonState::PLAYER_HP);
    EXPECT_EQ(snapshot.entities.size(), state.GetEntities().size());
}

TEST(StateSynchronizerTest, DisplayOnlyChangesProduceNoEntityDelta) {
    DungeonMapGenerator generator;
    DungeonState state;
    state.Initialize(generator.Generate(11), 11);
    std::string entityId = state.AddPlayer("p1", "Alice", generator.FindSpawnPositions(1)[0]);

    StateSynchronizer synchronizer;
    synchronizer.Publish(synchronizer.Capture(state, nlohmann::json::object()));

    state.FindEntity(entityId)->SetLastEvent("Alice waits");
    nlohmann::json delta = synchronizer.Publish(synchronizer.Capture(state, nlohmann::json::object()));

    EXPECT_TRUE(StateSynchronizer::IsEmptyDelta(delta));
    EXPECT_EQ(synchronizer.GetRevision(), 2u);
}

TEST(StateSnapshotTest, JsonFormIsStable) {
    StateSnapshot snapshot = MakeSnapshot(9);
    StateSnapshot parsed = StateSnapshot::FromJson(snapshot.ToJson());
    EXPECT_EQ(parsed, snapshot);

    EXPECT_THROW(StateSnapshot::FromJson(nlohmann::json::array()), SyncError);
}
