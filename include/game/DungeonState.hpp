#pragma once

#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "game/GameState.hpp"

// Reference world: players, monsters and items on a room-and-corridor map.
// Victory when every monster is dead, defeat when every player is dead.
class DungeonState : public GameState {
public:
    static constexpr int PLAYER_HP = 20;
    static constexpr int PLAYER_ATTACK = 4;
    static constexpr int MONSTER_HP = 6;
    static constexpr int MONSTER_ATTACK = 2;

    DungeonState() = default;

    void Initialize(const DungeonMap& map, uint32_t seed) override;

    std::string AddPlayer(const std::string& playerId, const std::string& name,
                          const Coord& spawn) override;
    void RemovePlayer(const std::string& playerId) override;

    const GameEntity* GetPlayer(const std::string& playerId) const override;
    std::vector<const GameEntity*> GetEntities() const override;

    Outcome Apply(GameAction& action, ActionContext& context) override;

    bool IsGameOver() const override;
    bool IsVictory() const override;

    nlohmann::json Describe() const override;

    GameEntity* FindEntity(const std::string& entityId) override;
    const GameEntity* FindEntity(const std::string& entityId) const override;
    const GameEntity* BlockerAt(const Coord& position) const override;
    const GameEntity* ItemAt(const Coord& position) const override;
    bool IsWalkable(const Coord& position) const override;
    void RemoveEntity(const std::string& entityId) override;
    void AdvanceTurn() override { ++turnCount_; }

    uint64_t GetTurnCount() const { return turnCount_; }

    // Also used by tests to place extra entities.
    GameEntity& SpawnMonster(const std::string& name, const Coord& position);
    GameEntity& SpawnItem(const std::string& name, const Coord& position);

private:
    std::string NextId(const char* prefix);
    void PopulateRooms();

    DungeonMap map_;
    uint32_t seed_ = 0;
    std::mt19937 rng_;
    uint64_t turnCount_ = 0;
    uint64_t nextEntityNumber_ = 1;
    bool initialized_ = false;

    std::map<std::string, std::unique_ptr<GameEntity>> entities_;
    std::map<std::string, std::string> playerEntities_; // playerId -> entityId
    size_t monstersSpawned_ = 0;
};
