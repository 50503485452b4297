#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "game/DungeonMap.hpp"
#include "game/GameAction.hpp"
#include "game/GameEntity.hpp"

// Shared world owned by exactly one GameSession. Only that session's
// serialized pipeline calls the mutating members.
class GameState {
public:
    virtual ~GameState() = default;

    virtual void Initialize(const DungeonMap& map, uint32_t seed) = 0;

    // Returns the entity id created for the player.
    virtual std::string AddPlayer(const std::string& playerId, const std::string& name,
                                  const Coord& spawn) = 0;
    virtual void RemovePlayer(const std::string& playerId) = 0;

    virtual const GameEntity* GetPlayer(const std::string& playerId) const = 0;
    virtual std::vector<const GameEntity*> GetEntities() const = 0;

    virtual Outcome Apply(GameAction& action, ActionContext& context) = 0;

    virtual bool IsGameOver() const = 0;
    virtual bool IsVictory() const = 0;

    // World-level fields that go into snapshot meta.
    virtual nlohmann::json Describe() const = 0;

    // Used by actions and turn systems.
    virtual GameEntity* FindEntity(const std::string& entityId) = 0;
    virtual const GameEntity* FindEntity(const std::string& entityId) const = 0;
    virtual const GameEntity* BlockerAt(const Coord& position) const = 0;
    virtual const GameEntity* ItemAt(const Coord& position) const = 0;
    virtual bool IsWalkable(const Coord& position) const = 0;
    virtual void RemoveEntity(const std::string& entityId) = 0;
    virtual void AdvanceTurn() = 0;
};
