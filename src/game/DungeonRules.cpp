#include "game/DungeonRules.hpp"
#include "game/DungeonActions.hpp"
#include "game/DungeonMapGenerator.hpp"
#include "game/DungeonState.hpp"
#include "game/MonsterTurnSystem.hpp"

GameRules MakeDungeonRules() {
    auto codec = std::make_shared<ActionCodec>();
    RegisterDungeonActions(*codec);

    GameRules rules;
    rules.createState = [] { return std::make_unique<DungeonState>(); };
    rules.createMapGenerator = [] { return std::make_unique<DungeonMapGenerator>(); };
    rules.createTurnSystem = [] { return std::make_unique<MonsterTurnSystem>(); };
    rules.codec = codec;
    return rules;
}
