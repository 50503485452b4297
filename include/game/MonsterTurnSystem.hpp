#pragma once

#include "game/TurnSystem.hpp"

// Each living monster attacks an adjacent player, or steps toward the
// nearest living player within its sight range.
class MonsterTurnSystem : public TurnSystem {
public:
    static constexpr int SIGHT_RANGE = 8;

    void ProcessRound(TurnContext& context) override;
};
