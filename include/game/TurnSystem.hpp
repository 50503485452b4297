#pragma once

#include <cstdint>
#include <string>
#include <vector>

class GameState;

struct TurnContext {
    GameState& state;
    uint32_t roundNumber;
    std::vector<std::string> events;
};

// The environment's move, run once per completed round.
class TurnSystem {
public:
    virtual ~TurnSystem() = default;

    virtual void ProcessRound(TurnContext& context) = 0;
};
