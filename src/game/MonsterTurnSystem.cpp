#include "game/MonsterTurnSystem.hpp"
#include "game/GameState.hpp"
#include "logging/Logger.hpp"
#include <limits>

namespace {

int StepToward(int from, int to) {
    if (to > from) return 1;
    if (to < from) return -1;
    return 0;
}

} // namespace

void MonsterTurnSystem::ProcessRound(TurnContext& context) {
    GameState& state = context.state;

    std::vector<std::string> monsterIds;
    std::vector<std::string> playerIds;
    for (const GameEntity* entity : state.GetEntities()) {
        if (!entity->IsAlive()) {
            continue;
        }
        if (entity->GetType() == EntityType::MONSTER) {
            monsterIds.push_back(entity->GetId());
        } else if (entity->GetType() == EntityType::PLAYER) {
            playerIds.push_back(entity->GetId());
        }
    }

    for (const auto& monsterId : monsterIds) {
        GameEntity* monster = state.FindEntity(monsterId);
        if (!monster || !monster->IsAlive()) {
            continue;
        }

        GameEntity* nearest = nullptr;
        int nearestDistance = std::numeric_limits<int>::max();
        for (const auto& playerId : playerIds) {
            GameEntity* player = state.FindEntity(playerId);
            if (!player || !player->IsAlive()) {
                continue;
            }
            int distance = GridDistance(monster->GetPosition(), player->GetPosition());
            if (distance < nearestDistance) {
                nearest = player;
                nearestDistance = distance;
            }
        }

        if (!nearest || nearestDistance > SIGHT_RANGE) {
            continue;
        }

        if (nearestDistance <= 1) {
            nearest->ApplyDamage(monster->GetAttack());
            std::string event = monster->GetName() + " hits " + nearest->GetName() +
                                " for " + std::to_string(monster->GetAttack());
            monster->SetLastEvent(event);
            context.events.push_back(event);
            if (!nearest->IsAlive()) {
                context.events.push_back(nearest->GetName() + " falls");
            }
            continue;
        }

        const Coord& from = monster->GetPosition();
        const Coord& to = nearest->GetPosition();
        int dx = StepToward(from.x, to.x);
        int dy = StepToward(from.y, to.y);

        // Try the diagonal first, then each axis alone.
        const Coord candidates[] = {
            Coord{from.x + dx, from.y + dy},
            Coord{from.x + dx, from.y},
            Coord{from.x, from.y + dy}
        };
        for (const Coord& step : candidates) {
            if (step == from) {
                continue;
            }
            if (state.IsWalkable(step) && !state.BlockerAt(step)) {
                monster->SetPosition(step);
                break;
            }
        }
    }

    state.AdvanceTurn();
    Logger::Trace("Round {} environment turn: {} monsters, {} events",
                  context.roundNumber, monsterIds.size(), context.events.size());
}
