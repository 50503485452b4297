#include "game/DungeonState.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace {

const std::array<const char*, 3> kMonsterNames = {"goblin", "rat", "skeleton"};
const std::array<const char*, 4> kItemNames = {"potion", "gold", "dagger", "torch"};

} // namespace

void DungeonState::Initialize(const DungeonMap& map, uint32_t seed) {
    map_ = map;
    seed_ = seed;
    rng_.seed(seed);
    turnCount_ = 0;
    entities_.clear();
    playerEntities_.clear();
    monstersSpawned_ = 0;
    initialized_ = true;

    PopulateRooms();

    Logger::Debug("DungeonState initialized with seed {} ({} entities)", seed, entities_.size());
}

// The first room is left empty for spawning.
void DungeonState::PopulateRooms() {
    const auto& rooms = map_.GetRooms();
    for (size_t i = 1; i < rooms.size(); ++i) {
        const Room& room = rooms[i];
        std::uniform_int_distribution<int> countDist(1, 2);
        std::uniform_int_distribution<int> xDist(room.x, room.x + room.width - 1);
        std::uniform_int_distribution<int> yDist(room.y, room.y + room.height - 1);

        int monsters = countDist(rng_);
        for (int m = 0; m < monsters; ++m) {
            Coord position{xDist(rng_), yDist(rng_)};
            if (BlockerAt(position) || !map_.IsWalkable(position)) {
                continue;
            }
            std::uniform_int_distribution<size_t> nameDist(0, kMonsterNames.size() - 1);
            SpawnMonster(kMonsterNames[nameDist(rng_)], position);
        }

        Coord itemPosition{xDist(rng_), yDist(rng_)};
        if (map_.IsWalkable(itemPosition) && !ItemAt(itemPosition)) {
            std::uniform_int_distribution<size_t> itemDist(0, kItemNames.size() - 1);
            SpawnItem(kItemNames[itemDist(rng_)], itemPosition);
        }
    }
}

GameEntity& DungeonState::SpawnMonster(const std::string& name, const Coord& position) {
    const std::string id = NextId("monster");
    auto monster = std::make_unique<GameEntity>(id, EntityType::MONSTER, name, position);
    monster->SetMaxHp(MONSTER_HP);
    monster->SetHp(MONSTER_HP);
    monster->SetAttack(MONSTER_ATTACK);
    monster->SetGlyph(static_cast<char>(name.empty() ? 'm' : name.front()));

    GameEntity& ref = *monster;
    entities_.emplace(id, std::move(monster));
    ++monstersSpawned_;
    return ref;
}

GameEntity& DungeonState::SpawnItem(const std::string& name, const Coord& position) {
    const std::string id = NextId("item");
    auto item = std::make_unique<GameEntity>(id, EntityType::ITEM, name, position);
    item->SetGlyph('!');

    GameEntity& ref = *item;
    entities_.emplace(id, std::move(item));
    return ref;
}

std::string DungeonState::AddPlayer(const std::string& playerId, const std::string& name,
                                    const Coord& spawn) {
    if (!initialized_) {
        throw std::logic_error("DungeonState::AddPlayer before Initialize");
    }
    if (playerEntities_.count(playerId)) {
        return playerEntities_[playerId];
    }

    const std::string id = NextId("player");
    auto entity = std::make_unique<GameEntity>(id, EntityType::PLAYER, name, spawn);
    entity->SetOwnerId(playerId);
    entity->SetMaxHp(PLAYER_HP);
    entity->SetHp(PLAYER_HP);
    entity->SetAttack(PLAYER_ATTACK);
    entity->SetGlyph('@');

    entities_.emplace(id, std::move(entity));
    playerEntities_[playerId] = id;

    Logger::Debug("Player {} placed as {} at ({}, {})", playerId, id, spawn.x, spawn.y);
    return id;
}

void DungeonState::RemovePlayer(const std::string& playerId) {
    auto it = playerEntities_.find(playerId);
    if (it == playerEntities_.end()) {
        return;
    }
    entities_.erase(it->second);
    playerEntities_.erase(it);
}

const GameEntity* DungeonState::GetPlayer(const std::string& playerId) const {
    auto it = playerEntities_.find(playerId);
    if (it == playerEntities_.end()) {
        return nullptr;
    }
    return FindEntity(it->second);
}

std::vector<const GameEntity*> DungeonState::GetEntities() const {
    std::vector<const GameEntity*> result;
    result.reserve(entities_.size());
    for (const auto& [id, entity] : entities_) {
        result.push_back(entity.get());
    }
    return result;
}

Outcome DungeonState::Apply(GameAction& action, ActionContext& context) {
    Outcome outcome = action.Execute(context);
    if (outcome.success) {
        if (GameEntity* actor = FindEntity(context.actorId)) {
            actor->SetLastEvent(outcome.message);
        }
    }
    return outcome;
}

bool DungeonState::IsGameOver() const {
    if (IsVictory()) {
        return true;
    }
    if (playerEntities_.empty()) {
        return false;
    }
    return std::none_of(playerEntities_.begin(), playerEntities_.end(), [this](const auto& entry) {
        const GameEntity* entity = FindEntity(entry.second);
        return entity && entity->IsAlive();
    });
}

bool DungeonState::IsVictory() const {
    if (monstersSpawned_ == 0) {
        return false;
    }
    return std::none_of(entities_.begin(), entities_.end(), [](const auto& entry) {
        return entry.second->GetType() == EntityType::MONSTER && entry.second->IsAlive();
    });
}

nlohmann::json DungeonState::Describe() const {
    return {
        {"seed", seed_},
        {"turn_count", turnCount_},
        {"width", map_.GetWidth()},
        {"height", map_.GetHeight()},
        {"map", map_.ToRows()}
    };
}

GameEntity* DungeonState::FindEntity(const std::string& entityId) {
    auto it = entities_.find(entityId);
    return it == entities_.end() ? nullptr : it->second.get();
}

const GameEntity* DungeonState::FindEntity(const std::string& entityId) const {
    auto it = entities_.find(entityId);
    return it == entities_.end() ? nullptr : it->second.get();
}

const GameEntity* DungeonState::BlockerAt(const Coord& position) const {
    for (const auto& [id, entity] : entities_) {
        if (entity->GetType() != EntityType::ITEM && entity->IsAlive() &&
            entity->GetPosition() == position) {
            return entity.get();
        }
    }
    return nullptr;
}

const GameEntity* DungeonState::ItemAt(const Coord& position) const {
    for (const auto& [id, entity] : entities_) {
        if (entity->GetType() == EntityType::ITEM && entity->GetPosition() == position) {
            return entity.get();
        }
    }
    return nullptr;
}

bool DungeonState::IsWalkable(const Coord& position) const {
    return map_.IsWalkable(position);
}

void DungeonState::RemoveEntity(const std::string& entityId) {
    auto it = entities_.find(entityId);
    if (it == entities_.end()) {
        return;
    }
    if (it->second->GetType() == EntityType::PLAYER) {
        playerEntities_.erase(it->second->GetOwnerId());
    }
    entities_.erase(it);
}

std::string DungeonState::NextId(const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(nextEntityNumber_++);
}
