#include "game/GameEntity.hpp"
#include <algorithm>
#include <cstdlib>
#include <utility>

const char* ToString(EntityType type) {
    switch (type) {
        case EntityType::PLAYER:  return "player";
        case EntityType::MONSTER: return "monster";
        case EntityType::ITEM:    return "item";
    }
    return "unknown";
}

int GridDistance(const Coord& a, const Coord& b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

GameEntity::GameEntity(std::string id, EntityType type, std::string name, const Coord& position)
    : id_(std::move(id)),
      type_(type),
      name_(std::move(name)),
      position_(position) {
}

void GameEntity::SetHp(int hp) {
    hp_ = std::clamp(hp, 0, maxHp_);
}

void GameEntity::ApplyDamage(int amount) {
    hp_ = std::max(0, hp_ - std::max(0, amount));
}

nlohmann::json GameEntity::Serialize() const {
    nlohmann::json data = {
        {"kind", ToString(type_)},
        {"name", name_},
        {"x", position_.x},
        {"y", position_.y},
        {"hp", hp_},
        {"max_hp", maxHp_},
        {"attack", attack_},
        {"inventory", inventory_}
    };

    if (!ownerId_.empty()) {
        data["owner"] = ownerId_;
    }

    data["display"] = {
        {"glyph", std::string(1, glyph_)},
        {"last_event", lastEvent_}
    };

    return data;
}
