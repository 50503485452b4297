#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

enum class EntityType {
    PLAYER,
    MONSTER,
    ITEM
};

const char* ToString(EntityType type);

struct Coord {
    int x = 0;
    int y = 0;

    bool operator==(const Coord& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Coord& other) const { return !(*this == other); }
    bool operator<(const Coord& other) const { return y != other.y ? y < other.y : x < other.x; }
};

// Chebyshev distance, diagonal steps count as one.
int GridDistance(const Coord& a, const Coord& b);

class GameEntity {
public:
    GameEntity(std::string id, EntityType type, std::string name, const Coord& position);
    virtual ~GameEntity() = default;

    const std::string& GetId() const { return id_; }
    EntityType GetType() const { return type_; }
    const std::string& GetName() const { return name_; }

    const std::string& GetOwnerId() const { return ownerId_; }
    void SetOwnerId(const std::string& ownerId) { ownerId_ = ownerId; }

    const Coord& GetPosition() const { return position_; }
    void SetPosition(const Coord& position) { position_ = position; }

    int GetHp() const { return hp_; }
    int GetMaxHp() const { return maxHp_; }
    void SetHp(int hp);
    void SetMaxHp(int maxHp) { maxHp_ = maxHp; }
    void ApplyDamage(int amount);
    bool IsAlive() const { return hp_ > 0; }

    int GetAttack() const { return attack_; }
    void SetAttack(int attack) { attack_ = attack; }

    const std::vector<std::string>& GetInventory() const { return inventory_; }
    void AddItem(const std::string& item) { inventory_.push_back(item); }

    // Display-only state, never synchronized.
    void SetGlyph(char glyph) { glyph_ = glyph; }
    void SetLastEvent(const std::string& lastEvent) { lastEvent_ = lastEvent; }

    // Canonical fields plus a "display" block of render hints.
    virtual nlohmann::json Serialize() const;

protected:
    std::string id_;
    EntityType type_;
    std::string name_;
    std::string ownerId_;
    Coord position_;
    int hp_ = 1;
    int maxHp_ = 1;
    int attack_ = 0;
    std::vector<std::string> inventory_;

    char glyph_ = '?';
    std::string lastEvent_;
};
