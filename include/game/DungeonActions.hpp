#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

#include "game/GameAction.hpp"
#include "game/GameEntity.hpp"

class ActionCodec;

// =============== Move ===============
// params: {"dx", "dy"} in [-1, 1] or {"direction": "north" | "south" | ...}
class MoveAction : public GameAction {
public:
    MoveAction(int dx, int dy);

    static std::unique_ptr<GameAction> FromParams(const nlohmann::json& params);

    const std::string& GetType() const override;
    bool Validate(const ActionContext& context) const override;
    Outcome Execute(ActionContext& context) override;

private:
    int dx_;
    int dy_;
};

// =============== Attack ===============
// params: {"target_id"}
class AttackAction : public GameAction {
public:
    explicit AttackAction(std::string targetId);

    static std::unique_ptr<GameAction> FromParams(const nlohmann::json& params);

    const std::string& GetType() const override;
    bool Validate(const ActionContext& context) const override;
    Outcome Execute(ActionContext& context) override;

private:
    std::string targetId_;
};

// =============== Pickup ===============
class PickupAction : public GameAction {
public:
    static std::unique_ptr<GameAction> FromParams(const nlohmann::json& params);

    const std::string& GetType() const override;
    bool Validate(const ActionContext& context) const override;
    Outcome Execute(ActionContext& context) override;
};

// =============== Wait ===============
class WaitAction : public GameAction {
public:
    static std::unique_ptr<GameAction> FromParams(const nlohmann::json& params);

    const std::string& GetType() const override;
    bool Validate(const ActionContext& context) const override;
    Outcome Execute(ActionContext& context) override;
};

// Registers move, attack, pickup and wait.
void RegisterDungeonActions(ActionCodec& codec);
