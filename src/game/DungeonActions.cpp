#include "game/DungeonActions.hpp"
#include "game/GameState.hpp"
#include "protocol/ActionCodec.hpp"
#include "errors/GameError.hpp"
#include <cstdint>
#include <map>

namespace {

const std::map<std::string, Coord> kDirections = {
    {"north", {0, -1}},
    {"south", {0, 1}},
    {"east", {1, 0}},
    {"west", {-1, 0}},
    {"northeast", {1, -1}},
    {"northwest", {-1, -1}},
    {"southeast", {1, 1}},
    {"southwest", {-1, 1}}
};

const GameEntity* LivingActor(const ActionContext& context) {
    const GameEntity* actor = context.state.FindEntity(context.actorId);
    if (!actor || !actor->IsAlive()) {
        return nullptr;
    }
    return actor;
}

// Reads one step component, rejecting anything outside [-1, 1] before narrowing.
bool ReadStep(const nlohmann::json& value, int& step) {
    if (value.is_number_unsigned()) {
        const uint64_t raw = value.get<uint64_t>();
        if (raw > 1) {
            return false;
        }
        step = static_cast<int>(raw);
        return true;
    }
    const int64_t raw = value.get<int64_t>();
    if (raw < -1 || raw > 1) {
        return false;
    }
    step = static_cast<int>(raw);
    return true;
}

} // namespace

// =============== Move ===============

MoveAction::MoveAction(int dx, int dy) : dx_(dx), dy_(dy) {}

std::unique_ptr<GameAction> MoveAction::FromParams(const nlohmann::json& params) {
    if (params.contains("direction")) {
        if (!params["direction"].is_string()) {
            throw ActionError(ErrorCode::INVALID_PARAMS, "direction must be a string");
        }
        auto it = kDirections.find(params["direction"].get<std::string>());
        if (it == kDirections.end()) {
            throw ActionError(ErrorCode::INVALID_PARAMS, "Unknown direction");
        }
        return std::make_unique<MoveAction>(it->second.x, it->second.y);
    }

    if (!params.contains("dx") || !params.contains("dy") ||
        !params["dx"].is_number_integer() || !params["dy"].is_number_integer()) {
        throw ActionError(ErrorCode::INVALID_PARAMS, "move requires integer dx and dy");
    }
    int dx = 0;
    int dy = 0;
    if (!ReadStep(params["dx"], dx) || !ReadStep(params["dy"], dy) || (dx == 0 && dy == 0)) {
        throw ActionError(ErrorCode::INVALID_PARAMS, "move step must be one tile");
    }
    return std::make_unique<MoveAction>(dx, dy);
}

const std::string& MoveAction::GetType() const {
    static const std::string type = "move";
    return type;
}

bool MoveAction::Validate(const ActionContext& context) const {
    const GameEntity* actor = LivingActor(context);
    if (!actor) {
        return false;
    }
    Coord target{actor->GetPosition().x + dx_, actor->GetPosition().y + dy_};
    return context.state.IsWalkable(target) && !context.state.BlockerAt(target);
}

Outcome MoveAction::Execute(ActionContext& context) {
    if (!Validate(context)) {
        return Outcome::Failure("Cannot move there");
    }
    GameEntity* actor = context.state.FindEntity(context.actorId);
    Coord target{actor->GetPosition().x + dx_, actor->GetPosition().y + dy_};
    actor->SetPosition(target);

    Outcome outcome = Outcome::Success(actor->GetName() + " moves to (" +
                                       std::to_string(target.x) + ", " + std::to_string(target.y) + ")");
    if (const GameEntity* item = context.state.ItemAt(target)) {
        outcome.events.push_back(actor->GetName() + " sees a " + item->GetName());
    }
    return outcome;
}

// =============== Attack ===============

AttackAction::AttackAction(std::string targetId) : targetId_(std::move(targetId)) {}

std::unique_ptr<GameAction> AttackAction::FromParams(const nlohmann::json& params) {
    if (!params.contains("target_id") || !params["target_id"].is_string() ||
        params["target_id"].get<std::string>().empty()) {
        throw ActionError(ErrorCode::INVALID_PARAMS, "attack requires target_id");
    }
    return std::make_unique<AttackAction>(params["target_id"].get<std::string>());
}

const std::string& AttackAction::GetType() const {
    static const std::string type = "attack";
    return type;
}

bool AttackAction::Validate(const ActionContext& context) const {
    const GameEntity* actor = LivingActor(context);
    const GameEntity* target = context.state.FindEntity(targetId_);
    if (!actor || !target) {
        return false;
    }
    return target->GetType() == EntityType::MONSTER && target->IsAlive() &&
           GridDistance(actor->GetPosition(), target->GetPosition()) == 1;
}

Outcome AttackAction::Execute(ActionContext& context) {
    if (!Validate(context)) {
        return Outcome::Failure("No valid target");
    }
    GameEntity* actor = context.state.FindEntity(context.actorId);
    GameEntity* target = context.state.FindEntity(targetId_);

    target->ApplyDamage(actor->GetAttack());
    Outcome outcome = Outcome::Success(actor->GetName() + " hits " + target->GetName() +
                                       " for " + std::to_string(actor->GetAttack()));
    if (!target->IsAlive()) {
        outcome.events.push_back(target->GetName() + " dies");
        context.state.RemoveEntity(targetId_);
    }
    return outcome;
}

// =============== Pickup ===============

std::unique_ptr<GameAction> PickupAction::FromParams(const nlohmann::json&) {
    return std::make_unique<PickupAction>();
}

const std::string& PickupAction::GetType() const {
    static const std::string type = "pickup";
    return type;
}

bool PickupAction::Validate(const ActionContext& context) const {
    const GameEntity* actor = LivingActor(context);
    return actor && context.state.ItemAt(actor->GetPosition()) != nullptr;
}

Outcome PickupAction::Execute(ActionContext& context) {
    if (!Validate(context)) {
        return Outcome::Failure("Nothing to pick up");
    }
    GameEntity* actor = context.state.FindEntity(context.actorId);
    const GameEntity* item = context.state.ItemAt(actor->GetPosition());
    const std::string itemId = item->GetId();
    const std::string itemName = item->GetName();

    actor->AddItem(itemName);
    context.state.RemoveEntity(itemId);
    return Outcome::Success(actor->GetName() + " picks up " + itemName);
}

// =============== Wait ===============

std::unique_ptr<GameAction> WaitAction::FromParams(const nlohmann::json&) {
    return std::make_unique<WaitAction>();
}

const std::string& WaitAction::GetType() const {
    static const std::string type = "wait";
    return type;
}

bool WaitAction::Validate(const ActionContext& context) const {
    return LivingActor(context) != nullptr;
}

Outcome WaitAction::Execute(ActionContext& context) {
    if (!Validate(context)) {
        return Outcome::Failure("Cannot act");
    }
    const GameEntity* actor = context.state.FindEntity(context.actorId);
    return Outcome::Success(actor->GetName() + " waits");
}

void RegisterDungeonActions(ActionCodec& codec) {
    codec.Register("move", &MoveAction::FromParams);
    codec.Register("attack", &AttackAction::FromParams);
    codec.Register("pickup", &PickupAction::FromParams);
    codec.Register("wait", &WaitAction::FromParams);
}
