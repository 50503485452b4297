#pragma once

#include <string>
#include <vector>

class GameState;

struct Outcome {
    bool success = false;
    std::string message;
    std::vector<std::string> events;

    static Outcome Success(const std::string& message) { return Outcome{true, message, {message}}; }
    static Outcome Failure(const std::string& message) { return Outcome{false, message, {}}; }
};

// What an action may see and touch while it runs.
struct ActionContext {
    GameState& state;
    std::string playerId;
    std::string actorId;
};

class GameAction {
public:
    virtual ~GameAction() = default;

    virtual const std::string& GetType() const = 0;

    // Must not mutate state.
    virtual bool Validate(const ActionContext& context) const = 0;
    virtual Outcome Execute(ActionContext& context) = 0;
};
