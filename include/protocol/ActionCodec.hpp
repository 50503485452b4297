#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "game/GameAction.hpp"

// Maps wire action types to factories that build GameAction objects from
// the "params" object of an action message.
class ActionCodec {
public:
    using Factory = std::function<std::unique_ptr<GameAction>(const nlohmann::json&)>;

    void Register(const std::string& actionType, Factory factory);
    bool IsRegistered(const std::string& actionType) const;
    std::vector<std::string> GetRegisteredTypes() const;

    // Throws ActionError UNKNOWN_ACTION or INVALID_PARAMS.
    std::unique_ptr<GameAction> Decode(const std::string& actionType,
                                       const nlohmann::json& params) const;

private:
    std::map<std::string, Factory> factories_;
};
