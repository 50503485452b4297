#include "protocol/ActionCodec.hpp"
#include "errors/GameError.hpp"
#include "logging/Logger.hpp"
#include <utility>

void ActionCodec::Register(const std::string& actionType, Factory factory) {
    if (factories_.count(actionType)) {
        Logger::Warn("Replacing action factory for '{}'", actionType);
    }
    factories_[actionType] = std::move(factory);
}

bool ActionCodec::IsRegistered(const std::string& actionType) const {
    return factories_.find(actionType) != factories_.end();
}

std::vector<std::string> ActionCodec::GetRegisteredTypes() const {
    std::vector<std::string> types;
    types.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        types.push_back(type);
    }
    return types;
}

std::unique_ptr<GameAction> ActionCodec::Decode(const std::string& actionType,
                                                const nlohmann::json& params) const {
    auto it = factories_.find(actionType);
    if (it == factories_.end()) {
        throw ActionError(ErrorCode::UNKNOWN_ACTION, "Unknown action type: " + actionType);
    }

    const nlohmann::json& effective = params.is_null() ? nlohmann::json::object() : params;
    if (!effective.is_object()) {
        throw ActionError(ErrorCode::INVALID_PARAMS, "Action params must be an object");
    }

    try {
        auto action = it->second(effective);
        if (!action) {
            throw ActionError(ErrorCode::INVALID_PARAMS, "Invalid params for " + actionType);
        }
        return action;
    } catch (const GameError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::Warn("Action factory for '{}' failed: {}", actionType, e.what());
        throw ActionError(ErrorCode::INVALID_PARAMS,
                          "Invalid params for " + actionType + ": " + e.what());
    }
}
