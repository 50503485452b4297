#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>

// Full serializable state of one session at a revision.
struct StateSnapshot {
    uint64_t revision = 0;
    nlohmann::json meta = nlohmann::json::object();
    std::map<std::string, nlohmann::json> entities;

    bool operator==(const StateSnapshot& other) const {
        return revision == other.revision && meta == other.meta && entities == other.entities;
    }
    bool operator!=(const StateSnapshot& other) const { return !(*this == other); }

    // {"revision", "meta", "entities": {id: record}}
    nlohmann::json ToJson() const;
    static StateSnapshot FromJson(const nlohmann::json& json);
};
