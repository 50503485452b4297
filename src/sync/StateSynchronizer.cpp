#include "sync/StateSynchronizer.hpp"
#include "game/GameState.hpp"
#include "errors/GameError.hpp"
#include "logging/Logger.hpp"
#include <utility>

StateSynchronizer::StateSynchronizer()
    : transientKeys_{"display", "hint"} {
}

StateSynchronizer::StateSynchronizer(std::set<std::string> transientKeys)
    : transientKeys_(std::move(transientKeys)) {
}

StateSnapshot StateSynchronizer::Capture(const GameState& state, const nlohmann::json& meta) const {
    StateSnapshot snapshot;
    snapshot.meta = meta;
    for (const GameEntity* entity : state.GetEntities()) {
        snapshot.entities[entity->GetId()] = StripTransient(entity->Serialize());
    }
    return snapshot;
}

StateSnapshot StateSynchronizer::Capture(const GameState* state, const nlohmann::json& meta) const {
    if (state) {
        return Capture(*state, meta);
    }
    StateSnapshot snapshot;
    snapshot.meta = meta;
    return snapshot;
}

nlohmann::json StateSynchronizer::Publish(StateSnapshot snapshot) {
    snapshot.revision = current_.revision + 1;
    nlohmann::json delta = ComputeDelta(current_, snapshot);
    current_ = std::move(snapshot);
    Logger::Trace("Published revision {}", current_.revision);
    return delta;
}

nlohmann::json StateSynchronizer::StripTransient(const nlohmann::json& record) const {
    if (!record.is_object()) {
        return record;
    }
    nlohmann::json stripped = record;
    for (const auto& key : transientKeys_) {
        stripped.erase(key);
    }
    return stripped;
}

nlohmann::json StateSynchronizer::ComputeDelta(const StateSnapshot& from, const StateSnapshot& to) {
    nlohmann::json entities = nlohmann::json::array();

    for (const auto& [id, record] : to.entities) {
        auto previous = from.entities.find(id);
        if (previous == from.entities.end()) {
            entities.push_back({{"id", id}, {"record", record}});
            continue;
        }
        if (previous->second == record) {
            continue;
        }
        if (!record.is_object() || !previous->second.is_object()) {
            entities.push_back({{"id", id}, {"record", record}});
            continue;
        }

        nlohmann::json fields = nlohmann::json::object();
        nlohmann::json removedFields = nlohmann::json::array();
        for (const auto& [key, value] : record.items()) {
            if (!previous->second.contains(key) || previous->second[key] != value) {
                fields[key] = value;
            }
        }
        for (const auto& [key, value] : previous->second.items()) {
            if (!record.contains(key)) {
                removedFields.push_back(key);
            }
        }
        entities.push_back({{"id", id}, {"fields", fields}, {"removed_fields", removedFields}});
    }

    for (const auto& [id, record] : from.entities) {
        if (to.entities.find(id) == to.entities.end()) {
            entities.push_back({{"id", id}, {"removed", true}});
        }
    }

    nlohmann::json meta = nlohmann::json::object();
    nlohmann::json removedMeta = nlohmann::json::array();
    if (to.meta.is_object()) {
        for (const auto& [key, value] : to.meta.items()) {
            if (!from.meta.is_object() || !from.meta.contains(key) || from.meta[key] != value) {
                meta[key] = value;
            }
        }
    }
    if (from.meta.is_object()) {
        for (const auto& [key, value] : from.meta.items()) {
            if (!to.meta.is_object() || !to.meta.contains(key)) {
                removedMeta.push_back(key);
            }
        }
    }

    return {
        {"base_revision", from.revision},
        {"new_revision", to.revision},
        {"entities", entities},
        {"meta", meta},
        {"removed_meta", removedMeta}
    };
}

StateSnapshot StateSynchronizer::ApplyDelta(const StateSnapshot& snapshot, const nlohmann::json& delta) {
    if (!delta.is_object() || !delta.contains("base_revision") || !delta.contains("new_revision")) {
        throw SyncError(ErrorCode::STALE_REVISION, "Delta carries no revision numbers");
    }
    uint64_t base = delta["base_revision"].get<uint64_t>();
    if (base != snapshot.revision) {
        throw SyncError(ErrorCode::STALE_REVISION,
                        "Delta base " + std::to_string(base) + " does not match revision " +
                        std::to_string(snapshot.revision));
    }

    StateSnapshot result = snapshot;
    result.revision = delta["new_revision"].get<uint64_t>();

    for (const auto& change : delta.value("entities", nlohmann::json::array())) {
        const std::string id = change.at("id").get<std::string>();
        if (change.value("removed", false)) {
            result.entities.erase(id);
        } else if (change.contains("record")) {
            result.entities[id] = change["record"];
        } else {
            nlohmann::json& record = result.entities[id];
            if (!record.is_object()) {
                record = nlohmann::json::object();
            }
            const nlohmann::json fields = change.value("fields", nlohmann::json::object());
            for (const auto& [key, value] : fields.items()) {
                record[key] = value;
            }
            for (const auto& key : change.value("removed_fields", nlohmann::json::array())) {
                record.erase(key.get<std::string>());
            }
        }
    }

    if (!result.meta.is_object()) {
        result.meta = nlohmann::json::object();
    }
    const nlohmann::json meta = delta.value("meta", nlohmann::json::object());
    for (const auto& [key, value] : meta.items()) {
        result.meta[key] = value;
    }
    for (const auto& key : delta.value("removed_meta", nlohmann::json::array())) {
        result.meta.erase(key.get<std::string>());
    }

    return result;
}

bool StateSynchronizer::IsEmptyDelta(const nlohmann::json& delta) {
    return delta.value("entities", nlohmann::json::array()).empty() &&
           delta.value("meta", nlohmann::json::object()).empty() &&
           delta.value("removed_meta", nlohmann::json::array()).empty();
}
