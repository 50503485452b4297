#include "sync/StateSnapshot.hpp"
#include "errors/GameError.hpp"

nlohmann::json StateSnapshot::ToJson() const {
    nlohmann::json entityJson = nlohmann::json::object();
    for (const auto& [id, record] : entities) {
        entityJson[id] = record;
    }
    return {
        {"revision", revision},
        {"meta", meta},
        {"entities", entityJson}
    };
}

StateSnapshot StateSnapshot::FromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("revision") || !json["revision"].is_number_unsigned()) {
        throw SyncError(ErrorCode::STALE_REVISION, "Snapshot has no usable revision");
    }

    StateSnapshot snapshot;
    snapshot.revision = json["revision"].get<uint64_t>();
    snapshot.meta = json.value("meta", nlohmann::json::object());
    if (json.contains("entities") && json["entities"].is_object()) {
        for (const auto& [id, record] : json["entities"].items()) {
            snapshot.entities[id] = record;
        }
    }
    return snapshot;
}
