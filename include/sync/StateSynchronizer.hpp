#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>

#include "sync/StateSnapshot.hpp"

class GameState;

// Per-session delta encoder. Holds the last published snapshot and
// numbers every publication with the next revision.
class StateSynchronizer {
public:
    StateSynchronizer();
    explicit StateSynchronizer(std::set<std::string> transientKeys);

    // Canonical snapshot of the collaborator's entities; transient keys stripped.
    // The revision is left at 0 until published.
    StateSnapshot Capture(const GameState& state, const nlohmann::json& meta) const;
    StateSnapshot Capture(const GameState* state, const nlohmann::json& meta) const;

    // Stores the snapshot as revision current+1 and returns the delta from
    // the previous publication.
    nlohmann::json Publish(StateSnapshot snapshot);

    const StateSnapshot& GetCurrent() const { return current_; }
    uint64_t GetRevision() const { return current_.revision; }

    // Delta shape:
    // {"base_revision", "new_revision",
    //  "entities": [{"id","fields","removed_fields"} | {"id","removed":true} | {"id","record"}],
    //  "meta": {...}, "removed_meta": [...]}
    static nlohmann::json ComputeDelta(const StateSnapshot& from, const StateSnapshot& to);

    // Throws SyncError STALE_REVISION when base_revision != snapshot.revision.
    static StateSnapshot ApplyDelta(const StateSnapshot& snapshot, const nlohmann::json& delta);

    static bool IsEmptyDelta(const nlohmann::json& delta);

private:
    nlohmann::json StripTransient(const nlohmann::json& record) const;

    std::set<std::string> transientKeys_;
    StateSnapshot current_;
};
