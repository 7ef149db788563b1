#pragma once

#include <optional>
#include <string>
#include <vector>

#include "game/GameState.h"

namespace json
{
struct JsonValue;
}

namespace game
{

struct SnapshotParseResult
{
    std::optional<GameState> state;
    std::vector<std::string> errors;

    bool ok() const { return state.has_value(); }
};

// Required keys: provider.timestamp, map.name, map.round. Everything else is optional
// and defaults explicitly; documents missing a required key are rejected.
SnapshotParseResult parseSnapshot(const std::string &text);
SnapshotParseResult normalizeSnapshot(const json::JsonValue &root);

} // namespace game
