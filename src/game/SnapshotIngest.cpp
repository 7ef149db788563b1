#include "game/SnapshotIngest.h"

#include <cmath>
#include <utility>

#include "json/JsonUtils.h"

namespace game
{

namespace
{

// Year 5138; keeps the millisecond conversion far from overflow.
constexpr double kMaxTimestampSeconds = 1e11;

PlayerSnapshot readPlayer(const json::JsonValue &node, std::string id)
{
    PlayerSnapshot player;
    player.id = std::move(id);
    player.name = json::getString(node, "name", player.id);
    player.team = teamFromString(json::getString(node, "team", ""));
    if (const json::JsonValue *state = json::getObjectField(node, "state"))
    {
        player.health = json::getInt(*state, "health", player.health);
        player.armor = json::getInt(*state, "armor", player.armor);
        player.money = json::getInt(*state, "money", player.money);
        player.roundKills = json::getInt(*state, "round_kills", player.roundKills);
        player.roundHeadshots = json::getInt(*state, "round_killhs", player.roundHeadshots);
    }
    if (const json::JsonValue *stats = json::getObjectField(node, "match_stats"))
    {
        player.kills = json::getInt(*stats, "kills", player.kills);
        player.assists = json::getInt(*stats, "assists", player.assists);
        player.deaths = json::getInt(*stats, "deaths", player.deaths);
        player.mvps = json::getInt(*stats, "mvps", player.mvps);
    }
    return player;
}

} // namespace

SnapshotParseResult parseSnapshot(const std::string &text)
{
    json::JsonParseError error;
    auto root = json::parseJson(text, &error);
    if (!root)
    {
        SnapshotParseResult result;
        result.errors.push_back("Invalid JSON at offset " + std::to_string(error.offset) + ": " + error.message);
        return result;
    }
    return normalizeSnapshot(*root);
}

SnapshotParseResult normalizeSnapshot(const json::JsonValue &root)
{
    SnapshotParseResult result;
    if (!root.isObject())
    {
        result.errors.push_back("Snapshot root must be an object");
        return result;
    }

    const json::JsonValue *provider = json::getObjectField(root, "provider");
    const json::JsonValue *map = json::getObjectField(root, "map");
    if (!provider || !json::hasNumber(*provider, "timestamp"))
    {
        result.errors.push_back("Missing provider.timestamp");
    }
    if (!map || json::getString(*map, "name", "").empty())
    {
        result.errors.push_back("Missing map.name");
    }
    if (!map || !json::hasNumber(*map, "round"))
    {
        result.errors.push_back("Missing map.round");
    }
    if (!result.errors.empty())
    {
        return result;
    }

    const double timestampSeconds = json::getDouble(*provider, "timestamp", 0.0);
    if (!std::isfinite(timestampSeconds) || timestampSeconds < 0.0 || timestampSeconds > kMaxTimestampSeconds)
    {
        result.errors.push_back("provider.timestamp out of range");
        return result;
    }

    GameState state;
    state.timestampMs = static_cast<std::int64_t>(std::llround(timestampSeconds * 1000.0));
    state.trackedId = json::getString(*provider, "steamid", "");

    state.mapName = json::getString(*map, "name", "");
    state.mapPhase = mapPhaseFromString(json::getString(*map, "phase", ""));
    state.round = json::getInt(*map, "round", 0);
    if (const json::JsonValue *ct = json::getObjectField(*map, "team_ct"))
    {
        state.ctScore = json::getInt(*ct, "score", 0);
    }
    if (const json::JsonValue *t = json::getObjectField(*map, "team_t"))
    {
        state.tScore = json::getInt(*t, "score", 0);
    }
    if (state.round < 0)
    {
        result.errors.push_back("map.round must not be negative");
        return result;
    }

    if (const json::JsonValue *round = json::getObjectField(root, "round"))
    {
        state.phase = roundPhaseFromString(json::getString(*round, "phase", ""));
        state.bomb = bombStateFromString(json::getString(*round, "bomb", ""));
        state.winTeam = teamFromString(json::getString(*round, "win_team", ""));
    }

    if (const json::JsonValue *roster = json::getObjectField(root, "allplayers"))
    {
        if (roster->isObject())
        {
            for (const auto &entry : roster->object)
            {
                if (entry.second.isObject())
                {
                    state.players[entry.first] = readPlayer(entry.second, entry.first);
                }
            }
            state.fullRoster = !state.players.empty();
        }
    }

    if (const json::JsonValue *player = json::getObjectField(root, "player"))
    {
        std::string id = json::getString(*player, "steamid", state.trackedId);
        if (state.trackedId.empty())
        {
            state.trackedId = id;
        }
        if (!id.empty())
        {
            // The player block carries per-round fields the roster entry may lack.
            state.players[id] = readPlayer(*player, id);
        }
    }

    result.state = std::move(state);
    return result;
}

} // namespace game
