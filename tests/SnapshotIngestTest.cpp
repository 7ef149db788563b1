#include "game/SnapshotIngest.h"

#include "TestSupport.h"

#include <iostream>
#include <limits>
#include <string>

namespace
{

bool testFullRosterSnapshot()
{
    const std::string doc = SnapshotBuilder("de_dust2", 4, 1700000000)
                                .bomb("planted")
                                .score(3, 1)
                                .player("P1", "CT", 80, 7, 2, 1, 1, 3, 2)
                                .player("P2", "T", 0, 4, 5)
                                .build();
    const game::SnapshotParseResult result = game::parseSnapshot(doc);
    if (!result.ok())
    {
        std::cerr << "Valid snapshot was rejected" << '\n';
        return false;
    }
    const game::GameState &state = *result.state;
    if (state.timestampMs != 1700000000000LL || state.mapName != "de_dust2" || state.round != 4)
    {
        std::cerr << "Snapshot header fields were not normalized" << '\n';
        return false;
    }
    if (state.bomb != game::BombState::Planted || state.phase != game::RoundPhase::Live || state.ctScore != 3)
    {
        std::cerr << "Round fields were not normalized" << '\n';
        return false;
    }
    if (!state.fullRoster || state.players.size() != 2)
    {
        std::cerr << "Roster was not read" << '\n';
        return false;
    }
    const game::PlayerSnapshot *tracked = state.tracked();
    if (!tracked || tracked->kills != 7 || tracked->assists != 3 || tracked->mvps != 2 ||
        tracked->team != game::Team::CounterTerrorist || tracked->roundHeadshots != 1)
    {
        std::cerr << "Tracked player fields were not normalized" << '\n';
        return false;
    }
    if (state.player("P2")->alive())
    {
        std::cerr << "Zero health player reported alive" << '\n';
        return false;
    }
    return true;
}

bool testPlayerOnlySnapshot()
{
    const std::string doc = "{\"provider\":{\"steamid\":\"765\",\"timestamp\":12.5},"
                            "\"map\":{\"name\":\"de_inferno\",\"round\":0},"
                            "\"player\":{\"name\":\"Streamer\",\"team\":\"T\","
                            "\"state\":{\"health\":55},\"match_stats\":{\"kills\":1}}}";
    const game::SnapshotParseResult result = game::parseSnapshot(doc);
    if (!result.ok())
    {
        std::cerr << "Player-only snapshot was rejected" << '\n';
        return false;
    }
    const game::GameState &state = *result.state;
    if (state.fullRoster)
    {
        std::cerr << "Player-only snapshot claimed a full roster" << '\n';
        return false;
    }
    if (state.timestampMs != 12500 || state.phase != game::RoundPhase::Unknown || state.bomb != game::BombState::None)
    {
        std::cerr << "Optional fields did not take their defaults" << '\n';
        return false;
    }
    const game::PlayerSnapshot *tracked = state.tracked();
    if (!tracked || tracked->name != "Streamer" || tracked->health != 55 || tracked->deaths != 0)
    {
        std::cerr << "Tracked player was not read from the player block" << '\n';
        return false;
    }
    return true;
}

bool testMissingRequiredKeysRejected()
{
    const char *documents[] = {
        "{\"map\":{\"name\":\"de_nuke\",\"round\":1}}",
        "{\"provider\":{\"timestamp\":1},\"map\":{\"round\":1}}",
        "{\"provider\":{\"timestamp\":1},\"map\":{\"name\":\"de_nuke\"}}",
        "{\"provider\":{\"timestamp\":1},\"map\":{\"name\":\"de_nuke\",\"round\":-2}}",
        "[1,2,3]",
        "{not json",
    };
    for (const char *doc : documents)
    {
        const game::SnapshotParseResult result = game::parseSnapshot(doc);
        if (result.ok() || result.errors.empty())
        {
            std::cerr << "Malformed snapshot was accepted: " << doc << '\n';
            return false;
        }
    }
    return true;
}

bool testHugeNumbersSaturate()
{
    const std::string doc = "{\"provider\":{\"steamid\":\"765\",\"timestamp\":100},"
                            "\"map\":{\"name\":\"de_ancient\",\"round\":2},"
                            "\"player\":{\"team\":\"CT\",\"match_stats\":{\"kills\":1e30,\"deaths\":-1e30}}}";
    const game::SnapshotParseResult result = game::parseSnapshot(doc);
    if (!result.ok())
    {
        std::cerr << "Snapshot with huge counters was rejected at parse time" << '\n';
        return false;
    }
    const game::PlayerSnapshot *tracked = result.state->tracked();
    if (!tracked || tracked->kills != std::numeric_limits<int>::max() ||
        tracked->deaths != std::numeric_limits<int>::min())
    {
        std::cerr << "Out-of-range counters were not saturated" << '\n';
        return false;
    }

    const std::string future = "{\"provider\":{\"steamid\":\"765\",\"timestamp\":1e30},"
                               "\"map\":{\"name\":\"de_ancient\",\"round\":2}}";
    if (game::parseSnapshot(future).ok())
    {
        std::cerr << "Timestamp beyond the representable range was accepted" << '\n';
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;
    if (!testFullRosterSnapshot())
    {
        success = false;
    }
    if (!testPlayerOnlySnapshot())
    {
        success = false;
    }
    if (!testMissingRequiredKeysRejected())
    {
        success = false;
    }
    if (!testHugeNumbersSaturate())
    {
        success = false;
    }
    return success ? 0 : 1;
}
