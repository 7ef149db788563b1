#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace game
{

enum class Team : std::uint8_t
{
    Unknown = 0,
    CounterTerrorist,
    Terrorist
};

enum class RoundPhase : std::uint8_t
{
    Unknown = 0,
    FreezeTime,
    Live,
    Over
};

enum class BombState : std::uint8_t
{
    None = 0,
    Planted,
    Defused,
    Exploded
};

enum class MapPhase : std::uint8_t
{
    Unknown = 0,
    Warmup,
    Live,
    Intermission,
    GameOver
};

Team teamFromString(const std::string &id);
const char *teamToString(Team team);
RoundPhase roundPhaseFromString(const std::string &id);
BombState bombStateFromString(const std::string &id);
MapPhase mapPhaseFromString(const std::string &id);

inline bool opposing(Team a, Team b)
{
    return a != Team::Unknown && b != Team::Unknown && a != b;
}

struct PlayerSnapshot
{
    std::string id;
    std::string name;
    Team team = Team::Unknown;
    int health = 100;
    int armor = 0;
    int money = 0;
    int roundKills = 0;
    int roundHeadshots = 0;
    int kills = 0;
    int assists = 0;
    int deaths = 0;
    int mvps = 0;

    bool alive() const { return health > 0; }
};

// Normalized, immutable view of one game snapshot.
struct GameState
{
    std::int64_t timestampMs = 0;
    std::string trackedId;

    std::string mapName;
    MapPhase mapPhase = MapPhase::Unknown;
    int round = 0;
    int ctScore = 0;
    int tScore = 0;

    RoundPhase phase = RoundPhase::Unknown;
    BombState bomb = BombState::None;
    Team winTeam = Team::Unknown;

    // Keyed by player id; ordered so derivation walks players deterministically.
    std::map<std::string, PlayerSnapshot> players;
    // True when the document carried the full roster rather than only the tracked player.
    bool fullRoster = false;

    const PlayerSnapshot *tracked() const
    {
        const auto it = players.find(trackedId);
        return it == players.end() ? nullptr : &it->second;
    }

    const PlayerSnapshot *player(const std::string &id) const
    {
        const auto it = players.find(id);
        return it == players.end() ? nullptr : &it->second;
    }
};

} // namespace game
