#include "game/GameState.h"

namespace game
{

Team teamFromString(const std::string &id)
{
    if (id == "CT" || id == "ct")
    {
        return Team::CounterTerrorist;
    }
    if (id == "T" || id == "t")
    {
        return Team::Terrorist;
    }
    return Team::Unknown;
}

const char *teamToString(Team team)
{
    switch (team)
    {
    case Team::CounterTerrorist:
        return "CT";
    case Team::Terrorist:
        return "T";
    case Team::Unknown:
        break;
    }
    return "";
}

RoundPhase roundPhaseFromString(const std::string &id)
{
    if (id == "freezetime")
    {
        return RoundPhase::FreezeTime;
    }
    if (id == "live")
    {
        return RoundPhase::Live;
    }
    if (id == "over")
    {
        return RoundPhase::Over;
    }
    return RoundPhase::Unknown;
}

BombState bombStateFromString(const std::string &id)
{
    if (id == "planted")
    {
        return BombState::Planted;
    }
    if (id == "defused")
    {
        return BombState::Defused;
    }
    if (id == "exploded")
    {
        return BombState::Exploded;
    }
    return BombState::None;
}

MapPhase mapPhaseFromString(const std::string &id)
{
    if (id == "warmup")
    {
        return MapPhase::Warmup;
    }
    if (id == "live")
    {
        return MapPhase::Live;
    }
    if (id == "intermission")
    {
        return MapPhase::Intermission;
    }
    if (id == "gameover")
    {
        return MapPhase::GameOver;
    }
    return MapPhase::Unknown;
}

} // namespace game
