#include "events/StreamEvent.h"

#include <array>
#include <utility>

namespace
{

constexpr std::array<std::pair<EventKind, const char *>, 21> kEventKindNames{{
    {EventKind::MapChange, "map_change"},
    {EventKind::RoundStart, "round_start"},
    {EventKind::Kill, "kill"},
    {EventKind::Death, "death"},
    {EventKind::Assist, "assist"},
    {EventKind::LowHealth, "low_health"},
    {EventKind::Clutch, "clutch"},
    {EventKind::Ace, "ace"},
    {EventKind::BombPlanted, "bomb_planted"},
    {EventKind::BombDefused, "bomb_defused"},
    {EventKind::BombExploded, "bomb_exploded"},
    {EventKind::RoundEnd, "round_end"},
    {EventKind::Mvp, "mvp"},
    {EventKind::MatchEnd, "match_end"},
    {EventKind::Donation, "donation"},
    {EventKind::Subscription, "subscription"},
    {EventKind::Raid, "raid"},
    {EventKind::Follow, "follow"},
    {EventKind::ChatMessage, "chat_message"},
    {EventKind::SessionTick, "session_tick"},
    {EventKind::Unlock, "unlock"},
}};

} // namespace

const char *eventKindToString(EventKind kind)
{
    for (const auto &entry : kEventKindNames)
    {
        if (entry.first == kind)
        {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<EventKind> eventKindFromString(std::string_view id)
{
    for (const auto &entry : kEventKindNames)
    {
        if (id == entry.second)
        {
            return entry.first;
        }
    }
    return std::nullopt;
}
