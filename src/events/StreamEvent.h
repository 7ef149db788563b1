#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class EventKind : std::uint8_t
{
    MapChange = 0,
    RoundStart,
    Kill,
    Death,
    Assist,
    LowHealth,
    Clutch,
    Ace,
    BombPlanted,
    BombDefused,
    BombExploded,
    RoundEnd,
    Mvp,
    MatchEnd,
    Donation,
    Subscription,
    Raid,
    Follow,
    ChatMessage,
    SessionTick,
    Unlock,
};

const char *eventKindToString(EventKind kind);
std::optional<EventKind> eventKindFromString(std::string_view id);

// One discrete occurrence. Fields not meaningful for a kind keep their defaults.
struct StreamEvent
{
    std::uint64_t id = 0;
    EventKind kind = EventKind::RoundStart;
    std::int64_t timestampMs = 0;

    // Concerns the streamer: the tracked player in game events, always true for feed events.
    bool tracked = false;

    std::string actor;
    std::string actorName;
    std::string other;
    std::string otherName;

    std::string mapName;
    int round = 0;
    std::int64_t tick = 0;

    int count = 0;
    int streak = 0;
    bool headshot = false;
    bool won = false;

    // RoundEnd: the tracked player opened the round short of a full buy / lost no health in it.
    bool eco = false;
    bool flawless = false;
    // MatchEnd: the tracked player's match deaths, and the widest score gap their side trailed by.
    int deaths = 0;
    int deficit = 0;

    double amount = 0.0;
    std::string currency;
    std::string text;

    std::string achievementId;
};

// Hands out process-unique event identifiers; safe to share between producers.
class EventIdAllocator
{
  public:
    std::uint64_t next() { return m_next.fetch_add(1, std::memory_order_relaxed); }

  private:
    std::atomic<std::uint64_t> m_next{1};
};

inline constexpr const char *StreamEventName = "stream.event";
inline constexpr const char *UnlockEventName = "achievement.unlocked";
