#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "events/StreamEvent.h"
#include "game/GameState.h"

class TelemetrySink;

namespace game
{

// Rolling state carried between diffs: the snapshot that opened the current round,
// what has been credited inside it, and kill streaks that outlive single rounds.
struct RoundWindow
{
    bool open = false;
    bool ended = false;
    std::string mapName;
    GameState openState;
    std::map<std::string, int> roundKills;
    int clutchOpponents = 0;
    bool trackedHurt = false;
    std::map<std::string, int> killStreaks;
    // Widest score gap the tracked player's side has trailed by in the current match.
    int trailingMax = 0;
};

struct DiffOutcome
{
    std::vector<StreamEvent> events;
    RoundWindow window;
    bool baseline = false;
    bool outOfOrder = false;
    // Counters went negative or jumped further than one update allows; nothing was derived.
    bool malformed = false;
};

inline constexpr int kLowHealthThreshold = 25;
inline constexpr int kAceKillsWithoutRoster = 5;
inline constexpr int kMinClutchOpponents = 2;
inline constexpr int kEcoMoneyThreshold = 2000;

// Pure: the outcome depends only on the arguments. Event ids are left at zero.
// previous == nullptr means there is no comparable snapshot.
DiffOutcome derive(const GameState *previous, const GameState &current, const RoundWindow &window);

class StateDiffer
{
  public:
    explicit StateDiffer(std::shared_ptr<TelemetrySink> telemetry = nullptr,
                         std::shared_ptr<EventIdAllocator> ids = nullptr);

    std::vector<StreamEvent> ingest(GameState current);
    void reset();

    const RoundWindow &window() const { return m_window; }
    const GameState *previous() const { return m_previous ? &*m_previous : nullptr; }

  private:
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::shared_ptr<EventIdAllocator> m_ids;
    std::optional<GameState> m_previous;
    RoundWindow m_window;
};

} // namespace game
