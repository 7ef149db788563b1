#include "game/StateDiffer.h"

#include <algorithm>
#include <string>
#include <utility>

#include "telemetry/TelemetrySink.h"

namespace game
{

namespace
{

struct KillUnit
{
    std::string actor;
    bool headshot = false;
};

// Counter-Strike bumps the round number in the same update that reports the round as over,
// so that transition still belongs to the round that is ending.
bool sameLogicalRound(const GameState &previous, const GameState &current)
{
    if (previous.mapName != current.mapName)
    {
        return false;
    }
    if (current.round == previous.round)
    {
        return true;
    }
    return current.round == previous.round + 1 && current.phase == RoundPhase::Over &&
           previous.phase != RoundPhase::Over;
}

int countTeam(const GameState &state, Team team, bool aliveOnly, const std::string &excludeId = {})
{
    int count = 0;
    for (const auto &[id, player] : state.players)
    {
        if (player.team != team || id == excludeId)
        {
            continue;
        }
        if (aliveOnly && !player.alive())
        {
            continue;
        }
        ++count;
    }
    return count;
}

Team opponentOf(Team team)
{
    switch (team)
    {
    case Team::CounterTerrorist:
        return Team::Terrorist;
    case Team::Terrorist:
        return Team::CounterTerrorist;
    case Team::Unknown:
        break;
    }
    return Team::Unknown;
}

void openWindow(RoundWindow &window, const GameState &current)
{
    window.open = true;
    window.ended = current.phase == RoundPhase::Over;
    window.mapName = current.mapName;
    window.openState = current;
    window.roundKills.clear();
    window.clutchOpponents = 0;
    window.trackedHurt = false;
}

// Players per side when the document carries only the tracked player.
int counterJumpLimit(const GameState &current)
{
    return current.fullRoster ? static_cast<int>(current.players.size()) : kAceKillsWithoutRoster;
}

bool countersValid(const GameState &state)
{
    return std::none_of(state.players.begin(), state.players.end(), [](const auto &entry) {
        const PlayerSnapshot &player = entry.second;
        return player.kills < 0 || player.deaths < 0 || player.assists < 0 || player.mvps < 0;
    });
}

bool plausibleJumps(const GameState &previous, const GameState &current)
{
    const std::int64_t limit = counterJumpLimit(current);
    for (const auto &[id, player] : current.players)
    {
        const PlayerSnapshot *before = previous.player(id);
        if (!before)
        {
            continue;
        }
        if (static_cast<std::int64_t>(player.kills) - before->kills > limit ||
            static_cast<std::int64_t>(player.deaths) - before->deaths > limit ||
            static_cast<std::int64_t>(player.assists) - before->assists > limit)
        {
            return false;
        }
    }
    return true;
}

void trackScoreGap(const GameState &current, RoundWindow &window)
{
    const PlayerSnapshot *tracked = current.tracked();
    if (!tracked)
    {
        return;
    }
    int gap = 0;
    if (tracked->team == Team::CounterTerrorist)
    {
        gap = current.tScore - current.ctScore;
    }
    else if (tracked->team == Team::Terrorist)
    {
        gap = current.ctScore - current.tScore;
    }
    window.trailingMax = std::max(window.trailingMax, gap);
}

class EventWriter
{
  public:
    EventWriter(const GameState &current, std::vector<StreamEvent> &out)
        : m_current(current), m_out(out), m_round(current.round)
    {
    }

    void stampRound(int round) { m_round = round; }

    StreamEvent &emit(EventKind kind, const std::string &actor = {})
    {
        StreamEvent event;
        event.kind = kind;
        event.timestampMs = m_current.timestampMs;
        event.tick = m_current.timestampMs;
        event.mapName = m_current.mapName;
        event.round = m_round;
        event.actor = actor;
        if (!actor.empty())
        {
            event.tracked = actor == m_current.trackedId;
            if (const PlayerSnapshot *player = m_current.player(actor))
            {
                event.actorName = player->name;
            }
        }
        m_out.push_back(std::move(event));
        return m_out.back();
    }

    void setOther(StreamEvent &event, const std::string &other) const
    {
        event.other = other;
        if (const PlayerSnapshot *player = m_current.player(other))
        {
            event.otherName = player->name;
        }
    }

  private:
    const GameState &m_current;
    std::vector<StreamEvent> &m_out;
    int m_round = 0;
};

void deriveCombat(const GameState &previous, const GameState &current, RoundWindow &window, EventWriter &writer)
{
    std::vector<KillUnit> kills;
    std::vector<std::string> deaths;
    for (const auto &[id, player] : current.players)
    {
        const PlayerSnapshot *before = previous.player(id);
        if (!before)
        {
            continue;
        }
        const int killDelta = player.kills - before->kills;
        int headshotDelta = std::max(0, player.roundHeadshots - before->roundHeadshots);
        for (int i = 0; i < killDelta; ++i)
        {
            kills.push_back({id, headshotDelta > 0});
            if (headshotDelta > 0)
            {
                --headshotDelta;
            }
        }
        for (int i = 0; i < player.deaths - before->deaths; ++i)
        {
            deaths.push_back(id);
        }
    }

    std::vector<bool> paired(deaths.size(), false);
    for (const KillUnit &kill : kills)
    {
        const PlayerSnapshot *killer = current.player(kill.actor);
        std::size_t victimIndex = deaths.size();
        for (std::size_t i = 0; i < deaths.size(); ++i)
        {
            if (paired[i] || deaths[i] == kill.actor)
            {
                continue;
            }
            const PlayerSnapshot *victim = current.player(deaths[i]);
            const bool teamsKnown = killer && victim && killer->team != Team::Unknown && victim->team != Team::Unknown;
            if (teamsKnown && !opposing(killer->team, victim->team))
            {
                continue;
            }
            victimIndex = i;
            break;
        }

        const int credited = ++window.roundKills[kill.actor];
        const int streak = ++window.killStreaks[kill.actor];

        StreamEvent &event = writer.emit(EventKind::Kill, kill.actor);
        event.headshot = kill.headshot;
        event.streak = streak;
        event.count = killer ? std::max(killer->roundKills, credited) : credited;
        if (victimIndex == deaths.size())
        {
            continue;
        }
        paired[victimIndex] = true;
        writer.setOther(event, deaths[victimIndex]);

        window.killStreaks[deaths[victimIndex]] = 0;
        StreamEvent &death = writer.emit(EventKind::Death, deaths[victimIndex]);
        writer.setOther(death, kill.actor);
    }

    for (std::size_t i = 0; i < deaths.size(); ++i)
    {
        if (!paired[i])
        {
            window.killStreaks[deaths[i]] = 0;
            writer.emit(EventKind::Death, deaths[i]);
        }
    }
}

void deriveTrackedVitals(const GameState &previous, const GameState &current, RoundWindow &window, EventWriter &writer)
{
    const PlayerSnapshot *before = previous.tracked();
    const PlayerSnapshot *after = current.tracked();
    if (!before || !after)
    {
        return;
    }
    if (after->health < before->health)
    {
        window.trackedHurt = true;
    }
    if (after->assists > before->assists)
    {
        writer.emit(EventKind::Assist, after->id).count = after->assists - before->assists;
    }
    if (before->health > kLowHealthThreshold && after->health >= 1 && after->health <= kLowHealthThreshold)
    {
        writer.emit(EventKind::LowHealth, after->id).count = after->health;
    }
}

void detectClutch(const GameState &current, RoundWindow &window)
{
    if (window.clutchOpponents > 0 || window.ended || !current.fullRoster || current.phase != RoundPhase::Live)
    {
        return;
    }
    const PlayerSnapshot *tracked = current.tracked();
    if (!tracked || !tracked->alive() || tracked->team == Team::Unknown)
    {
        return;
    }
    if (countTeam(current, tracked->team, true, tracked->id) != 0)
    {
        return;
    }
    const int opponents = countTeam(current, opponentOf(tracked->team), true);
    if (opponents >= kMinClutchOpponents)
    {
        window.clutchOpponents = opponents;
    }
}

void deriveBomb(const GameState &previous, const GameState &current, EventWriter &writer)
{
    if (previous.bomb == current.bomb)
    {
        return;
    }
    switch (current.bomb)
    {
    case BombState::Planted:
        writer.emit(EventKind::BombPlanted);
        break;
    case BombState::Defused:
        {
            StreamEvent &event = writer.emit(EventKind::BombDefused);
            if (const PlayerSnapshot *tracked = current.tracked())
            {
                event.count = tracked->health;
            }
            break;
        }
    case BombState::Exploded:
        writer.emit(EventKind::BombExploded);
        break;
    case BombState::None:
        break;
    }
}

void closeRound(const GameState &current, RoundWindow &window, EventWriter &writer)
{
    const PlayerSnapshot *tracked = current.tracked();
    const Team trackedTeam = tracked ? tracked->team : Team::Unknown;

    const GameState &opened = window.openState;
    std::string aceActor;
    int aceKills = 0;
    if (opened.fullRoster)
    {
        for (const auto &[actor, kills] : window.roundKills)
        {
            const PlayerSnapshot *player = opened.player(actor);
            if (!player || player->team == Team::Unknown)
            {
                continue;
            }
            const int enemies = countTeam(opened, opponentOf(player->team), false);
            if (enemies >= 2 && kills >= enemies)
            {
                aceActor = actor;
                aceKills = kills;
                break;
            }
        }
    }
    else if (tracked && tracked->roundKills >= kAceKillsWithoutRoster)
    {
        aceActor = tracked->id;
        aceKills = tracked->roundKills;
    }
    if (!aceActor.empty())
    {
        writer.emit(EventKind::Ace, aceActor).count = aceKills;
    }

    const bool won = trackedTeam != Team::Unknown && current.winTeam == trackedTeam;
    if (window.clutchOpponents >= kMinClutchOpponents && won && tracked)
    {
        StreamEvent &event = writer.emit(EventKind::Clutch, tracked->id);
        event.count = window.clutchOpponents;
        event.won = true;
    }

    window.ended = true;
}

void deriveMvp(const GameState &previous, const GameState &current, EventWriter &writer)
{
    for (const auto &[id, player] : current.players)
    {
        const PlayerSnapshot *before = previous.player(id);
        if (before && player.mvps > before->mvps)
        {
            writer.emit(EventKind::Mvp, id);
        }
    }
}

void emitRoundEnd(const GameState &current, const RoundWindow &window, EventWriter &writer)
{
    const PlayerSnapshot *tracked = current.tracked();
    StreamEvent &event = writer.emit(EventKind::RoundEnd, tracked ? tracked->id : std::string{});
    event.won = tracked && tracked->team != Team::Unknown && current.winTeam == tracked->team;
    event.count = tracked ? tracked->roundKills : 0;
    event.text = teamToString(current.winTeam);
    if (!tracked)
    {
        return;
    }
    if (const PlayerSnapshot *opened = window.openState.tracked())
    {
        event.eco = opened->money < kEcoMoneyThreshold;
        event.flawless = tracked->alive() && !window.trackedHurt && tracked->health >= opened->health;
    }
}

void emitMatchEnd(const GameState &current, const RoundWindow &window, EventWriter &writer)
{
    const PlayerSnapshot *tracked = current.tracked();
    StreamEvent &event = writer.emit(EventKind::MatchEnd, tracked ? tracked->id : std::string{});
    event.text = current.mapName;
    event.deficit = window.trailingMax;
    if (tracked)
    {
        event.count = tracked->kills;
        event.deaths = tracked->deaths;
        if (tracked->team == Team::CounterTerrorist)
        {
            event.won = current.ctScore > current.tScore;
        }
        else if (tracked->team == Team::Terrorist)
        {
            event.won = current.tScore > current.ctScore;
        }
    }
}

} // namespace

DiffOutcome derive(const GameState *previous, const GameState &current, const RoundWindow &window)
{
    DiffOutcome outcome;
    outcome.window = window;
    RoundWindow &next = outcome.window;
    EventWriter writer(current, outcome.events);

    if (previous && previous->mapName == current.mapName &&
        (current.round < previous->round || current.timestampMs < previous->timestampMs))
    {
        outcome.outOfOrder = true;
        previous = nullptr;
    }
    if (previous && !sameLogicalRound(*previous, current))
    {
        previous = nullptr;
    }
    if (previous && !countersValid(*previous))
    {
        previous = nullptr;
    }
    if (!countersValid(current) || (previous && !plausibleJumps(*previous, current)))
    {
        outcome.malformed = true;
        outcome.baseline = true;
        return outcome;
    }

    if (!previous)
    {
        outcome.baseline = true;
        if (current.mapName != next.mapName)
        {
            writer.emit(EventKind::MapChange).text = current.mapName;
            next.killStreaks.clear();
            next.trailingMax = 0;
        }
        openWindow(next, current);
        trackScoreGap(current, next);
        writer.emit(EventKind::RoundStart).count = current.round;
        return outcome;
    }
    // Leaving the over phase without a new round number starts the next round.
    if (previous->phase == RoundPhase::Over && current.phase != RoundPhase::Over)
    {
        openWindow(next, current);
        writer.emit(EventKind::RoundStart).count = current.round;
        return outcome;
    }
    // The update that reports a round as over may already carry the next round number.
    writer.stampRound(previous->round);

    trackScoreGap(current, next);
    deriveCombat(*previous, current, next, writer);
    deriveTrackedVitals(*previous, current, next, writer);
    detectClutch(current, next);
    deriveBomb(*previous, current, writer);

    const bool roundEnded = previous->phase != RoundPhase::Over && current.phase == RoundPhase::Over;
    if (roundEnded && next.open && !next.ended)
    {
        closeRound(current, next, writer);
    }
    deriveMvp(*previous, current, writer);
    if (roundEnded)
    {
        next.ended = true;
        emitRoundEnd(current, next, writer);
    }
    if (previous->mapPhase != MapPhase::GameOver && current.mapPhase == MapPhase::GameOver)
    {
        emitMatchEnd(current, next, writer);
        next.trailingMax = 0;
    }
    return outcome;
}

StateDiffer::StateDiffer(std::shared_ptr<TelemetrySink> telemetry, std::shared_ptr<EventIdAllocator> ids)
    : m_telemetry(std::move(telemetry)), m_ids(ids ? std::move(ids) : std::make_shared<EventIdAllocator>())
{
}

std::vector<StreamEvent> StateDiffer::ingest(GameState current)
{
    DiffOutcome outcome = derive(previous(), current, m_window);
    if (outcome.outOfOrder && m_previous)
    {
        telemetry::emit(m_telemetry, "differ.out_of_order",
                        {{"map", current.mapName},
                         {"previous_round", std::to_string(m_previous->round)},
                         {"round", std::to_string(current.round)},
                         {"previous_timestamp_ms", std::to_string(m_previous->timestampMs)},
                         {"timestamp_ms", std::to_string(current.timestampMs)}});
    }
    else if (outcome.malformed)
    {
        telemetry::emit(m_telemetry, "differ.malformed",
                        {{"map", current.mapName}, {"round", std::to_string(current.round)}});
    }
    else if (outcome.baseline && m_previous)
    {
        telemetry::emit(m_telemetry, "differ.baseline",
                        {{"map", current.mapName}, {"round", std::to_string(current.round)}});
    }

    for (StreamEvent &event : outcome.events)
    {
        event.id = m_ids->next();
    }
    m_window = std::move(outcome.window);
    m_previous = std::move(current);
    return std::move(outcome.events);
}

void StateDiffer::reset()
{
    m_previous.reset();
    m_window = RoundWindow{};
}

} // namespace game
