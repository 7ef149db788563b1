#include "achievements/AchievementTracker.h"

#include "TestSupport.h"

#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace
{

using achievements::AchievementTracker;
using achievements::Progress;

StreamEvent makeEvent(std::uint64_t id, EventKind kind)
{
    StreamEvent event;
    event.id = id;
    event.kind = kind;
    event.timestampMs = static_cast<std::int64_t>(id) * 1000;
    event.tracked = true;
    return event;
}

bool testFirstBloodUnlocksOnce()
{
    auto state = std::make_shared<MemoryProgressStore::State>();
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(),
                               std::make_unique<MemoryProgressStore>(state), telemetry);
    tracker.load();

    StreamEvent first = makeEvent(1, EventKind::Kill);
    first.streak = 1;
    const auto unlocks = tracker.apply(first);
    if (unlocks.size() != 1 || unlocks[0].kind != EventKind::Unlock || unlocks[0].achievementId != "first_blood")
    {
        std::cerr << "First kill did not unlock first_blood" << '\n';
        return false;
    }
    if (unlocks[0].text != "Первая кровь" || unlocks[0].id == 0 || unlocks[0].timestampMs != 1000)
    {
        std::cerr << "Unlock event fields were not filled" << '\n';
        return false;
    }

    StreamEvent second = makeEvent(2, EventKind::Kill);
    second.streak = 2;
    if (!tracker.apply(second).empty())
    {
        std::cerr << "first_blood unlocked twice" << '\n';
        return false;
    }
    const auto &saved = state->saved;
    const auto it = saved.find("first_blood");
    if (it == saved.end() || !it->second.unlocked || it->second.counter != 2 || it->second.unlockedAtMs != 1000)
    {
        std::cerr << "Unlock was not persisted" << '\n';
        return false;
    }
    if (telemetry->count("achievements.unlocked") != 1)
    {
        std::cerr << "Unlock telemetry count mismatch" << '\n';
        return false;
    }
    return true;
}

bool testUntrackedKillDoesNotCount()
{
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(), nullptr);
    StreamEvent kill = makeEvent(1, EventKind::Kill);
    kill.tracked = false;
    if (!tracker.apply(kill).empty() || tracker.snapshot().count("first_blood") != 0)
    {
        std::cerr << "Kill by another player counted toward a tracked-only rule" << '\n';
        return false;
    }
    return true;
}

bool testDuplicateEventIgnored()
{
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(), nullptr, telemetry);

    const StreamEvent chat = makeEvent(10, EventKind::ChatMessage);
    tracker.apply(chat);
    tracker.apply(chat);
    if (tracker.snapshot()["popular"].counter != 1)
    {
        std::cerr << "Duplicate event id advanced the counter" << '\n';
        return false;
    }
    if (telemetry->count("achievements.duplicate_event") != 1)
    {
        std::cerr << "Duplicate event was not reported" << '\n';
        return false;
    }
    return true;
}

bool testPeakStreakAndCurrencyThresholds()
{
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(), nullptr);

    StreamEvent streak = makeEvent(1, EventKind::Kill);
    streak.streak = 5;
    bool spree = false;
    for (const StreamEvent &unlock : tracker.apply(streak))
    {
        spree = spree || unlock.achievementId == "killing_spree";
    }
    if (!spree)
    {
        std::cerr << "Five kill streak did not unlock killing_spree" << '\n';
        return false;
    }
    StreamEvent shorter = makeEvent(2, EventKind::Kill);
    shorter.streak = 1;
    tracker.apply(shorter);
    if (tracker.snapshot()["unstoppable"].counter != 5)
    {
        std::cerr << "Shorter streak lowered the peak counter" << '\n';
        return false;
    }

    StreamEvent euro = makeEvent(3, EventKind::Donation);
    euro.amount = 5000.0;
    euro.currency = "EUR";
    StreamEvent small = makeEvent(4, EventKind::Donation);
    small.amount = 999.0;
    small.currency = "RUB";
    tracker.apply(euro);
    tracker.apply(small);
    if (tracker.snapshot()["whale_friend"].unlocked)
    {
        std::cerr << "whale_friend unlocked below its currency threshold" << '\n';
        return false;
    }
    StreamEvent big = makeEvent(5, EventKind::Donation);
    big.amount = 1000.0;
    big.currency = "RUB";
    tracker.apply(big);
    const Progress progress = tracker.snapshot();
    if (!progress.at("whale_friend").unlocked || progress.at("loved").counter != 3)
    {
        std::cerr << "Donation rules did not count as expected" << '\n';
        return false;
    }
    return true;
}

bool testPersistenceFailureDegradesToMemory()
{
    auto state = std::make_shared<MemoryProgressStore::State>();
    state->failSaves = true;
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(),
                               std::make_unique<MemoryProgressStore>(state), telemetry);
    tracker.load();

    tracker.apply(makeEvent(1, EventKind::Kill));
    const auto unlocks = tracker.apply(makeEvent(2, EventKind::ChatMessage));
    if (tracker.persistent())
    {
        std::cerr << "Tracker still claims persistence after a failed save" << '\n';
        return false;
    }
    if (state->saves != 1 || telemetry->count("achievements.persist_failed") != 1)
    {
        std::cerr << "Failed store was retried or reported more than once" << '\n';
        return false;
    }
    if (!unlocks.empty() || tracker.snapshot()["popular"].counter != 1 || !tracker.snapshot()["first_blood"].unlocked)
    {
        std::cerr << "Progress stopped advancing after persistence failed" << '\n';
        return false;
    }
    if (tracker.checkpoint())
    {
        std::cerr << "Checkpoint succeeded in memory-only mode" << '\n';
        return false;
    }
    return true;
}

bool testLoadFailureStartsFromZero()
{
    auto state = std::make_shared<MemoryProgressStore::State>();
    state->initial.success = false;
    state->initial.error = "corrupt";
    state->initial.progress["first_blood"].unlocked = true;
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(),
                               std::make_unique<MemoryProgressStore>(state), telemetry);
    if (tracker.load())
    {
        std::cerr << "Failed load reported success" << '\n';
        return false;
    }
    if (!tracker.snapshot().empty() || telemetry->count("achievements.load_failed") != 1)
    {
        std::cerr << "Failed load did not start from empty progress" << '\n';
        return false;
    }
    if (tracker.apply(makeEvent(1, EventKind::Kill)).size() != 1 || !tracker.persistent())
    {
        std::cerr << "Tracker did not keep working after a failed load" << '\n';
        return false;
    }
    return true;
}

bool testLoadedUnlockIsNotRepeated()
{
    auto state = std::make_shared<MemoryProgressStore::State>();
    state->initial.progress["first_blood"].counter = 3;
    state->initial.progress["first_blood"].unlocked = true;
    state->initial.progress["first_blood"].unlockedAtMs = 42;
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(),
                               std::make_unique<MemoryProgressStore>(state));
    if (!tracker.load())
    {
        std::cerr << "Load failed" << '\n';
        return false;
    }
    if (!tracker.apply(makeEvent(7, EventKind::Kill)).empty())
    {
        std::cerr << "Previously unlocked achievement unlocked again" << '\n';
        return false;
    }
    if (state->saved.at("first_blood").counter != 4 || state->saved.at("first_blood").unlockedAtMs != 42)
    {
        std::cerr << "Loaded progress was not carried forward" << '\n';
        return false;
    }
    return true;
}

std::set<std::string> unlockedIds(const std::vector<StreamEvent> &unlocks)
{
    std::set<std::string> ids;
    for (const StreamEvent &unlock : unlocks)
    {
        ids.insert(unlock.achievementId);
    }
    return ids;
}

bool testRoundAndMatchOutcomeAchievements()
{
    AchievementTracker tracker(achievements::buildDefaultAchievementRules(), nullptr);

    StreamEvent plainWin = makeEvent(1, EventKind::RoundEnd);
    plainWin.won = true;
    StreamEvent flawlessLoss = makeEvent(2, EventKind::RoundEnd);
    flawlessLoss.flawless = true;
    if (!tracker.apply(plainWin).empty() || !tracker.apply(flawlessLoss).empty())
    {
        std::cerr << "Ordinary round results unlocked a round achievement" << '\n';
        return false;
    }

    StreamEvent ecoWin = makeEvent(3, EventKind::RoundEnd);
    ecoWin.won = true;
    ecoWin.eco = true;
    if (unlockedIds(tracker.apply(ecoWin)) != std::set<std::string>{"economical"})
    {
        std::cerr << "Eco round win did not unlock economical alone" << '\n';
        return false;
    }
    StreamEvent cleanWin = makeEvent(4, EventKind::RoundEnd);
    cleanWin.won = true;
    cleanWin.flawless = true;
    if (unlockedIds(tracker.apply(cleanWin)) != std::set<std::string>{"perfect_round"})
    {
        std::cerr << "Flawless round win did not unlock perfect_round" << '\n';
        return false;
    }

    StreamEvent evenMatch = makeEvent(5, EventKind::MatchEnd);
    evenMatch.won = true;
    evenMatch.count = 20;
    evenMatch.deaths = 20;
    evenMatch.deficit = 4;
    StreamEvent lostMatch = makeEvent(6, EventKind::MatchEnd);
    lostMatch.count = 30;
    lostMatch.deaths = 1;
    lostMatch.deficit = 9;
    if (!tracker.apply(evenMatch).empty() || !tracker.apply(lostMatch).empty())
    {
        std::cerr << "Match without a comeback or positive ratio unlocked a match achievement" << '\n';
        return false;
    }

    StreamEvent comeback = makeEvent(7, EventKind::MatchEnd);
    comeback.won = true;
    comeback.count = 21;
    comeback.deaths = 10;
    comeback.deficit = 6;
    if (unlockedIds(tracker.apply(comeback)) != std::set<std::string>{"comeback_kid", "consistent"})
    {
        std::cerr << "Comeback win with positive ratio did not unlock comeback_kid and consistent" << '\n';
        return false;
    }
    if (tracker.snapshot()["dedication"].counter != 3)
    {
        std::cerr << "Every match end should count toward dedication" << '\n';
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;
    if (!testFirstBloodUnlocksOnce())
    {
        success = false;
    }
    if (!testUntrackedKillDoesNotCount())
    {
        success = false;
    }
    if (!testDuplicateEventIgnored())
    {
        success = false;
    }
    if (!testPeakStreakAndCurrencyThresholds())
    {
        success = false;
    }
    if (!testPersistenceFailureDegradesToMemory())
    {
        success = false;
    }
    if (!testLoadFailureStartsFromZero())
    {
        success = false;
    }
    if (!testLoadedUnlockIsNotRepeated())
    {
        success = false;
    }
    if (!testRoundAndMatchOutcomeAchievements())
    {
        success = false;
    }
    return success ? 0 : 1;
}
