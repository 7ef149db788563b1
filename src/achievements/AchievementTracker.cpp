#include "achievements/AchievementTracker.h"

#include <algorithm>
#include <string>
#include <utility>

#include "telemetry/TelemetrySink.h"

namespace achievements
{

AchievementTracker::AchievementTracker(std::vector<AchievementRule> rules,
                                       std::unique_ptr<ProgressStore> store,
                                       std::shared_ptr<TelemetrySink> telemetry,
                                       std::shared_ptr<EventIdAllocator> ids,
                                       std::size_t historyLimit)
    : m_rules(std::move(rules))
    , m_store(std::move(store))
    , m_telemetry(std::move(telemetry))
    , m_ids(ids ? std::move(ids) : std::make_shared<EventIdAllocator>())
    , m_persistent(m_store != nullptr)
    , m_historyLimit(std::max<std::size_t>(1, historyLimit))
{
}

bool AchievementTracker::load()
{
    if (!m_store)
    {
        return false;
    }
    ProgressLoadResult result = m_store->load();
    if (!result.success)
    {
        m_progress.clear();
        telemetry::emit(m_telemetry, "achievements.load_failed", {{"error", result.error}});
        return false;
    }
    m_progress = std::move(result.progress);

    std::size_t unlocked = 0;
    for (const auto &entry : m_progress)
    {
        if (entry.second.unlocked)
        {
            ++unlocked;
        }
    }
    telemetry::emit(m_telemetry, "achievements.loaded",
                    {{"entries", std::to_string(m_progress.size())}, {"unlocked", std::to_string(unlocked)}});
    return true;
}

bool AchievementTracker::remember(std::uint64_t eventId)
{
    if (eventId == 0)
    {
        return true;
    }
    if (!m_recentIds.insert(eventId).second)
    {
        return false;
    }
    m_recentOrder.push_back(eventId);
    while (m_recentOrder.size() > m_historyLimit)
    {
        m_recentIds.erase(m_recentOrder.front());
        m_recentOrder.pop_front();
    }
    return true;
}

std::vector<StreamEvent> AchievementTracker::apply(const StreamEvent &event)
{
    std::vector<StreamEvent> unlocks;
    if (event.kind == EventKind::Unlock)
    {
        return unlocks;
    }
    if (!remember(event.id))
    {
        telemetry::emit(m_telemetry, "achievements.duplicate_event",
                        {{"event_id", std::to_string(event.id)}, {"kind", eventKindToString(event.kind)}});
        return unlocks;
    }

    bool mutated = false;
    for (const AchievementRule &rule : m_rules)
    {
        if (rule.trigger != event.kind || !rule.filter.matches(event))
        {
            continue;
        }
        AchievementProgress &progress = m_progress[rule.id];
        const std::int64_t contribution = rule.contribution(event);
        std::int64_t updated = progress.counter;
        if (rule.increment == Increment::PeakCount || rule.increment == Increment::PeakStreak)
        {
            updated = std::max(progress.counter, contribution);
        }
        else
        {
            updated = progress.counter + contribution;
        }
        if (updated != progress.counter)
        {
            progress.counter = updated;
            mutated = true;
        }

        if (progress.unlocked || progress.counter < rule.threshold)
        {
            continue;
        }
        progress.unlocked = true;
        progress.unlockedAtMs = event.timestampMs;
        mutated = true;

        StreamEvent unlock;
        unlock.id = m_ids->next();
        unlock.kind = EventKind::Unlock;
        unlock.timestampMs = event.timestampMs;
        unlock.tracked = true;
        unlock.achievementId = rule.id;
        unlock.text = rule.name;
        unlock.count = static_cast<int>(std::min<std::int64_t>(progress.counter, rule.threshold));
        unlocks.push_back(std::move(unlock));

        telemetry::emit(m_telemetry, "achievements.unlocked",
                        {{"id", rule.id}, {"name", rule.name}, {"trigger_event_id", std::to_string(event.id)}});
    }

    if (mutated)
    {
        persist();
    }
    return unlocks;
}

bool AchievementTracker::checkpoint()
{
    if (!m_persistent)
    {
        return false;
    }
    persist();
    return m_persistent;
}

void AchievementTracker::persist()
{
    if (!m_persistent || !m_store)
    {
        return;
    }
    std::string error;
    if (!m_store->save(m_progress, error))
    {
        m_persistent = false;
        telemetry::emit(m_telemetry, "achievements.persist_failed",
                        {{"error", error}, {"mode", "memory_only"}});
    }
}

} // namespace achievements
