#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <unordered_set>
#include <vector>

#include "achievements/AchievementRules.h"
#include "achievements/ProgressStore.h"
#include "events/StreamEvent.h"

class TelemetrySink;

namespace achievements
{

// Single writer of achievement progress. Not thread-safe: callers apply events from one thread.
class AchievementTracker
{
  public:
    AchievementTracker(std::vector<AchievementRule> rules,
                       std::unique_ptr<ProgressStore> store,
                       std::shared_ptr<TelemetrySink> telemetry = nullptr,
                       std::shared_ptr<EventIdAllocator> ids = nullptr,
                       std::size_t historyLimit = 1024);

    // Reads persisted progress once. A failed read starts every counter from zero.
    bool load();

    // Returns the unlock events caused by this event, in rule order.
    std::vector<StreamEvent> apply(const StreamEvent &event);

    Progress snapshot() const { return m_progress; }
    bool checkpoint();

    bool persistent() const { return m_persistent; }
    const std::vector<AchievementRule> &rules() const { return m_rules; }

  private:
    bool remember(std::uint64_t eventId);
    void persist();

    std::vector<AchievementRule> m_rules;
    std::unique_ptr<ProgressStore> m_store;
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::shared_ptr<EventIdAllocator> m_ids;

    Progress m_progress;
    bool m_persistent = true;

    std::size_t m_historyLimit;
    std::deque<std::uint64_t> m_recentOrder;
    std::unordered_set<std::uint64_t> m_recentIds;
};

} // namespace achievements
