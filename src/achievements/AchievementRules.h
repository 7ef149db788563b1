#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "events/StreamEvent.h"

namespace json
{
struct JsonValue;
}

namespace achievements
{

// How a matching event moves the counter. Peak increments keep the highest value seen.
enum class Increment : std::uint8_t
{
    One = 0,
    Count,
    Amount,
    PeakCount,
    PeakStreak
};

const char *incrementToString(Increment increment);
std::optional<Increment> incrementFromString(const std::string &id);

struct RuleFilter
{
    bool trackedOnly = false;
    bool headshot = false;
    bool won = false;
    bool eco = false;
    bool flawless = false;
    bool killsOverDeaths = false;
    std::optional<int> minCount;
    std::optional<int> minDeficit;
    std::optional<int> maxCount;
    // Applies to every currency when no per-currency minimum is given.
    std::optional<double> minAmount;
    std::map<std::string, double> minAmountByCurrency;

    bool matches(const StreamEvent &event) const;
};

struct AchievementRule
{
    std::string id;
    std::string name;
    std::string description;
    EventKind trigger = EventKind::Kill;
    std::int64_t threshold = 1;
    Increment increment = Increment::One;
    RuleFilter filter{};

    // Value added to (or, for peak increments, compared with) the counter. Never negative.
    std::int64_t contribution(const StreamEvent &event) const;
};

std::vector<AchievementRule> buildDefaultAchievementRules();

// Parses {"schema_version": 1, "achievements": [...]}. Invalid entries are reported and skipped;
// returns nullopt when no usable rule remains.
std::optional<std::vector<AchievementRule>> parseAchievementRules(const json::JsonValue &root,
                                                                  std::vector<std::string> &errors);

} // namespace achievements
