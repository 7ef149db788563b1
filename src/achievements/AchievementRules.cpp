#include "achievements/AchievementRules.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "json/JsonUtils.h"

namespace achievements
{

namespace
{

AchievementRule makeRule(const char *id, const char *name, const char *description, EventKind trigger,
                         std::int64_t threshold, Increment increment = Increment::One)
{
    AchievementRule rule;
    rule.id = id;
    rule.name = name;
    rule.description = description;
    rule.trigger = trigger;
    rule.threshold = threshold;
    rule.increment = increment;
    return rule;
}

std::optional<AchievementRule> parseRule(const json::JsonValue &node, std::size_t index, std::vector<std::string> &errors)
{
    const std::string where = "achievements[" + std::to_string(index) + "]";
    if (!node.isObject())
    {
        errors.push_back(where + " must be an object");
        return std::nullopt;
    }

    AchievementRule rule;
    rule.id = json::getString(node, "id", "");
    if (rule.id.empty())
    {
        errors.push_back(where + " is missing id");
        return std::nullopt;
    }
    rule.name = json::getString(node, "name", rule.id);
    rule.description = json::getString(node, "description", "");

    const auto trigger = eventKindFromString(json::getString(node, "trigger", ""));
    if (!trigger)
    {
        errors.push_back(where + " (" + rule.id + ") has unknown trigger");
        return std::nullopt;
    }
    rule.trigger = *trigger;

    const auto increment = incrementFromString(json::getString(node, "increment", "one"));
    if (!increment)
    {
        errors.push_back(where + " (" + rule.id + ") has unknown increment");
        return std::nullopt;
    }
    rule.increment = *increment;

    rule.threshold = json::getInt64(node, "threshold", 1);
    if (rule.threshold < 1)
    {
        errors.push_back(where + " (" + rule.id + ") threshold must be at least 1");
        return std::nullopt;
    }

    if (const json::JsonValue *filter = json::getObjectField(node, "filter"))
    {
        RuleFilter &out = rule.filter;
        out.trackedOnly = json::getBool(*filter, "tracked_only", false);
        out.headshot = json::getBool(*filter, "headshot", false);
        out.won = json::getBool(*filter, "won", false);
        out.eco = json::getBool(*filter, "eco", false);
        out.flawless = json::getBool(*filter, "flawless", false);
        out.killsOverDeaths = json::getBool(*filter, "kills_over_deaths", false);
        if (json::hasNumber(*filter, "min_deficit"))
        {
            out.minDeficit = json::getInt(*filter, "min_deficit", 0);
        }
        if (json::hasNumber(*filter, "min_count"))
        {
            out.minCount = json::getInt(*filter, "min_count", 0);
        }
        if (json::hasNumber(*filter, "max_count"))
        {
            out.maxCount = json::getInt(*filter, "max_count", 0);
        }
        if (const json::JsonValue *minAmount = json::getObjectField(*filter, "min_amount"))
        {
            if (minAmount->type == json::JsonValue::Type::Number)
            {
                out.minAmount = minAmount->number;
            }
            else if (minAmount->isObject())
            {
                for (const auto &[currency, value] : minAmount->object)
                {
                    if (value.type == json::JsonValue::Type::Number)
                    {
                        out.minAmountByCurrency[currency] = value.number;
                    }
                }
            }
        }
    }
    return rule;
}

} // namespace

const char *incrementToString(Increment increment)
{
    switch (increment)
    {
    case Increment::One:
        return "one";
    case Increment::Count:
        return "count";
    case Increment::Amount:
        return "amount";
    case Increment::PeakCount:
        return "peak_count";
    case Increment::PeakStreak:
        return "peak_streak";
    }
    return "one";
}

std::optional<Increment> incrementFromString(const std::string &id)
{
    if (id == "one")
    {
        return Increment::One;
    }
    if (id == "count")
    {
        return Increment::Count;
    }
    if (id == "amount")
    {
        return Increment::Amount;
    }
    if (id == "peak_count")
    {
        return Increment::PeakCount;
    }
    if (id == "peak_streak")
    {
        return Increment::PeakStreak;
    }
    return std::nullopt;
}

bool RuleFilter::matches(const StreamEvent &event) const
{
    if (trackedOnly && !event.tracked)
    {
        return false;
    }
    if (headshot && !event.headshot)
    {
        return false;
    }
    if (won && !event.won)
    {
        return false;
    }
    if ((eco && !event.eco) || (flawless && !event.flawless))
    {
        return false;
    }
    if (killsOverDeaths && event.count <= event.deaths)
    {
        return false;
    }
    if (minDeficit && event.deficit < *minDeficit)
    {
        return false;
    }
    if (minCount && event.count < *minCount)
    {
        return false;
    }
    if (maxCount && event.count > *maxCount)
    {
        return false;
    }
    if (!minAmountByCurrency.empty())
    {
        const auto it = minAmountByCurrency.find(event.currency);
        if (it == minAmountByCurrency.end() || event.amount < it->second)
        {
            return false;
        }
    }
    else if (minAmount && event.amount < *minAmount)
    {
        return false;
    }
    return true;
}

std::int64_t AchievementRule::contribution(const StreamEvent &event) const
{
    switch (increment)
    {
    case Increment::One:
        return 1;
    case Increment::Count:
    case Increment::PeakCount:
        return std::max(0, event.count);
    case Increment::Amount:
        return event.amount > 0.0 ? static_cast<std::int64_t>(std::floor(event.amount)) : 0;
    case Increment::PeakStreak:
        return std::max(0, event.streak);
    }
    return 0;
}

std::vector<AchievementRule> buildDefaultAchievementRules()
{
    std::vector<AchievementRule> rules;

    auto firstBlood = makeRule("first_blood", "Первая кровь", "Первое убийство на стриме", EventKind::Kill, 1);
    firstBlood.filter.trackedOnly = true;
    rules.push_back(firstBlood);

    auto spree = makeRule("killing_spree", "Серия убийств", "5 убийств подряд без смерти", EventKind::Kill, 5,
                          Increment::PeakStreak);
    spree.filter.trackedOnly = true;
    rules.push_back(spree);

    auto unstoppable = makeRule("unstoppable", "Неостановимый", "10 убийств подряд без смерти", EventKind::Kill, 10,
                                Increment::PeakStreak);
    unstoppable.filter.trackedOnly = true;
    rules.push_back(unstoppable);

    auto ace = makeRule("ace_master", "Мастер ACE", "Сделать ACE", EventKind::Ace, 1);
    ace.filter.trackedOnly = true;
    rules.push_back(ace);

    auto clutch = makeRule("clutch_king", "Король клатчей", "Выиграть 3 clutch ситуации", EventKind::Clutch, 3);
    clutch.filter.trackedOnly = true;
    rules.push_back(clutch);

    auto headhunter = makeRule("headhunter", "Охотник за головами", "50 хедшотов", EventKind::Kill, 50);
    headhunter.filter.trackedOnly = true;
    headhunter.filter.headshot = true;
    rules.push_back(headhunter);

    auto survivor = makeRule("survivor", "Выживший", "Выжить с 1 HP", EventKind::LowHealth, 1);
    survivor.filter.trackedOnly = true;
    survivor.filter.maxCount = 1;
    rules.push_back(survivor);

    auto comeback = makeRule("comeback_kid", "Камбэк", "Выиграть матч, проигрывая 5+ раундов", EventKind::MatchEnd, 1);
    comeback.filter.trackedOnly = true;
    comeback.filter.won = true;
    comeback.filter.minDeficit = 5;
    rules.push_back(comeback);

    auto consistent = makeRule("consistent", "Стабильный", "Положительный KD весь матч", EventKind::MatchEnd, 1);
    consistent.filter.trackedOnly = true;
    consistent.filter.won = true;
    consistent.filter.killsOverDeaths = true;
    rules.push_back(consistent);

    auto economical = makeRule("economical", "Экономный", "Выиграть эко раунд", EventKind::RoundEnd, 1);
    economical.filter.trackedOnly = true;
    economical.filter.won = true;
    economical.filter.eco = true;
    rules.push_back(economical);

    auto perfect = makeRule("perfect_round", "Идеальный раунд", "Выиграть раунд без потери HP", EventKind::RoundEnd, 1);
    perfect.filter.trackedOnly = true;
    perfect.filter.won = true;
    perfect.filter.flawless = true;
    rules.push_back(perfect);

    auto ninja = makeRule("ninja", "Ниндзя", "Дефуз бомбы почти без здоровья", EventKind::BombDefused, 1);
    ninja.filter.minCount = 1;
    ninja.filter.maxCount = 10;
    rules.push_back(ninja);

    auto teamPlayer = makeRule("team_player", "Командный игрок", "10 ассистов", EventKind::Assist, 10, Increment::Count);
    teamPlayer.filter.trackedOnly = true;
    rules.push_back(teamPlayer);

    rules.push_back(makeRule("popular", "Популярный", "Получить 10 сообщений в чате", EventKind::ChatMessage, 10));
    rules.push_back(makeRule("loved", "Любимец", "Получить 5 донатов", EventKind::Donation, 5));

    auto whale = makeRule("whale_friend", "Друг китов", "Получить крупный донат", EventKind::Donation, 1);
    whale.filter.minAmountByCurrency = {{"RUB", 1000.0}, {"USD", 15.0}};
    rules.push_back(whale);

    auto raided = makeRule("raided", "Под рейдом", "Получить рейд 50+ зрителей", EventKind::Raid, 1);
    raided.filter.minCount = 50;
    rules.push_back(raided);

    rules.push_back(makeRule("marathon", "Марафонец", "Стримить 4+ часа", EventKind::SessionTick, 240, Increment::PeakCount));
    rules.push_back(makeRule("sub_love", "Любовь подписчиков", "10 новых подписчиков", EventKind::Subscription, 10));
    rules.push_back(makeRule("dedication", "Преданность", "10 матчей", EventKind::MatchEnd, 10));

    return rules;
}

std::optional<std::vector<AchievementRule>> parseAchievementRules(const json::JsonValue &root,
                                                                  std::vector<std::string> &errors)
{
    const json::JsonValue *list = json::getObjectField(root, "achievements");
    if (!list || !list->isArray())
    {
        errors.push_back("achievements must be an array");
        return std::nullopt;
    }

    std::vector<AchievementRule> rules;
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < list->array.size(); ++i)
    {
        auto rule = parseRule(list->array[i], i, errors);
        if (!rule)
        {
            continue;
        }
        if (!seen.insert(rule->id).second)
        {
            errors.push_back("Duplicate achievement id " + rule->id);
            continue;
        }
        rules.push_back(std::move(*rule));
    }
    if (rules.empty())
    {
        return std::nullopt;
    }
    return rules;
}

} // namespace achievements
