#include "speech/ReactionPlanner.h"

#include <utility>

#include "telemetry/TelemetrySink.h"

namespace
{

std::string roundKey(const char *prefix, const StreamEvent &event)
{
    return std::string(prefix) + ":" + event.mapName + ":r" + std::to_string(event.round);
}

} // namespace

NarrationCooldowns NarrationCooldowns::defaults()
{
    NarrationCooldowns cooldowns;
    cooldowns.millis = {{"kill", 3000},         {"death", 5000},          {"round_end", 2000},
                        {"bomb_planted", 10000}, {"bomb_defused", 10000}, {"bomb_exploded", 10000},
                        {"chat", 8000},          {"ambient", 25000}};
    return cooldowns;
}

ReactionPlanner::ReactionPlanner(std::shared_ptr<TemplateNarrator> templates,
                                 std::shared_ptr<NarrationGenerator> generator,
                                 NarrationCooldowns cooldowns,
                                 std::shared_ptr<TelemetrySink> telemetry)
    : m_templates(templates ? std::move(templates) : std::make_shared<TemplateNarrator>())
    , m_generator(std::move(generator))
    , m_cooldowns(std::move(cooldowns))
    , m_telemetry(std::move(telemetry))
{
}

bool ReactionPlanner::admit(const std::string &category, std::int64_t nowMs)
{
    const auto cooldown = m_cooldowns.millis.find(category);
    if (cooldown != m_cooldowns.millis.end())
    {
        const auto last = m_lastSpoken.find(category);
        if (last != m_lastSpoken.end() && nowMs - last->second < cooldown->second)
        {
            telemetry::emit(m_telemetry, "planner.cooldown",
                            {{"category", category}, {"remaining_ms", std::to_string(cooldown->second - (nowMs - last->second))}});
            return false;
        }
    }
    m_lastSpoken[category] = nowMs;
    return true;
}

SpeechRequest ReactionPlanner::narrate(const std::string &category, SpeechPriority priority, const StreamEvent &event,
                                       std::string dedupKey)
{
    SpeechRequest request;
    request.category = category;
    request.priority = priority;
    request.dedupKey = std::move(dedupKey);

    NarrationPrompt prompt{category, event};
    request.fallbackText = m_templates->phrase(prompt);
    if (m_generator)
    {
        auto generator = m_generator;
        request.producer = [generator, prompt]() { return generator->generate(prompt); };
    }
    else
    {
        request.text = request.fallbackText;
    }
    return request;
}

std::optional<SpeechRequest> ReactionPlanner::plan(const StreamEvent &event, std::int64_t nowMs)
{
    std::string category;
    SpeechPriority priority = SpeechPriority::Combat;
    std::string dedupKey;

    switch (event.kind)
    {
    case EventKind::Unlock:
        {
            SpeechRequest request;
            request.category = "achievement";
            request.priority = SpeechPriority::Achievement;
            request.text = "Достижение разблокировано! " + event.text + "!";
            request.dedupKey = "achievement:" + event.achievementId;
            return request;
        }
    case EventKind::Donation:
        category = "donation";
        priority = SpeechPriority::Donation;
        break;
    case EventKind::Subscription:
        category = "subscription";
        priority = SpeechPriority::Donation;
        break;
    case EventKind::Raid:
        category = "raid";
        priority = SpeechPriority::Donation;
        break;
    case EventKind::Ace:
        if (!event.tracked)
        {
            return std::nullopt;
        }
        // Shares the kill key so a queued kill line collapses into the ace call.
        category = "ace";
        priority = SpeechPriority::Highlight;
        dedupKey = roundKey("combat", event);
        break;
    case EventKind::Clutch:
        category = "clutch";
        priority = SpeechPriority::Highlight;
        dedupKey = roundKey("clutch", event);
        break;
    case EventKind::Mvp:
        if (!event.tracked)
        {
            return std::nullopt;
        }
        category = "mvp";
        priority = SpeechPriority::Highlight;
        dedupKey = roundKey("mvp", event);
        break;
    case EventKind::MatchEnd:
        category = "match_end";
        priority = SpeechPriority::Highlight;
        dedupKey = "match_end:" + event.mapName;
        break;
    case EventKind::Kill:
        if (!event.tracked)
        {
            return std::nullopt;
        }
        category = "kill";
        dedupKey = roundKey("combat", event);
        break;
    case EventKind::Death:
        if (!event.tracked)
        {
            return std::nullopt;
        }
        category = "death";
        dedupKey = roundKey("death", event);
        break;
    case EventKind::LowHealth:
        category = "low_health";
        dedupKey = roundKey("low_health", event);
        break;
    case EventKind::BombPlanted:
        category = "bomb_planted";
        dedupKey = "bomb";
        break;
    case EventKind::BombDefused:
        category = "bomb_defused";
        dedupKey = "bomb";
        break;
    case EventKind::BombExploded:
        category = "bomb_exploded";
        dedupKey = "bomb";
        break;
    case EventKind::RoundEnd:
        category = "round_end";
        dedupKey = "round_end";
        break;
    case EventKind::ChatMessage:
        category = "chat";
        priority = SpeechPriority::ChatReply;
        dedupKey = "chat";
        break;
    case EventKind::Follow:
        category = "follow";
        priority = SpeechPriority::ChatReply;
        break;
    case EventKind::MapChange:
    case EventKind::RoundStart:
    case EventKind::Assist:
    case EventKind::SessionTick:
        return std::nullopt;
    }

    if (!admit(category, nowMs))
    {
        return std::nullopt;
    }
    return narrate(category, priority, event, std::move(dedupKey));
}

std::optional<SpeechRequest> ReactionPlanner::planAmbient(std::int64_t nowMs)
{
    if (!admit("ambient", nowMs))
    {
        return std::nullopt;
    }
    StreamEvent event;
    event.kind = EventKind::SessionTick;
    event.timestampMs = nowMs;
    return narrate("ambient", SpeechPriority::Ambient, event, "ambient");
}

SpeechRequest ReactionPlanner::commandFeedback(std::string text, std::string dedupKey)
{
    SpeechRequest request;
    request.category = "command_feedback";
    request.priority = SpeechPriority::CommandFeedback;
    request.text = std::move(text);
    request.dedupKey = std::move(dedupKey);
    return request;
}
