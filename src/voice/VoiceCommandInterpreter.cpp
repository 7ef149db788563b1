#include "voice/VoiceCommandInterpreter.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

#include "speech/ReactionPlanner.h"
#include "telemetry/TelemetrySink.h"
#include "voice/TextNormalize.h"

namespace
{

const std::vector<std::string> kMutePrefixes = {"выключ", "отключ", "замут", "заглуш", "mute"};
const std::vector<std::string> kUnmutePrefixes = {"включ", "размут", "unmute"};
const std::vector<std::string> kDecreasePrefixes = {"тише", "потише", "убав", "понизь", "уменьш", "quieter"};
const std::vector<std::string> kIncreasePrefixes = {"громче", "погромче", "прибав", "повысь", "увелич", "louder"};

const std::vector<std::string> kFillerWords = {
    "пожалуйста", "плиз", "плз", "на",  "в",     "до",       "и",        "мне",     "немного", "чуть",
    "очень",      "еще",  "ещё", "процентов", "процента", "процент", "а", "можешь", "давай", "please", "the"};

// Words after which the next unrecognized word names the application.
const std::vector<std::string> kTargetSlotWords = {"сделай", "сделать", "поставь", "установи", "звук",
                                                   "громкость", "уровень", "volume", "set"};

struct NamedLevel
{
    const char *prefix;
    int percent;
};

const std::vector<NamedLevel> kNamedLevels = {
    {"половин", 50}, {"средн", 50}, {"максим", 100}, {"полн", 100}, {"четверть", 25}, {"ноль", 0}};

bool matchesAny(const std::string &token, const std::vector<std::string> &prefixes)
{
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&token](const std::string &prefix) { return text::startsWith(token, prefix); });
}

std::optional<int> parsePercent(const std::string &token)
{
    std::string digits = token;
    if (!digits.empty() && digits.back() == '%')
    {
        digits.pop_back();
    }
    if (digits.empty() || digits.size() > 3)
    {
        return std::nullopt;
    }
    for (char ch : digits)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
        {
            return std::nullopt;
        }
    }
    return std::stoi(digits);
}

std::string join(const std::vector<std::string> &tokens, std::size_t from)
{
    std::string out;
    for (std::size_t i = from; i < tokens.size(); ++i)
    {
        if (!out.empty())
        {
            out += ' ';
        }
        out += tokens[i];
    }
    return out;
}

Intent converse(std::string text)
{
    Intent intent;
    intent.kind = IntentKind::Converse;
    intent.text = std::move(text);
    return intent;
}

} // namespace

VoiceCommandOptions VoiceCommandOptions::defaults()
{
    VoiceCommandOptions options;
    options.wakeWords = {"ирис",  "iris", "ири",  "ириска", "ирисс", "ириса", "айрис", "арис",
                         "ириш",  "ирись", "эрис", "ирисю",  "ирися", "ирису", "ирисе"};
    options.targets = {{"music", {"музык", "яндекс", "yandex", "spotify", "спотифай", "music"}},
                       {"discord", {"дискорд", "discord"}},
                       {"browser", {"браузер", "хром", "chrome", "firefox", "browser"}},
                       {"game", {"игр", "game"}},
                       {SystemTarget, {"систем", "общ", "компьютер", "system"}}};
    options.spokenNames = {{"music", "музыку"},
                           {"discord", "дискорд"},
                           {"browser", "браузер"},
                           {"game", "игру"},
                           {SystemTarget, "звук"}};
    return options;
}

VoiceCommandInterpreter::VoiceCommandInterpreter(VoiceCommandOptions options, std::shared_ptr<TelemetrySink> telemetry)
    : m_options(std::move(options)), m_telemetry(std::move(telemetry))
{
    for (std::string &word : m_options.wakeWords)
    {
        word = text::toLowerUtf8(word);
    }
    for (auto &[name, aliases] : m_options.targets)
    {
        for (std::string &alias : aliases)
        {
            alias = text::toLowerUtf8(alias);
        }
    }
    m_options.volumeStep = std::clamp(m_options.volumeStep, 1, 100);
}

VoiceCommandInterpreter::Action VoiceCommandInterpreter::classifyAction(const std::string &token) const
{
    // "выключи" must not read as "включи", so mute is checked first.
    if (matchesAny(token, kMutePrefixes))
    {
        return Action::Mute;
    }
    if (matchesAny(token, kUnmutePrefixes))
    {
        return Action::Unmute;
    }
    if (matchesAny(token, kDecreasePrefixes))
    {
        return Action::Decrease;
    }
    if (matchesAny(token, kIncreasePrefixes))
    {
        return Action::Increase;
    }
    return Action::None;
}

std::optional<std::string> VoiceCommandInterpreter::classifyTarget(const std::string &token) const
{
    for (const auto &[name, aliases] : m_options.targets)
    {
        if (matchesAny(token, aliases))
        {
            return name;
        }
    }
    return std::nullopt;
}

std::string VoiceCommandInterpreter::spokenName(const std::string &target) const
{
    const auto it = m_options.spokenNames.find(target);
    return it == m_options.spokenNames.end() ? target : it->second;
}

VoiceOutcome VoiceCommandInterpreter::interpret(const std::string &utterance) const
{
    VoiceOutcome outcome;
    const std::vector<std::string> tokens = text::tokenize(utterance);
    if (tokens.empty() ||
        std::find(m_options.wakeWords.begin(), m_options.wakeWords.end(), tokens.front()) == m_options.wakeWords.end())
    {
        return outcome;
    }
    outcome.wake = true;

    const std::string remainder = join(tokens, 1);
    std::set<Action> actions;
    std::set<std::string> targets;
    std::optional<std::string> unknownTarget;
    std::optional<int> level;
    bool malformedLevel = false;
    bool targetSlot = false;

    for (std::size_t i = 1; i < tokens.size(); ++i)
    {
        const std::string &token = tokens[i];
        if (const Action action = classifyAction(token); action != Action::None)
        {
            actions.insert(action);
            targetSlot = true;
            continue;
        }
        if (auto target = classifyTarget(token))
        {
            targets.insert(*target);
            targetSlot = false;
            continue;
        }
        if (auto percent = parsePercent(token))
        {
            if (*percent > 100 || level)
            {
                malformedLevel = true;
            }
            level = percent;
            targetSlot = true;
            continue;
        }
        const auto named = std::find_if(kNamedLevels.begin(), kNamedLevels.end(),
                                        [&token](const NamedLevel &entry) { return text::startsWith(token, entry.prefix); });
        if (named != kNamedLevels.end())
        {
            if (level)
            {
                malformedLevel = true;
            }
            level = named->percent;
            targetSlot = true;
            continue;
        }
        if (std::find(kTargetSlotWords.begin(), kTargetSlotWords.end(), token) != kTargetSlotWords.end())
        {
            targetSlot = true;
            continue;
        }
        if (std::find(kFillerWords.begin(), kFillerWords.end(), token) != kFillerWords.end())
        {
            continue;
        }
        if (targetSlot && !unknownTarget)
        {
            unknownTarget = token;
        }
        targetSlot = false;
    }

    const bool command = !actions.empty() || level.has_value();
    if (!command || actions.size() > 1 || targets.size() > 1 || malformedLevel)
    {
        outcome.intent = converse(remainder);
        return outcome;
    }

    // Stray words elsewhere in the command are ignored and the system volume is meant.
    if (targets.empty() && unknownTarget)
    {
        const std::string &requested = *unknownTarget;
        telemetry::emit(m_telemetry, "voice.target_not_found", {{"target", requested}, {"utterance", remainder}});
        outcome.feedback = ReactionPlanner::commandFeedback("Не нашла приложение " + requested + ".", "voice:feedback");
        return outcome;
    }

    Intent intent;
    intent.target = targets.empty() ? std::string(SystemTarget) : *targets.begin();
    const Action action = actions.empty() ? Action::None : *actions.begin();
    switch (action)
    {
    case Action::Mute:
        intent.kind = IntentKind::Mute;
        break;
    case Action::Unmute:
        intent.kind = IntentKind::Unmute;
        break;
    case Action::Decrease:
        intent.kind = IntentKind::SetVolume;
        intent.delta = -(level ? *level : m_options.volumeStep);
        break;
    case Action::Increase:
        intent.kind = IntentKind::SetVolume;
        intent.delta = level ? *level : m_options.volumeStep;
        break;
    case Action::None:
        intent.kind = IntentKind::SetVolume;
        intent.percent = level;
        break;
    }
    telemetry::emit(m_telemetry, "voice.intent",
                    {{"kind", intentKindToString(intent.kind)}, {"target", intent.target}});
    outcome.intent = std::move(intent);
    return outcome;
}

SpeechRequest VoiceCommandInterpreter::mixerFeedback(const Intent &intent, const MixerResult &result) const
{
    const std::string name = spokenName(intent.target);
    std::string line;
    switch (intent.kind)
    {
    case IntentKind::Mute:
        line = result.success ? "Выключила " + name + "." : "Не смогла выключить " + name + ".";
        break;
    case IntentKind::Unmute:
        line = result.success ? "Включила " + name + "." : "Не смогла включить " + name + ".";
        break;
    case IntentKind::SetVolume:
        if (result.success)
        {
            line = "Громкость: " + name + " на " + std::to_string(result.volume) + "%.";
        }
        else
        {
            line = "Не смогла изменить громкость: " + name + ".";
        }
        break;
    case IntentKind::Converse:
        line = "Не поняла команду.";
        break;
    }
    return ReactionPlanner::commandFeedback(std::move(line), "voice:feedback");
}
