#include "config/AppConfigLoader.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

#include "json/JsonUtils.h"

namespace fs = std::filesystem;

namespace
{

constexpr int kAppSchemaVersion = 1;
constexpr int kAchievementsSchemaVersion = 1;

// Acknowledgements that must always be spoken; configured cooldowns for them are refused.
const std::vector<std::string> kUnthrottledCategories = {"donation", "subscription", "raid", "achievement",
                                                         "command_feedback"};

AppConfigLoadError makeError(const fs::path &path, std::string message)
{
    AppConfigLoadError error;
    error.file = path.lexically_normal().string();
    error.message = std::move(message);
    return error;
}

std::optional<json::JsonValue> readLocalJson(const fs::path &path, std::vector<AppConfigLoadError> &errors)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        errors.push_back(makeError(path, "Failed to open JSON"));
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    json::JsonParseError parseError;
    auto parsed = json::parseJson(buffer.str(), &parseError);
    if (!parsed)
    {
        errors.push_back(makeError(path, "Failed to parse JSON at offset " + std::to_string(parseError.offset) + ": " +
                                             parseError.message));
        return std::nullopt;
    }
    return parsed;
}

bool validateSchema(const json::JsonValue &root, int expected, const fs::path &path, std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *schemaValue = json::getObjectField(root, "schema_version");
    if (!schemaValue || schemaValue->type != json::JsonValue::Type::Number)
    {
        errors.push_back(makeError(path, "Missing schema_version"));
        return false;
    }
    const int schema = static_cast<int>(schemaValue->number);
    if (schema != expected)
    {
        errors.push_back(makeError(path, "schema_version mismatch"));
        return false;
    }
    return true;
}

void parseTelemetry(const json::JsonValue &node, TelemetryOptions &options)
{
    const std::string directory = json::getString(node, "directory", options.outputDirectory);
    if (!directory.empty())
    {
        options.outputDirectory = directory;
    }
    const double rotationBytes = json::getDouble(node, "rotation_bytes", static_cast<double>(options.rotationBytes));
    if (rotationBytes > 0.0)
    {
        options.rotationBytes = static_cast<std::uintmax_t>(rotationBytes);
    }
    const int retention = json::getInt(node, "retention_files", static_cast<int>(options.maxFiles));
    if (retention > 0)
    {
        options.maxFiles = static_cast<std::size_t>(retention);
    }
    options.console = json::getBool(node, "console", options.console);
}

void parseArbiter(const json::JsonValue &node, AppConfig &config, const fs::path &path,
                  std::vector<AppConfigLoadError> &errors)
{
    ArbiterOptions &options = config.arbiter;
    const int capacity = json::getInt(node, "queue_capacity", static_cast<int>(options.queueCapacity));
    if (capacity < 1)
    {
        errors.push_back(makeError(path, "arbiter.queue_capacity must be at least 1"));
    }
    else
    {
        options.queueCapacity = static_cast<std::size_t>(capacity);
    }

    const int timeoutMs = json::getInt(node, "speech_timeout_ms", static_cast<int>(options.speechTimeout.count()));
    if (timeoutMs < 1)
    {
        errors.push_back(makeError(path, "arbiter.speech_timeout_ms must be positive"));
    }
    else
    {
        options.speechTimeout = std::chrono::milliseconds(timeoutMs);
    }

    options.retryFailed = json::getBool(node, "retry_failed", options.retryFailed);
    config.idleCommentSeconds = std::max(0, json::getInt(node, "idle_comment_seconds", config.idleCommentSeconds));
}

void parseSpeech(const json::JsonValue &node, SpeechConfig &speech, const fs::path &path,
                 std::vector<AppConfigLoadError> &errors)
{
    const std::string engine = json::getString(node, "engine", speechEngineToString(speech.engine));
    if (engine == "console")
    {
        speech.engine = SpeechEngine::Console;
    }
    else if (engine == "command")
    {
        speech.engine = SpeechEngine::Command;
    }
    else
    {
        errors.push_back(makeError(path, "Unknown speech.engine '" + engine + "'"));
    }
    speech.command = json::getStringArray(node, "command");
    speech.audioDevice = json::getString(node, "audio_device", speech.audioDevice);
    if (speech.engine == SpeechEngine::Command && speech.command.empty())
    {
        errors.push_back(makeError(path, "speech.command is required for the command engine"));
        speech.engine = SpeechEngine::Console;
    }
}

void parseVoice(const json::JsonValue &node, VoiceCommandOptions &voice, const fs::path &path,
                std::vector<AppConfigLoadError> &errors)
{
    auto wakeWords = json::getStringArray(node, "wake_words");
    if (!wakeWords.empty())
    {
        voice.wakeWords = std::move(wakeWords);
    }
    const int step = json::getInt(node, "volume_step", voice.volumeStep);
    if (step < 1 || step > 100)
    {
        errors.push_back(makeError(path, "voice.volume_step must be within 1..100"));
    }
    else
    {
        voice.volumeStep = step;
    }

    if (const json::JsonValue *targets = json::getObjectField(node, "targets"))
    {
        if (!targets->isObject())
        {
            errors.push_back(makeError(path, "voice.targets must be an object"));
            return;
        }
        std::map<std::string, std::vector<std::string>> parsed;
        for (const auto &[name, aliases] : targets->object)
        {
            std::vector<std::string> words;
            if (aliases.isArray())
            {
                for (const auto &alias : aliases.array)
                {
                    if (alias.type == json::JsonValue::Type::String && !alias.string.empty())
                    {
                        words.push_back(alias.string);
                    }
                }
            }
            if (words.empty())
            {
                errors.push_back(makeError(path, "voice.targets." + name + " has no aliases"));
                continue;
            }
            parsed.emplace(name, std::move(words));
        }
        if (!parsed.empty())
        {
            voice.targets = std::move(parsed);
        }
    }

    if (const json::JsonValue *names = json::getObjectField(node, "spoken_names"))
    {
        for (const auto &[name, value] : names->object)
        {
            if (value.type == json::JsonValue::Type::String)
            {
                voice.spokenNames[name] = value.string;
            }
        }
    }
}

void parseNarration(const json::JsonValue &node, NarrationCooldowns &cooldowns, const fs::path &path,
                    std::vector<AppConfigLoadError> &errors)
{
    const json::JsonValue *entries = json::getObjectField(node, "cooldowns");
    if (!entries)
    {
        return;
    }
    for (const auto &[category, value] : entries->object)
    {
        if (value.type != json::JsonValue::Type::Number || value.number < 0.0)
        {
            errors.push_back(makeError(path, "narration.cooldowns." + category + " must be a non-negative number"));
            continue;
        }
        if (std::find(kUnthrottledCategories.begin(), kUnthrottledCategories.end(), category) !=
            kUnthrottledCategories.end())
        {
            errors.push_back(makeError(path, "narration.cooldowns." + category + " cannot be throttled"));
            continue;
        }
        cooldowns.millis[category] = static_cast<std::int64_t>(value.number * 1000.0);
    }
}

} // namespace

AppConfigLoader::AppConfigLoader(fs::path configRoot) : m_configRoot(std::move(configRoot)) {}

AppConfigLoadResult AppConfigLoader::load()
{
    AppConfigLoadResult result;
    result.success = false;

    std::vector<AppConfigLoadError> errors;

    const fs::path appPath = m_configRoot / "app.json";
    auto appJson = readLocalJson(appPath, errors);
    if (!appJson)
    {
        result.errors = std::move(errors);
        return result;
    }
    if (!validateSchema(*appJson, kAppSchemaVersion, appPath, errors))
    {
        result.errors = std::move(errors);
        return result;
    }

    AppConfig config;
    if (const json::JsonValue *telemetryObj = json::getObjectField(*appJson, "telemetry"))
    {
        parseTelemetry(*telemetryObj, config.telemetry);
    }
    if (const json::JsonValue *arbiterObj = json::getObjectField(*appJson, "arbiter"))
    {
        parseArbiter(*arbiterObj, config, appPath, errors);
    }
    if (const json::JsonValue *speechObj = json::getObjectField(*appJson, "speech"))
    {
        parseSpeech(*speechObj, config.speech, appPath, errors);
    }
    if (const json::JsonValue *voiceObj = json::getObjectField(*appJson, "voice"))
    {
        parseVoice(*voiceObj, config.voice, appPath, errors);
    }
    if (const json::JsonValue *storeObj = json::getObjectField(*appJson, "achievements"))
    {
        config.achievementStore.storePath = json::getString(*storeObj, "store_path", config.achievementStore.storePath);
        const int history = json::getInt(*storeObj, "history_limit", static_cast<int>(config.achievementStore.historyLimit));
        if (history > 0)
        {
            config.achievementStore.historyLimit = static_cast<std::size_t>(history);
        }
    }
    if (const json::JsonValue *ingestObj = json::getObjectField(*appJson, "ingest"))
    {
        const int capacity = json::getInt(*ingestObj, "inbox_capacity", static_cast<int>(config.ingest.inboxCapacity));
        if (capacity > 0)
        {
            config.ingest.inboxCapacity = static_cast<std::size_t>(capacity);
        }
        config.ingest.trackedPlayer = json::getString(*ingestObj, "tracked_player", config.ingest.trackedPlayer);
    }
    if (const json::JsonValue *narrationObj = json::getObjectField(*appJson, "narration"))
    {
        parseNarration(*narrationObj, config.cooldowns, appPath, errors);
    }

    const fs::path achievementsPath = m_configRoot / "achievements.json";
    std::optional<std::vector<achievements::AchievementRule>> rules;
    if (auto achievementsJson = readLocalJson(achievementsPath, errors))
    {
        if (validateSchema(*achievementsJson, kAchievementsSchemaVersion, achievementsPath, errors))
        {
            std::vector<std::string> ruleErrors;
            rules = achievements::parseAchievementRules(*achievementsJson, ruleErrors);
            for (auto &message : ruleErrors)
            {
                errors.push_back(makeError(achievementsPath, std::move(message)));
            }
        }
    }
    if (rules)
    {
        config.achievements = std::move(*rules);
    }
    else
    {
        errors.push_back(makeError(achievementsPath, "Failed to parse achievements, using defaults"));
    }

    result.config = std::move(config);
    result.errors = std::move(errors);
    result.success = result.errors.empty();
    return result;
}
