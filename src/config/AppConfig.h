#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "achievements/AchievementRules.h"
#include "speech/ReactionArbiter.h"
#include "speech/ReactionPlanner.h"
#include "voice/VoiceCommandInterpreter.h"

struct TelemetryOptions
{
    std::string outputDirectory{"logs"};
    std::uintmax_t rotationBytes = 4ull * 1024ull * 1024ull;
    std::size_t maxFiles = 10;
    bool console = true;
};

enum class SpeechEngine : std::uint8_t
{
    Console = 0,
    Command
};

const char *speechEngineToString(SpeechEngine engine);

struct SpeechConfig
{
    SpeechEngine engine = SpeechEngine::Console;
    // argv of the external synthesizer: text on stdin, WAV on stdout.
    std::vector<std::string> command;
    // Empty selects the default playback device.
    std::string audioDevice;
};

struct AchievementStoreConfig
{
    std::string storePath{"stream_stats.json"};
    std::size_t historyLimit = 1024;
};

struct IngestConfig
{
    std::size_t inboxCapacity = 256;
    // Overrides provider.steamid when set.
    std::string trackedPlayer;
};

struct AppConfig
{
    TelemetryOptions telemetry{};
    ArbiterOptions arbiter{};
    int idleCommentSeconds = 120;
    SpeechConfig speech{};
    VoiceCommandOptions voice = VoiceCommandOptions::defaults();
    AchievementStoreConfig achievementStore{};
    std::vector<achievements::AchievementRule> achievements = achievements::buildDefaultAchievementRules();
    IngestConfig ingest{};
    NarrationCooldowns cooldowns = NarrationCooldowns::defaults();
};
