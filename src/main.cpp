#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "achievements/ProgressStore.h"
#include "app/CohostApplication.h"
#include "audio/CommandSpeechSynthesizer.h"
#include "audio/SdlAudioPlayback.h"
#include "audio/SynthesizedSpeechOutput.h"
#include "config/AppConfigLoader.h"
#include "json/JsonUtils.h"
#include "speech/SpeechOutput.h"
#include "telemetry/ConsoleTelemetrySink.h"
#include "telemetry/FileTelemetrySink.h"
#include "telemetry/TelemetrySink.h"
#include "voice/AudioMixer.h"

namespace
{

std::atomic<bool> g_stopRequested{false};

void handleSignal(int)
{
    g_stopRequested.store(true);
}

struct CommandLine
{
    std::filesystem::path configDir{"config"};
    std::optional<std::filesystem::path> telemetryDir;
    std::optional<std::filesystem::path> replayFile;
    bool dryRun = false;
};

bool matchPrefix(std::string_view arg, std::string_view prefix, std::string &value)
{
    if (arg.substr(0, prefix.size()) != prefix)
    {
        return false;
    }
    value = std::string(arg.substr(prefix.size()));
    return true;
}

std::optional<CommandLine> parseCommandLine(int argc, char **argv)
{
    CommandLine options;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        std::string value;
        if (matchPrefix(arg, "--config=", value))
        {
            options.configDir = value;
        }
        else if (matchPrefix(arg, "--telemetry=", value))
        {
            options.telemetryDir = std::filesystem::path(value);
        }
        else if (matchPrefix(arg, "--replay=", value))
        {
            options.replayFile = std::filesystem::path(value);
        }
        else if (arg == "--dry-run")
        {
            options.dryRun = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cout << "Usage: iris_cohost [--config=<dir>] [--telemetry=<dir>] [--replay=<file>] [--dry-run]\n"
                         "Reads JSON lines {\"type\": \"snapshot\"|\"feed\"|\"utterance\", ...} from the replay file or stdin.\n";
            return std::nullopt;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << '\n';
            return std::nullopt;
        }
    }
    return options;
}

// Session files plus, when enabled, a mirror on stderr. The console also catches records the
// file sink could not write.
std::shared_ptr<TelemetrySink> buildTelemetry(const TelemetryOptions &options, const std::optional<std::filesystem::path> &overrideDir)
{
    std::shared_ptr<TelemetrySink> console = std::make_shared<ConsoleTelemetrySink>(std::cerr);
    const std::filesystem::path directory = overrideDir ? *overrideDir : std::filesystem::path(options.outputDirectory);
    if (directory.empty())
    {
        return options.console ? console : std::make_shared<NullTelemetrySink>();
    }

    TelemetrySettings settings;
    settings.directory = directory;
    settings.rotationBytes = options.rotationBytes;
    settings.maxFiles = options.maxFiles;
    if (!options.console)
    {
        return std::make_shared<FileTelemetrySink>(std::move(settings), console);
    }
    auto file = std::make_shared<FileTelemetrySink>(std::move(settings));
    return std::make_shared<FanoutTelemetrySink>(std::vector<std::shared_ptr<TelemetrySink>>{file, console});
}

std::shared_ptr<SpeechOutput> buildSpeechOutput(const AppConfig &config, bool dryRun,
                                                const std::shared_ptr<TelemetrySink> &telemetry)
{
    if (dryRun || config.speech.engine == SpeechEngine::Console)
    {
        return std::make_shared<ConsoleSpeechOutput>();
    }
    auto synthesizer = std::make_unique<CommandSpeechSynthesizer>(config.speech.command, telemetry);
    auto playback = std::make_unique<SdlAudioPlayback>(config.speech.audioDevice, telemetry);
    std::string error;
    if (!playback->initialize(error))
    {
        std::cerr << error << "\nFalling back to console narration.\n";
        telemetry::emit(telemetry, "audio.unavailable", {{"error", error}});
        return std::make_shared<ConsoleSpeechOutput>();
    }
    return std::make_shared<SynthesizedSpeechOutput>(std::move(synthesizer), std::move(playback), telemetry);
}

// Returns false for lines that could not be understood.
bool postReplayLine(CohostApplication &app, const std::string &line, const std::shared_ptr<TelemetrySink> &telemetry)
{
    json::JsonParseError error;
    auto root = json::parseJson(line, &error);
    if (!root || !root->isObject())
    {
        telemetry::emit(telemetry, "replay.invalid_line", {{"offset", std::to_string(error.offset)}, {"error", error.message}});
        return false;
    }

    const int delayMs = json::getInt(*root, "delay_ms", 0);
    if (delayMs > 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }

    const std::string type = json::getString(*root, "type", "");
    if (type == "utterance")
    {
        return app.postUtterance(json::getString(*root, "text", ""));
    }
    const json::JsonValue *document = json::getObjectField(*root, "document");
    if (!document)
    {
        telemetry::emit(telemetry, "replay.invalid_line", {{"type", type}, {"error", "missing document"}});
        return false;
    }
    if (type == "snapshot")
    {
        return app.postSnapshot(json::serializeJson(*document));
    }
    if (type == "feed")
    {
        return app.postFeedEvent(json::serializeJson(*document));
    }
    telemetry::emit(telemetry, "replay.invalid_line", {{"type", type}, {"error", "unknown type"}});
    return false;
}

} // namespace

int main(int argc, char **argv)
{
    auto commandLine = parseCommandLine(argc, argv);
    if (!commandLine)
    {
        return 2;
    }

    AppConfigLoader loader(std::filesystem::absolute(commandLine->configDir));
    AppConfigLoadResult configResult = loader.load();
    if (!configResult.success)
    {
        std::cerr << "AppConfig loaded with errors, running with fallback values.\n";
        for (const auto &error : configResult.errors)
        {
            std::cerr << "  " << error.file << ": " << error.message << '\n';
        }
    }
    AppConfig config = std::move(configResult.config);

    auto telemetry = buildTelemetry(config.telemetry, commandLine->telemetryDir);
    if (!configResult.success)
    {
        telemetry::emit(telemetry, "config.errors", {{"count", std::to_string(configResult.errors.size())}});
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif

    CohostCollaborators collaborators;
    collaborators.telemetry = telemetry;
    collaborators.speechOutput = buildSpeechOutput(config, commandLine->dryRun, telemetry);
    collaborators.mixer = std::make_shared<LoggingAudioMixer>(telemetry);
    collaborators.progressStore = std::make_unique<achievements::JsonProgressStore>(config.achievementStore.storePath);

    auto app = std::make_shared<CohostApplication>(std::move(config), std::move(collaborators));
    if (!app->start())
    {
        std::cerr << "Failed to start the co-host.\n";
        return 1;
    }

    auto replayStream = std::make_shared<std::ifstream>();
    if (commandLine->replayFile)
    {
        replayStream->open(*commandLine->replayFile);
        if (!replayStream->is_open())
        {
            std::cerr << "Failed to open replay file " << commandLine->replayFile->string() << '\n';
            app->shutdown();
            return 1;
        }
    }
    const bool fromFile = commandLine->replayFile.has_value();

    auto inputDone = std::make_shared<std::atomic<bool>>(false);
    std::thread reader([app, replayStream, fromFile, inputDone, telemetry]() {
        std::istream &input = fromFile ? static_cast<std::istream &>(*replayStream) : std::cin;
        std::string line;
        while (!g_stopRequested.load() && std::getline(input, line))
        {
            if (line.empty() || line.front() == '#')
            {
                continue;
            }
            postReplayLine(*app, line, telemetry);
        }
        inputDone->store(true);
    });

    while (!g_stopRequested.load() && !inputDone->load())
    {
        app->tick();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (inputDone->load())
    {
        reader.join();
        while (!g_stopRequested.load() && !app->waitUntilDrained(std::chrono::milliseconds(200)))
        {
            app->tick();
        }
    }
    else
    {
        // The reader may be blocked on stdin; it owns references to everything it touches.
        reader.detach();
    }

    app->shutdown();
    const CohostStats stats = app->stats();
    std::cerr << "Snapshots: " << stats.snapshotsAccepted << " accepted, " << stats.snapshotsRejected
              << " rejected; events: " << stats.eventsDerived << "; unlocks: " << stats.unlocks << '\n';
    return 0;
}
