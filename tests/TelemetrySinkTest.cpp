#include "telemetry/ConsoleTelemetrySink.h"
#include "telemetry/FileTelemetrySink.h"

#include "TestSupport.h"
#include "json/JsonUtils.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace
{

namespace fs = std::filesystem;

fs::path scratchDirectory(const std::string &label)
{
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() / ("iris_telemetry_" + label + "_" + std::to_string(stamp));
}

std::vector<std::string> readLines(const fs::path &path)
{
    std::vector<std::string> lines;
    std::ifstream stream(path);
    std::string line;
    while (std::getline(stream, line))
    {
        lines.push_back(line);
    }
    return lines;
}

std::size_t countSessionFiles(const fs::path &dir)
{
    std::size_t count = 0;
    for (const auto &entry : fs::directory_iterator(dir))
    {
        if (entry.path().extension() == ".jsonl")
        {
            ++count;
        }
    }
    return count;
}

bool testFileSinkWritesJsonLines()
{
    const fs::path dir = scratchDirectory("lines");
    bool ok = true;
    {
        TelemetrySettings settings;
        settings.directory = dir;
        settings.rotationBytes = 0;
        FileTelemetrySink sink(settings);
        sink.recordEvent("cohost.started", {{"queue_capacity", "16"}});
        sink.recordEvent("arbiter.spoken", {{"category", "kill"}});
        sink.flush();

        const std::vector<std::string> lines = readLines(sink.currentFile());
        if (lines.size() != 2)
        {
            std::cerr << "Expected two telemetry lines, got " << lines.size() << '\n';
            ok = false;
        }
        else
        {
            const auto first = json::parseJson(lines[0]);
            if (!first || json::getString(*first, "event", "") != "cohost.started" ||
                json::getInt(*first, "seq", 0) != 1 || json::getString(*first, "queue_capacity", "") != "16" ||
                json::getInt64(*first, "ts_ms", 0) <= 0)
            {
                std::cerr << "Telemetry line did not carry the event fields" << '\n';
                ok = false;
            }
        }
        if (sink.recordsWritten() != 2)
        {
            std::cerr << "Record counter mismatch" << '\n';
            ok = false;
        }
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    return ok;
}

bool testRotationAndRetention()
{
    const fs::path dir = scratchDirectory("rotation");
    bool ok = true;
    {
        TelemetrySettings settings;
        settings.directory = dir;
        settings.rotationBytes = 1;
        settings.maxFiles = 2;
        FileTelemetrySink sink(settings);
        for (int i = 0; i < 5; ++i)
        {
            sink.recordEvent("stream.event", {{"n", std::to_string(i)}});
        }
        sink.flush();
        if (countSessionFiles(dir) != 2)
        {
            std::cerr << "Retention did not keep exactly two session files" << '\n';
            ok = false;
        }
        const std::vector<std::string> lines = readLines(sink.currentFile());
        if (lines.empty() || lines.front().find("telemetry.rotated") == std::string::npos)
        {
            std::cerr << "Rotated session did not start with a rotation record" << '\n';
            ok = false;
        }
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    return ok;
}

bool testUnwritableDirectoryFallsBack()
{
    const fs::path dir = scratchDirectory("blocked");
    fs::create_directories(dir);
    const fs::path blocker = dir / "not_a_directory";
    {
        std::ofstream stream(blocker);
        stream << "x";
    }

    auto fallback = std::make_shared<RecordingTelemetrySink>();
    TelemetrySettings settings;
    settings.directory = blocker / "logs";
    FileTelemetrySink sink(settings, fallback);
    sink.recordEvent("cohost.started", {});

    bool ok = true;
    if (fallback->count("telemetry.directory_unavailable") != 1 || fallback->count("cohost.started") != 1)
    {
        std::cerr << "Records were not redirected to the fallback sink" << '\n';
        ok = false;
    }
    if (!sink.currentFile().empty() || sink.recordsWritten() != 0)
    {
        std::cerr << "File sink claims to have written without a directory" << '\n';
        ok = false;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    return ok;
}

bool testConsoleAndFanout()
{
    std::ostringstream out;
    auto console = std::make_shared<ConsoleTelemetrySink>(out);
    auto recorder = std::make_shared<RecordingTelemetrySink>();
    FanoutTelemetrySink fanout({console, nullptr, recorder});
    fanout.recordEvent("voice.intent", {{"target", "music"}, {"kind", "set_volume"}, {"utterance", "сделай тише"}});
    fanout.flush();

    const std::string line = out.str();
    if (line.find("] voice.intent kind=set_volume target=music utterance=\"сделай тише\"\n") == std::string::npos)
    {
        std::cerr << "Console line format mismatch: " << line;
        return false;
    }
    if (recorder->count("voice.intent") != 1)
    {
        std::cerr << "Fanout skipped a sink" << '\n';
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;
    if (!testFileSinkWritesJsonLines())
    {
        success = false;
    }
    if (!testRotationAndRetention())
    {
        success = false;
    }
    if (!testUnwritableDirectoryFallsBack())
    {
        success = false;
    }
    if (!testConsoleAndFanout())
    {
        success = false;
    }
    return success ? 0 : 1;
}
