#include "telemetry/FileTelemetrySink.h"

#include "json/JsonUtils.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{

constexpr const char *kSessionPrefix = "iris_";
constexpr const char *kSessionExtension = ".jsonl";

bool isSessionFile(const fs::directory_entry &entry)
{
    const fs::path &path = entry.path();
    return entry.is_regular_file() && path.extension() == kSessionExtension &&
           path.filename().string().rfind(kSessionPrefix, 0) == 0;
}

std::string sessionFileName(std::int64_t epochMs, std::uint64_t index)
{
    std::ostringstream oss;
    oss << kSessionPrefix << telemetry::formatLocalTime(epochMs, "%Y%m%d_%H%M%S") << '_' << std::setw(4)
        << std::setfill('0') << index << kSessionExtension;
    return oss.str();
}

} // namespace

FileTelemetrySink::FileTelemetrySink(TelemetrySettings settings, std::shared_ptr<TelemetrySink> fallback)
    : m_settings(std::move(settings)), m_fallback(std::move(fallback))
{
    if (m_settings.directory.empty())
    {
        m_settings.directory = TelemetrySettings{}.directory;
    }
}

FileTelemetrySink::~FileTelemetrySink()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    closeSessionLocked();
}

void FileTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_stream.is_open() && !openSessionLocked())
    {
        fallbackLocked(eventName, payload);
        return;
    }
    if (!appendLocked(eventName, payload))
    {
        return;
    }
    if (m_settings.rotationBytes == 0 || m_sessionBytes < m_settings.rotationBytes)
    {
        return;
    }

    const std::string finished = m_currentFile.filename().string();
    const std::uintmax_t finishedBytes = m_sessionBytes;
    closeSessionLocked();
    if (openSessionLocked())
    {
        appendLocked("telemetry.rotated", {{"previous", finished}, {"bytes", std::to_string(finishedBytes)}});
    }
}

void FileTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stream.is_open())
    {
        m_stream.flush();
    }
    if (m_fallback)
    {
        m_fallback->flush();
    }
}

fs::path FileTelemetrySink::currentFile() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentFile;
}

std::uint64_t FileTelemetrySink::recordsWritten() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sequence;
}

bool FileTelemetrySink::openSessionLocked()
{
    std::error_code ec;
    fs::create_directories(m_settings.directory, ec);
    if (!fs::is_directory(m_settings.directory))
    {
        fallbackLocked("telemetry.directory_unavailable",
                       {{"path", m_settings.directory.lexically_normal().string()}, {"error", ec.message()}});
        return false;
    }

    const fs::path path = m_settings.directory / sessionFileName(telemetry::wallClockMs(), ++m_sessionIndex);
    m_stream.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!m_stream.is_open())
    {
        m_stream.clear();
        fallbackLocked("telemetry.open_failed", {{"path", path.lexically_normal().string()}});
        return false;
    }
    m_currentFile = path;
    m_sessionBytes = 0;
    pruneSessionsLocked();
    return true;
}

void FileTelemetrySink::closeSessionLocked()
{
    if (m_stream.is_open())
    {
        m_stream.flush();
        m_stream.close();
    }
    m_stream.clear();
    m_currentFile.clear();
    m_sessionBytes = 0;
}

void FileTelemetrySink::pruneSessionsLocked()
{
    if (m_settings.maxFiles == 0)
    {
        return;
    }
    std::error_code ec;
    std::vector<fs::path> sessions;
    for (fs::directory_iterator it(m_settings.directory, ec), end; !ec && it != end; it.increment(ec))
    {
        if (isSessionFile(*it))
        {
            sessions.push_back(it->path());
        }
    }
    if (sessions.size() <= m_settings.maxFiles)
    {
        return;
    }

    // Names start with the local time and a zero-padded index, so newest sorts first when descending.
    std::sort(sessions.begin(), sessions.end(), [](const fs::path &a, const fs::path &b) {
        return a.filename().string() > b.filename().string();
    });
    for (std::size_t i = m_settings.maxFiles; i < sessions.size(); ++i)
    {
        if (sessions[i] == m_currentFile)
        {
            continue;
        }
        std::error_code removeEc;
        if (!fs::remove(sessions[i], removeEc) && removeEc)
        {
            fallbackLocked("telemetry.prune_failed",
                           {{"path", sessions[i].lexically_normal().string()}, {"error", removeEc.message()}});
        }
    }
}

bool FileTelemetrySink::appendLocked(std::string_view eventName, const Payload &payload)
{
    json::JsonValue record = json::JsonValue::makeObject();
    for (const auto &[key, value] : payload)
    {
        record.set(key, json::JsonValue::makeString(value));
    }
    record.set("event", json::JsonValue::makeString(std::string(eventName)));
    record.set("seq", json::JsonValue::makeNumber(static_cast<double>(m_sequence + 1)));
    record.set("ts_ms", json::JsonValue::makeNumber(static_cast<double>(telemetry::wallClockMs())));

    const std::string line = json::serializeJson(record) + "\n";
    m_stream << line;
    if (!m_stream.good())
    {
        const std::string failed = m_currentFile.lexically_normal().string();
        closeSessionLocked();
        fallbackLocked("telemetry.write_failed", {{"path", failed}});
        fallbackLocked(eventName, payload);
        return false;
    }
    ++m_sequence;
    m_sessionBytes += line.size();
    return true;
}

void FileTelemetrySink::fallbackLocked(std::string_view eventName, const Payload &payload)
{
    if (m_fallback)
    {
        m_fallback->recordEvent(eventName, payload);
    }
}
