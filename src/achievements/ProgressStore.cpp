#include "achievements/ProgressStore.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "json/JsonUtils.h"

namespace fs = std::filesystem;

namespace achievements
{

namespace
{

constexpr int kProgressSchemaVersion = 1;

} // namespace

JsonProgressStore::JsonProgressStore(fs::path path) : m_path(std::move(path)) {}

ProgressLoadResult JsonProgressStore::load()
{
    ProgressLoadResult result;
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        return result;
    }

    std::ifstream stream(m_path, std::ios::binary);
    if (!stream.is_open())
    {
        result.success = false;
        result.error = "Failed to open " + m_path.string();
        return result;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();

    json::JsonParseError parseError;
    auto root = json::parseJson(buffer.str(), &parseError);
    if (!root || !root->isObject())
    {
        result.success = false;
        result.error = "Failed to parse " + m_path.string() + ": " + parseError.message;
        return result;
    }
    if (json::getInt(*root, "schema_version", 0) != kProgressSchemaVersion)
    {
        result.success = false;
        result.error = "schema_version mismatch in " + m_path.string();
        return result;
    }

    if (const json::JsonValue *entries = json::getObjectField(*root, "achievements"))
    {
        for (const auto &[id, node] : entries->object)
        {
            AchievementProgress progress;
            progress.counter = std::max<std::int64_t>(0, json::getInt64(node, "counter", 0));
            progress.unlocked = json::getBool(node, "unlocked", false);
            progress.unlockedAtMs = json::getInt64(node, "unlocked_at_ms", 0);
            result.progress.emplace(id, progress);
        }
    }
    return result;
}

bool JsonProgressStore::save(const Progress &progress, std::string &error)
{
    json::JsonValue entries = json::JsonValue::makeObject();
    for (const auto &[id, value] : progress)
    {
        json::JsonValue node = json::JsonValue::makeObject();
        node.set("counter", json::JsonValue::makeNumber(static_cast<double>(value.counter)));
        node.set("unlocked", json::JsonValue::makeBool(value.unlocked));
        if (value.unlocked)
        {
            node.set("unlocked_at_ms", json::JsonValue::makeNumber(static_cast<double>(value.unlockedAtMs)));
        }
        entries.set(id, std::move(node));
    }
    json::JsonValue root = json::JsonValue::makeObject();
    root.set("schema_version", json::JsonValue::makeNumber(kProgressSchemaVersion));
    root.set("achievements", std::move(entries));

    std::error_code ec;
    if (m_path.has_parent_path())
    {
        fs::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            error = "Failed to create " + m_path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    fs::path temporary = m_path;
    temporary += ".tmp";
    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
        if (!stream.is_open())
        {
            error = "Failed to open " + temporary.string();
            return false;
        }
        stream << json::serializeJson(root, true) << '\n';
        stream.flush();
        if (!stream)
        {
            error = "Failed to write " + temporary.string();
            return false;
        }
    }

    fs::rename(temporary, m_path, ec);
    if (ec)
    {
        error = "Failed to replace " + m_path.string() + ": " + ec.message();
        fs::remove(temporary, ec);
        return false;
    }
    return true;
}

} // namespace achievements
