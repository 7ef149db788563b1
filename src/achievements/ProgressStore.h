#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace achievements
{

struct AchievementProgress
{
    std::int64_t counter = 0;
    bool unlocked = false;
    std::int64_t unlockedAtMs = 0;
};

using Progress = std::map<std::string, AchievementProgress>;

struct ProgressLoadResult
{
    Progress progress;
    bool success = true;
    std::string error;
};

class ProgressStore
{
  public:
    virtual ~ProgressStore() = default;

    virtual ProgressLoadResult load() = 0;
    // Returns false and fills error when the progress could not be written.
    virtual bool save(const Progress &progress, std::string &error) = 0;
};

// Keeps progress in a JSON document. Writes go to a sibling temporary file that then
// replaces the target, so a crash never leaves a half-written store behind.
class JsonProgressStore : public ProgressStore
{
  public:
    explicit JsonProgressStore(std::filesystem::path path);

    ProgressLoadResult load() override;
    bool save(const Progress &progress, std::string &error) override;

    const std::filesystem::path &path() const { return m_path; }

  private:
    std::filesystem::path m_path;
};

} // namespace achievements
