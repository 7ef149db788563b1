#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/AppConfig.h"

struct AppConfigLoadError
{
    std::string file;
    std::string message;
};

struct AppConfigLoadResult
{
    AppConfig config;
    bool success = false;
    std::vector<AppConfigLoadError> errors;
};

// Reads app.json and achievements.json from one directory. Every field has a default,
// so a partial result is still usable when success is false.
class AppConfigLoader
{
  public:
    explicit AppConfigLoader(std::filesystem::path configRoot);

    const std::filesystem::path &configRoot() const { return m_configRoot; }

    AppConfigLoadResult load();

  private:
    std::filesystem::path m_configRoot;
};
