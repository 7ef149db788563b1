#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "voice/Intent.h"

class TelemetrySink;

struct MixerResult
{
    bool success = false;
    // Level after the change, in percent; meaningful on success.
    int volume = 0;
    std::string error;
};

// OS-level per-application volume control.
class AudioMixer
{
  public:
    virtual ~AudioMixer() = default;

    virtual MixerResult apply(const Intent &intent) = 0;
};

// Keeps levels in memory and reports every change to telemetry. Used where no platform
// mixer is available.
class LoggingAudioMixer : public AudioMixer
{
  public:
    explicit LoggingAudioMixer(std::shared_ptr<TelemetrySink> telemetry = nullptr);

    MixerResult apply(const Intent &intent) override;

    int volume(const std::string &target) const;
    bool muted(const std::string &target) const;

  private:
    struct Channel
    {
        int volume = 100;
        bool muted = false;
    };

    std::shared_ptr<TelemetrySink> m_telemetry;
    mutable std::mutex m_mutex;
    std::map<std::string, Channel> m_channels;
};
