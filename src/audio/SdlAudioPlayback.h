#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <SDL.h>

#include "speech/SpeechOutput.h"

class TelemetrySink;

// Plays WAV documents on one SDL audio device. The device is opened lazily and reopened
// only when the incoming format changes. Not thread-safe; owned by the speech worker.
class SdlAudioPlayback
{
  public:
    explicit SdlAudioPlayback(std::string deviceName = {}, std::shared_ptr<TelemetrySink> telemetry = nullptr);
    ~SdlAudioPlayback();

    SdlAudioPlayback(const SdlAudioPlayback &) = delete;
    SdlAudioPlayback &operator=(const SdlAudioPlayback &) = delete;

    bool initialize(std::string &error);
    SpeechOutcome playWav(const std::vector<std::uint8_t> &wav, std::chrono::steady_clock::time_point deadline);
    void close();

  private:
    bool ensureDevice(const SDL_AudioSpec &spec, std::string &error);

    std::string m_deviceName;
    std::shared_ptr<TelemetrySink> m_telemetry;
    bool m_initialized = false;
    SDL_AudioDeviceID m_device = 0;
    SDL_AudioSpec m_deviceSpec{};
};
