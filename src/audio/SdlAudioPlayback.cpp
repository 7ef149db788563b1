#include "audio/SdlAudioPlayback.h"

#include <utility>

#include "telemetry/TelemetrySink.h"

namespace
{

using WavBufferPtr = std::unique_ptr<Uint8, void (*)(Uint8 *)>;

bool sameFormat(const SDL_AudioSpec &a, const SDL_AudioSpec &b)
{
    return a.freq == b.freq && a.format == b.format && a.channels == b.channels;
}

} // namespace

SdlAudioPlayback::SdlAudioPlayback(std::string deviceName, std::shared_ptr<TelemetrySink> telemetry)
    : m_deviceName(std::move(deviceName)), m_telemetry(std::move(telemetry))
{
}

SdlAudioPlayback::~SdlAudioPlayback()
{
    close();
}

bool SdlAudioPlayback::initialize(std::string &error)
{
    if (m_initialized)
    {
        return true;
    }
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0)
    {
        error = std::string("SDL_InitSubSystem(AUDIO) failed: ") + SDL_GetError();
        return false;
    }
    m_initialized = true;
    telemetry::emit(m_telemetry, "audio.initialized",
                    {{"driver", SDL_GetCurrentAudioDriver() ? SDL_GetCurrentAudioDriver() : ""},
                     {"device", m_deviceName.empty() ? "default" : m_deviceName}});
    return true;
}

bool SdlAudioPlayback::ensureDevice(const SDL_AudioSpec &spec, std::string &error)
{
    if (m_device != 0 && sameFormat(m_deviceSpec, spec))
    {
        return true;
    }
    if (m_device != 0)
    {
        SDL_CloseAudioDevice(m_device);
        m_device = 0;
    }

    SDL_AudioSpec desired = spec;
    desired.callback = nullptr;
    desired.userdata = nullptr;
    SDL_AudioSpec obtained{};
    m_device = SDL_OpenAudioDevice(m_deviceName.empty() ? nullptr : m_deviceName.c_str(), 0, &desired, &obtained, 0);
    if (m_device == 0)
    {
        error = std::string("SDL_OpenAudioDevice failed: ") + SDL_GetError();
        return false;
    }
    m_deviceSpec = spec;
    return true;
}

SpeechOutcome SdlAudioPlayback::playWav(const std::vector<std::uint8_t> &wav, std::chrono::steady_clock::time_point deadline)
{
    std::string error;
    if (!initialize(error))
    {
        return SpeechOutcome::failure(error);
    }
    if (wav.empty())
    {
        return SpeechOutcome::failure("empty audio");
    }

    SDL_RWops *stream = SDL_RWFromConstMem(wav.data(), static_cast<int>(wav.size()));
    if (!stream)
    {
        return SpeechOutcome::failure(std::string("SDL_RWFromConstMem failed: ") + SDL_GetError());
    }
    SDL_AudioSpec spec{};
    Uint8 *rawBuffer = nullptr;
    Uint32 length = 0;
    if (!SDL_LoadWAV_RW(stream, 1, &spec, &rawBuffer, &length))
    {
        return SpeechOutcome::failure(std::string("SDL_LoadWAV_RW failed: ") + SDL_GetError());
    }
    WavBufferPtr buffer(rawBuffer, [](Uint8 *ptr) {
        if (ptr) SDL_FreeWAV(ptr);
    });

    if (!ensureDevice(spec, error))
    {
        return SpeechOutcome::failure(error);
    }

    SDL_ClearQueuedAudio(m_device);
    if (SDL_QueueAudio(m_device, buffer.get(), length) != 0)
    {
        return SpeechOutcome::failure(std::string("SDL_QueueAudio failed: ") + SDL_GetError());
    }
    buffer.reset();
    SDL_PauseAudioDevice(m_device, 0);

    while (SDL_GetQueuedAudioSize(m_device) > 0)
    {
        if (SDL_GetAudioDeviceStatus(m_device) == SDL_AUDIO_STOPPED)
        {
            SDL_ClearQueuedAudio(m_device);
            return SpeechOutcome::failure("audio device stopped");
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            SDL_ClearQueuedAudio(m_device);
            SDL_PauseAudioDevice(m_device, 1);
            return SpeechOutcome::failure("playback deadline exceeded", true);
        }
        SDL_Delay(10);
    }
    SDL_PauseAudioDevice(m_device, 1);
    return SpeechOutcome::ok();
}

void SdlAudioPlayback::close()
{
    if (m_device != 0)
    {
        SDL_ClearQueuedAudio(m_device);
        SDL_CloseAudioDevice(m_device);
        m_device = 0;
    }
    if (m_initialized)
    {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
        telemetry::emit(m_telemetry, "audio.closed", {});
    }
}
