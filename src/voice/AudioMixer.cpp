#include "voice/AudioMixer.h"

#include <algorithm>
#include <utility>

#include "telemetry/TelemetrySink.h"

const char *intentKindToString(IntentKind kind)
{
    switch (kind)
    {
    case IntentKind::SetVolume:
        return "set_volume";
    case IntentKind::Mute:
        return "mute";
    case IntentKind::Unmute:
        return "unmute";
    case IntentKind::Converse:
        return "converse";
    }
    return "unknown";
}

LoggingAudioMixer::LoggingAudioMixer(std::shared_ptr<TelemetrySink> telemetry) : m_telemetry(std::move(telemetry)) {}

MixerResult LoggingAudioMixer::apply(const Intent &intent)
{
    MixerResult result;
    if (intent.target.empty())
    {
        result.error = "no target";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Channel &channel = m_channels[intent.target];
        switch (intent.kind)
        {
        case IntentKind::SetVolume:
            if (intent.percent)
            {
                channel.volume = std::clamp(*intent.percent, 0, 100);
            }
            else if (intent.delta)
            {
                channel.volume = std::clamp(channel.volume + *intent.delta, 0, 100);
            }
            else
            {
                result.error = "no level";
                return result;
            }
            break;
        case IntentKind::Mute:
            channel.muted = true;
            break;
        case IntentKind::Unmute:
            channel.muted = false;
            break;
        case IntentKind::Converse:
            result.error = "not a mixer command";
            return result;
        }
        result.success = true;
        result.volume = channel.muted ? 0 : channel.volume;
    }

    telemetry::emit(m_telemetry, "mixer.applied",
                    {{"action", intentKindToString(intent.kind)},
                     {"target", intent.target},
                     {"volume", std::to_string(result.volume)}});
    return result;
}

int LoggingAudioMixer::volume(const std::string &target) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_channels.find(target);
    return it == m_channels.end() ? 100 : it->second.volume;
}

bool LoggingAudioMixer::muted(const std::string &target) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_channels.find(target);
    return it != m_channels.end() && it->second.muted;
}
