#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum class IntentKind : std::uint8_t
{
    SetVolume = 0,
    Mute,
    Unmute,
    Converse,
};

const char *intentKindToString(IntentKind kind);

// "system" targets the master volume.
inline constexpr const char *SystemTarget = "system";

struct Intent
{
    IntentKind kind = IntentKind::Converse;
    std::string target;
    // SetVolume carries exactly one of these: an absolute level or a signed step, in percent.
    std::optional<int> percent;
    std::optional<int> delta;
    // Converse only.
    std::string text;
};
