#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Higher value speaks first.
enum class SpeechPriority : std::uint8_t
{
    Ambient = 0,
    ChatReply,
    Combat,
    Highlight,
    CommandFeedback,
    Donation,
    Achievement,
};

enum class SpeechState : std::uint8_t
{
    Queued = 0,
    Speaking,
    Done,
    Cancelled,
    Dropped,
};

const char *speechPriorityToString(SpeechPriority priority);
const char *speechStateToString(SpeechState state);

struct SpeechRequest
{
    using TextProducer = std::function<std::optional<std::string>()>;

    std::uint64_t id = 0;
    SpeechPriority priority = SpeechPriority::Ambient;
    std::string category;

    // Either fixed text or a producer that is called right before synthesis.
    std::string text;
    TextProducer producer;
    // Spoken when the producer fails or returns nothing.
    std::string fallbackText;

    std::int64_t createdMs = 0;
    // Empty keys never collapse.
    std::string dedupKey;
};
