#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "events/StreamEvent.h"

namespace json
{
struct JsonValue;
}

namespace feed
{

struct FeedParseResult
{
    std::optional<StreamEvent> event;
    std::vector<std::string> errors;
    // Well-formed document of a kind the co-host does not react to.
    bool ignored = false;

    bool ok() const { return event.has_value(); }
};

// Accepts StreamElements-style documents: {"listener": "tip-latest", "event": {...}},
// {"type": "subscriber", "data": {...}} or a flat payload carrying "type".
FeedParseResult parseFeedEvent(const std::string &text, std::int64_t receivedMs);
FeedParseResult normalizeFeedEvent(const json::JsonValue &root, std::int64_t receivedMs);

} // namespace feed
