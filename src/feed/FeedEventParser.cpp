#include "feed/FeedEventParser.h"

#include "json/JsonUtils.h"

namespace feed
{

namespace
{

constexpr const char *kAnonymous = "Аноним";

bool contains(const std::string &haystack, const char *needle)
{
    return haystack.find(needle) != std::string::npos;
}

std::string readUser(const json::JsonValue &payload)
{
    std::string name = json::getString(payload, "displayName", "");
    if (name.empty())
    {
        name = json::getString(payload, "username", "");
    }
    if (name.empty())
    {
        name = json::getString(payload, "name", kAnonymous);
    }
    return name;
}

StreamEvent baseEvent(EventKind kind, const json::JsonValue &payload, std::int64_t receivedMs)
{
    StreamEvent event;
    event.kind = kind;
    event.timestampMs = receivedMs;
    event.tick = receivedMs;
    event.tracked = true;
    event.actorName = readUser(payload);
    event.actor = event.actorName;
    return event;
}

} // namespace

FeedParseResult parseFeedEvent(const std::string &text, std::int64_t receivedMs)
{
    json::JsonParseError error;
    auto root = json::parseJson(text, &error);
    if (!root)
    {
        FeedParseResult result;
        result.errors.push_back("Invalid JSON at offset " + std::to_string(error.offset) + ": " + error.message);
        return result;
    }
    return normalizeFeedEvent(*root, receivedMs);
}

FeedParseResult normalizeFeedEvent(const json::JsonValue &root, std::int64_t receivedMs)
{
    FeedParseResult result;
    if (!root.isObject())
    {
        result.errors.push_back("Feed document must be an object");
        return result;
    }

    const std::string listener = json::getString(root, "listener", "");
    const std::string type = json::getString(root, "type", "");
    const json::JsonValue *payload = json::getObjectField(root, "event");
    if (!payload || !payload->isObject())
    {
        payload = json::getObjectField(root, "data");
    }
    if (!payload || !payload->isObject())
    {
        payload = &root;
    }

    auto is = [&listener, &type](const char *name) { return contains(listener, name) || contains(type, name); };

    if (is("tip") || is("cheer"))
    {
        StreamEvent event = baseEvent(EventKind::Donation, *payload, receivedMs);
        event.amount = json::getDouble(*payload, "amount", 0.0);
        if (event.amount < 0.0)
        {
            result.errors.push_back("Donation amount must not be negative");
            return result;
        }
        event.currency = is("cheer") ? "BITS" : json::getString(*payload, "currency", "USD");
        event.text = json::getString(*payload, "message", "");
        result.event = std::move(event);
        return result;
    }
    if (is("subscriber"))
    {
        StreamEvent event = baseEvent(EventKind::Subscription, *payload, receivedMs);
        event.count = json::getInt(*payload, "amount", json::getInt(*payload, "months", 1));
        if (json::getBool(*payload, "gifted", false))
        {
            event.other = json::getString(*payload, "sender", "");
            event.otherName = event.other;
        }
        event.currency = json::getString(*payload, "tier", "1000");
        event.text = json::getString(*payload, "message", "");
        result.event = std::move(event);
        return result;
    }
    if (is("raid") || is("host"))
    {
        StreamEvent event = baseEvent(EventKind::Raid, *payload, receivedMs);
        event.count = json::getInt(*payload, "amount", json::getInt(*payload, "viewers", 0));
        result.event = std::move(event);
        return result;
    }
    if (is("follower"))
    {
        result.event = baseEvent(EventKind::Follow, *payload, receivedMs);
        return result;
    }
    if (is("message") || is("chat"))
    {
        StreamEvent event = baseEvent(EventKind::ChatMessage, *payload, receivedMs);
        event.text = json::getString(*payload, "message", json::getString(*payload, "text", ""));
        if (event.text.empty())
        {
            result.errors.push_back("Chat message without text");
            result.ignored = true;
            return result;
        }
        result.event = std::move(event);
        return result;
    }

    result.ignored = true;
    result.errors.push_back("Unknown listener '" + (listener.empty() ? type : listener) + "'");
    return result;
}

} // namespace feed
