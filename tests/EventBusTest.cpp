#include "events/EventBus.h"

#include "TestSupport.h"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

bool testSubscriptionResetRemovesHandler()
{
    EventBus bus;
    bool handled = false;
    {
        auto token = bus.subscribe("token_test", [&](const EventContext &) { handled = true; });
        EventContext ctx;
        bus.dispatch("token_test", ctx);
        bus.pump();
        if (!handled)
        {
            std::cerr << "Handler did not fire while the subscription was alive" << '\n';
            return false;
        }
    }

    handled = false;
    EventContext ctx;
    bus.dispatch("token_test", ctx);
    bus.pump();
    if (handled)
    {
        std::cerr << "Handler fired after the subscription was destroyed" << '\n';
        return false;
    }
    if (bus.unconsumedCount() != 1)
    {
        std::cerr << "Event without listeners was not counted as unconsumed" << '\n';
        return false;
    }
    return true;
}

bool testNoListenerTelemetry()
{
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    EventBus bus(telemetry);

    EventContext ctx;
    bus.dispatch("orphan", ctx);
    const std::size_t delivered = bus.pump();
    if (delivered != 0)
    {
        std::cerr << "Orphan event reported as delivered" << '\n';
        return false;
    }
    if (telemetry->count("event_bus.no_listener") != 1)
    {
        std::cerr << "Missing no_listener telemetry" << '\n';
        return false;
    }
    const auto &payload = telemetry->events.front().second;
    const auto it = payload.find("event");
    if (it == payload.end() || it->second != "orphan")
    {
        std::cerr << "no_listener telemetry did not name the event" << '\n';
        return false;
    }
    return true;
}

bool testNestedDispatchDeliveredInSamePump()
{
    EventBus bus;
    std::vector<std::string> order;
    auto first = bus.subscribe("first", [&](const EventContext &) {
        order.push_back("first");
        bus.dispatch("second", EventContext{});
    });
    auto second = bus.subscribe("second", [&](const EventContext &) { order.push_back("second"); });

    bus.dispatch("first", EventContext{});
    bus.dispatch("third", EventContext{});
    const std::size_t delivered = bus.pump();
    if (delivered != 2)
    {
        std::cerr << "Expected two delivered events, got " << delivered << '\n';
        return false;
    }
    if (order.size() != 2 || order[0] != "first" || order[1] != "second")
    {
        std::cerr << "Nested dispatch was not delivered in order within the same pump" << '\n';
        return false;
    }
    return true;
}

bool testPayloadReachesAllHandlersInSubscriptionOrder()
{
    EventBus bus;
    std::vector<int> seen;
    auto a = bus.subscribe("value", [&](const EventContext &ctx) { seen.push_back(std::any_cast<int>(ctx.payload)); });
    auto b = bus.subscribe("value", [&](const EventContext &ctx) { seen.push_back(-std::any_cast<int>(ctx.payload)); });

    EventContext ctx;
    ctx.payload = 7;
    bus.dispatch("value", ctx);
    bus.pump();
    if (seen.size() != 2 || seen[0] != 7 || seen[1] != -7)
    {
        std::cerr << "Handlers did not receive the payload in subscription order" << '\n';
        return false;
    }
    return true;
}

bool testHandlerExceptionIsReported()
{
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    EventBus bus(telemetry);
    bool laterHandlerRan = false;
    auto failing = bus.subscribe("boom", [](const EventContext &) { throw std::runtime_error("handler broke"); });
    auto later = bus.subscribe("boom", [&](const EventContext &) { laterHandlerRan = true; });
    bool lastHandlerRan = false;
    auto throwsInt = bus.subscribe("boom", [](const EventContext &) { throw 42; });
    auto last = bus.subscribe("boom", [&](const EventContext &) { lastHandlerRan = true; });

    bus.dispatch("boom", EventContext{});
    bus.pump();
    if (!laterHandlerRan || !lastHandlerRan)
    {
        std::cerr << "Exception in one handler stopped delivery to the next" << '\n';
        return false;
    }
    if (telemetry->count("event_bus.warning") != 2)
    {
        std::cerr << "Handler exception was not reported" << '\n';
        return false;
    }
    const auto &unknown = telemetry->events.back().second;
    if (unknown.at("message") != "unknown")
    {
        std::cerr << "Non-standard exception was reported with the wrong message" << '\n';
        return false;
    }
    return true;
}

bool testSubscriptionOutlivingBusIsInert()
{
    EventBus::Subscription kept;
    {
        EventBus bus;
        kept = bus.subscribe("short_lived", [](const EventContext &) {});
        bus.dispatch("short_lived", EventContext{});
        if (bus.pendingCount() != 1)
        {
            std::cerr << "Dispatch should only enqueue until pump" << '\n';
            return false;
        }
        if (bus.pump() != 1 || bus.pendingCount() != 0)
        {
            std::cerr << "Pump did not drain the queue" << '\n';
            return false;
        }
    }
    if (!kept.active())
    {
        std::cerr << "Subscription lost its state before reset" << '\n';
        return false;
    }
    kept.reset();
    if (kept.active())
    {
        std::cerr << "Reset left the subscription active" << '\n';
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;
    if (!testSubscriptionResetRemovesHandler())
    {
        success = false;
    }
    if (!testNoListenerTelemetry())
    {
        success = false;
    }
    if (!testNestedDispatchDeliveredInSamePump())
    {
        success = false;
    }
    if (!testPayloadReachesAllHandlersInSubscriptionOrder())
    {
        success = false;
    }
    if (!testHandlerExceptionIsReported())
    {
        success = false;
    }
    if (!testSubscriptionOutlivingBusIsInert())
    {
        success = false;
    }
    return success ? 0 : 1;
}
