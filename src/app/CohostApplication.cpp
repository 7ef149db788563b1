#include "app/CohostApplication.h"

#include <algorithm>
#include <any>
#include <exception>
#include <utility>

#include "feed/FeedEventParser.h"
#include "game/SnapshotIngest.h"
#include "telemetry/TelemetrySink.h"

namespace
{

std::int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

const char *CohostApplication::inboxKindName(InboxKind kind)
{
    switch (kind)
    {
    case InboxKind::Snapshot:
        return "snapshot";
    case InboxKind::Feed:
        return "feed";
    case InboxKind::Utterance:
        return "utterance";
    case InboxKind::SessionTick:
        return "session_tick";
    case InboxKind::Ambient:
        return "ambient";
    }
    return "unknown";
}

CohostApplication::CohostApplication(AppConfig config, CohostCollaborators collaborators)
    : m_config(std::move(config))
    , m_telemetry(collaborators.telemetry ? std::move(collaborators.telemetry) : std::make_shared<NullTelemetrySink>())
    , m_mixer(collaborators.mixer ? std::move(collaborators.mixer) : std::make_shared<LoggingAudioMixer>(m_telemetry))
    , m_clock(collaborators.clock ? std::move(collaborators.clock) : std::function<std::int64_t()>(steadyNowMs))
    , m_ids(std::make_shared<EventIdAllocator>())
    , m_bus(std::make_shared<EventBus>(m_telemetry))
    , m_differ(m_telemetry, m_ids)
    , m_templates(std::make_shared<TemplateNarrator>())
    , m_generator(std::move(collaborators.generator))
    , m_planner(m_templates, m_generator, m_config.cooldowns, m_telemetry)
    , m_interpreter(m_config.voice, m_telemetry)
{
    m_tracker = std::make_unique<achievements::AchievementTracker>(
        m_config.achievements, std::move(collaborators.progressStore), m_telemetry, m_ids,
        m_config.achievementStore.historyLimit);

    auto output = collaborators.speechOutput ? std::move(collaborators.speechOutput)
                                             : std::make_shared<ConsoleSpeechOutput>();
    m_arbiter = std::make_unique<ReactionArbiter>(std::move(output), m_config.arbiter, m_telemetry);

    // Tracker first so unlocks raised by an event are queued behind its commentary on the bus.
    m_subscriptions.push_back(
        m_bus->subscribe(StreamEventName, [this](const EventContext &context) { onStreamEvent(context); }));
    m_subscriptions.push_back(
        m_bus->subscribe(StreamEventName, [this](const EventContext &context) { onPlanEvent(context); }));
    m_subscriptions.push_back(
        m_bus->subscribe(UnlockEventName, [this](const EventContext &context) { onPlanEvent(context); }));
}

CohostApplication::~CohostApplication()
{
    shutdown();
    m_subscriptions.clear();
}

std::int64_t CohostApplication::now() const
{
    return m_clock();
}

bool CohostApplication::start()
{
    if (m_running.load())
    {
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(m_inboxMutex);
        if (m_stopping)
        {
            return false;
        }
    }

    bool progressLoaded = false;
    {
        std::lock_guard<std::mutex> lock(m_trackerMutex);
        progressLoaded = m_tracker->load();
    }
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.progressLoaded = progressLoaded;
    }

    m_startedMs = now();
    m_lastAmbientMs = m_startedMs;
    m_lastSessionMinute = 0;
    m_arbiter->start();
    m_consumer = std::thread([this]() { consumerLoop(); });
    m_running.store(true);

    telemetry::emit(m_telemetry, "cohost.started",
                    {{"achievements", std::to_string(m_config.achievements.size())},
                     {"queue_capacity", std::to_string(m_config.arbiter.queueCapacity)},
                     {"inbox_capacity", std::to_string(m_config.ingest.inboxCapacity)}});
    return true;
}

bool CohostApplication::post(InboxItem item)
{
    {
        std::lock_guard<std::mutex> lock(m_inboxMutex);
        if (m_stopping)
        {
            return false;
        }
        if (m_inbox.size() >= m_config.ingest.inboxCapacity)
        {
            std::lock_guard<std::mutex> statsLock(m_statsMutex);
            ++m_stats.inboxDropped;
        }
        else
        {
            m_inbox.push_back(std::move(item));
            m_inboxReady.notify_one();
            return true;
        }
    }
    telemetry::emit(m_telemetry, "cohost.inbox_full",
                    {{"kind", inboxKindName(item.kind)},
                     {"capacity", std::to_string(m_config.ingest.inboxCapacity)}});
    return false;
}

bool CohostApplication::postSnapshot(std::string document)
{
    return post(InboxItem{InboxKind::Snapshot, std::move(document), now(), 0});
}

bool CohostApplication::postFeedEvent(std::string document)
{
    return post(InboxItem{InboxKind::Feed, std::move(document), now(), 0});
}

bool CohostApplication::postUtterance(std::string text)
{
    return post(InboxItem{InboxKind::Utterance, std::move(text), now(), 0});
}

void CohostApplication::tick()
{
    if (!m_running.load())
    {
        return;
    }
    const std::int64_t current = now();
    const int minutes = static_cast<int>((current - m_startedMs) / 60000);
    if (minutes > m_lastSessionMinute)
    {
        m_lastSessionMinute = minutes;
        post(InboxItem{InboxKind::SessionTick, {}, current, minutes});
    }

    const std::int64_t idleMs = static_cast<std::int64_t>(m_config.idleCommentSeconds) * 1000;
    if (idleMs > 0 && current - m_lastAmbientMs >= idleMs && m_arbiter->isIdle())
    {
        m_lastAmbientMs = current;
        post(InboxItem{InboxKind::Ambient, {}, current, 0});
    }
}

void CohostApplication::consumerLoop()
{
    for (;;)
    {
        InboxItem item;
        {
            std::unique_lock<std::mutex> lock(m_inboxMutex);
            m_inboxReady.wait(lock, [this]() { return m_stopping || !m_inbox.empty(); });
            if (m_stopping)
            {
                return;
            }
            item = std::move(m_inbox.front());
            m_inbox.pop_front();
            m_processing = true;
        }

        process(item);

        {
            std::lock_guard<std::mutex> lock(m_inboxMutex);
            m_processing = false;
        }
        m_inboxDrained.notify_all();
    }
}

void CohostApplication::process(const InboxItem &item)
{
    try
    {
        switch (item.kind)
        {
        case InboxKind::Snapshot:
            handleSnapshot(item);
            break;
        case InboxKind::Feed:
            handleFeed(item);
            break;
        case InboxKind::Utterance:
            handleUtterance(item);
            break;
        case InboxKind::SessionTick:
            handleSessionTick(item);
            break;
        case InboxKind::Ambient:
            handleAmbient(item);
            break;
        }
        m_bus->pump();
    }
    catch (const std::exception &ex)
    {
        telemetry::emit(m_telemetry, "cohost.item_failed",
                        {{"kind", inboxKindName(item.kind)}, {"message", ex.what()}});
    }
    catch (...)
    {
        telemetry::emit(m_telemetry, "cohost.item_failed", {{"kind", inboxKindName(item.kind)}, {"message", "unknown"}});
    }
}

void CohostApplication::handleSnapshot(const InboxItem &item)
{
    game::SnapshotParseResult parsed = game::parseSnapshot(item.payload);
    if (!parsed.ok())
    {
        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_stats.snapshotsRejected;
        }
        TelemetrySink::Payload payload{{"errors", std::to_string(parsed.errors.size())}};
        if (!parsed.errors.empty())
        {
            payload["first_error"] = parsed.errors.front();
        }
        telemetry::emit(m_telemetry, "ingest.rejected", payload);
        // A document that cannot be read breaks the comparison chain.
        m_differ.reset();
        return;
    }

    game::GameState state = std::move(*parsed.state);
    if (!m_config.ingest.trackedPlayer.empty())
    {
        state.trackedId = m_config.ingest.trackedPlayer;
    }

    std::vector<StreamEvent> events = m_differ.ingest(std::move(state));
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.snapshotsAccepted;
        m_stats.eventsDerived += events.size();
    }
    for (StreamEvent &event : events)
    {
        publish(std::move(event));
    }
}

void CohostApplication::handleFeed(const InboxItem &item)
{
    feed::FeedParseResult parsed = feed::parseFeedEvent(item.payload, item.receivedMs);
    if (!parsed.ok())
    {
        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            ++m_stats.feedRejected;
        }
        telemetry::emit(m_telemetry, parsed.ignored ? "feed.ignored" : "feed.rejected",
                        {{"error", parsed.errors.empty() ? std::string{} : parsed.errors.front()}});
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.feedAccepted;
    }
    StreamEvent event = std::move(*parsed.event);
    event.id = m_ids->next();
    publish(std::move(event));
}

void CohostApplication::handleUtterance(const InboxItem &item)
{
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.utterances;
    }
    VoiceOutcome outcome = m_interpreter.interpret(item.payload);
    if (outcome.feedback)
    {
        submitSpeech(std::move(*outcome.feedback));
    }
    if (!outcome.intent)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        ++m_stats.intents;
    }

    const Intent &intent = *outcome.intent;
    if (intent.kind == IntentKind::Converse)
    {
        StreamEvent event;
        event.kind = EventKind::ChatMessage;
        event.timestampMs = item.receivedMs;
        event.tracked = true;
        event.text = intent.text;
        NarrationPrompt prompt{"conversation", event};

        SpeechRequest request;
        request.category = "conversation";
        request.priority = SpeechPriority::CommandFeedback;
        request.dedupKey = "voice:conversation";
        request.fallbackText = m_templates->phrase(prompt);
        if (m_generator)
        {
            auto generator = m_generator;
            request.producer = [generator, prompt]() { return generator->generate(prompt); };
        }
        else
        {
            request.text = request.fallbackText;
        }
        submitSpeech(std::move(request));
        return;
    }

    MixerResult result;
    try
    {
        result = m_mixer->apply(intent);
    }
    catch (const std::exception &ex)
    {
        result.success = false;
        result.error = ex.what();
    }
    catch (...)
    {
        result.success = false;
        result.error = "unknown exception";
    }
    if (!result.success)
    {
        telemetry::emit(m_telemetry, "mixer.failed",
                        {{"action", intentKindToString(intent.kind)}, {"target", intent.target}, {"error", result.error}});
    }
    submitSpeech(m_interpreter.mixerFeedback(intent, result));
}

void CohostApplication::handleSessionTick(const InboxItem &item)
{
    StreamEvent event;
    event.id = m_ids->next();
    event.kind = EventKind::SessionTick;
    event.timestampMs = item.receivedMs;
    event.tick = item.receivedMs;
    event.tracked = true;
    event.count = item.count;
    publish(std::move(event));
}

void CohostApplication::handleAmbient(const InboxItem &item)
{
    if (auto request = m_planner.planAmbient(item.receivedMs))
    {
        submitSpeech(std::move(*request));
    }
}

void CohostApplication::publish(StreamEvent event)
{
    telemetry::emit(m_telemetry, StreamEventName,
                    {{"id", std::to_string(event.id)},
                     {"kind", eventKindToString(event.kind)},
                     {"actor", event.actor},
                     {"round", std::to_string(event.round)}});
    m_bus->dispatch(StreamEventName, EventContext{std::move(event)});
}

void CohostApplication::onStreamEvent(const EventContext &context)
{
    const auto *event = std::any_cast<StreamEvent>(&context.payload);
    if (!event)
    {
        return;
    }
    std::vector<StreamEvent> unlocks;
    {
        std::lock_guard<std::mutex> lock(m_trackerMutex);
        unlocks = m_tracker->apply(*event);
    }
    if (unlocks.empty())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.unlocks += unlocks.size();
    }
    for (StreamEvent &unlock : unlocks)
    {
        m_bus->dispatch(UnlockEventName, EventContext{std::move(unlock)});
    }
}

void CohostApplication::onPlanEvent(const EventContext &context)
{
    const auto *event = std::any_cast<StreamEvent>(&context.payload);
    if (!event)
    {
        return;
    }
    if (auto request = m_planner.plan(*event, now()))
    {
        submitSpeech(std::move(*request));
    }
}

void CohostApplication::submitSpeech(SpeechRequest request)
{
    const std::string category = request.category;
    const SubmitResult result = m_arbiter->submit(std::move(request));
    if (result == SubmitResult::Rejected)
    {
        telemetry::emit(m_telemetry, "cohost.speech_rejected", {{"category", category}});
    }
}

bool CohostApplication::waitUntilDrained(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::unique_lock<std::mutex> lock(m_inboxMutex);
        if (!m_inboxDrained.wait_until(lock, deadline, [this]() {
                return m_stopping || (m_inbox.empty() && !m_processing);
            }))
        {
            return false;
        }
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return m_arbiter->waitUntilIdle(std::max(remaining, std::chrono::milliseconds(0)));
}

void CohostApplication::shutdown()
{
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(m_inboxMutex);
        if (m_stopping && !m_consumer.joinable())
        {
            return;
        }
        m_stopping = true;
        discarded = m_inbox.size();
        m_inbox.clear();
    }
    m_inboxReady.notify_all();
    m_inboxDrained.notify_all();
    if (m_consumer.joinable())
    {
        m_consumer.join();
    }

    m_arbiter->shutdown();
    if (m_running.exchange(false))
    {
        {
            std::lock_guard<std::mutex> lock(m_trackerMutex);
            m_tracker->checkpoint();
        }
        telemetry::emit(m_telemetry, "cohost.shutdown", {{"discarded_inbox", std::to_string(discarded)}});
        m_telemetry->flush();
    }
}

CohostStats CohostApplication::stats() const
{
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

achievements::Progress CohostApplication::progress() const
{
    std::lock_guard<std::mutex> lock(m_trackerMutex);
    return m_tracker->snapshot();
}
