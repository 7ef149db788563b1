#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "achievements/AchievementTracker.h"
#include "config/AppConfig.h"
#include "events/EventBus.h"
#include "events/StreamEvent.h"
#include "game/StateDiffer.h"
#include "speech/NarrationGenerator.h"
#include "speech/ReactionArbiter.h"
#include "speech/ReactionPlanner.h"
#include "voice/AudioMixer.h"
#include "voice/VoiceCommandInterpreter.h"

class TelemetrySink;

struct CohostCollaborators
{
    std::shared_ptr<TelemetrySink> telemetry;
    std::shared_ptr<SpeechOutput> speechOutput;
    std::shared_ptr<AudioMixer> mixer;
    // Optional language-model seam; templates are used when absent.
    std::shared_ptr<NarrationGenerator> generator;
    std::unique_ptr<achievements::ProgressStore> progressStore;
    // Monotonic milliseconds. Defaults to the steady clock.
    std::function<std::int64_t()> clock;
};

struct CohostStats
{
    std::size_t snapshotsAccepted = 0;
    std::size_t snapshotsRejected = 0;
    std::size_t feedAccepted = 0;
    std::size_t feedRejected = 0;
    std::size_t utterances = 0;
    std::size_t intents = 0;
    std::size_t eventsDerived = 0;
    std::size_t unlocks = 0;
    std::size_t inboxDropped = 0;
    // False when no progress store is configured or loading failed; progress starts from zero.
    bool progressLoaded = false;
};

// Owns the pipeline. Producers post raw documents from any thread; a single consumer
// thread runs ingest, differencing, achievements and planning in arrival order.
class CohostApplication
{
  public:
    CohostApplication(AppConfig config, CohostCollaborators collaborators);
    ~CohostApplication();

    CohostApplication(const CohostApplication &) = delete;
    CohostApplication &operator=(const CohostApplication &) = delete;

    bool start();

    // Return false when the inbox is full or the application is stopping.
    bool postSnapshot(std::string document);
    bool postFeedEvent(std::string document);
    bool postUtterance(std::string text);

    // Periodic housekeeping: session minute ticks and idle commentary.
    void tick();

    bool waitUntilDrained(std::chrono::milliseconds timeout);
    void shutdown();

    bool running() const { return m_running.load(); }
    CohostStats stats() const;
    achievements::Progress progress() const;
    ReactionArbiter &arbiter() { return *m_arbiter; }
    const AppConfig &config() const { return m_config; }

  private:
    enum class InboxKind
    {
        Snapshot,
        Feed,
        Utterance,
        SessionTick,
        Ambient,
    };

    struct InboxItem
    {
        InboxKind kind = InboxKind::Snapshot;
        std::string payload;
        std::int64_t receivedMs = 0;
        int count = 0;
    };

    static const char *inboxKindName(InboxKind kind);

    bool post(InboxItem item);
    void consumerLoop();
    void process(const InboxItem &item);
    void handleSnapshot(const InboxItem &item);
    void handleFeed(const InboxItem &item);
    void handleUtterance(const InboxItem &item);
    void handleSessionTick(const InboxItem &item);
    void handleAmbient(const InboxItem &item);
    void publish(StreamEvent event);
    void onStreamEvent(const EventContext &context);
    void onPlanEvent(const EventContext &context);
    void submitSpeech(SpeechRequest request);
    std::int64_t now() const;

    AppConfig m_config;
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::shared_ptr<AudioMixer> m_mixer;
    std::function<std::int64_t()> m_clock;

    std::shared_ptr<EventIdAllocator> m_ids;
    std::shared_ptr<EventBus> m_bus;
    std::vector<EventBus::Subscription> m_subscriptions;

    game::StateDiffer m_differ;
    std::unique_ptr<achievements::AchievementTracker> m_tracker;
    mutable std::mutex m_trackerMutex;
    std::shared_ptr<TemplateNarrator> m_templates;
    std::shared_ptr<NarrationGenerator> m_generator;
    ReactionPlanner m_planner;
    VoiceCommandInterpreter m_interpreter;
    std::unique_ptr<ReactionArbiter> m_arbiter;

    mutable std::mutex m_inboxMutex;
    std::condition_variable m_inboxReady;
    std::condition_variable m_inboxDrained;
    std::deque<InboxItem> m_inbox;
    bool m_processing = false;
    bool m_stopping = false;
    std::thread m_consumer;
    std::atomic<bool> m_running{false};

    std::int64_t m_startedMs = 0;
    int m_lastSessionMinute = 0;
    std::int64_t m_lastAmbientMs = 0;

    mutable std::mutex m_statsMutex;
    CohostStats m_stats{};
};
