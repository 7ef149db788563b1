#pragma once

#include <any>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "telemetry/TelemetrySink.h"

struct EventContext
{
    std::any payload;
};

// Named-topic queue. dispatch() only enqueues; pump() delivers in dispatch order on the calling
// thread, including events dispatched by handlers while the pump is running.
class EventBus
{
    struct Registry;

  public:
    using Handler = std::function<void(const EventContext &)>;

    // Move-only handle. The handler stays registered until the handle is reset or destroyed;
    // a handle that outlives its bus is inert.
    class Subscription
    {
      public:
        Subscription() = default;
        Subscription(Subscription &&other) noexcept;
        Subscription &operator=(Subscription &&other) noexcept;
        Subscription(const Subscription &) = delete;
        Subscription &operator=(const Subscription &) = delete;
        ~Subscription();

        void reset();
        [[nodiscard]] bool active() const noexcept { return m_id != 0; }

      private:
        friend class EventBus;
        Subscription(std::weak_ptr<Registry> registry, std::string topic, std::uint64_t id);

        std::weak_ptr<Registry> m_registry;
        std::string m_topic;
        std::uint64_t m_id = 0;
    };

    explicit EventBus(std::shared_ptr<TelemetrySink> telemetry = nullptr);

    [[nodiscard]] Subscription subscribe(const std::string &topic, Handler handler);
    void dispatch(const std::string &topic, EventContext context);
    // Returns how many events reached at least one handler.
    std::size_t pump();

    std::size_t pendingCount() const;
    std::size_t unconsumedCount() const;

  private:
    struct Registry
    {
        std::mutex mutex;
        std::unordered_map<std::string, std::vector<std::pair<std::uint64_t, std::shared_ptr<Handler>>>> topics;
        std::uint64_t nextId = 1;

        void remove(const std::string &topic, std::uint64_t id);
    };

    struct Pending
    {
        std::string topic;
        EventContext context;
    };

    bool takeNext(Pending &event, std::vector<std::shared_ptr<Handler>> &handlers);

    std::shared_ptr<TelemetrySink> m_telemetry;
    std::shared_ptr<Registry> m_registry;
    mutable std::mutex m_queueMutex;
    std::deque<Pending> m_queue;
    std::size_t m_unconsumed = 0;
};
