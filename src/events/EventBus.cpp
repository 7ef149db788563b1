#include "events/EventBus.h"

#include <algorithm>
#include <exception>
#include <utility>

void EventBus::Registry::remove(const std::string &topic, std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex);
    const auto found = topics.find(topic);
    if (found == topics.end())
    {
        return;
    }
    auto &handlers = found->second;
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(), [id](const auto &entry) { return entry.first == id; }),
                   handlers.end());
    if (handlers.empty())
    {
        topics.erase(found);
    }
}

EventBus::Subscription::Subscription(std::weak_ptr<Registry> registry, std::string topic, std::uint64_t id)
    : m_registry(std::move(registry)), m_topic(std::move(topic)), m_id(id)
{
}

EventBus::Subscription::Subscription(Subscription &&other) noexcept
    : m_registry(std::move(other.m_registry)), m_topic(std::move(other.m_topic)), m_id(std::exchange(other.m_id, 0))
{
}

EventBus::Subscription &EventBus::Subscription::operator=(Subscription &&other) noexcept
{
    if (this != &other)
    {
        reset();
        m_registry = std::move(other.m_registry);
        m_topic = std::move(other.m_topic);
        m_id = std::exchange(other.m_id, 0);
    }
    return *this;
}

EventBus::Subscription::~Subscription()
{
    reset();
}

void EventBus::Subscription::reset()
{
    if (m_id != 0)
    {
        if (auto registry = m_registry.lock())
        {
            registry->remove(m_topic, m_id);
        }
    }
    m_registry.reset();
    m_topic.clear();
    m_id = 0;
}

EventBus::EventBus(std::shared_ptr<TelemetrySink> telemetry)
    : m_telemetry(std::move(telemetry)), m_registry(std::make_shared<Registry>())
{
}

EventBus::Subscription EventBus::subscribe(const std::string &topic, Handler handler)
{
    if (!handler)
    {
        return {};
    }
    std::lock_guard<std::mutex> lock(m_registry->mutex);
    const std::uint64_t id = m_registry->nextId++;
    m_registry->topics[topic].emplace_back(id, std::make_shared<Handler>(std::move(handler)));
    return Subscription(m_registry, topic, id);
}

void EventBus::dispatch(const std::string &topic, EventContext context)
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.push_back(Pending{topic, std::move(context)});
}

bool EventBus::takeNext(Pending &event, std::vector<std::shared_ptr<Handler>> &handlers)
{
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_queue.empty())
        {
            return false;
        }
        event = std::move(m_queue.front());
        m_queue.pop_front();
    }

    handlers.clear();
    std::lock_guard<std::mutex> lock(m_registry->mutex);
    const auto found = m_registry->topics.find(event.topic);
    if (found != m_registry->topics.end())
    {
        for (const auto &entry : found->second)
        {
            handlers.push_back(entry.second);
        }
    }
    return true;
}

std::size_t EventBus::pump()
{
    std::size_t delivered = 0;
    Pending event;
    std::vector<std::shared_ptr<Handler>> handlers;
    while (takeNext(event, handlers))
    {
        if (handlers.empty())
        {
            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                ++m_unconsumed;
            }
            telemetry::emit(m_telemetry, "event_bus.no_listener", {{"event", event.topic}});
            continue;
        }

        for (const auto &handler : handlers)
        {
            try
            {
                (*handler)(event.context);
            }
            catch (const std::exception &ex)
            {
                telemetry::emit(m_telemetry, "event_bus.warning",
                                {{"event", event.topic}, {"reason", "handler_exception"}, {"message", ex.what()}});
            }
            catch (...)
            {
                telemetry::emit(m_telemetry, "event_bus.warning",
                                {{"event", event.topic}, {"reason", "handler_exception"}, {"message", "unknown"}});
            }
        }
        ++delivered;
    }
    return delivered;
}

std::size_t EventBus::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}

std::size_t EventBus::unconsumedCount() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_unconsumed;
}
