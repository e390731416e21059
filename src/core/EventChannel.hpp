#pragma once

/**
 * EventChannel.hpp
 *
 * Typed publish/subscribe channel. Each publisher owns its channels; there is
 * no process-wide bus. Subscribers register and unregister explicitly.
 */

#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace surge::core {

/**
 * Subscription handle
 *
 * Cancelling the handle stops delivery immediately, even if the owning
 * channel has not pruned the entry yet.
 */
class Subscription {
public:
    explicit Subscription(uint64_t id)
        : m_id(id), m_active(true) {}

    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventChannel - synchronous delivery to every active subscriber
 *
 * publish() calls subscribers on the publishing thread, outside the channel
 * lock, in subscription order. Ordering between concurrent publishers is the
 * caller's responsibility.
 */
template<typename Event>
class EventChannel {
public:
    using Callback = std::function<void(const Event&)>;

    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * Subscribe to the channel
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto subscription = std::make_shared<Subscription>(m_nextId++);
        m_subscribers.push_back({std::move(callback), subscription});
        return subscription;
    }

    /**
     * Unsubscribe. Idempotent; unknown handles are ignored.
     * @param subscription Subscription handle
     * @return true if the handle belonged to this channel
     */
    bool unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return false;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);
        auto before = m_subscribers.size();
        m_subscribers.erase(
            std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                [&subscription](const Entry& entry) {
                    return entry.subscription == subscription;
                }),
            m_subscribers.end()
        );
        return m_subscribers.size() != before;
    }

    /**
     * Deliver an event to all active subscribers
     * @param event Event payload
     */
    void publish(const Event& event) {
        std::vector<Entry> entries;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            entries = m_subscribers;
        }

        for (const auto& entry : entries) {
            if (!entry.subscription->isActive()) {
                continue;
            }
            try {
                entry.callback(event);
            } catch (const std::exception& e) {
                LOG_WARN("Subscriber {} threw: {}", entry.subscription->getId(), e.what());
            }
        }
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_subscribers) {
            entry.subscription->cancel();
        }
        m_subscribers.clear();
    }

private:
    struct Entry {
        Callback callback;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_subscribers;
    uint64_t m_nextId{0};
};

} // namespace surge::core
