/**
 * @file TraceBus.hpp
 * @brief Append-only store of status transitions with non-blocking fan-out.
 */

#pragma once

#include "core/types/TraceEvent.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace beamstate::monitor {

class TraceBus;

/**
 * @brief A subscriber's bounded view of the trace stream.
 *
 * The bus pushes events into the subscription without ever waiting. When the
 * backlog is full the bus closes the subscription and stops delivering to it;
 * the consumer sees isDropped() and can subscribe again. An UNBOUNDED
 * subscription is never dropped.
 */
class TraceSubscription {
public:
    static constexpr size_t UNBOUNDED = 0;

    explicit TraceSubscription(size_t capacity);

    TraceSubscription(const TraceSubscription&) = delete;
    TraceSubscription& operator=(const TraceSubscription&) = delete;

    /**
     * @brief Waits for the next event.
     * @param timeout Maximum time to wait.
     * @return The event, or nullopt on timeout or once closed and drained.
     */
    std::optional<core::TraceEvent> next(std::chrono::milliseconds timeout);

    /**
     * @brief Returns the next event without waiting.
     */
    std::optional<core::TraceEvent> tryNext();

    /**
     * @brief Stops delivery and wakes any waiting consumer.
     */
    void close();

    [[nodiscard]] bool isClosed() const;

    /**
     * @brief True if the bus closed this subscription because its backlog overflowed.
     */
    [[nodiscard]] bool isDropped() const;

    [[nodiscard]] size_t pending() const;

private:
    friend class TraceBus;

    bool offer(const core::TraceEvent& event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<core::TraceEvent> queue_;
    size_t capacity_;
    bool closed_{false};
    bool dropped_{false};
};

/**
 * @brief Records every status transition and fans it out to subscribers.
 *
 * Keeps the most recent events in a bounded ring. Publishing, snapshotting and
 * subscribing are serialized by one mutex, so a replaying subscriber sees the
 * buffered history followed by live events with no gap and no duplicate.
 */
class TraceBus {
public:
    static constexpr size_t DEFAULT_CAPACITY = 500;
    static constexpr size_t DEFAULT_SUBSCRIBER_BACKLOG = 100;

    /**
     * @brief Constructs a bus.
     * @param capacity Number of recent events retained.
     * @param subscriberBacklog Live events a subscriber may fall behind before it is dropped.
     */
    explicit TraceBus(size_t capacity = DEFAULT_CAPACITY,
                      size_t subscriberBacklog = DEFAULT_SUBSCRIBER_BACKLOG);

    TraceBus(const TraceBus&) = delete;
    TraceBus& operator=(const TraceBus&) = delete;

    /**
     * @brief Appends an event and delivers it to all subscribers.
     * @param event Event to record; its sequence number is assigned here.
     * @return The stored event.
     */
    core::TraceEvent publish(core::TraceEvent event);

    /**
     * @brief Returns up to limit most recent events, oldest first.
     */
    std::vector<core::TraceEvent> recent(size_t limit = 100) const;

    /**
     * @brief Attaches a new subscriber.
     * @param replay If true, the retained history is queued before live events.
     * @return The subscription; keep it alive for as long as events are wanted.
     */
    std::shared_ptr<TraceSubscription> subscribe(bool replay = false);

    /**
     * @brief Attaches a subscriber that receives every live event.
     *
     * Its backlog has no limit, so it is never dropped. Meant for in-process
     * consumers that must not miss a transition and keep up on average.
     */
    std::shared_ptr<TraceSubscription> subscribeLossless();

    /**
     * @brief Detaches and closes a subscription.
     */
    void unsubscribe(const std::shared_ptr<TraceSubscription>& subscription);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] size_t subscriberCount() const;
    [[nodiscard]] uint64_t lastSequence() const;

private:
    const size_t capacity_;
    const size_t subscriberBacklog_;

    mutable std::mutex mutex_;
    std::deque<core::TraceEvent> events_;
    std::vector<std::shared_ptr<TraceSubscription>> subscribers_;
    uint64_t nextSequence_{1};
};

} // namespace beamstate::monitor
