#include "monitor/TraceBus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace beamstate::monitor {

TraceSubscription::TraceSubscription(size_t capacity) : capacity_(capacity) {}

std::optional<core::TraceEvent> TraceSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<core::TraceEvent> TraceSubscription::tryNext() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void TraceSubscription::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool TraceSubscription::isClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool TraceSubscription::isDropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

size_t TraceSubscription::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

bool TraceSubscription::offer(const core::TraceEvent& event) {
    bool accepted = false;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        if (capacity_ != UNBOUNDED && queue_.size() >= capacity_) {
            closed_ = true;
            dropped_ = true;
        } else {
            queue_.push_back(event);
            accepted = true;
        }
    }
    cv_.notify_all();
    return accepted;
}

TraceBus::TraceBus(size_t capacity, size_t subscriberBacklog)
    : capacity_(capacity > 0 ? capacity : 1),
      subscriberBacklog_(subscriberBacklog > 0 ? subscriberBacklog : 1) {}

core::TraceEvent TraceBus::publish(core::TraceEvent event) {
    std::lock_guard lock(mutex_);

    event.sequence = nextSequence_++;
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }

    auto it = std::remove_if(subscribers_.begin(), subscribers_.end(),
                             [&event](const std::shared_ptr<TraceSubscription>& subscriber) {
                                 if (subscriber->offer(event)) {
                                     return false;
                                 }
                                 if (subscriber->isDropped()) {
                                     spdlog::warn("Trace subscriber fell behind, dropping it");
                                 }
                                 return true;
                             });
    subscribers_.erase(it, subscribers_.end());

    spdlog::debug("Trace #{}: {} ({}) {} -> {}: {}", event.sequence, event.nodeName,
                  event.nodeIp, core::statusToString(event.oldStatus),
                  core::statusToString(event.newStatus), event.reason);
    return event;
}

std::vector<core::TraceEvent> TraceBus::recent(size_t limit) const {
    std::lock_guard lock(mutex_);
    auto count = std::min(limit, events_.size());
    return {events_.end() - static_cast<std::ptrdiff_t>(count), events_.end()};
}

std::shared_ptr<TraceSubscription> TraceBus::subscribe(bool replay) {
    std::lock_guard lock(mutex_);

    auto backlog = subscriberBacklog_ + (replay ? events_.size() : 0);
    auto subscription = std::make_shared<TraceSubscription>(backlog);
    if (replay) {
        for (const auto& event : events_) {
            subscription->offer(event);
        }
    }
    subscribers_.push_back(subscription);

    spdlog::debug("Trace subscriber attached (replay: {}, {} buffered)", replay,
                  replay ? events_.size() : 0);
    return subscription;
}

std::shared_ptr<TraceSubscription> TraceBus::subscribeLossless() {
    std::lock_guard lock(mutex_);
    auto subscription = std::make_shared<TraceSubscription>(TraceSubscription::UNBOUNDED);
    subscribers_.push_back(subscription);
    spdlog::debug("Lossless trace subscriber attached");
    return subscription;
}

void TraceBus::unsubscribe(const std::shared_ptr<TraceSubscription>& subscription) {
    {
        std::lock_guard lock(mutex_);
        std::erase(subscribers_, subscription);
    }
    if (subscription) {
        subscription->close();
    }
}

size_t TraceBus::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

size_t TraceBus::subscriberCount() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
}

uint64_t TraceBus::lastSequence() const {
    std::lock_guard lock(mutex_);
    return nextSequence_ - 1;
}

} // namespace beamstate::monitor
