#pragma once

#include "core/services/INotifier.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace beamstate::test {

class RecordingNotifier : public core::INotifier {
public:
    struct Sent {
        int priority;
        std::string title;
        std::string message;
    };

    void notify(int priority, const std::string& title, const std::string& message) override {
        {
            std::lock_guard lock(mutex_);
            sent_.push_back({priority, title, message});
        }
        cv_.notify_all();
    }

    std::vector<Sent> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    size_t count() const {
        std::lock_guard lock(mutex_);
        return sent_.size();
    }

    size_t countTitled(const std::string& fragment) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& entry : sent_) {
            if (entry.title.find(fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    bool waitForCount(size_t expected, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return sent_.size() >= expected; });
    }

    void clear() {
        std::lock_guard lock(mutex_);
        sent_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Sent> sent_;
};

} // namespace beamstate::test
