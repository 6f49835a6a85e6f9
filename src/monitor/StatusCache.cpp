#include "monitor/StatusCache.hpp"

#include <vector>

namespace beamstate::monitor {

std::shared_ptr<StatusCache::Entry> StatusCache::entry(int64_t nodeId) {
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(nodeId);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto& slot = entries_[nodeId];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

std::optional<core::StatusRecord> StatusCache::snapshot(int64_t nodeId) const {
    std::shared_ptr<Entry> target;
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(nodeId);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        target = it->second;
    }

    std::lock_guard lock(target->mutex);
    return target->record;
}

std::map<int64_t, core::StatusRecord> StatusCache::snapshotAll() const {
    std::vector<std::pair<int64_t, std::shared_ptr<Entry>>> targets;
    {
        std::shared_lock lock(mutex_);
        targets.assign(entries_.begin(), entries_.end());
    }

    std::map<int64_t, core::StatusRecord> result;
    for (const auto& [id, target] : targets) {
        std::lock_guard lock(target->mutex);
        result.emplace(id, target->record);
    }
    return result;
}

void StatusCache::remove(int64_t nodeId) {
    std::unique_lock lock(mutex_);
    entries_.erase(nodeId);
}

void StatusCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t StatusCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace beamstate::monitor
