#pragma once

#include "core/types/StatusRecord.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace beamstate::monitor {

/**
 * @file StatusCache.hpp
 * @brief Latest reachability and metric state of every node.
 */

/**
 * @brief Per-node StatusRecord store with per-entry locking.
 *
 * The map itself is guarded by a shared mutex; each record has its own mutex
 * so that node loops never contend with each other. Readers get copies.
 */
class StatusCache {
public:
    /**
     * @brief Runs fn on the node's record under its lock, creating the record if needed.
     *
     * The node's loop is the only writer of its record; fn must not call back
     * into the cache for the same node.
     * @param nodeId Node whose record is updated.
     * @param fn Callable taking core::StatusRecord&.
     * @return Whatever fn returns.
     */
    template <typename Fn>
    auto update(int64_t nodeId, Fn&& fn) {
        auto target = entry(nodeId);
        std::lock_guard lock(target->mutex);
        return fn(target->record);
    }

    /**
     * @brief Copies one node's record.
     * @param nodeId Node to look up.
     * @return The record, or nullopt if the node has never been checked or paused.
     */
    [[nodiscard]] std::optional<core::StatusRecord> snapshot(int64_t nodeId) const;

    /**
     * @brief Copies every record, keyed by node id.
     *
     * Each record is copied under its own lock, so the result is consistent per
     * node but not across nodes.
     */
    [[nodiscard]] std::map<int64_t, core::StatusRecord> snapshotAll() const;

    /**
     * @brief Drops a node's record. An update already holding the entry completes on the old record.
     */
    void remove(int64_t nodeId);

    /**
     * @brief Drops every record.
     */
    void clear();

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        core::StatusRecord record;
    };

    std::shared_ptr<Entry> entry(int64_t nodeId);

    mutable std::shared_mutex mutex_;
    std::unordered_map<int64_t, std::shared_ptr<Entry>> entries_;
};

} // namespace beamstate::monitor
