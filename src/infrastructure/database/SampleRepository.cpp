#include "infrastructure/database/SampleRepository.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace beamstate::infra {

namespace {

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMs(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

} // namespace

SampleRepository::SampleRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void SampleRepository::record(const core::MetricSample& sample) {
    try {
        auto stmt = db_->prepare(R"(
            INSERT INTO metric_samples (node_id, metric_id, interface_index, value, rate, unit, timestamp_ms)
            VALUES (?, ?, ?, ?, ?, ?, ?)
        )");
        stmt.bind(1, sample.nodeId);
        stmt.bind(2, sample.metricId);
        stmt.bind(3, sample.interfaceIndex);
        stmt.bind(4, sample.value);
        stmt.bind(5, sample.rate);
        stmt.bind(6, sample.unit);
        stmt.bind(7, toEpochMs(sample.timestamp));
        stmt.step();
    } catch (const std::exception& e) {
        spdlog::error("Failed to store sample for node {} metric {}: {}", sample.nodeId,
                      sample.metricId, e.what());
    }
}

core::MetricSample SampleRepository::readSample(const Statement& stmt) {
    core::MetricSample sample;
    sample.nodeId = stmt.columnInt64(0);
    sample.metricId = stmt.columnInt64(1);
    sample.interfaceIndex = stmt.columnOptionalInt(2);
    sample.value = stmt.columnDouble(3);
    sample.rate = stmt.columnOptionalDouble(4);
    sample.unit = stmt.columnText(5);
    sample.timestamp = fromEpochMs(stmt.columnInt64(6));
    return sample;
}

std::vector<core::MetricSample> SampleRepository::findSamples(int64_t nodeId, int64_t metricId,
                                                              std::optional<int> interfaceIndex,
                                                              int limit) {
    // "IS ?" matches NULL against NULL for system metrics without an index
    auto stmt = db_->prepare(R"(
        SELECT node_id, metric_id, interface_index, value, rate, unit, timestamp_ms
        FROM metric_samples
        WHERE node_id = ? AND metric_id = ? AND interface_index IS ?
        ORDER BY timestamp_ms DESC, id DESC
        LIMIT ?
    )");
    stmt.bind(1, nodeId);
    stmt.bind(2, metricId);
    stmt.bind(3, interfaceIndex);
    stmt.bind(4, limit);

    std::vector<core::MetricSample> samples;
    while (stmt.step()) {
        samples.push_back(readSample(stmt));
    }
    return samples;
}

std::vector<core::MetricSample>
SampleRepository::findSamplesSince(int64_t nodeId, std::chrono::system_clock::time_point since) {
    auto stmt = db_->prepare(R"(
        SELECT node_id, metric_id, interface_index, value, rate, unit, timestamp_ms
        FROM metric_samples
        WHERE node_id = ? AND timestamp_ms >= ?
        ORDER BY timestamp_ms ASC, id ASC
    )");
    stmt.bind(1, nodeId);
    stmt.bind(2, toEpochMs(since));

    std::vector<core::MetricSample> samples;
    while (stmt.step()) {
        samples.push_back(readSample(stmt));
    }
    return samples;
}

int64_t SampleRepository::sampleCount() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM metric_samples");
    if (stmt.step()) {
        return stmt.columnInt64(0);
    }
    return 0;
}

int SampleRepository::cleanup(int retentionDays) {
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retentionDays);
    int removed = 0;
    db_->transaction([&]() {
        auto stmt = db_->prepare("DELETE FROM metric_samples WHERE timestamp_ms < ?");
        stmt.bind(1, toEpochMs(cutoff));
        stmt.step();
        removed = db_->changes();
    });
    spdlog::info("Cleaned up {} metric samples older than {} days", removed, retentionDays);
    return removed;
}

} // namespace beamstate::infra
