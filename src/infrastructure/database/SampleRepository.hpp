#pragma once

#include "core/services/IMetricsSink.hpp"
#include "core/types/MetricSample.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace beamstate::infra {

/**
 * @brief Stores collected metric samples in the metric_samples table.
 *
 * Samples are written as they arrive; cleanup() removes rows older than the
 * configured retention.
 */
class SampleRepository : public core::IMetricsSink {
public:
    explicit SampleRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts one sample. Database errors are logged, not thrown.
     */
    void record(const core::MetricSample& sample) override;

    /**
     * @brief Returns the most recent samples of one series, newest first.
     */
    std::vector<core::MetricSample> findSamples(int64_t nodeId, int64_t metricId,
                                                std::optional<int> interfaceIndex,
                                                int limit = 100);

    /**
     * @brief Returns the most recent samples of every series of a node since a point in time.
     */
    std::vector<core::MetricSample> findSamplesSince(int64_t nodeId,
                                                     std::chrono::system_clock::time_point since);

    [[nodiscard]] int64_t sampleCount();

    /**
     * @brief Deletes samples older than retentionDays.
     * @return Number of deleted rows.
     */
    int cleanup(int retentionDays);

private:
    static core::MetricSample readSample(const Statement& stmt);

    std::shared_ptr<Database> db_;
};

} // namespace beamstate::infra
