#pragma once

#include "core/types/MetricSample.hpp"

namespace beamstate::core {

/**
 * @brief Receiver of collected metric samples (time-series storage).
 */
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    /**
     * @brief Stores one sample. May be called concurrently from several node loops.
     */
    virtual void record(const MetricSample& sample) = 0;
};

} // namespace beamstate::core
