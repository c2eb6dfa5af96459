/**
 * @file metrics_sampler.hpp
 * @brief Source of live workspace usage samples
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_types.hpp"
#include "cellguard/monitors/security_types.hpp"
#include "cellguard/runtime/container_runtime.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cellguard {
namespace monitors {

/**
 * @class MetricsSampler
 * @brief Produces one usage sample per call for a watched workspace
 */
class MetricsSampler {
public:
    virtual ~MetricsSampler() = default;

    /**
     * @return Sample, or std::nullopt when the container is not running
     * @throws core::RuntimeError when the runtime cannot be queried
     */
    virtual std::optional<core::WorkspaceMetrics> Sample(const WatchedWorkspace& workspace) = 0;
};

/**
 * @class RuntimeMetricsSampler
 * @brief Derives per-second rates from consecutive runtime stats
 *
 * The runtime reports cumulative network and block I/O counters. The first
 * sample of a container therefore reports zero rates.
 */
class RuntimeMetricsSampler : public MetricsSampler {
public:
    explicit RuntimeMetricsSampler(std::shared_ptr<runtime::ContainerRuntime> runtime);

    std::optional<core::WorkspaceMetrics> Sample(const WatchedWorkspace& workspace) override;

    /// Drop the remembered counters of a container
    void Forget(const std::string& container_id);

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    std::mutex mutex_;
    std::map<std::string, runtime::ContainerStats> previous_;
};

} // namespace monitors
} // namespace cellguard
