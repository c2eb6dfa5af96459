/**
 * @file metrics_sampler.cpp
 * @brief Runtime-backed workspace usage sampling
 *
 * @date 2025
 */

#include "cellguard/monitors/metrics_sampler.hpp"
#include "cellguard/core/errors.hpp"


namespace cellguard {
namespace monitors {

namespace {

// Counter resets (container restart) yield 0 rather than a negative rate
std::int64_t RatePerSecond(std::int64_t current, std::int64_t previous, double seconds) {
    if (seconds <= 0.0 || current < previous) {
        return 0;
    }
    return static_cast<std::int64_t>(static_cast<double>(current - previous) / seconds);
}

} // anonymous namespace

RuntimeMetricsSampler::RuntimeMetricsSampler(std::shared_ptr<runtime::ContainerRuntime> runtime)
    : runtime_(std::move(runtime)) {
    if (!runtime_) {
        throw core::InvalidArgumentError("container runtime cannot be nil");
    }
}

std::optional<core::WorkspaceMetrics> RuntimeMetricsSampler::Sample(const WatchedWorkspace& workspace) {
    auto stats = runtime_->GetContainerStats(workspace.container_id);
    if (!stats) {
        Forget(workspace.container_id);
        return std::nullopt;
    }

    core::WorkspaceMetrics metrics;
    metrics.workspace_id = workspace.workspace_id;
    metrics.cpu_percent = stats->cpu_usage_percent;
    metrics.memory_usage = stats->memory_usage_bytes;
    metrics.memory_limit = stats->memory_limit_bytes > 0 ? stats->memory_limit_bytes
                                                         : workspace.limits.memory;
    metrics.process_count = stats->process_count;
    metrics.timestamp = stats->timestamp;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = previous_.find(workspace.container_id);
    if (it != previous_.end()) {
        const auto& prev = it->second;
        const double seconds = std::chrono::duration<double>(stats->timestamp - prev.timestamp).count();

        metrics.network_rx = RatePerSecond(stats->network_rx_bytes, prev.network_rx_bytes, seconds);
        metrics.network_tx = RatePerSecond(stats->network_tx_bytes, prev.network_tx_bytes, seconds);
        metrics.disk_read = RatePerSecond(stats->block_read_bytes, prev.block_read_bytes, seconds);
        metrics.disk_write = RatePerSecond(stats->block_write_bytes, prev.block_write_bytes, seconds);
    }
    previous_[workspace.container_id] = *stats;

    return metrics;
}

void RuntimeMetricsSampler::Forget(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    previous_.erase(container_id);
}

} // namespace monitors
} // namespace cellguard
