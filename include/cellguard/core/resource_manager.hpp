/**
 * @file resource_manager.hpp
 * @brief Resource limit computation, validation and usage evaluation
 *
 * Builds CPU, memory, process and I/O ceilings from policy defaults, presets,
 * workload baselines or caller overrides. Converts them to runtime resource
 * constraints and checks live usage samples against fixed hard thresholds.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_config.hpp"
#include "cellguard/core/isolation_types.hpp"
#include "cellguard/runtime/container_spec.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cellguard {
namespace core {

/**
 * @struct ResourceLimitRequest
 * @brief Caller overrides for CreateCustomResourceLimits
 *
 * Zero or empty fields keep the policy default.
 */
struct ResourceLimitRequest {
    double cpu_cores{0.0};
    std::int64_t memory_bytes{0};
    std::int64_t pids_limit{0};
    std::string io_max_bandwidth;
    std::int64_t io_max_iops{0};
};

/**
 * @enum WorkloadType
 * @brief Workload classification used to pick baseline limits
 */
enum class WorkloadType {
    DEVELOPMENT,  ///< 2 CPU / 1 GiB / 200 procs
    BUILD,        ///< 4 CPU / 2 GiB / 500 procs / 2000 IOPS
    TEST,         ///< 1 CPU / 512 MiB / 100 procs
    PRODUCTION    ///< 1.5 CPU / 1 GiB / 300 procs / 1500 IOPS
};

std::string WorkloadTypeToString(WorkloadType type);

/**
 * @brief Parse "development", "build", "test" or "production"
 * @throws InvalidArgumentError on an unknown name
 */
WorkloadType WorkloadTypeFromString(const std::string& name);

/**
 * @enum ResourcePreset
 * @brief Hand-tuned limit tiers
 */
enum class ResourcePreset {
    MINIMAL,  ///< 0.5 CPU / 256 MiB / 50 procs
    SMALL,    ///< 1 CPU / 512 MiB / 100 procs
    MEDIUM,   ///< 2 CPU / 1 GiB / 200 procs
    LARGE     ///< 4 CPU / 2 GiB / 500 procs
};

std::optional<ResourcePreset> ResourcePresetFromString(const std::string& name);

/**
 * @class ResourceManager
 * @brief Stateless limit arithmetic over the shared isolation policy
 *
 * Every operation reads one policy snapshot, so a concurrent UpdateConfig
 * never yields a mix of old and new defaults.
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class ResourceManager {
public:
    /**
     * @param policy Shared policy store; null uses process defaults
     */
    explicit ResourceManager(std::shared_ptr<PolicyStore> policy = nullptr);
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    /**
     * @brief Default limits from policy
     *
     * Quota = default CPU x 100000us period, memory = default memory with
     * swap disabled, 100 processes, "100m" bandwidth and 1000 IOPS.
     */
    ResourceLimits CreateResourceLimits() const;

    /**
     * @brief Default limits with the request's positive fields applied
     */
    ResourceLimits CreateCustomResourceLimits(const ResourceLimitRequest& request) const;

    /**
     * @brief Map limits onto runtime resource constraints
     *
     * Adds a fixed block-I/O weight and the device allow-list for /dev/null,
     * /dev/zero, /dev/urandom and pseudo-terminals. The PID ceiling is set
     * only when positive.
     */
    runtime::Resources ToRuntimeResources(const ResourceLimits& limits) const;

    /**
     * @brief Enforce the ResourceLimits invariants
     * @throws InvalidArgumentError for null or negative/zero fields
     * @throws PolicyViolationError for memory below 4 MiB or memory+swap below memory
     */
    void ValidateResourceLimits(const ResourceLimits* limits) const;

    /**
     * @brief Evaluate one usage sample against the hard thresholds
     *
     * CPU > 90% and memory > 85% of limit raise warnings. Network rx+tx above
     * 100 MiB/s and disk read+write above 50 MiB/s raise infos.
     *
     * @return Violations in evaluation order (possibly empty)
     */
    std::vector<ResourceViolation> ValidateResourceUsage(const WorkspaceMetrics& metrics) const;

    /**
     * @brief Workload baseline raised to fit observed usage
     *
     * CPU becomes 1.5x the mean observed cores and memory 1.2x the mean
     * observed memory whenever that exceeds the baseline. Never lowers.
     */
    ResourceLimits CalculateOptimalLimits(WorkloadType workload,
                                          const std::vector<WorkspaceMetrics>& history) const;

    /**
     * @brief Preset tier by name; unknown names yield CreateResourceLimits()
     */
    ResourceLimits GetResourceLimitPreset(const std::string& name) const;

    static ResourceLimits GetResourceLimitPreset(ResourcePreset preset);

    /**
     * @brief Workload baseline before history adjustment
     */
    static ResourceLimits WorkloadBaseline(WorkloadType workload);

private:
    std::shared_ptr<PolicyStore> policy_;
};

} // namespace core
} // namespace cellguard
