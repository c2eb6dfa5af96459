/**
 * @file resource_manager.cpp
 * @brief Implementation of resource limit policy
 *
 * **Hard usage thresholds** (ValidateResourceUsage):
 * | Metric                | Threshold  | Type              | Severity |
 * |-----------------------|------------|-------------------|----------|
 * | CPU                   | > 90%      | cpu_high_usage    | warning  |
 * | Memory / limit        | > 85%      | memory_high_usage | warning  |
 * | Network rx + tx       | > 100 MiB/s| network_high_io   | info     |
 * | Disk read + write     | > 50 MiB/s | disk_high_io      | info     |
 *
 * **Presets**:
 * | Tier    | Shares | CPU | Memory  | PIDs | Bandwidth | IOPS |
 * |---------|--------|-----|---------|------|-----------|------|
 * | minimal | 512    | 0.5 | 256 MiB | 50   | 50m       | 500  |
 * | small   | 1024   | 1   | 512 MiB | 100  | 100m      | 1000 |
 * | medium  | 2048   | 2   | 1 GiB   | 200  | 200m      | 2000 |
 * | large   | 4096   | 4   | 2 GiB   | 500  | 500m      | 5000 |
 *
 * @date 2025
 */

#include "cellguard/core/resource_manager.hpp"
#include "cellguard/core/errors.hpp"
#include "cellguard/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace cellguard {
namespace core {

namespace {

constexpr double kCpuViolationPercent = 90.0;
constexpr double kMemoryViolationPercent = 85.0;
constexpr std::int64_t kNetworkViolationRate = 100 * kMiB;
constexpr std::int64_t kDiskViolationRate = 50 * kMiB;

constexpr std::int64_t kDefaultPidsLimit = 100;
constexpr std::int64_t kDefaultIops = 1000;
const char* const kDefaultBandwidth = "100m";

// /dev/null, /dev/zero, /dev/urandom, pseudo-terminals
const std::vector<std::string> kDeviceCgroupRules = {
    "c 1:3 rmw",
    "c 1:5 rmw",
    "c 1:9 rmw",
    "c 136:* rmw"
};

std::int64_t CoresToQuota(double cores) {
    return static_cast<std::int64_t>(std::llround(cores * static_cast<double>(kDefaultCpuPeriod)));
}

ResourceLimits MakeLimits(std::int64_t shares, double cores, std::int64_t memory,
                          std::int64_t pids, const std::string& bandwidth, std::int64_t iops) {
    ResourceLimits limits;
    limits.cpu_shares = shares;
    limits.cpu_quota = CoresToQuota(cores);
    limits.cpu_period = kDefaultCpuPeriod;
    limits.memory = memory;
    limits.memory_swap = memory;  // swap disabled
    limits.pids_limit = pids;
    limits.io_max_bandwidth = bandwidth;
    limits.io_max_iops = iops;
    return limits;
}

ResourceViolation MakeViolation(const std::string& type, double threshold, double current,
                                const std::string& description, Severity severity,
                                std::chrono::system_clock::time_point timestamp) {
    ResourceViolation violation;
    violation.type = type;
    violation.threshold = threshold;
    violation.current_value = current;
    violation.description = description;
    violation.severity = severity;
    violation.timestamp = timestamp;
    return violation;
}

} // anonymous namespace

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

std::string WorkloadTypeToString(WorkloadType type) {
    switch (type) {
        case WorkloadType::DEVELOPMENT: return "development";
        case WorkloadType::BUILD:       return "build";
        case WorkloadType::TEST:        return "test";
        case WorkloadType::PRODUCTION:  return "production";
    }
    return "unknown";
}

WorkloadType WorkloadTypeFromString(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(name);
    if (lower == "development") return WorkloadType::DEVELOPMENT;
    if (lower == "build") return WorkloadType::BUILD;
    if (lower == "test") return WorkloadType::TEST;
    if (lower == "production") return WorkloadType::PRODUCTION;
    throw InvalidArgumentError("unknown workload type: " + name);
}

std::optional<ResourcePreset> ResourcePresetFromString(const std::string& name) {
    if (name == "minimal") return ResourcePreset::MINIMAL;
    if (name == "small") return ResourcePreset::SMALL;
    if (name == "medium") return ResourcePreset::MEDIUM;
    if (name == "large") return ResourcePreset::LARGE;
    return std::nullopt;
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ResourceManager::ResourceManager(std::shared_ptr<PolicyStore> policy)
    : policy_(policy ? std::move(policy) : std::make_shared<PolicyStore>()) {
    spdlog::debug("Resource Manager initialized");
}

ResourceManager::~ResourceManager() = default;

// ============================================================================
// LIMIT CONSTRUCTION
// ============================================================================

ResourceLimits ResourceManager::CreateResourceLimits() const {
    auto config = policy_->Get();

    return MakeLimits(kDefaultCpuShares,
                      config->default_cpu_limit,
                      config->default_memory_limit,
                      kDefaultPidsLimit,
                      kDefaultBandwidth,
                      kDefaultIops);
}

ResourceLimits ResourceManager::CreateCustomResourceLimits(const ResourceLimitRequest& request) const {
    ResourceLimits limits = CreateResourceLimits();

    if (request.cpu_cores > 0) {
        limits.cpu_quota = CoresToQuota(request.cpu_cores);
    }
    if (request.memory_bytes > 0) {
        limits.memory = request.memory_bytes;
        limits.memory_swap = request.memory_bytes;
    }
    if (request.pids_limit > 0) {
        limits.pids_limit = request.pids_limit;
    }
    if (!request.io_max_bandwidth.empty()) {
        limits.io_max_bandwidth = request.io_max_bandwidth;
    }
    if (request.io_max_iops > 0) {
        limits.io_max_iops = request.io_max_iops;
    }

    return limits;
}

runtime::Resources ResourceManager::ToRuntimeResources(const ResourceLimits& limits) const {
    runtime::Resources resources;
    resources.cpu_shares = limits.cpu_shares;
    resources.cpu_quota = limits.cpu_quota;
    resources.cpu_period = limits.cpu_period;
    resources.memory = limits.memory;
    resources.memory_swap = limits.memory_swap;
    resources.blkio_weight = kDefaultBlkioWeight;
    resources.device_cgroup_rules = kDeviceCgroupRules;

    if (limits.pids_limit > 0) {
        resources.pids_limit = limits.pids_limit;
    }

    return resources;
}

// ============================================================================
// VALIDATION
// ============================================================================

void ResourceManager::ValidateResourceLimits(const ResourceLimits* limits) const {
    if (limits == nullptr) {
        throw InvalidArgumentError("resource limits cannot be nil");
    }

    if (limits->cpu_quota < 0) {
        throw InvalidArgumentError("CPU quota cannot be negative");
    }
    if (limits->cpu_period <= 0) {
        throw InvalidArgumentError("CPU period must be positive");
    }
    if (limits->cpu_shares < 0) {
        throw InvalidArgumentError("CPU shares cannot be negative");
    }

    if (limits->memory < 0) {
        throw InvalidArgumentError("memory limit cannot be negative");
    }
    if (limits->memory > 0 && limits->memory < kMinimumMemory) {
        throw PolicyViolationError("memory limit too small (minimum 4MB)");
    }
    if (limits->memory_swap != kUnlimitedSwap && limits->memory_swap < limits->memory) {
        throw PolicyViolationError("memory+swap limit must be >= memory limit");
    }

    if (limits->pids_limit < 0) {
        throw InvalidArgumentError("PIDs limit cannot be negative");
    }
}

std::vector<ResourceViolation> ResourceManager::ValidateResourceUsage(const WorkspaceMetrics& metrics) const {
    std::vector<ResourceViolation> violations;
    const auto now = std::chrono::system_clock::now();

    if (metrics.cpu_percent > kCpuViolationPercent) {
        violations.push_back(MakeViolation("cpu_high_usage", kCpuViolationPercent,
                                           metrics.cpu_percent,
                                           "CPU usage exceeded 90%",
                                           Severity::WARNING, now));
    }

    if (metrics.memory_limit > 0) {
        double memory_percent = static_cast<double>(metrics.memory_usage) /
                                static_cast<double>(metrics.memory_limit) * 100.0;
        if (memory_percent > kMemoryViolationPercent) {
            violations.push_back(MakeViolation("memory_high_usage", kMemoryViolationPercent,
                                               memory_percent,
                                               "Memory usage exceeded 85%",
                                               Severity::WARNING, now));
        }
    }

    const std::int64_t network_io = metrics.network_rx + metrics.network_tx;
    if (network_io > kNetworkViolationRate) {
        violations.push_back(MakeViolation("network_high_io",
                                           static_cast<double>(kNetworkViolationRate),
                                           static_cast<double>(network_io),
                                           "Network I/O exceeded 100MB/s",
                                           Severity::INFO, now));
    }

    const std::int64_t disk_io = metrics.disk_read + metrics.disk_write;
    if (disk_io > kDiskViolationRate) {
        violations.push_back(MakeViolation("disk_high_io",
                                           static_cast<double>(kDiskViolationRate),
                                           static_cast<double>(disk_io),
                                           "Disk I/O exceeded 50MB/s",
                                           Severity::INFO, now));
    }

    return violations;
}

// ============================================================================
// ADAPTIVE LIMITS AND PRESETS
// ============================================================================

ResourceLimits ResourceManager::WorkloadBaseline(WorkloadType workload) {
    switch (workload) {
        case WorkloadType::DEVELOPMENT:
            return MakeLimits(kDefaultCpuShares, 2.0, 1 * kGiB, 200, kDefaultBandwidth, kDefaultIops);
        case WorkloadType::BUILD:
            return MakeLimits(kDefaultCpuShares, 4.0, 2 * kGiB, 500, kDefaultBandwidth, 2000);
        case WorkloadType::TEST:
            return MakeLimits(kDefaultCpuShares, 1.0, 512 * kMiB, 100, kDefaultBandwidth, kDefaultIops);
        case WorkloadType::PRODUCTION:
            return MakeLimits(kDefaultCpuShares, 1.5, 1 * kGiB, 300, kDefaultBandwidth, 1500);
    }
    throw InvalidArgumentError("unknown workload type");
}

ResourceLimits ResourceManager::CalculateOptimalLimits(WorkloadType workload,
                                                       const std::vector<WorkspaceMetrics>& history) const {
    ResourceLimits limits = WorkloadBaseline(workload);

    if (history.empty()) {
        return limits;
    }

    double total_cores = 0.0;
    double total_memory = 0.0;
    for (const auto& sample : history) {
        total_cores += sample.cpu_percent / 100.0;
        total_memory += static_cast<double>(sample.memory_usage);
    }

    const double samples = static_cast<double>(history.size());
    const double mean_cores = total_cores / samples;
    const double mean_memory = total_memory / samples;

    const double recommended_cores = mean_cores * 1.5;
    if (recommended_cores > limits.CpuCores()) {
        limits.cpu_quota = CoresToQuota(recommended_cores);
    }

    const auto recommended_memory = static_cast<std::int64_t>(mean_memory * 1.2);
    if (recommended_memory > limits.memory) {
        limits.memory = recommended_memory;
        limits.memory_swap = recommended_memory;
    }

    spdlog::debug("Optimal limits for {} workload over {} samples: {:.2f} cores, {} bytes",
                  WorkloadTypeToString(workload), history.size(),
                  limits.CpuCores(), limits.memory);
    return limits;
}

ResourceLimits ResourceManager::GetResourceLimitPreset(ResourcePreset preset) {
    switch (preset) {
        case ResourcePreset::MINIMAL:
            return MakeLimits(512, 0.5, 256 * kMiB, 50, "50m", 500);
        case ResourcePreset::SMALL:
            return MakeLimits(1024, 1.0, 512 * kMiB, 100, "100m", 1000);
        case ResourcePreset::MEDIUM:
            return MakeLimits(2048, 2.0, 1 * kGiB, 200, "200m", 2000);
        case ResourcePreset::LARGE:
            return MakeLimits(4096, 4.0, 2 * kGiB, 500, "500m", 5000);
    }
    throw InvalidArgumentError("unknown resource preset");
}

ResourceLimits ResourceManager::GetResourceLimitPreset(const std::string& name) const {
    auto preset = ResourcePresetFromString(name);
    if (!preset) {
        spdlog::debug("Unknown preset '{}', using policy defaults", name);
        return CreateResourceLimits();
    }
    return GetResourceLimitPreset(*preset);
}

} // namespace core
} // namespace cellguard
