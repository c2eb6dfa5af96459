/**
 * @file isolation_types.hpp
 * @brief Core data model of workspace isolation profiles
 *
 * Defines the value types exchanged between the resource, network and
 * isolation managers and the security monitor: resource ceilings, security
 * options, monitoring thresholds, the per-workspace isolation profile, live
 * usage samples and the violations derived from them.
 *
 * All types are plain values. A WorkspaceIsolation owns its limits, security
 * options and monitoring settings by composition.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cellguard {
namespace core {

// ============================================================================
// UNITS AND LIMIT CONSTANTS
// ============================================================================

constexpr std::int64_t kKiB = 1024;
constexpr std::int64_t kMiB = 1024 * kKiB;
constexpr std::int64_t kGiB = 1024 * kMiB;

constexpr std::int64_t kDefaultCpuShares = 1024;
constexpr std::int64_t kDefaultCpuPeriod = 100000;   ///< CFS period in microseconds
constexpr std::int64_t kMinimumMemory = 4 * kMiB;    ///< Smallest accepted memory ceiling
constexpr std::int64_t kUnlimitedSwap = -1;          ///< memory+swap sentinel for "no limit"
constexpr std::uint16_t kDefaultBlkioWeight = 500;

/**
 * @enum Severity
 * @brief Severity attached to violations and alerts
 */
enum class Severity {
    INFO,      ///< Informational, no action needed
    WARNING,   ///< Approaching or exceeding a soft threshold
    ERROR,     ///< Threshold breached, action recommended
    CRITICAL   ///< Security incident, immediate containment
};

std::string SeverityToString(Severity severity);

/**
 * @brief Parse "info", "warning", "error" or "critical" (case-insensitive)
 * @throws InvalidArgumentError on an unknown name
 */
Severity SeverityFromString(const std::string& name);

/**
 * @enum IsolationLevel
 * @brief Overall strength of a workspace profile
 */
enum class IsolationLevel {
    BASIC,
    STANDARD,
    STRICT
};

std::string IsolationLevelToString(IsolationLevel level);

/**
 * @struct ResourceLimits
 * @brief CPU, memory, process and I/O ceilings for one container
 *
 * Invariants (checked by ResourceManager::ValidateResourceLimits):
 * - cpu_quota, cpu_shares and pids_limit are non-negative
 * - cpu_period is positive
 * - memory, when set, is at least 4 MiB
 * - memory_swap is kUnlimitedSwap or at least memory
 */
struct ResourceLimits {
    // CPU
    std::int64_t cpu_shares{0};   ///< Relative CPU weight
    std::int64_t cpu_quota{0};    ///< Microseconds of CPU per period (cores x period)
    std::int64_t cpu_period{0};   ///< CFS period in microseconds

    // Memory
    std::int64_t memory{0};       ///< Memory ceiling in bytes
    std::int64_t memory_swap{0};  ///< Memory+swap ceiling in bytes (-1 = unlimited)

    // Processes
    std::int64_t pids_limit{0};   ///< Process-count ceiling (0 = unset)

    // I/O
    std::string io_max_bandwidth; ///< Bandwidth ceiling, e.g. "100m"
    std::int64_t io_max_iops{0};  ///< IOPS ceiling

    /// CPU quota expressed in cores (quota / period)
    double CpuCores() const {
        return cpu_period > 0 ? static_cast<double>(cpu_quota) / static_cast<double>(cpu_period) : 0.0;
    }
};

bool operator==(const ResourceLimits& lhs, const ResourceLimits& rhs);
inline bool operator!=(const ResourceLimits& lhs, const ResourceLimits& rhs) { return !(lhs == rhs); }

/**
 * @struct CapabilityConfig
 * @brief Linux capability adjustments
 */
struct CapabilityConfig {
    std::vector<std::string> drop;  ///< Capabilities to drop ("ALL" drops everything)
    std::vector<std::string> add;   ///< Capabilities re-added after the drop
};

/**
 * @struct SecurityOptions
 * @brief Kernel hardening options applied at container creation
 */
struct SecurityOptions {
    std::string seccomp_profile;      ///< Seccomp profile name (empty = runtime default)
    std::string apparmor_profile;     ///< AppArmor profile name (empty = none)
    CapabilityConfig capabilities;
    bool no_new_privileges{false};    ///< Block setuid privilege gain
    bool read_only_root_fs{false};    ///< Mount the root filesystem read-only
};

/**
 * @struct AlertThresholds
 * @brief Pre-warning band used by monitoring consumers
 *
 * Differs from the hard-violation thresholds applied by
 * ResourceManager::ValidateResourceUsage.
 */
struct AlertThresholds {
    double cpu_percent{85.0};
    double memory_percent{90.0};
    std::int64_t network_bytes_per_sec{100 * kMiB};
    std::int64_t disk_bytes_per_sec{50 * kMiB};
};

/**
 * @struct MonitoringConfig
 * @brief What the security monitor watches for one workspace
 */
struct MonitoringConfig {
    bool enable_resource_monitoring{true};
    bool enable_network_monitoring{true};
    bool enable_filesystem_audit{false};
    std::string log_level{"info"};
    AlertThresholds alert_thresholds;
};

/**
 * @struct Workspace
 * @brief Minimal workspace handle supplied by the workspace service
 */
struct Workspace {
    std::string id;            ///< Stable, non-empty identifier
    std::string name;
    std::string owner_id;
    std::string project_path;
};

/**
 * @struct WorkspaceIsolation
 * @brief Complete isolation profile of one workspace
 */
struct WorkspaceIsolation {
    std::string workspace_id;
    std::string network_mode;            ///< "custom" = dedicated workspace network
    std::string network_name;            ///< aicli-workspace-<id>
    IsolationLevel isolation_level{IsolationLevel::STANDARD};
    ResourceLimits resource_limits;
    SecurityOptions security_options;
    MonitoringConfig monitoring;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @struct WorkspaceMetrics
 * @brief One live usage sample of a workspace container
 *
 * I/O fields are rates in bytes per second.
 */
struct WorkspaceMetrics {
    std::string workspace_id;
    double cpu_percent{0.0};
    std::int64_t memory_usage{0};
    std::int64_t memory_limit{0};   ///< 0 = no limit known
    std::int64_t network_rx{0};
    std::int64_t network_tx{0};
    std::int64_t disk_read{0};
    std::int64_t disk_write{0};
    int process_count{0};
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct ResourceViolation
 * @brief A live-usage threshold breach
 */
struct ResourceViolation {
    std::string type;          ///< cpu_high_usage, memory_high_usage, network_high_io, disk_high_io
    double threshold{0.0};
    double current_value{0.0};
    std::string description;
    Severity severity{Severity::INFO};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// JSON
// ============================================================================

/// RFC 3339 UTC rendering, e.g. 2025-01-31T12:00:00Z
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

void to_json(nlohmann::json& j, const ResourceLimits& limits);
void to_json(nlohmann::json& j, const SecurityOptions& options);
void to_json(nlohmann::json& j, const MonitoringConfig& config);
void to_json(nlohmann::json& j, const WorkspaceIsolation& isolation);
void to_json(nlohmann::json& j, const WorkspaceMetrics& metrics);
void to_json(nlohmann::json& j, const ResourceViolation& violation);

} // namespace core
} // namespace cellguard
