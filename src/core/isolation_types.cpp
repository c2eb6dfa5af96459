/**
 * @file isolation_types.cpp
 * @brief Enum conversions and JSON rendering of the isolation data model
 *
 * JSON field names follow the snake_case tags used by the workspace service
 * so profiles can be stored next to workspace records unchanged.
 *
 * @date 2025
 */

#include "cellguard/core/isolation_types.hpp"
#include "cellguard/core/errors.hpp"
#include "cellguard/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace cellguard {
namespace core {

std::string ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCategory::POLICY_VIOLATION: return "policy_violation";
        case ErrorCategory::RUNTIME:          return "runtime";
        case ErrorCategory::CONFIG:           return "config";
    }
    return "unknown";
}

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "info";
        case Severity::WARNING:  return "warning";
        case Severity::ERROR:    return "error";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

Severity SeverityFromString(const std::string& name) {
    const std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "info") return Severity::INFO;
    if (lower == "warning") return Severity::WARNING;
    if (lower == "error") return Severity::ERROR;
    if (lower == "critical") return Severity::CRITICAL;
    throw InvalidArgumentError("unknown severity: " + name);
}

std::string IsolationLevelToString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::BASIC:    return "basic";
        case IsolationLevel::STANDARD: return "standard";
        case IsolationLevel::STRICT:   return "strict";
    }
    return "unknown";
}

bool operator==(const ResourceLimits& lhs, const ResourceLimits& rhs) {
    return lhs.cpu_shares == rhs.cpu_shares &&
           lhs.cpu_quota == rhs.cpu_quota &&
           lhs.cpu_period == rhs.cpu_period &&
           lhs.memory == rhs.memory &&
           lhs.memory_swap == rhs.memory_swap &&
           lhs.pids_limit == rhs.pids_limit &&
           lhs.io_max_bandwidth == rhs.io_max_bandwidth &&
           lhs.io_max_iops == rhs.io_max_iops;
}

// ============================================================================
// JSON RENDERING
// ============================================================================

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void to_json(json& j, const ResourceLimits& limits) {
    j = json{
        {"cpu_shares", limits.cpu_shares},
        {"cpu_quota", limits.cpu_quota},
        {"cpu_period", limits.cpu_period},
        {"memory", limits.memory},
        {"memory_swap", limits.memory_swap},
        {"pids_limit", limits.pids_limit},
        {"io_max_bandwidth", limits.io_max_bandwidth},
        {"io_max_iops", limits.io_max_iops}
    };
}

void to_json(json& j, const SecurityOptions& options) {
    j = json{
        {"seccomp_profile", options.seccomp_profile},
        {"apparmor_profile", options.apparmor_profile},
        {"capabilities", {
            {"drop", options.capabilities.drop},
            {"add", options.capabilities.add}
        }},
        {"no_new_privileges", options.no_new_privileges},
        {"read_only_root_fs", options.read_only_root_fs}
    };
}

void to_json(json& j, const MonitoringConfig& config) {
    j = json{
        {"enable_resource_monitoring", config.enable_resource_monitoring},
        {"enable_network_monitoring", config.enable_network_monitoring},
        {"enable_filesystem_audit", config.enable_filesystem_audit},
        {"log_level", config.log_level},
        {"alert_thresholds", {
            {"cpu_percent", config.alert_thresholds.cpu_percent},
            {"memory_percent", config.alert_thresholds.memory_percent},
            {"network_bytes_per_sec", config.alert_thresholds.network_bytes_per_sec},
            {"disk_bytes_per_sec", config.alert_thresholds.disk_bytes_per_sec}
        }}
    };
}

void to_json(json& j, const WorkspaceIsolation& isolation) {
    j = json{
        {"workspace_id", isolation.workspace_id},
        {"network_mode", isolation.network_mode},
        {"network_name", isolation.network_name},
        {"isolation_level", IsolationLevelToString(isolation.isolation_level)},
        {"resource_limits", isolation.resource_limits},
        {"security_options", isolation.security_options},
        {"monitoring", isolation.monitoring},
        {"created_at", FormatTimestamp(isolation.created_at)}
    };
}

void to_json(json& j, const WorkspaceMetrics& metrics) {
    j = json{
        {"workspace_id", metrics.workspace_id},
        {"cpu_percent", metrics.cpu_percent},
        {"memory_usage", metrics.memory_usage},
        {"memory_limit", metrics.memory_limit},
        {"network_rx", metrics.network_rx},
        {"network_tx", metrics.network_tx},
        {"disk_read", metrics.disk_read},
        {"disk_write", metrics.disk_write},
        {"process_count", metrics.process_count},
        {"timestamp", FormatTimestamp(metrics.timestamp)}
    };
}

void to_json(json& j, const ResourceViolation& violation) {
    j = json{
        {"type", violation.type},
        {"threshold", violation.threshold},
        {"current_value", violation.current_value},
        {"description", violation.description},
        {"severity", SeverityToString(violation.severity)},
        {"timestamp", FormatTimestamp(violation.timestamp)}
    };
}

} // namespace core
} // namespace cellguard
