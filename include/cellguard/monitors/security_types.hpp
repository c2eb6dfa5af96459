/**
 * @file security_types.hpp
 * @brief Alerts, breaches, remediation plans and dashboard aggregates
 *
 * Everything here is data flowing through the monitoring pipeline. None of
 * these types are thrown.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cellguard {
namespace monitors {

/**
 * @struct WatchedWorkspace
 * @brief A workspace container under security monitoring
 */
struct WatchedWorkspace {
    std::string workspace_id;
    std::string container_id;
    core::ResourceLimits limits;   ///< Limits the container was created with
};

/**
 * @enum AlertType
 * @brief Category of a security alert
 */
enum class AlertType {
    RESOURCE_VIOLATION,  ///< Live usage crossed a hard threshold
    SECURITY_BREACH,     ///< Behavioral security incident
    NETWORK_ANOMALY,     ///< Unusual traffic, below breach level
    PROCESS_ANOMALY      ///< Unusual process activity, below breach level
};

std::string AlertTypeToString(AlertType type);

/**
 * @struct SecurityAlert
 * @brief Unified notification for violations and breaches
 */
struct SecurityAlert {
    AlertType type{AlertType::RESOURCE_VIOLATION};
    std::string workspace_id;
    core::Severity severity{core::Severity::INFO};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, std::string> data;   ///< Opaque payload
};

/**
 * @enum BreachType
 * @brief Closed set of breach kinds driving remediation
 */
enum class BreachType {
    PRIVILEGE_ESCALATION,
    SUSPICIOUS_NETWORK_ACTIVITY,
    UNAUTHORIZED_FILE_ACCESS,
    RESOURCE_EXHAUSTION,
    GENERIC              ///< Anything else: log and heighten monitoring
};

std::string BreachTypeToString(BreachType type);

/// Unknown names map to BreachType::GENERIC
BreachType BreachTypeFromString(const std::string& name);

/**
 * @struct SecurityBreach
 * @brief A detected security incident
 */
struct SecurityBreach {
    BreachType type{BreachType::GENERIC};
    std::string type_name;    ///< Reported name; kept for GENERIC breaches
    std::string description;
    std::map<std::string, std::string> evidence;
    core::Severity risk_level{core::Severity::WARNING};
    std::chrono::system_clock::time_point timestamp;

    /// type_name when set, otherwise the canonical name of type
    std::string TypeName() const;
};

/**
 * @brief Build a breach from a type name such as "privilege_escalation"
 */
SecurityBreach MakeBreach(const std::string& type_name,
                          const std::string& description,
                          core::Severity risk_level,
                          std::map<std::string, std::string> evidence = {});

/**
 * @struct MonitoringProfile
 * @brief Per-workspace monitoring intensity raised by remediation
 */
struct MonitoringProfile {
    bool heightened_network{false};
    bool heightened_process{false};
    bool heightened_filesystem{false};
    bool detailed_audit{false};
    bool network_restricted{false};
    int breach_count{0};
};

/**
 * @struct RemediationPlan
 * @brief Policy change decided for one breach
 *
 * Describes intent. Only the container pause is executed directly, and only
 * when a runtime and a tracked container are available.
 */
struct RemediationPlan {
    BreachType breach_type{BreachType::GENERIC};
    std::string workspace_id;
    bool pause_container{false};
    bool container_paused{false};      ///< Pause actually performed
    bool restrict_network{false};
    bool increase_network_monitoring{false};
    bool increase_process_monitoring{false};
    bool increase_filesystem_monitoring{false};
    bool enable_detailed_audit{false};
    std::optional<core::ResourceLimits> recommended_limits;
    std::vector<std::string> actions;  ///< Human-readable steps, in order
};

/**
 * @struct SecurityDashboard
 * @brief Operator overview of the monitor
 */
struct SecurityDashboard {
    std::size_t total_alerts{0};        ///< Alerts emitted since construction
    std::size_t critical_alerts{0};
    std::size_t error_alerts{0};
    std::size_t warning_alerts{0};
    std::size_t info_alerts{0};
    std::size_t dropped_alerts{0};      ///< Rejected by a full alert channel
    std::size_t queued_alerts{0};       ///< Waiting in the alert channel
    std::map<std::string, std::size_t> violation_summary;  ///< Violation type -> count
    std::string monitoring_status{"stopped"};               ///< "active" or "stopped"
    std::vector<std::string> active_workspaces;             ///< Workspaces with violations
    std::size_t tracked_workspaces{0};
    std::chrono::system_clock::time_point last_updated;
};

void to_json(nlohmann::json& j, const SecurityAlert& alert);
void to_json(nlohmann::json& j, const SecurityBreach& breach);
void to_json(nlohmann::json& j, const RemediationPlan& plan);
void to_json(nlohmann::json& j, const SecurityDashboard& dashboard);

} // namespace monitors
} // namespace cellguard
