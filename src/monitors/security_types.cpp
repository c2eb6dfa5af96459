/**
 * @file security_types.cpp
 * @brief Conversions and JSON rendering of monitoring data
 *
 * @date 2025
 */

#include "cellguard/monitors/security_types.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cellguard {
namespace monitors {

std::string AlertTypeToString(AlertType type) {
    switch (type) {
        case AlertType::RESOURCE_VIOLATION: return "resource_violation";
        case AlertType::SECURITY_BREACH:    return "security_breach";
        case AlertType::NETWORK_ANOMALY:    return "network_anomaly";
        case AlertType::PROCESS_ANOMALY:    return "process_anomaly";
    }
    return "unknown";
}

std::string BreachTypeToString(BreachType type) {
    switch (type) {
        case BreachType::PRIVILEGE_ESCALATION:        return "privilege_escalation";
        case BreachType::SUSPICIOUS_NETWORK_ACTIVITY: return "suspicious_network_activity";
        case BreachType::UNAUTHORIZED_FILE_ACCESS:    return "unauthorized_file_access";
        case BreachType::RESOURCE_EXHAUSTION:         return "resource_exhaustion";
        case BreachType::GENERIC:                     return "generic";
    }
    return "generic";
}

BreachType BreachTypeFromString(const std::string& name) {
    if (name == "privilege_escalation") return BreachType::PRIVILEGE_ESCALATION;
    if (name == "suspicious_network_activity") return BreachType::SUSPICIOUS_NETWORK_ACTIVITY;
    if (name == "unauthorized_file_access") return BreachType::UNAUTHORIZED_FILE_ACCESS;
    if (name == "resource_exhaustion") return BreachType::RESOURCE_EXHAUSTION;
    return BreachType::GENERIC;
}

std::string SecurityBreach::TypeName() const {
    return type_name.empty() ? BreachTypeToString(type) : type_name;
}

SecurityBreach MakeBreach(const std::string& type_name,
                          const std::string& description,
                          core::Severity risk_level,
                          std::map<std::string, std::string> evidence) {
    SecurityBreach breach;
    breach.type = BreachTypeFromString(type_name);
    breach.type_name = type_name;
    breach.description = description;
    breach.evidence = std::move(evidence);
    breach.risk_level = risk_level;
    breach.timestamp = std::chrono::system_clock::now();
    return breach;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const SecurityAlert& alert) {
    j = json{
        {"type", AlertTypeToString(alert.type)},
        {"workspace_id", alert.workspace_id},
        {"severity", core::SeverityToString(alert.severity)},
        {"message", alert.message},
        {"timestamp", core::FormatTimestamp(alert.timestamp)},
        {"data", alert.data}
    };
}

void to_json(json& j, const SecurityBreach& breach) {
    j = json{
        {"type", breach.TypeName()},
        {"description", breach.description},
        {"evidence", breach.evidence},
        {"risk_level", core::SeverityToString(breach.risk_level)},
        {"timestamp", core::FormatTimestamp(breach.timestamp)}
    };
}

void to_json(json& j, const RemediationPlan& plan) {
    j = json{
        {"breach_type", BreachTypeToString(plan.breach_type)},
        {"workspace_id", plan.workspace_id},
        {"pause_container", plan.pause_container},
        {"container_paused", plan.container_paused},
        {"restrict_network", plan.restrict_network},
        {"increase_network_monitoring", plan.increase_network_monitoring},
        {"increase_process_monitoring", plan.increase_process_monitoring},
        {"increase_filesystem_monitoring", plan.increase_filesystem_monitoring},
        {"enable_detailed_audit", plan.enable_detailed_audit},
        {"actions", plan.actions}
    };
    if (plan.recommended_limits) {
        j["recommended_limits"] = *plan.recommended_limits;
    }
}

void to_json(json& j, const SecurityDashboard& dashboard) {
    j = json{
        {"total_alerts", dashboard.total_alerts},
        {"critical_alerts", dashboard.critical_alerts},
        {"error_alerts", dashboard.error_alerts},
        {"warning_alerts", dashboard.warning_alerts},
        {"info_alerts", dashboard.info_alerts},
        {"dropped_alerts", dashboard.dropped_alerts},
        {"queued_alerts", dashboard.queued_alerts},
        {"violation_summary", dashboard.violation_summary},
        {"monitoring_status", dashboard.monitoring_status},
        {"active_workspaces", dashboard.active_workspaces},
        {"tracked_workspaces", dashboard.tracked_workspaces},
        {"last_updated", core::FormatTimestamp(dashboard.last_updated)}
    };
}

} // namespace monitors
} // namespace cellguard
