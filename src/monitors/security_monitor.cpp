/**
 * @file security_monitor.cpp
 * @brief Implementation of the workspace security monitor
 *
 * **Lock layout**:
 * - lifecycle_mutex_: running flag, loop generation, thread handle, channel
 * - tracked_mutex_: watched workspaces, sampler, detectors
 * - violations_mutex_: per-workspace violation history
 * - subscribers_mutex_: alert callbacks
 * - profiles_mutex_: remediation state
 *
 * No two of these are ever held at the same time. Subscriber callbacks are
 * copied out under a shared lock and executed on the dispatch pool.
 *
 * @date 2025
 */

#include "cellguard/monitors/security_monitor.hpp"
#include "cellguard/core/errors.hpp"
#include "cellguard/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <exception>

namespace cellguard {
namespace monitors {

namespace {

constexpr const char* kAuditLoggerName = "audit";

std::shared_ptr<spdlog::logger> AuditLogger() {
    static std::mutex creation_mutex;
    std::lock_guard<std::mutex> lock(creation_mutex);

    auto logger = spdlog::get(kAuditLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kAuditLoggerName);
        logger->set_pattern("[%Y-%m-%dT%H:%M:%S] [audit] [%^%l%$] %v");
    }
    return logger;
}

spdlog::level::level_enum ToLogLevel(core::Severity severity) {
    switch (severity) {
        case core::Severity::INFO:     return spdlog::level::info;
        case core::Severity::WARNING:  return spdlog::level::warn;
        case core::Severity::ERROR:    return spdlog::level::err;
        case core::Severity::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void RequireWorkspaceId(const std::string& workspace_id) {
    if (workspace_id.empty()) {
        throw core::InvalidArgumentError("workspace ID cannot be empty");
    }
}

const SecurityMonitorOptions& RequireValidOptions(const SecurityMonitorOptions& options) {
    if (options.check_interval.count() <= 0) {
        throw core::InvalidArgumentError("check interval must be positive");
    }
    return options;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SecurityMonitor::SecurityMonitor(std::shared_ptr<core::PolicyStore> policy,
                                 std::shared_ptr<runtime::ContainerRuntime> runtime,
                                 SecurityMonitorOptions options)
    : policy_(policy ? std::move(policy) : std::make_shared<core::PolicyStore>())
    , runtime_(std::move(runtime))
    , options_(RequireValidOptions(options))
    , resource_manager_(policy_)
    , audit_logger_(AuditLogger())
    , alert_channel_(std::make_shared<AlertChannel>(std::max<std::size_t>(options.alert_buffer, 1)))
    , dispatch_pool_("alert-dispatch", options.dispatch_workers, options.dispatch_queue) {

    if (runtime_) {
        sampler_ = std::make_shared<RuntimeMetricsSampler>(runtime_);
        if (options_.install_default_detectors) {
            detectors_.push_back(std::make_shared<NetworkTrafficDetector>(runtime_));
            detectors_.push_back(std::make_shared<ProcessActivityDetector>(runtime_));
            detectors_.push_back(std::make_shared<FileAccessDetector>(runtime_));
        }
    }

    spdlog::info("Security Monitor initialized");
    spdlog::debug("Check interval {}ms, alert buffer {}, {} detectors",
                  options_.check_interval.count(), options_.alert_buffer, detectors_.size());
}

SecurityMonitor::~SecurityMonitor() {
    StopMonitoring();
    dispatch_pool_.Shutdown();
    spdlog::info("Security Monitor destroyed");
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::shared_ptr<AlertChannel> SecurityMonitor::StartMonitoring() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
        spdlog::debug("Security monitoring already active");
        return alert_channel_;
    }

    if (alert_channel_->IsClosed()) {
        alert_channel_ = std::make_shared<AlertChannel>(std::max<std::size_t>(options_.alert_buffer, 1));
    }

    running_ = true;
    const std::uint64_t generation = ++generation_;
    loop_thread_ = std::thread(&SecurityMonitor::MonitorLoop, this, generation);

    spdlog::info("Security monitoring started (every {}ms)", options_.check_interval.count());
    return alert_channel_;
}

void SecurityMonitor::StopMonitoring() {
    std::thread loop;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        ++generation_;
        alert_channel_->Close();
        loop = std::move(loop_thread_);
    }
    lifecycle_cv_.notify_all();

    if (loop.joinable()) {
        if (loop.get_id() == std::this_thread::get_id()) {
            loop.detach();
        } else {
            loop.join();
        }
    }

    spdlog::info("Security monitoring stopped");
}

bool SecurityMonitor::IsMonitoring() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return running_;
}

std::shared_ptr<AlertChannel> SecurityMonitor::Alerts() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return alert_channel_;
}

void SecurityMonitor::MonitorLoop(std::uint64_t generation) {
    spdlog::debug("Security monitor loop {} running", generation);

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(lifecycle_mutex_);
            const bool stopped = lifecycle_cv_.wait_for(lock, options_.check_interval, [&] {
                return generation_ != generation;
            });
            if (stopped) {
                break;
            }
        }
        RunSecurityCheck();
    }

    spdlog::debug("Security monitor loop {} exited", generation);
}

// ============================================================================
// WATCHED WORKSPACES
// ============================================================================

void SecurityMonitor::TrackWorkspace(const std::string& workspace_id,
                                     const std::string& container_id,
                                     const core::ResourceLimits& limits) {
    RequireWorkspaceId(workspace_id);
    if (container_id.empty()) {
        throw core::InvalidArgumentError("container ID cannot be empty");
    }

    {
        std::unique_lock<std::shared_mutex> lock(tracked_mutex_);
        tracked_[workspace_id] = WatchedWorkspace{workspace_id, container_id, limits};
    }
    spdlog::info("Tracking workspace {} (container {})", workspace_id, container_id);
}

void SecurityMonitor::UntrackWorkspace(const std::string& workspace_id) {
    std::string container_id;
    std::shared_ptr<MetricsSampler> sampler;
    {
        std::unique_lock<std::shared_mutex> lock(tracked_mutex_);
        auto it = tracked_.find(workspace_id);
        if (it == tracked_.end()) {
            return;
        }
        container_id = it->second.container_id;
        sampler = sampler_;
        tracked_.erase(it);
    }

    if (auto runtime_sampler = std::dynamic_pointer_cast<RuntimeMetricsSampler>(sampler)) {
        runtime_sampler->Forget(container_id);
    }
    spdlog::info("Stopped tracking workspace {}", workspace_id);
}

std::vector<WatchedWorkspace> SecurityMonitor::GetTrackedWorkspaces() const {
    std::shared_lock<std::shared_mutex> lock(tracked_mutex_);
    std::vector<WatchedWorkspace> result;
    result.reserve(tracked_.size());
    for (const auto& [id, workspace] : tracked_) {
        result.push_back(workspace);
    }
    return result;
}

void SecurityMonitor::SetMetricsSampler(std::shared_ptr<MetricsSampler> sampler) {
    std::unique_lock<std::shared_mutex> lock(tracked_mutex_);
    sampler_ = std::move(sampler);
}

void SecurityMonitor::AddDetector(std::shared_ptr<AnomalyDetector> detector) {
    if (!detector) {
        throw core::InvalidArgumentError("detector cannot be nil");
    }
    const std::string name = detector->Name();
    {
        std::unique_lock<std::shared_mutex> lock(tracked_mutex_);
        detectors_.push_back(std::move(detector));
    }
    spdlog::debug("Detector '{}' registered", name);
}

std::string SecurityMonitor::ContainerFor(const std::string& workspace_id) const {
    std::shared_lock<std::shared_mutex> lock(tracked_mutex_);
    auto it = tracked_.find(workspace_id);
    return it == tracked_.end() ? std::string() : it->second.container_id;
}

// ============================================================================
// CHECKS
// ============================================================================

void SecurityMonitor::RunSecurityCheck() {
    spdlog::debug("Running security check");

    try {
        CheckResourceUsage();
    } catch (const std::exception& e) {
        spdlog::error("Resource usage check failed: {}", e.what());
    }

    try {
        RunDetectors(DetectorKind::NETWORK);
    } catch (const std::exception& e) {
        spdlog::error("Network check failed: {}", e.what());
    }

    try {
        RunDetectors(DetectorKind::PROCESS);
    } catch (const std::exception& e) {
        spdlog::error("Process check failed: {}", e.what());
    }

    if (policy_->Get()->enable_audit_log) {
        try {
            RunDetectors(DetectorKind::FILESYSTEM);
        } catch (const std::exception& e) {
            spdlog::error("Filesystem check failed: {}", e.what());
        }
    }
}

void SecurityMonitor::CheckResourceUsage() {
    std::shared_ptr<MetricsSampler> sampler;
    std::vector<WatchedWorkspace> workspaces;
    {
        std::shared_lock<std::shared_mutex> lock(tracked_mutex_);
        sampler = sampler_;
        for (const auto& [id, workspace] : tracked_) {
            workspaces.push_back(workspace);
        }
    }

    if (!sampler) {
        spdlog::debug("No metrics sampler configured, skipping resource check");
        return;
    }

    for (const auto& workspace : workspaces) {
        try {
            auto metrics = sampler->Sample(workspace);
            if (!metrics) {
                spdlog::debug("No metrics for workspace {}", workspace.workspace_id);
                continue;
            }
            for (const auto& violation : resource_manager_.ValidateResourceUsage(*metrics)) {
                ReportViolation(workspace.workspace_id, violation);
            }
        } catch (const std::exception& e) {
            spdlog::warn("Failed to sample workspace {}: {}", workspace.workspace_id, e.what());
        }
    }
}

void SecurityMonitor::RunDetectors(DetectorKind kind) {
    std::vector<std::shared_ptr<AnomalyDetector>> detectors;
    std::vector<WatchedWorkspace> workspaces;
    {
        std::shared_lock<std::shared_mutex> lock(tracked_mutex_);
        for (const auto& detector : detectors_) {
            if (detector->Kind() == kind) {
                detectors.push_back(detector);
            }
        }
        for (const auto& [id, workspace] : tracked_) {
            workspaces.push_back(workspace);
        }
    }

    for (const auto& detector : detectors) {
        for (const auto& workspace : workspaces) {
            try {
                for (const auto& finding : detector->Scan(workspace)) {
                    EmitFinding(workspace, finding);
                }
            } catch (const std::exception& e) {
                spdlog::warn("Detector '{}' failed on workspace {}: {}",
                             detector->Name(), workspace.workspace_id, e.what());
            }
        }
    }
}

void SecurityMonitor::EmitFinding(const WatchedWorkspace& workspace, const DetectorFinding& finding) {
    if (finding.breach) {
        ReportSecurityBreach(workspace.workspace_id, *finding.breach);
        return;
    }

    SecurityAlert alert;
    alert.type = finding.alert_type;
    alert.workspace_id = workspace.workspace_id;
    alert.severity = finding.severity;
    alert.message = finding.message;
    alert.timestamp = std::chrono::system_clock::now();
    alert.data = finding.data;
    SendAlert(alert);
}

// ============================================================================
// REPORTING
// ============================================================================

void SecurityMonitor::ReportViolation(const std::string& workspace_id,
                                      const core::ResourceViolation& violation) {
    RequireWorkspaceId(workspace_id);

    {
        std::unique_lock<std::shared_mutex> lock(violations_mutex_);
        auto& history = violations_[workspace_id];
        history.push_back(violation);
        while (history.size() > options_.max_violations_per_workspace) {
            history.pop_front();
        }
    }

    SecurityAlert alert;
    alert.type = AlertType::RESOURCE_VIOLATION;
    alert.workspace_id = workspace_id;
    alert.severity = violation.severity;
    alert.message = "Resource violation detected: " + violation.description;
    alert.timestamp = std::chrono::system_clock::now();
    alert.data = {
        {"violation_type", violation.type},
        {"threshold", std::to_string(violation.threshold)},
        {"current_value", std::to_string(violation.current_value)}
    };
    SendAlert(alert);
}

RemediationPlan SecurityMonitor::ReportSecurityBreach(const std::string& workspace_id,
                                                      const SecurityBreach& breach) {
    RequireWorkspaceId(workspace_id);

    SecurityAlert alert;
    alert.type = AlertType::SECURITY_BREACH;
    alert.workspace_id = workspace_id;
    alert.severity = breach.risk_level;
    alert.message = "Security breach detected: " + breach.description;
    alert.timestamp = std::chrono::system_clock::now();
    alert.data = breach.evidence;
    alert.data["breach_type"] = breach.TypeName();
    SendAlert(alert);

    return HandleSecurityBreach(workspace_id, breach);
}

// ============================================================================
// REMEDIATION
// ============================================================================

RemediationPlan SecurityMonitor::HandleSecurityBreach(const std::string& workspace_id,
                                                      const SecurityBreach& breach) {
    RemediationPlan plan;
    plan.breach_type = breach.type;
    plan.workspace_id = workspace_id;

    switch (breach.type) {
        case BreachType::PRIVILEGE_ESCALATION: {
            plan.pause_container = true;
            const std::string container_id = ContainerFor(workspace_id);
            if (runtime_ && !container_id.empty()) {
                try {
                    runtime_->PauseContainer(container_id);
                    plan.container_paused = true;
                    plan.actions.push_back("paused container " + container_id);
                } catch (const std::exception& e) {
                    spdlog::error("Failed to pause container {} of workspace {}: {}",
                                  container_id, workspace_id, e.what());
                    plan.actions.push_back("pause failed: " + std::string(e.what()));
                }
            } else {
                spdlog::warn("No container to pause for workspace {}", workspace_id);
                plan.actions.push_back("no container to pause");
            }

            SecurityAlert alert;
            alert.type = AlertType::SECURITY_BREACH;
            alert.workspace_id = workspace_id;
            alert.severity = core::Severity::CRITICAL;
            alert.message = "CRITICAL: Privilege escalation detected - container paused";
            alert.timestamp = std::chrono::system_clock::now();
            alert.data = breach.evidence;
            alert.data["breach_type"] = breach.TypeName();
            alert.data["container_paused"] = plan.container_paused ? "true" : "false";
            SendAlert(alert);
            plan.actions.push_back("critical alert raised");

            if (policy_->Get()->enable_audit_log) {
                Audit(core::Severity::CRITICAL,
                      "privilege escalation in workspace " + workspace_id + ": " + breach.description);
                plan.actions.push_back("audit entry written");
            }
            break;
        }

        case BreachType::SUSPICIOUS_NETWORK_ACTIVITY:
            plan.restrict_network = true;
            plan.increase_network_monitoring = true;
            plan.actions.push_back("network traffic restricted");
            plan.actions.push_back("network monitoring heightened");
            spdlog::warn("Restricting network for workspace {}", workspace_id);
            break;

        case BreachType::UNAUTHORIZED_FILE_ACCESS:
            plan.increase_filesystem_monitoring = true;
            plan.enable_detailed_audit = true;
            plan.actions.push_back("filesystem monitoring heightened");
            plan.actions.push_back("detailed audit enabled");
            spdlog::warn("Heightening filesystem monitoring for workspace {}", workspace_id);
            break;

        case BreachType::RESOURCE_EXHAUSTION:
            plan.recommended_limits = core::ResourceManager::GetResourceLimitPreset(core::ResourcePreset::MINIMAL);
            plan.increase_process_monitoring = true;
            plan.actions.push_back("stricter limits recommended (minimal preset)");
            plan.actions.push_back("process monitoring heightened");
            spdlog::warn("Recommending minimal resource limits for workspace {}", workspace_id);
            break;

        case BreachType::GENERIC:
            plan.increase_network_monitoring = true;
            plan.increase_process_monitoring = true;
            plan.increase_filesystem_monitoring = true;
            plan.actions.push_back("monitoring heightened");
            spdlog::warn("Unclassified breach '{}' in workspace {}: {}",
                         breach.TypeName(), workspace_id, breach.description);
            break;
    }

    UpdateProfile(workspace_id, plan);

    if (policy_->Get()->enable_audit_log) {
        Audit(breach.risk_level,
              "remediation for " + workspace_id + " (" + breach.TypeName() + "): " +
              utils::StringUtils::Join(plan.actions, "; "));
    }

    return plan;
}

void SecurityMonitor::UpdateProfile(const std::string& workspace_id, const RemediationPlan& plan) {
    std::lock_guard<std::mutex> lock(profiles_mutex_);
    auto& profile = profiles_[workspace_id];
    profile.breach_count++;
    profile.heightened_network |= plan.increase_network_monitoring;
    profile.heightened_process |= plan.increase_process_monitoring;
    profile.heightened_filesystem |= plan.increase_filesystem_monitoring;
    profile.detailed_audit |= plan.enable_detailed_audit;
    profile.network_restricted |= plan.restrict_network;
}

MonitoringProfile SecurityMonitor::GetMonitoringProfile(const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lock(profiles_mutex_);
    auto it = profiles_.find(workspace_id);
    return it == profiles_.end() ? MonitoringProfile{} : it->second;
}

void SecurityMonitor::Audit(core::Severity severity, const std::string& message) const {
    audit_logger_->log(ToLogLevel(severity), message);
}

// ============================================================================
// ALERT PIPELINE
// ============================================================================

void SecurityMonitor::SendAlert(const SecurityAlert& alert) {
    auto channel = Alerts();

    if (!channel->TrySend(alert)) {
        dropped_alerts_++;
        if (channel->IsClosed()) {
            spdlog::debug("Monitoring stopped, alert for {} not delivered: {}",
                          alert.workspace_id, alert.message);
        } else {
            spdlog::warn("Alert channel full, dropping alert for {}: {}",
                         alert.workspace_id, alert.message);
        }
        return;
    }

    total_alerts_++;
    switch (alert.severity) {
        case core::Severity::INFO:     info_alerts_++; break;
        case core::Severity::WARNING:  warning_alerts_++; break;
        case core::Severity::ERROR:    error_alerts_++; break;
        case core::Severity::CRITICAL: critical_alerts_++; break;
    }

    std::vector<AlertHandler> handlers;
    {
        std::shared_lock<std::shared_mutex> lock(subscribers_mutex_);
        for (const std::string& key : {alert.workspace_id, std::string(kAllWorkspaces)}) {
            auto it = subscribers_.find(key);
            if (it != subscribers_.end()) {
                handlers.insert(handlers.end(), it->second.begin(), it->second.end());
            }
        }
    }

    for (auto& handler : handlers) {
        if (!dispatch_pool_.Submit([handler, alert]() { handler(alert); })) {
            spdlog::warn("Alert callback for {} rejected by dispatch pool", alert.workspace_id);
        }
    }
}

// ============================================================================
// SUBSCRIPTIONS AND HISTORY
// ============================================================================

void SecurityMonitor::Subscribe(const std::string& workspace_id, AlertHandler handler) {
    RequireWorkspaceId(workspace_id);
    if (!handler) {
        throw core::InvalidArgumentError("alert handler cannot be nil");
    }

    std::unique_lock<std::shared_mutex> lock(subscribers_mutex_);
    subscribers_[workspace_id].push_back(std::move(handler));
}

void SecurityMonitor::Unsubscribe(const std::string& workspace_id) {
    std::unique_lock<std::shared_mutex> lock(subscribers_mutex_);
    subscribers_.erase(workspace_id);
}

SecurityDashboard SecurityMonitor::GetSecurityDashboard() const {
    SecurityDashboard dashboard;
    dashboard.total_alerts = total_alerts_.load();
    dashboard.critical_alerts = critical_alerts_.load();
    dashboard.error_alerts = error_alerts_.load();
    dashboard.warning_alerts = warning_alerts_.load();
    dashboard.info_alerts = info_alerts_.load();
    dashboard.dropped_alerts = dropped_alerts_.load();

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        dashboard.queued_alerts = alert_channel_->Size();
        dashboard.monitoring_status = running_ ? "active" : "stopped";
    }

    {
        std::shared_lock<std::shared_mutex> lock(violations_mutex_);
        for (const auto& [workspace_id, history] : violations_) {
            if (history.empty()) {
                continue;
            }
            dashboard.active_workspaces.push_back(workspace_id);
            for (const auto& violation : history) {
                dashboard.violation_summary[violation.type]++;
            }
        }
    }

    {
        std::shared_lock<std::shared_mutex> lock(tracked_mutex_);
        dashboard.tracked_workspaces = tracked_.size();
    }

    dashboard.last_updated = std::chrono::system_clock::now();
    return dashboard;
}

std::vector<core::ResourceViolation> SecurityMonitor::GetWorkspaceViolations(const std::string& workspace_id) const {
    std::shared_lock<std::shared_mutex> lock(violations_mutex_);
    auto it = violations_.find(workspace_id);
    if (it == violations_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

void SecurityMonitor::ClearViolations(const std::string& workspace_id) {
    std::unique_lock<std::shared_mutex> lock(violations_mutex_);
    if (workspace_id.empty()) {
        violations_.clear();
        spdlog::info("Cleared violation history of all workspaces");
        return;
    }
    violations_.erase(workspace_id);
    spdlog::info("Cleared violation history of workspace {}", workspace_id);
}

} // namespace monitors
} // namespace cellguard
