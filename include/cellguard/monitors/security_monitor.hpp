/**
 * @file security_monitor.hpp
 * @brief Background supervisor of workspace resource and security behavior
 *
 * While running, one loop wakes on a fixed interval and performs, in order:
 * resource-usage checks, network checks, process checks and (when audit
 * logging is enabled) filesystem checks. Findings become alerts on a bounded
 * channel and are fanned out to subscribers. Breaches additionally go through
 * a remediation table keyed by breach type.
 *
 * **State machine**:
 * ```
 * stopped --StartMonitoring()--> running --StopMonitoring()--> stopped
 * ```
 * Both transitions are idempotent. Stopping closes the alert channel;
 * starting again opens a fresh one.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_config.hpp"
#include "cellguard/core/isolation_types.hpp"
#include "cellguard/core/resource_manager.hpp"
#include "cellguard/monitors/anomaly_detectors.hpp"
#include "cellguard/monitors/metrics_sampler.hpp"
#include "cellguard/monitors/security_types.hpp"
#include "cellguard/runtime/container_runtime.hpp"
#include "cellguard/utils/channel.hpp"
#include "cellguard/utils/dispatch_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace spdlog {
class logger;
}

namespace cellguard {
namespace monitors {

using AlertChannel = utils::Channel<SecurityAlert>;
using AlertHandler = std::function<void(const SecurityAlert&)>;

/**
 * @struct SecurityMonitorOptions
 * @brief Tuning of the monitor loop and alert pipeline
 */
struct SecurityMonitorOptions {
    std::chrono::milliseconds check_interval{std::chrono::seconds(30)};
    std::size_t alert_buffer{100};                   ///< Alert channel capacity
    std::size_t dispatch_workers{4};                 ///< Subscriber callback threads
    std::size_t dispatch_queue{1024};                ///< Pending callbacks before rejection
    std::size_t max_violations_per_workspace{1000};  ///< History cap (oldest dropped)
    bool install_default_detectors{true};            ///< Add built-in detectors when a runtime is given
};

/**
 * @class SecurityMonitor
 * @brief Periodic resource/behavior checks, alerting and breach remediation
 *
 * **Usage Example**:
 * @code
 * SecurityMonitor monitor(policy, runtime);
 * monitor.TrackWorkspace("ws-1", container_id, profile.resource_limits);
 * monitor.Subscribe("*", [](const SecurityAlert& alert) {
 *     spdlog::warn("{}: {}", alert.workspace_id, alert.message);
 * });
 *
 * auto alerts = monitor.StartMonitoring();
 * while (auto alert = alerts->Receive()) {
 *     // ...
 * }
 * @endcode
 *
 * **Thread Safety**: All public methods are thread-safe. Subscriber
 * callbacks run on the dispatch pool and must not block indefinitely.
 */
class SecurityMonitor {
public:
    static constexpr const char* kAllWorkspaces = "*";

    /**
     * @param policy  Shared policy store; null uses process defaults
     * @param runtime Runtime for sampling, detectors and container pause; may be null
     * @param options Loop and pipeline tuning
     * @throws core::InvalidArgumentError if the check interval is not positive
     */
    explicit SecurityMonitor(std::shared_ptr<core::PolicyStore> policy = nullptr,
                             std::shared_ptr<runtime::ContainerRuntime> runtime = nullptr,
                             SecurityMonitorOptions options = {});
    ~SecurityMonitor();

    SecurityMonitor(const SecurityMonitor&) = delete;
    SecurityMonitor& operator=(const SecurityMonitor&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Start the check loop
     * @return Alert channel of this run (the current one if already running)
     */
    std::shared_ptr<AlertChannel> StartMonitoring();

    /**
     * @brief Stop the loop and close the alert channel (idempotent)
     */
    void StopMonitoring();

    bool IsMonitoring() const;

    /// Current alert channel (closed after a stop)
    std::shared_ptr<AlertChannel> Alerts() const;

    // ========================================================================
    // Watched workspaces and checks
    // ========================================================================

    /**
     * @throws core::InvalidArgumentError on empty workspace or container ID
     */
    void TrackWorkspace(const std::string& workspace_id,
                        const std::string& container_id,
                        const core::ResourceLimits& limits = {});

    void UntrackWorkspace(const std::string& workspace_id);
    std::vector<WatchedWorkspace> GetTrackedWorkspaces() const;

    /// Source of usage samples for the resource check (null disables it)
    void SetMetricsSampler(std::shared_ptr<MetricsSampler> sampler);

    /**
     * @throws core::InvalidArgumentError if @p detector is null
     */
    void AddDetector(std::shared_ptr<AnomalyDetector> detector);

    /**
     * @brief Run one tick synchronously
     *
     * Resource, network, process and (if audit logging is enabled)
     * filesystem checks, in that order. A failing check is logged and the
     * remaining checks still run.
     */
    void RunSecurityCheck();

    // ========================================================================
    // Reporting and remediation
    // ========================================================================

    /**
     * @brief Record a violation and emit a resource_violation alert
     * @throws core::InvalidArgumentError if @p workspace_id is empty
     */
    void ReportViolation(const std::string& workspace_id, const core::ResourceViolation& violation);

    /**
     * @brief Emit a security_breach alert, then remediate
     * @throws core::InvalidArgumentError if @p workspace_id is empty
     */
    RemediationPlan ReportSecurityBreach(const std::string& workspace_id, const SecurityBreach& breach);

    /**
     * @brief Decide and apply the response to a breach
     *
     * | Breach                      | Response                                   |
     * |-----------------------------|--------------------------------------------|
     * | privilege_escalation        | pause container, critical alert, audit log |
     * | suspicious_network_activity | restrict traffic, heighten network watch   |
     * | unauthorized_file_access    | heighten fs watch, detailed audit          |
     * | resource_exhaustion         | stricter limits, heighten process watch    |
     * | anything else               | log, heighten monitoring                   |
     */
    RemediationPlan HandleSecurityBreach(const std::string& workspace_id, const SecurityBreach& breach);

    // ========================================================================
    // Subscriptions and history
    // ========================================================================

    /**
     * @brief Register a callback for a workspace, or "*" for every workspace
     * @throws core::InvalidArgumentError on empty key or null handler
     */
    void Subscribe(const std::string& workspace_id, AlertHandler handler);

    /// Remove every callback registered under the key
    void Unsubscribe(const std::string& workspace_id);

    SecurityDashboard GetSecurityDashboard() const;
    std::vector<core::ResourceViolation> GetWorkspaceViolations(const std::string& workspace_id) const;

    /// Empty ID clears every workspace's history
    void ClearViolations(const std::string& workspace_id);

    MonitoringProfile GetMonitoringProfile(const std::string& workspace_id) const;

private:
    void MonitorLoop(std::uint64_t generation);

    void CheckResourceUsage();
    void RunDetectors(DetectorKind kind);
    void EmitFinding(const WatchedWorkspace& workspace, const DetectorFinding& finding);

    void SendAlert(const SecurityAlert& alert);
    void Audit(core::Severity severity, const std::string& message) const;
    void UpdateProfile(const std::string& workspace_id, const RemediationPlan& plan);
    std::string ContainerFor(const std::string& workspace_id) const;

    std::shared_ptr<core::PolicyStore> policy_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    SecurityMonitorOptions options_;
    core::ResourceManager resource_manager_;
    std::shared_ptr<spdlog::logger> audit_logger_;

    // Lifecycle
    mutable std::mutex lifecycle_mutex_;
    std::condition_variable lifecycle_cv_;
    bool running_{false};
    std::uint64_t generation_{0};
    std::thread loop_thread_;
    std::shared_ptr<AlertChannel> alert_channel_;

    // Watched workspaces, sampler, detectors
    mutable std::shared_mutex tracked_mutex_;
    std::map<std::string, WatchedWorkspace> tracked_;
    std::shared_ptr<MetricsSampler> sampler_;
    std::vector<std::shared_ptr<AnomalyDetector>> detectors_;

    // Violation history
    mutable std::shared_mutex violations_mutex_;
    std::map<std::string, std::deque<core::ResourceViolation>> violations_;

    // Subscribers
    mutable std::shared_mutex subscribers_mutex_;
    std::map<std::string, std::vector<AlertHandler>> subscribers_;

    // Remediation state
    mutable std::mutex profiles_mutex_;
    std::map<std::string, MonitoringProfile> profiles_;

    // Alert counters
    std::atomic<std::size_t> total_alerts_{0};
    std::atomic<std::size_t> dropped_alerts_{0};
    std::atomic<std::size_t> critical_alerts_{0};
    std::atomic<std::size_t> error_alerts_{0};
    std::atomic<std::size_t> warning_alerts_{0};
    std::atomic<std::size_t> info_alerts_{0};

    utils::DispatchPool dispatch_pool_;
};

} // namespace monitors
} // namespace cellguard
