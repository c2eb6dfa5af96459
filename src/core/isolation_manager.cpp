/**
 * @file isolation_manager.cpp
 * @brief Implementation of workspace isolation profiles
 *
 * **Standard profile**:
 * - Dedicated network `aicli-workspace-<id>` (mode "custom") when network
 *   isolation is enabled, otherwise the default bridge
 * - Policy-default resource limits
 * - Capabilities: drop ALL, add CHOWN, DAC_OVERRIDE, SETGID, SETUID
 * - Seccomp "default" and AppArmor "docker-default" when enabled
 * - Monitoring pre-warning band: CPU 85%, memory 90%, network 100 MiB/s,
 *   disk 50 MiB/s
 *
 * **Security-opt strings** written to the host configuration:
 * `no-new-privileges:true`, `seccomp=<profile>`, `apparmor=<profile>`
 *
 * @date 2025
 */

#include "cellguard/core/isolation_manager.hpp"
#include "cellguard/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace cellguard {
namespace core {

namespace {

const char* const kCustomNetworkMode = "custom";
const char* const kBridgeNetworkMode = "bridge";

const std::vector<std::string> kDroppedCapabilities = {"ALL"};
const std::vector<std::string> kAddedCapabilities = {"CHOWN", "DAC_OVERRIDE", "SETGID", "SETUID"};

void AppendUnique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

IsolationManager::IsolationManager(std::shared_ptr<PolicyStore> policy,
                                   std::shared_ptr<runtime::ContainerRuntime> runtime)
    : policy_(policy ? std::move(policy) : std::make_shared<PolicyStore>())
    , resource_manager_(policy_)
    , network_manager_(policy_, std::move(runtime)) {

    auto config = policy_->Get();
    spdlog::info("Isolation Manager initialized");
    spdlog::debug("Network isolation: {}", config->enable_network_isolation);
    spdlog::debug("Seccomp: {}, AppArmor: {}", config->enable_seccomp, config->enable_apparmor);
}

IsolationManager::~IsolationManager() {
    spdlog::info("Isolation Manager destroyed");
}

// ============================================================================
// PROFILE CONSTRUCTION
// ============================================================================

SecurityOptions IsolationManager::BuildSecurityOptions(const IsolationConfig& config) {
    SecurityOptions options;
    options.capabilities.drop = kDroppedCapabilities;
    options.capabilities.add = kAddedCapabilities;
    options.no_new_privileges = config.no_new_privileges;
    options.read_only_root_fs = config.read_only_root_fs;

    if (config.enable_seccomp) {
        options.seccomp_profile = "default";
    }
    if (config.enable_apparmor) {
        options.apparmor_profile = "docker-default";
    }

    return options;
}

SecurityOptions IsolationManager::BuildSecurityOptions() const {
    return BuildSecurityOptions(*policy_->Get());
}

MonitoringConfig IsolationManager::BuildMonitoringConfig(const IsolationConfig& config) {
    MonitoringConfig monitoring;
    monitoring.enable_resource_monitoring = true;
    monitoring.enable_network_monitoring = true;
    monitoring.enable_filesystem_audit = config.enable_audit_log;
    monitoring.log_level = "info";
    monitoring.alert_thresholds = AlertThresholds{};
    return monitoring;
}

WorkspaceIsolation IsolationManager::CreateWorkspaceIsolation(const Workspace* workspace) const {
    if (workspace == nullptr) {
        throw InvalidArgumentError("workspace cannot be nil");
    }
    if (workspace->id.empty()) {
        throw InvalidArgumentError("workspace ID cannot be empty");
    }

    auto config = policy_->Get();

    WorkspaceIsolation isolation;
    isolation.workspace_id = workspace->id;
    isolation.network_mode = config->enable_network_isolation ? kCustomNetworkMode : kBridgeNetworkMode;
    isolation.network_name = NetworkManager::NetworkNameFor(workspace->id);
    isolation.isolation_level = IsolationLevel::STANDARD;
    isolation.resource_limits = resource_manager_.CreateResourceLimits();
    isolation.security_options = BuildSecurityOptions(*config);
    isolation.monitoring = BuildMonitoringConfig(*config);
    isolation.created_at = std::chrono::system_clock::now();

    spdlog::info("Isolation profile created for workspace {} ({}, {})",
                 workspace->id, isolation.network_mode,
                 IsolationLevelToString(isolation.isolation_level));
    return isolation;
}

// ============================================================================
// VALIDATION
// ============================================================================

void IsolationManager::ValidateIsolation(const WorkspaceIsolation* isolation) const {
    if (isolation == nullptr) {
        throw InvalidArgumentError("isolation config cannot be nil");
    }
    if (isolation->workspace_id.empty()) {
        throw InvalidArgumentError("workspace ID cannot be empty");
    }
    if (isolation->network_mode.empty()) {
        throw InvalidArgumentError("network mode cannot be empty");
    }
    if (isolation->network_mode == kCustomNetworkMode && isolation->network_name.empty()) {
        throw InvalidArgumentError("network name cannot be empty in custom network mode");
    }
    if (isolation->resource_limits.memory <= 0) {
        throw InvalidArgumentError("memory limit must be positive");
    }

    resource_manager_.ValidateResourceLimits(&isolation->resource_limits);
}

// ============================================================================
// CONTAINER RENDERING
// ============================================================================

void IsolationManager::ApplyToContainer(const WorkspaceIsolation* isolation,
                                        runtime::ContainerDefinition* container,
                                        runtime::HostConfig* host) const {
    if (isolation == nullptr) {
        throw InvalidArgumentError("isolation config cannot be nil");
    }
    if (container == nullptr) {
        throw InvalidArgumentError("container config cannot be nil");
    }
    if (host == nullptr) {
        throw InvalidArgumentError("host config cannot be nil");
    }

    ValidateIsolation(isolation);

    auto config = policy_->Get();
    const auto& options = isolation->security_options;

    // Resources: only the fields the profile sets
    const auto resources = resource_manager_.ToRuntimeResources(isolation->resource_limits);
    host->resources.cpu_shares = resources.cpu_shares;
    host->resources.cpu_quota = resources.cpu_quota;
    host->resources.cpu_period = resources.cpu_period;
    host->resources.memory = resources.memory;
    host->resources.memory_swap = resources.memory_swap;
    if (resources.pids_limit) {
        host->resources.pids_limit = resources.pids_limit;
    }
    host->resources.blkio_weight = resources.blkio_weight;
    for (const auto& rule : resources.device_cgroup_rules) {
        AppendUnique(host->resources.device_cgroup_rules, rule);
    }

    // Security
    if (options.no_new_privileges) {
        AppendUnique(host->security_opt, "no-new-privileges:true");
    }
    if (!options.seccomp_profile.empty()) {
        AppendUnique(host->security_opt, "seccomp=" + options.seccomp_profile);
    }
    if (!options.apparmor_profile.empty()) {
        AppendUnique(host->security_opt, "apparmor=" + options.apparmor_profile);
    }

    // Never loosens what the caller already set
    if (options.read_only_root_fs) {
        host->readonly_rootfs = true;
    }
    if (!options.capabilities.drop.empty()) {
        host->cap_drop = options.capabilities.drop;
    }
    if (!options.capabilities.add.empty()) {
        host->cap_add = options.capabilities.add;
    }

    if (config->disable_privileged) {
        host->privileged = false;
    }

    // Network
    if (isolation->network_mode == kCustomNetworkMode) {
        host->network_mode = isolation->network_name;
    }

    container->labels["aicli.workspace.id"] = isolation->workspace_id;
    container->labels["aicli.isolation.level"] = IsolationLevelToString(isolation->isolation_level);

    spdlog::debug("Isolation applied to container for workspace {} (network {})",
                  isolation->workspace_id, host->network_mode);
}

// ============================================================================
// POLICY
// ============================================================================

void IsolationManager::UpdateConfig(std::shared_ptr<const IsolationConfig> config) {
    if (!config) {
        throw InvalidArgumentError("config cannot be nil");
    }
    policy_->Replace(std::move(config));
    spdlog::info("Isolation config updated");
}

IsolationConfig IsolationManager::GetConfig() const {
    return *policy_->Get();
}

} // namespace core
} // namespace cellguard
