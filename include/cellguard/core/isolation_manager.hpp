/**
 * @file isolation_manager.hpp
 * @brief Workspace isolation profiles and their application to containers
 *
 * Composes resource limits, network assignment, capability and MAC settings
 * and monitoring thresholds into one WorkspaceIsolation per workspace. Then
 * renders it into the container definition and host configuration handed to
 * the runtime at create time.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_config.hpp"
#include "cellguard/core/isolation_types.hpp"
#include "cellguard/core/network_manager.hpp"
#include "cellguard/core/resource_manager.hpp"
#include "cellguard/runtime/container_spec.hpp"

#include <memory>
#include <string>

namespace cellguard {
namespace core {

/**
 * @class IsolationManager
 * @brief Builds, validates and applies workspace isolation profiles
 *
 * **Usage Example**:
 * @code
 * IsolationManager isolation;
 * Workspace ws{"ws-1", "demo", "user-7", "/projects/demo"};
 * auto profile = isolation.CreateWorkspaceIsolation(&ws);
 * isolation.ValidateIsolation(&profile);
 *
 * runtime::ContainerDefinition container;
 * runtime::HostConfig host;
 * isolation.ApplyToContainer(&profile, &container, &host);
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class IsolationManager {
public:
    /**
     * @param policy  Shared policy store; null creates one with defaults
     * @param runtime Runtime used by the network manager; may be null
     */
    explicit IsolationManager(std::shared_ptr<PolicyStore> policy = nullptr,
                              std::shared_ptr<runtime::ContainerRuntime> runtime = nullptr);
    ~IsolationManager();

    IsolationManager(const IsolationManager&) = delete;
    IsolationManager& operator=(const IsolationManager&) = delete;

    /**
     * @brief Build the standard isolation profile of a workspace
     * @throws InvalidArgumentError if @p workspace is null or has an empty ID
     */
    WorkspaceIsolation CreateWorkspaceIsolation(const Workspace* workspace) const;

    /**
     * @brief Write the profile into runtime create-time records
     *
     * Validates everything first, so nothing is written on failure.
     *
     * @throws InvalidArgumentError if any argument is null or the profile is invalid
     * @throws PolicyViolationError if the profile's limits violate policy
     */
    void ApplyToContainer(const WorkspaceIsolation* isolation,
                          runtime::ContainerDefinition* container,
                          runtime::HostConfig* host) const;

    /**
     * @brief Gate check before a profile reaches the runtime
     * @throws InvalidArgumentError describing the first problem
     * @throws PolicyViolationError if the resource limits violate policy
     */
    void ValidateIsolation(const WorkspaceIsolation* isolation) const;

    /**
     * @brief Replace the process-wide policy
     * @throws InvalidArgumentError if @p config is null
     * @throws ConfigError if @p config is out of range
     */
    void UpdateConfig(std::shared_ptr<const IsolationConfig> config);

    /// Snapshot of the active policy
    IsolationConfig GetConfig() const;

    /// Security options derived from the active policy
    SecurityOptions BuildSecurityOptions() const;

    ResourceManager& Resources() { return resource_manager_; }
    NetworkManager& Networks() { return network_manager_; }
    std::shared_ptr<PolicyStore> Policy() const { return policy_; }

private:
    static SecurityOptions BuildSecurityOptions(const IsolationConfig& config);
    static MonitoringConfig BuildMonitoringConfig(const IsolationConfig& config);

    std::shared_ptr<PolicyStore> policy_;
    ResourceManager resource_manager_;
    NetworkManager network_manager_;
};

} // namespace core
} // namespace cellguard
