/**
 * @file network_manager.hpp
 * @brief Per-workspace network allocation, port policy and firewall validation
 *
 * Every workspace gets a dedicated bridge network whose subnet is a pure
 * function of the workspace ID, so any process can recompute the assignment
 * without shared state. The manager also builds port-publishing tables under
 * the blocked-port policy, validates declarative firewall policies and
 * streams per-network traffic counters.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_config.hpp"
#include "cellguard/runtime/container_runtime.hpp"
#include "cellguard/runtime/container_spec.hpp"
#include "cellguard/utils/channel.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace cellguard {
namespace core {

/**
 * @struct NetworkInfo
 * @brief Identity of one workspace network
 */
struct NetworkInfo {
    std::string id;
    std::string name;        ///< aicli-workspace-<workspace id>
    std::string subnet;      ///< 172.x.y.0/24
    std::string gateway;     ///< First host address of the subnet
    bool isolated{true};
    std::string driver{"bridge"};
    std::chrono::system_clock::time_point created_at;
    std::map<std::string, std::string> labels;
    std::map<std::string, std::string> options;  ///< Driver options (bridge name, MTU, ...)
};

/**
 * @struct NetworkStats
 * @brief Cumulative traffic counters of one network
 */
struct NetworkStats {
    std::string network_id;
    std::int64_t rx_bytes{0};
    std::int64_t tx_bytes{0};
    std::int64_t rx_packets{0};
    std::int64_t tx_packets{0};
    int connection_count{0};
    std::chrono::system_clock::time_point timestamp;
};

/// host port -> container port, each optionally suffixed "/tcp" or "/udp"
using PortMappingTable = std::map<std::string, std::string>;

/**
 * @struct PortMappingRequest
 * @brief Ports a workspace wants published
 */
struct PortMappingRequest {
    PortMappingTable port_mappings;
    std::string host_ip;        ///< Empty = all interfaces
    bool bind_to_host{false};   ///< Publish on the host, not just expose
};

/**
 * @struct PortMapping
 * @brief Runtime port tables produced from a request
 */
struct PortMapping {
    runtime::PortSet exposed_ports;
    runtime::PortMap port_bindings;
};

/**
 * @struct FirewallRule
 * @brief One declarative allow/deny rule
 */
struct FirewallRule {
    std::string protocol;      ///< tcp, udp or icmp
    std::string source;        ///< IP or CIDR (empty = any)
    std::string destination;   ///< IP or CIDR (empty = any)
    std::string port;          ///< 1-65535 (empty = any)
    std::string action;        ///< allow or deny (empty = implied by list)
    int priority{0};
};

/**
 * @struct NetworkSecurityPolicy
 * @brief Traffic policy for one network
 */
struct NetworkSecurityPolicy {
    std::string network_id;
    std::int64_t max_bandwidth{0};   ///< Bytes per second (0 = unlimited)
    int max_connections{0};          ///< 0 = unlimited
    std::vector<FirewallRule> allow_rules;
    std::vector<FirewallRule> block_rules;
    bool enable_dpi{false};
    bool log_traffic{false};
};

void to_json(nlohmann::json& j, const NetworkInfo& info);
void to_json(nlohmann::json& j, const NetworkStats& stats);

/**
 * @class NetworkUsageStream
 * @brief Timer-driven producer of NetworkStats samples
 *
 * Emits the first sample immediately, then one per interval, into a bounded
 * channel (samples are dropped when the consumer falls behind). The producer
 * stops on Cancel() or destruction, after which the channel is closed.
 */
class NetworkUsageStream {
public:
    using Sampler = std::function<NetworkStats(const std::string& network_id)>;

    NetworkUsageStream(std::string network_id,
                       Sampler sampler,
                       std::chrono::milliseconds interval,
                       std::size_t capacity = 10);
    ~NetworkUsageStream();

    NetworkUsageStream(const NetworkUsageStream&) = delete;
    NetworkUsageStream& operator=(const NetworkUsageStream&) = delete;

    /// Channel of samples; closed once the producer exits
    std::shared_ptr<utils::Channel<NetworkStats>> Stats() const { return channel_; }

    /// Stop the producer and wait for it to exit (idempotent)
    void Cancel();

    const std::string& NetworkId() const { return network_id_; }

private:
    void Run();

    std::string network_id_;
    Sampler sampler_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<utils::Channel<NetworkStats>> channel_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
    std::thread worker_;
};

/**
 * @class NetworkManager
 * @brief Workspace network allocation and traffic policy
 *
 * **Usage Example**:
 * @code
 * NetworkManager networks(policy, runtime);
 * auto info = networks.CreateWorkspaceNetwork("ws-1");
 * // info.name == "aicli-workspace-ws-1", info.subnet == AllocateSubnet("ws-1")
 *
 * PortMappingRequest request;
 * request.port_mappings = {{"9000", "3000"}};
 * request.bind_to_host = true;
 * auto ports = networks.CreatePortMapping(&request);
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe. The network registry is
 * guarded by a read/write lock that is never held across runtime calls.
 */
class NetworkManager {
public:
    using StatsSampler = NetworkUsageStream::Sampler;

    /**
     * @param policy  Shared policy store; null uses process defaults
     * @param runtime Container runtime used to create/remove networks; null
     *                keeps networks purely declarative
     */
    explicit NetworkManager(std::shared_ptr<PolicyStore> policy = nullptr,
                            std::shared_ptr<runtime::ContainerRuntime> runtime = nullptr);
    ~NetworkManager();

    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    // ========================================================================
    // Workspace networks
    // ========================================================================

    /**
     * @brief Provision (or return the already provisioned) workspace network
     * @throws InvalidArgumentError if @p workspace_id is empty
     * @throws RuntimeError if the runtime fails to create the network
     */
    NetworkInfo CreateWorkspaceNetwork(const std::string& workspace_id);

    /**
     * @brief Registered network, or its deterministic reconstruction
     * @throws InvalidArgumentError if @p workspace_id is empty
     */
    NetworkInfo GetWorkspaceNetwork(const std::string& workspace_id) const;

    /**
     * @brief Remove the workspace network (no-op when none is registered)
     * @throws InvalidArgumentError if @p workspace_id is empty
     * @throws RuntimeError if the runtime fails to remove the network
     */
    void DeleteWorkspaceNetwork(const std::string& workspace_id);

    /**
     * @brief Networks registered for a workspace
     * @throws InvalidArgumentError if @p workspace_id is empty
     */
    std::vector<NetworkInfo> ListWorkspaceNetworks(const std::string& workspace_id) const;

    /**
     * @brief Network-create request for a workspace (no side effects)
     */
    runtime::NetworkCreateRequest BuildNetworkCreateRequest(const std::string& workspace_id) const;

    /**
     * @brief Registered workspaces sharing a subnet, keyed by subnet
     */
    std::map<std::string, std::vector<std::string>> FindSubnetConflicts() const;

    /**
     * @brief Deterministic /24 for a workspace
     *
     * n = FNV-1a(id) % 1000, subnet = 172.(20 + n / 256).(n % 256).0/24
     */
    static std::string AllocateSubnet(const std::string& workspace_id);

    /**
     * @brief First host address (.1) of an IPv4 subnet
     * @return Gateway, or "" when @p subnet is malformed
     */
    static std::string GetGatewayIP(const std::string& subnet);

    static std::string NetworkNameFor(const std::string& workspace_id);

    /// Kernel-safe bridge name (at most 15 chars) derived from the workspace hash
    static std::string BridgeNameFor(const std::string& workspace_id);

    // ========================================================================
    // Ports
    // ========================================================================

    /**
     * @brief Check a host->container port table
     *
     * An empty table is valid. Ports must be integers in 1-65535 (optionally
     * "/tcp" or "/udp"), and host ports must not be blocked.
     *
     * @throws InvalidArgumentError on malformed or out-of-range ports
     * @throws PolicyViolationError on a blocked host port
     */
    void ValidatePortMapping(const PortMappingTable& mappings) const;

    /**
     * @brief Build exposed-port and host-binding tables
     *
     * Bindings are produced only when bind_to_host is set.
     *
     * @throws InvalidArgumentError if @p request is null or invalid
     * @throws PolicyViolationError on a blocked host port
     */
    PortMapping CreatePortMapping(const PortMappingRequest* request) const;

    bool IsPortBlocked(int port) const;

    // ========================================================================
    // Traffic
    // ========================================================================

    /**
     * @brief Start streaming traffic samples for a network
     * @throws InvalidArgumentError if @p network_id is empty
     */
    std::unique_ptr<NetworkUsageStream> MonitorNetworkUsage(
        const std::string& network_id,
        std::chrono::milliseconds interval = std::chrono::seconds(5)) const;

    /// Replace the traffic sampler (defaults to /sys/class/net counters)
    void SetStatsSampler(StatsSampler sampler);

    /**
     * @brief Validate ceilings and every allow/block rule
     * @throws InvalidArgumentError describing the first problem
     */
    void ValidateNetworkSecurityPolicy(const NetworkSecurityPolicy* policy) const;

    /**
     * @throws InvalidArgumentError on a bad protocol, port, address or action
     */
    static void ValidateFirewallRule(const FirewallRule& rule);

    /**
     * @brief Validate and record the policy for a network
     *
     * Enforcement is left to the host; the recorded policy is what the host
     * agent should apply.
     *
     * @throws InvalidArgumentError on empty ID, null or invalid policy
     */
    void ApplyNetworkSecurity(const std::string& network_id, const NetworkSecurityPolicy* policy);

    std::optional<NetworkSecurityPolicy> GetAppliedPolicy(const std::string& network_id) const;

private:
    NetworkInfo MakeNetworkInfo(const std::string& workspace_id,
                                const std::string& network_id) const;
    std::string InterfaceFor(const std::string& network_id) const;

    std::shared_ptr<PolicyStore> policy_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;

    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, NetworkInfo> networks_;                 ///< By workspace ID
    std::map<std::string, NetworkSecurityPolicy> policies_;       ///< By network ID

    mutable std::mutex sampler_mutex_;
    StatsSampler sampler_;
};

} // namespace core
} // namespace cellguard
