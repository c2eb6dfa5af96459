/**
 * @file network_manager.cpp
 * @brief Implementation of workspace network allocation and traffic policy
 *
 * **Subnet allocation**:
 * ```
 * n      = FNV-1a-32(workspace_id) % 1000
 * subnet = 172.(20 + n / 256).(n % 256).0/24      (inside 172.20.0.0/14)
 * ```
 * The mapping needs no allocation table. Two IDs can share a bucket; such
 * collisions among provisioned networks are logged and reported by
 * FindSubnetConflicts() but not resolved.
 *
 * **Bridge options** applied to every workspace network:
 * - inter-container communication disabled
 * - IP masquerade enabled (outbound internet allowed)
 * - MTU 1500
 *
 * @date 2025
 */

#include "cellguard/core/network_manager.hpp"
#include "cellguard/core/errors.hpp"
#include "cellguard/core/isolation_types.hpp"
#include "cellguard/utils/hash_utils.hpp"
#include "cellguard/utils/net_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace cellguard {
namespace core {

namespace {

constexpr std::uint32_t kSubnetBuckets = 1000;
constexpr int kMaxPort = 65535;
const char* const kNetworkPrefix = "aicli-workspace-";
const char* const kBridgePrefix = "aicli-br-";
const char* const kBridgeNameOption = "com.docker.network.bridge.name";

std::int64_t ReadCounter(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::int64_t value = 0;
    if (!(file >> value)) {
        return 0;
    }
    return value;
}

// Falls back to zeros when the interface does not exist on this host
NetworkStats ReadInterfaceCounters(const std::string& network_id, const std::string& interface_name) {
    NetworkStats stats;
    stats.network_id = network_id;
    stats.timestamp = std::chrono::system_clock::now();

    const std::filesystem::path base = std::filesystem::path("/sys/class/net") / interface_name / "statistics";
    std::error_code ec;
    if (interface_name.empty() || !std::filesystem::is_directory(base, ec)) {
        return stats;
    }

    stats.rx_bytes = ReadCounter(base / "rx_bytes");
    stats.tx_bytes = ReadCounter(base / "tx_bytes");
    stats.rx_packets = ReadCounter(base / "rx_packets");
    stats.tx_packets = ReadCounter(base / "tx_packets");
    return stats;
}

void CheckPortRange(long port, const char* side) {
    if (port < 1 || port > kMaxPort) {
        throw InvalidArgumentError(std::string(side) + " port " + std::to_string(port) +
                                   " is out of valid range (1-65535)");
    }
}

long ParsePortOrThrow(const std::string& text, const char* side) {
    auto port = utils::NetUtils::ParsePort(text);
    if (!port) {
        throw InvalidArgumentError(std::string("invalid ") + side + " port: " + text);
    }
    return *port;
}

std::string ProtocolOf(const std::string& port_spec) {
    auto slash = port_spec.find('/');
    return slash == std::string::npos ? "tcp" : port_spec.substr(slash + 1);
}

void ValidateAddress(const std::string& value, const char* field) {
    if (value.empty()) {
        return;
    }
    if (value.find('/') != std::string::npos) {
        if (!utils::NetUtils::IsCIDR(value)) {
            throw InvalidArgumentError(std::string("invalid ") + field + " CIDR: " + value);
        }
    } else if (!utils::NetUtils::IsIPAddress(value)) {
        throw InvalidArgumentError(std::string("invalid ") + field + " IP: " + value);
    }
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const NetworkInfo& info) {
    j = json{
        {"id", info.id},
        {"name", info.name},
        {"subnet", info.subnet},
        {"gateway", info.gateway},
        {"isolated", info.isolated},
        {"driver", info.driver},
        {"created_at", FormatTimestamp(info.created_at)},
        {"labels", info.labels},
        {"options", info.options}
    };
}

void to_json(json& j, const NetworkStats& stats) {
    j = json{
        {"network_id", stats.network_id},
        {"rx_bytes", stats.rx_bytes},
        {"tx_bytes", stats.tx_bytes},
        {"rx_packets", stats.rx_packets},
        {"tx_packets", stats.tx_packets},
        {"connection_count", stats.connection_count},
        {"timestamp", FormatTimestamp(stats.timestamp)}
    };
}

// ============================================================================
// NETWORK USAGE STREAM
// ============================================================================

NetworkUsageStream::NetworkUsageStream(std::string network_id,
                                       Sampler sampler,
                                       std::chrono::milliseconds interval,
                                       std::size_t capacity)
    : network_id_(std::move(network_id))
    , sampler_(std::move(sampler))
    , interval_(interval)
    , channel_(std::make_shared<utils::Channel<NetworkStats>>(capacity)) {

    worker_ = std::thread(&NetworkUsageStream::Run, this);
    spdlog::debug("Network usage stream started for {} (every {} ms)",
                  network_id_, interval_.count());
}

NetworkUsageStream::~NetworkUsageStream() {
    Cancel();
}

void NetworkUsageStream::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void NetworkUsageStream::Run() {
    for (;;) {
        try {
            NetworkStats stats = sampler_(network_id_);
            if (!channel_->TrySend(std::move(stats))) {
                spdlog::debug("Network stats for {} dropped: consumer behind", network_id_);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("Network stats sampling failed for {}: {}", network_id_, e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, interval_, [this] { return cancelled_; })) {
            break;
        }
    }

    channel_->Close();
    spdlog::debug("Network usage stream stopped for {}", network_id_);
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

NetworkManager::NetworkManager(std::shared_ptr<PolicyStore> policy,
                               std::shared_ptr<runtime::ContainerRuntime> runtime)
    : policy_(policy ? std::move(policy) : std::make_shared<PolicyStore>())
    , runtime_(std::move(runtime)) {
    spdlog::debug("Network Manager initialized (runtime: {})", runtime_ ? "attached" : "none");
}

NetworkManager::~NetworkManager() = default;

// ============================================================================
// DETERMINISTIC ALLOCATION
// ============================================================================

std::string NetworkManager::AllocateSubnet(const std::string& workspace_id) {
    const std::uint32_t n = utils::HashUtils::Fnv1a32(workspace_id) % kSubnetBuckets;
    return "172." + std::to_string(20 + n / 256) + "." + std::to_string(n % 256) + ".0/24";
}

std::string NetworkManager::GetGatewayIP(const std::string& subnet) {
    auto network = utils::NetUtils::ParseIPv4Cidr(subnet);
    if (!network) {
        return "";
    }
    // .1 of the enclosing /24
    const std::uint32_t gateway = (network->NetworkAddress() & 0xFFFFFF00u) | 1u;
    return utils::NetUtils::FormatIPv4(gateway);
}

std::string NetworkManager::NetworkNameFor(const std::string& workspace_id) {
    return kNetworkPrefix + workspace_id;
}

std::string NetworkManager::BridgeNameFor(const std::string& workspace_id) {
    // aicli-br- (9) + 6 hex = 15 = IFNAMSIZ - 1
    return kBridgePrefix + utils::HashUtils::ToHex32(utils::HashUtils::Fnv1a32(workspace_id)).substr(0, 6);
}

runtime::NetworkCreateRequest NetworkManager::BuildNetworkCreateRequest(const std::string& workspace_id) const {
    runtime::NetworkCreateRequest request;
    request.name = NetworkNameFor(workspace_id);
    request.driver = "bridge";
    request.internal = false;     // outbound internet allowed
    request.attachable = false;   // no foreign containers
    request.ipam_driver = "default";
    request.subnet = AllocateSubnet(workspace_id);
    request.gateway = GetGatewayIP(request.subnet);

    request.options = {
        {kBridgeNameOption, BridgeNameFor(workspace_id)},
        {"com.docker.network.driver.mtu", "1500"},
        {"com.docker.network.bridge.enable_icc", "false"},
        {"com.docker.network.bridge.enable_ip_masquerade", "true"}
    };

    request.labels = {
        {"aicli.workspace.id", workspace_id},
        {"aicli.managed", "true"},
        {"aicli.isolation", "workspace"},
        {"aicli.created_at", FormatTimestamp(std::chrono::system_clock::now())}
    };

    return request;
}

NetworkInfo NetworkManager::MakeNetworkInfo(const std::string& workspace_id,
                                            const std::string& network_id) const {
    auto request = BuildNetworkCreateRequest(workspace_id);

    NetworkInfo info;
    info.id = network_id;
    info.name = request.name;
    info.subnet = request.subnet;
    info.gateway = request.gateway;
    info.isolated = true;
    info.driver = request.driver;
    info.created_at = std::chrono::system_clock::now();
    info.labels = request.labels;
    info.options = request.options;
    return info;
}

// ============================================================================
// WORKSPACE NETWORK LIFECYCLE
// ============================================================================

NetworkInfo NetworkManager::CreateWorkspaceNetwork(const std::string& workspace_id) {
    if (workspace_id.empty()) {
        throw InvalidArgumentError("workspace ID cannot be empty");
    }

    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = networks_.find(workspace_id);
        if (it != networks_.end()) {
            spdlog::debug("Workspace network already provisioned: {}", it->second.name);
            return it->second;
        }
    }

    auto request = BuildNetworkCreateRequest(workspace_id);
    if (request.gateway.empty()) {
        throw InvalidArgumentError("failed to derive gateway for subnet " + request.subnet);
    }

    std::string network_id;
    if (runtime_) {
        network_id = runtime_->CreateNetwork(request);
    } else {
        const auto unix_seconds = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        network_id = "net_" + workspace_id + "_" + std::to_string(unix_seconds);
    }

    NetworkInfo info = MakeNetworkInfo(workspace_id, network_id);
    info.labels = request.labels;

    std::vector<std::string> sharing;
    bool lost_race = false;
    NetworkInfo existing;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto [it, inserted] = networks_.emplace(workspace_id, info);
        if (!inserted) {
            lost_race = true;
            existing = it->second;
        } else {
            for (const auto& [other_id, other] : networks_) {
                if (other_id != workspace_id && other.subnet == info.subnet) {
                    sharing.push_back(other_id);
                }
            }
        }
    }

    if (lost_race) {
        // Another caller provisioned the same workspace concurrently
        if (runtime_) {
            runtime_->RemoveNetwork(network_id);
        }
        return existing;
    }

    for (const auto& other_id : sharing) {
        spdlog::warn("Subnet collision: {} shares {} with workspace {}",
                     workspace_id, info.subnet, other_id);
    }

    spdlog::info("Workspace network created: {} ({}, gateway {})",
                 info.name, info.subnet, info.gateway);
    return info;
}

NetworkInfo NetworkManager::GetWorkspaceNetwork(const std::string& workspace_id) const {
    if (workspace_id.empty()) {
        throw InvalidArgumentError("workspace ID cannot be empty");
    }

    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = networks_.find(workspace_id);
        if (it != networks_.end()) {
            return it->second;
        }
    }

    return MakeNetworkInfo(workspace_id, "net_" + workspace_id);
}

void NetworkManager::DeleteWorkspaceNetwork(const std::string& workspace_id) {
    if (workspace_id.empty()) {
        throw InvalidArgumentError("workspace ID cannot be empty");
    }

    std::optional<NetworkInfo> removed;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = networks_.find(workspace_id);
        if (it != networks_.end()) {
            removed = it->second;
            policies_.erase(it->second.id);
            networks_.erase(it);
        }
    }

    if (!removed) {
        spdlog::debug("No network registered for workspace {}", workspace_id);
        return;
    }

    if (runtime_) {
        runtime_->RemoveNetwork(removed->id);
    }
    spdlog::info("Workspace network deleted: {}", removed->name);
}

std::vector<NetworkInfo> NetworkManager::ListWorkspaceNetworks(const std::string& workspace_id) const {
    if (workspace_id.empty()) {
        throw InvalidArgumentError("workspace ID cannot be empty");
    }

    std::vector<NetworkInfo> result;
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = networks_.find(workspace_id);
    if (it != networks_.end()) {
        result.push_back(it->second);
    }
    return result;
}

std::map<std::string, std::vector<std::string>> NetworkManager::FindSubnetConflicts() const {
    std::map<std::string, std::vector<std::string>> by_subnet;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        for (const auto& [workspace_id, info] : networks_) {
            by_subnet[info.subnet].push_back(workspace_id);
        }
    }

    for (auto it = by_subnet.begin(); it != by_subnet.end();) {
        if (it->second.size() < 2) {
            it = by_subnet.erase(it);
        } else {
            ++it;
        }
    }
    return by_subnet;
}

// ============================================================================
// PORT POLICY
// ============================================================================

bool NetworkManager::IsPortBlocked(int port) const {
    auto config = policy_->Get();
    return std::find(config->blocked_ports.begin(), config->blocked_ports.end(), port) !=
           config->blocked_ports.end();
}

void NetworkManager::ValidatePortMapping(const PortMappingTable& mappings) const {
    for (const auto& [host_spec, container_spec] : mappings) {
        const long host_port = ParsePortOrThrow(host_spec, "host");
        const long container_port = ParsePortOrThrow(container_spec, "container");

        CheckPortRange(host_port, "host");
        CheckPortRange(container_port, "container");

        if (IsPortBlocked(static_cast<int>(host_port))) {
            throw PolicyViolationError("port " + std::to_string(host_port) +
                                       " is blocked by security policy");
        }
    }
}

PortMapping NetworkManager::CreatePortMapping(const PortMappingRequest* request) const {
    if (request == nullptr) {
        throw InvalidArgumentError("port mapping request cannot be nil");
    }

    ValidatePortMapping(request->port_mappings);

    PortMapping mapping;
    for (const auto& [host_spec, container_spec] : request->port_mappings) {
        const long container_port = ParsePortOrThrow(container_spec, "container");
        const std::string key = std::to_string(container_port) + "/" + ProtocolOf(container_spec);

        mapping.exposed_ports.insert(key);

        if (request->bind_to_host) {
            const long host_port = ParsePortOrThrow(host_spec, "host");
            mapping.port_bindings[key].push_back({request->host_ip, std::to_string(host_port)});
        }
    }

    return mapping;
}

// ============================================================================
// TRAFFIC MONITORING
// ============================================================================

void NetworkManager::SetStatsSampler(StatsSampler sampler) {
    std::lock_guard<std::mutex> lock(sampler_mutex_);
    sampler_ = std::move(sampler);
}

std::string NetworkManager::InterfaceFor(const std::string& network_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    for (const auto& [workspace_id, info] : networks_) {
        if (info.id == network_id) {
            auto it = info.options.find(kBridgeNameOption);
            if (it != info.options.end()) {
                return it->second;
            }
        }
    }
    return network_id;
}

std::unique_ptr<NetworkUsageStream> NetworkManager::MonitorNetworkUsage(
    const std::string& network_id,
    std::chrono::milliseconds interval) const {

    if (network_id.empty()) {
        throw InvalidArgumentError("network ID cannot be empty");
    }
    if (interval.count() <= 0) {
        throw InvalidArgumentError("monitoring interval must be positive");
    }

    StatsSampler sampler;
    {
        std::lock_guard<std::mutex> lock(sampler_mutex_);
        sampler = sampler_;
    }
    if (!sampler) {
        const std::string interface_name = InterfaceFor(network_id);
        sampler = [interface_name](const std::string& id) {
            return ReadInterfaceCounters(id, interface_name);
        };
    }

    spdlog::info("Monitoring network usage: {}", network_id);
    return std::make_unique<NetworkUsageStream>(network_id, std::move(sampler), interval);
}

// ============================================================================
// FIREWALL POLICY
// ============================================================================

void NetworkManager::ValidateFirewallRule(const FirewallRule& rule) {
    if (rule.protocol != "tcp" && rule.protocol != "udp" && rule.protocol != "icmp") {
        throw InvalidArgumentError("invalid protocol: " + rule.protocol);
    }

    if (!rule.port.empty()) {
        auto port = utils::NetUtils::ParsePort(rule.port);
        if (!port || *port < 1 || *port > kMaxPort) {
            throw InvalidArgumentError("invalid port: " + rule.port);
        }
    }

    ValidateAddress(rule.source, "source");
    ValidateAddress(rule.destination, "destination");

    if (!rule.action.empty() && rule.action != "allow" && rule.action != "deny") {
        throw InvalidArgumentError("invalid action: " + rule.action);
    }
}

void NetworkManager::ValidateNetworkSecurityPolicy(const NetworkSecurityPolicy* policy) const {
    if (policy == nullptr) {
        throw InvalidArgumentError("security policy cannot be nil");
    }

    if (policy->max_bandwidth < 0) {
        throw InvalidArgumentError("max bandwidth cannot be negative");
    }
    if (policy->max_connections < 0) {
        throw InvalidArgumentError("max connections cannot be negative");
    }

    for (std::size_t i = 0; i < policy->allow_rules.size(); ++i) {
        try {
            ValidateFirewallRule(policy->allow_rules[i]);
        }
        catch (const InvalidArgumentError& e) {
            throw InvalidArgumentError("invalid allow rule " + std::to_string(i) + ": " + e.what());
        }
    }

    for (std::size_t i = 0; i < policy->block_rules.size(); ++i) {
        try {
            ValidateFirewallRule(policy->block_rules[i]);
        }
        catch (const InvalidArgumentError& e) {
            throw InvalidArgumentError("invalid block rule " + std::to_string(i) + ": " + e.what());
        }
    }
}

void NetworkManager::ApplyNetworkSecurity(const std::string& network_id,
                                          const NetworkSecurityPolicy* policy) {
    if (network_id.empty()) {
        throw InvalidArgumentError("network ID cannot be empty");
    }
    if (policy == nullptr) {
        throw InvalidArgumentError("security policy cannot be nil");
    }

    ValidateNetworkSecurityPolicy(policy);

    NetworkSecurityPolicy applied = *policy;
    applied.network_id = network_id;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        policies_[network_id] = std::move(applied);
    }

    spdlog::info("Network security policy applied to {}: {} allow / {} block rules",
                 network_id, policy->allow_rules.size(), policy->block_rules.size());
}

std::optional<NetworkSecurityPolicy> NetworkManager::GetAppliedPolicy(const std::string& network_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = policies_.find(network_id);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace core
} // namespace cellguard
