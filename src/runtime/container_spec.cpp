/**
 * @file container_spec.cpp
 * @brief Engine API JSON and CLI argument rendering of container records
 *
 * JSON field names follow the Docker Engine API (PascalCase); CLI flags follow
 * `docker run --help`. Fields left at their zero value are omitted so the
 * runtime applies its own defaults.
 *
 * @date 2025
 */

#include "cellguard/runtime/container_spec.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cellguard {
namespace runtime {

bool operator==(const PortBinding& lhs, const PortBinding& rhs) {
    return lhs.host_ip == rhs.host_ip && lhs.host_port == rhs.host_port;
}

// ============================================================================
// ENGINE API JSON
// ============================================================================

void to_json(json& j, const Resources& resources) {
    j = json{
        {"CpuShares", resources.cpu_shares},
        {"CpuQuota", resources.cpu_quota},
        {"CpuPeriod", resources.cpu_period},
        {"Memory", resources.memory},
        {"MemorySwap", resources.memory_swap},
        {"BlkioWeight", resources.blkio_weight},
        {"DeviceCgroupRules", resources.device_cgroup_rules}
    };
    if (resources.pids_limit) {
        j["PidsLimit"] = *resources.pids_limit;
    }
}

void to_json(json& j, const PortBinding& binding) {
    j = json{
        {"HostIp", binding.host_ip},
        {"HostPort", binding.host_port}
    };
}

void to_json(json& j, const HostConfig& host) {
    // Resources fields are inlined into HostConfig by the Engine API
    j = host.resources;
    j["NetworkMode"] = host.network_mode;
    j["Privileged"] = host.privileged;
    j["ReadonlyRootfs"] = host.readonly_rootfs;
    j["CapAdd"] = host.cap_add;
    j["CapDrop"] = host.cap_drop;
    j["SecurityOpt"] = host.security_opt;
    j["Binds"] = host.binds;
    j["AutoRemove"] = host.auto_remove;

    json bindings = json::object();
    for (const auto& [port, list] : host.port_bindings) {
        bindings[port] = list;
    }
    j["PortBindings"] = bindings;
}

void to_json(json& j, const NetworkCreateRequest& request) {
    json ipam_config = json::array();
    if (!request.subnet.empty()) {
        ipam_config.push_back({{"Subnet", request.subnet}, {"Gateway", request.gateway}});
    }

    j = json{
        {"Name", request.name},
        {"Driver", request.driver},
        {"Internal", request.internal},
        {"Attachable", request.attachable},
        {"IPAM", {{"Driver", request.ipam_driver}, {"Config", ipam_config}}},
        {"Options", request.options},
        {"Labels", request.labels}
    };
}

std::string ToDockerCreateJson(const ContainerDefinition& container,
                               const HostConfig& host,
                               int indent) {
    json env = json::array();
    for (const auto& [key, value] : container.env) {
        env.push_back(key + "=" + value);
    }

    json exposed = json::object();
    for (const auto& port : container.exposed_ports) {
        exposed[port] = json::object();
    }

    json body = {
        {"Image", container.image},
        {"Hostname", container.hostname},
        {"User", container.user},
        {"WorkingDir", container.working_dir},
        {"Env", env},
        {"Cmd", container.cmd},
        {"Labels", container.labels},
        {"ExposedPorts", exposed},
        {"HostConfig", host}
    };
    return body.dump(indent);
}

// ============================================================================
// CLI ARGUMENTS
// ============================================================================

std::vector<std::string> BuildRunArguments(const ContainerDefinition& container,
                                           const HostConfig& host) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (!container.name.empty()) {
        args.push_back("--name");
        args.push_back(container.name);
    }

    if (!container.hostname.empty()) {
        args.push_back("--hostname");
        args.push_back(container.hostname);
    }

    // CPU
    const auto& res = host.resources;
    if (res.cpu_shares > 0) {
        args.push_back("--cpu-shares");
        args.push_back(std::to_string(res.cpu_shares));
    }
    if (res.cpu_period > 0) {
        args.push_back("--cpu-period");
        args.push_back(std::to_string(res.cpu_period));
    }
    if (res.cpu_quota > 0) {
        args.push_back("--cpu-quota");
        args.push_back(std::to_string(res.cpu_quota));
    }

    // Memory
    if (res.memory > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(res.memory));
    }
    if (res.memory_swap != 0) {
        args.push_back("--memory-swap");
        args.push_back(std::to_string(res.memory_swap));
    }

    // Process limit
    if (res.pids_limit && *res.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(*res.pids_limit));
    }

    if (res.blkio_weight > 0) {
        args.push_back("--blkio-weight");
        args.push_back(std::to_string(res.blkio_weight));
    }

    for (const auto& rule : res.device_cgroup_rules) {
        args.push_back("--device-cgroup-rule");
        args.push_back(rule);
    }

    if (!host.network_mode.empty()) {
        args.push_back("--network");
        args.push_back(host.network_mode);
    }

    // Published ports
    for (const auto& [port, bindings] : host.port_bindings) {
        const std::string container_port = port.substr(0, port.find('/'));
        const std::string proto = port.find('/') == std::string::npos ? "" : port.substr(port.find('/'));
        for (const auto& binding : bindings) {
            std::string spec;
            if (!binding.host_ip.empty()) {
                spec += binding.host_ip + ":";
            }
            spec += binding.host_port + ":" + container_port + proto;
            args.push_back("-p");
            args.push_back(spec);
        }
    }

    for (const auto& port : container.exposed_ports) {
        args.push_back("--expose");
        args.push_back(port);
    }

    // Security
    if (host.privileged) {
        args.push_back("--privileged");
    }
    for (const auto& cap : host.cap_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& cap : host.cap_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }
    for (const auto& opt : host.security_opt) {
        args.push_back("--security-opt");
        args.push_back(opt);
    }
    if (host.readonly_rootfs) {
        args.push_back("--read-only");
    }

    if (!container.user.empty()) {
        args.push_back("--user");
        args.push_back(container.user);
    }

    for (const auto& bind : host.binds) {
        args.push_back("-v");
        args.push_back(bind);
    }

    for (const auto& [key, value] : container.env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : container.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!container.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(container.working_dir);
    }

    if (host.auto_remove) {
        args.push_back("--rm");
    }

    // Image (must be last before command)
    args.push_back(container.image);
    args.insert(args.end(), container.cmd.begin(), container.cmd.end());

    return args;
}

std::vector<std::string> BuildNetworkCreateArguments(const NetworkCreateRequest& request) {
    std::vector<std::string> args = {"network", "create", "--driver", request.driver};

    if (request.internal) {
        args.push_back("--internal");
    }
    if (request.attachable) {
        args.push_back("--attachable");
    }
    if (!request.ipam_driver.empty()) {
        args.push_back("--ipam-driver");
        args.push_back(request.ipam_driver);
    }
    if (!request.subnet.empty()) {
        args.push_back("--subnet");
        args.push_back(request.subnet);
    }
    if (!request.gateway.empty()) {
        args.push_back("--gateway");
        args.push_back(request.gateway);
    }
    for (const auto& [key, value] : request.options) {
        args.push_back("--opt");
        args.push_back(key + "=" + value);
    }
    for (const auto& [key, value] : request.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    args.push_back(request.name);
    return args;
}

} // namespace runtime
} // namespace cellguard
