/**
 * @file container_spec.hpp
 * @brief Container-runtime create-time configuration records
 *
 * Mirrors the subset of the Docker Engine API that workspace isolation writes
 * into: the container definition (Config), the host configuration
 * (HostConfig) with its embedded Resources block, port tables and the
 * network-create request. Records can be rendered as Engine API JSON or as
 * `docker run` / `docker network create` arguments.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cellguard {
namespace runtime {

/**
 * @struct Resources
 * @brief Resource constraints in the runtime's vocabulary
 */
struct Resources {
    std::int64_t cpu_shares{0};
    std::int64_t cpu_quota{0};
    std::int64_t cpu_period{0};
    std::int64_t memory{0};
    std::int64_t memory_swap{0};
    std::optional<std::int64_t> pids_limit;        ///< Absent = runtime default
    std::uint16_t blkio_weight{0};                 ///< 10-1000, 0 = unset
    std::vector<std::string> device_cgroup_rules;  ///< e.g. "c 1:3 rmw"
};

/**
 * @struct PortBinding
 * @brief Host side of a published port
 */
struct PortBinding {
    std::string host_ip;     ///< Empty = all interfaces
    std::string host_port;
};

bool operator==(const PortBinding& lhs, const PortBinding& rhs);

using PortSet = std::set<std::string>;                              ///< "8080/tcp"
using PortMap = std::map<std::string, std::vector<PortBinding>>;    ///< "8080/tcp" -> bindings

/**
 * @struct ContainerDefinition
 * @brief Portable container configuration (image, process, labels)
 */
struct ContainerDefinition {
    std::string name;
    std::string image;
    std::string hostname;
    std::string user;
    std::string working_dir;
    std::map<std::string, std::string> env;
    std::vector<std::string> cmd;
    std::map<std::string, std::string> labels;
    PortSet exposed_ports;
};

/**
 * @struct HostConfig
 * @brief Host-dependent configuration (resources, security, networking)
 */
struct HostConfig {
    Resources resources;
    std::string network_mode;
    bool privileged{false};
    bool readonly_rootfs{false};
    std::vector<std::string> cap_add;
    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;
    PortMap port_bindings;
    std::vector<std::string> binds;   ///< "host:container[:ro]"
    bool auto_remove{false};
};

/**
 * @struct NetworkCreateRequest
 * @brief Body of a network-create call
 */
struct NetworkCreateRequest {
    std::string name;
    std::string driver{"bridge"};
    bool internal{false};
    bool attachable{false};
    std::string ipam_driver{"default"};
    std::string subnet;
    std::string gateway;
    std::map<std::string, std::string> options;
    std::map<std::string, std::string> labels;
};

// ============================================================================
// RENDERING
// ============================================================================

void to_json(nlohmann::json& j, const Resources& resources);
void to_json(nlohmann::json& j, const PortBinding& binding);
void to_json(nlohmann::json& j, const HostConfig& host);
void to_json(nlohmann::json& j, const NetworkCreateRequest& request);

/**
 * @brief Render a container-create body (Config fields plus "HostConfig")
 */
std::string ToDockerCreateJson(const ContainerDefinition& container,
                               const HostConfig& host,
                               int indent = 2);

/**
 * @brief Build `docker run` arguments (without the leading "docker")
 *
 * Flags are emitted for every set field; the image and command come last.
 */
std::vector<std::string> BuildRunArguments(const ContainerDefinition& container,
                                           const HostConfig& host);

/**
 * @brief Build `docker network create` arguments (without the leading "docker")
 */
std::vector<std::string> BuildNetworkCreateArguments(const NetworkCreateRequest& request);

} // namespace runtime
} // namespace cellguard
