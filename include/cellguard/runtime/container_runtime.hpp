/**
 * @file container_runtime.hpp
 * @brief Narrow port to the container runtime
 *
 * The isolation components never own a runtime connection. Anything that
 * must touch live containers or networks (provisioning a workspace network,
 * sampling stats, pausing a compromised container) goes through this
 * interface, which callers implement or inject (DockerCliRuntime, test mocks).
 *
 * @date 2025
 */

#pragma once

#include "cellguard/runtime/container_spec.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cellguard {
namespace runtime {

/**
 * @struct ContainerStats
 * @brief Point-in-time container resource statistics
 *
 * Counters are cumulative since container start.
 */
struct ContainerStats {
    // CPU
    double cpu_usage_percent{0.0};

    // Memory
    std::int64_t memory_usage_bytes{0};
    std::int64_t memory_limit_bytes{0};
    double memory_usage_percent{0.0};

    // Network
    std::int64_t network_rx_bytes{0};
    std::int64_t network_tx_bytes{0};

    // Block I/O
    std::int64_t block_read_bytes{0};
    std::int64_t block_write_bytes{0};

    // Processes
    int process_count{0};

    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct ContainerProcess
 * @brief One process running inside a container
 */
struct ContainerProcess {
    int pid{0};
    int ppid{0};
    std::string user;
    int uid{-1};     ///< Real UID (-1 = unknown)
    int euid{-1};    ///< Effective UID (-1 = unknown)
    std::string command;
};

/**
 * @struct ExecResult
 * @brief Outcome of a command run inside a container
 */
struct ExecResult {
    int exit_code{0};
    std::string output;
    bool success{false};
    std::chrono::milliseconds duration{0};
};

/**
 * @class ContainerRuntime
 * @brief Runtime operations used by isolation and monitoring
 *
 * Methods throw core::RuntimeError when the runtime rejects or fails a call.
 * Implementations must be safe to call from several threads.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// @return true if the runtime daemon answers
    virtual bool Ping() = 0;

    /**
     * @brief Create (but do not start) a container
     * @return Container ID
     */
    virtual std::string CreateContainer(const ContainerDefinition& container,
                                        const HostConfig& host) = 0;

    virtual void PauseContainer(const std::string& container_id) = 0;

    virtual ExecResult Exec(const std::string& container_id,
                            const std::vector<std::string>& command) = 0;

    /// @return Stats snapshot, or std::nullopt if the container is not running
    virtual std::optional<ContainerStats> GetContainerStats(const std::string& container_id) = 0;

    virtual std::vector<ContainerProcess> ListProcesses(const std::string& container_id) = 0;

    /**
     * @brief Create a network
     * @return Network ID
     */
    virtual std::string CreateNetwork(const NetworkCreateRequest& request) = 0;

    virtual void RemoveNetwork(const std::string& network_id) = 0;
};

} // namespace runtime
} // namespace cellguard
