/**
 * @file docker_cli.hpp
 * @brief ContainerRuntime implementation driving the docker CLI
 *
 * Executes `docker` subcommands through the shell and parses their output.
 * Intended for operator tooling and single-host deployments. Services with
 * an Engine API client should implement ContainerRuntime directly.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/runtime/container_runtime.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cellguard {
namespace runtime {

/**
 * @struct CommandResult
 * @brief Exit status and combined stdout/stderr of a shell command
 */
struct CommandResult {
    int exit_code{0};
    std::string output;
    bool success{false};
};

/**
 * @class DockerCliRuntime
 * @brief Runtime port backed by the local docker binary
 *
 * **Usage Example**:
 * @code
 * auto runtime = std::make_shared<DockerCliRuntime>();
 * if (runtime->Ping()) {
 *     auto stats = runtime->GetContainerStats("workspace-ws-1");
 * }
 * @endcode
 */
class DockerCliRuntime : public ContainerRuntime {
public:
    /**
     * @param docker_binary Binary name or path of the docker CLI
     */
    explicit DockerCliRuntime(std::string docker_binary = "docker");
    ~DockerCliRuntime() override;

    DockerCliRuntime(const DockerCliRuntime&) = delete;
    DockerCliRuntime& operator=(const DockerCliRuntime&) = delete;

    bool Ping() override;
    std::string CreateContainer(const ContainerDefinition& container,
                                const HostConfig& host) override;
    void PauseContainer(const std::string& container_id) override;
    ExecResult Exec(const std::string& container_id,
                    const std::vector<std::string>& command) override;
    std::optional<ContainerStats> GetContainerStats(const std::string& container_id) override;
    std::vector<ContainerProcess> ListProcesses(const std::string& container_id) override;
    std::string CreateNetwork(const NetworkCreateRequest& request) override;
    void RemoveNetwork(const std::string& network_id) override;

    // ========================================================================
    // Output parsers (public for reuse and testing)
    // ========================================================================

    /**
     * @brief Parse one line of `docker stats --format '{{json .}}'`
     * @throws core::RuntimeError on malformed JSON
     */
    static ContainerStats ParseStatsLine(const std::string& json_line);

    /**
     * @brief Parse a human-readable size such as "12.5MiB", "3kB" or "0B"
     *
     * Binary suffixes (KiB, MiB, GiB, TiB) scale by 1024, decimal suffixes
     * (kB, MB, GB, TB) by 1000.
     *
     * @return Bytes, or std::nullopt when malformed
     */
    static std::optional<std::int64_t> ParseSize(const std::string& text);

    /**
     * @brief Parse `docker top <id> -eo pid,ppid,user,ruid,euid,args`
     *
     * The header row is skipped; malformed rows are ignored.
     */
    static std::vector<ContainerProcess> ParseProcessTable(const std::string& output);

private:
    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;

    std::string docker_binary_;
};

} // namespace runtime
} // namespace cellguard
