/**
 * @file docker_cli.cpp
 * @brief docker CLI adapter for the container runtime port
 *
 * Every call shells out to `docker <args...> 2>&1` via popen. Arguments are
 * single-quoted so workspace-controlled strings (names, labels, commands)
 * cannot inject shell syntax.
 *
 * **Parsed formats**:
 * - `docker stats --no-stream --format '{{json .}}'`:
 *   `{"CPUPerc":"1.23%","MemUsage":"12MiB / 512MiB","MemPerc":"2.34%",
 *     "NetIO":"1.2kB / 648B","BlockIO":"0B / 8.19kB","PIDs":"3"}`
 * - `docker top <id> -eo pid,ppid,user,ruid,euid,args`:
 *   `PID PPID USER RUID EUID COMMAND` header followed by one row per process
 *
 * @date 2025
 */

#include "cellguard/runtime/docker_cli.hpp"
#include "cellguard/core/errors.hpp"
#include "cellguard/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

using json = nlohmann::json;

namespace cellguard {
namespace runtime {

namespace {

using utils::StringUtils;

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CommandResult ExecuteCommand(const std::string& command) {
    CommandResult result;

    std::array<char, 256> buffer;
    // Redirect stderr to stdout (2>&1)
    std::string cmd = command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    result.success = (result.exit_code == 0);
    return result;
}

std::string FirstLine(const std::string& text) {
    return StringUtils::Trim(text.substr(0, text.find('\n')));
}

double ParsePercent(const std::string& text) {
    std::string value = text;
    value.erase(std::remove(value.begin(), value.end(), '%'), value.end());
    value = StringUtils::Trim(value);
    if (value.empty() || value == "--") {
        return 0.0;
    }
    std::istringstream iss(value);
    double parsed = 0.0;
    if (!(iss >> parsed)) {
        return 0.0;
    }
    return parsed;
}

// Splits "a / b" into its two sizes
std::pair<std::int64_t, std::int64_t> ParseSizePair(const std::string& text) {
    auto slash = text.find('/');
    if (slash == std::string::npos) {
        return {DockerCliRuntime::ParseSize(text).value_or(0), 0};
    }
    return {
        DockerCliRuntime::ParseSize(text.substr(0, slash)).value_or(0),
        DockerCliRuntime::ParseSize(text.substr(slash + 1)).value_or(0)
    };
}

std::optional<int> ParseInt(const std::string& text) {
    std::istringstream iss(text);
    int value = 0;
    if (!(iss >> value) || !iss.eof()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerCliRuntime::DockerCliRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    spdlog::info("Docker CLI runtime initialized");
    spdlog::debug("Docker binary: {}", docker_binary_);
}

DockerCliRuntime::~DockerCliRuntime() {
    spdlog::debug("Docker CLI runtime destroyed");
}

// ============================================================================
// RUNTIME OPERATIONS
// ============================================================================

bool DockerCliRuntime::Ping() {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"});
    if (!result.success) {
        spdlog::warn("Docker daemon not reachable: {}", FirstLine(result.output));
        return false;
    }
    spdlog::debug("Docker server version: {}", FirstLine(result.output));
    return true;
}

std::string DockerCliRuntime::CreateContainer(const ContainerDefinition& container,
                                              const HostConfig& host) {
    auto args = BuildRunArguments(container, host);
    // "run -d" -> "create"
    args.erase(args.begin(), args.begin() + 2);
    args.insert(args.begin(), "create");

    spdlog::info("Creating container from image: {}", container.image);
    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        throw core::RuntimeError("failed to create container: " + FirstLine(result.output));
    }

    std::string container_id = FirstLine(result.output);
    spdlog::info("Container created: {}", container_id);
    return container_id;
}

void DockerCliRuntime::PauseContainer(const std::string& container_id) {
    spdlog::info("Pausing container: {}", container_id);

    auto result = ExecuteDockerCommand({"pause", container_id});
    if (!result.success) {
        throw core::RuntimeError("failed to pause container " + container_id + ": " +
                                 FirstLine(result.output));
    }
}

ExecResult DockerCliRuntime::Exec(const std::string& container_id,
                                  const std::vector<std::string>& command) {
    std::vector<std::string> args = {"exec", container_id};
    args.insert(args.end(), command.begin(), command.end());

    auto start_time = std::chrono::steady_clock::now();
    auto result = ExecuteDockerCommand(args);
    auto end_time = std::chrono::steady_clock::now();

    ExecResult exec_result;
    exec_result.exit_code = result.exit_code;
    exec_result.output = result.output;
    exec_result.success = result.success;
    exec_result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);
    return exec_result;
}

std::optional<ContainerStats> DockerCliRuntime::GetContainerStats(const std::string& container_id) {
    auto result = ExecuteDockerCommand({
        "stats",
        "--no-stream",
        "--format", "{{json .}}",
        container_id
    });

    if (!result.success) {
        if (StringUtils::Contains(result.output, "No such container") ||
            StringUtils::Contains(result.output, "is not running")) {
            return std::nullopt;
        }
        throw core::RuntimeError("failed to read stats for " + container_id + ": " +
                                 FirstLine(result.output));
    }

    const std::string line = FirstLine(result.output);
    if (line.empty()) {
        return std::nullopt;
    }
    return ParseStatsLine(line);
}

std::vector<ContainerProcess> DockerCliRuntime::ListProcesses(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"top", container_id, "-eo", "pid,ppid,user,ruid,euid,args"});
    if (!result.success) {
        throw core::RuntimeError("failed to list processes for " + container_id + ": " +
                                 FirstLine(result.output));
    }
    return ParseProcessTable(result.output);
}

std::string DockerCliRuntime::CreateNetwork(const NetworkCreateRequest& request) {
    spdlog::info("Creating network: {} ({})", request.name, request.subnet);

    auto result = ExecuteDockerCommand(BuildNetworkCreateArguments(request));
    if (!result.success) {
        throw core::RuntimeError("failed to create network " + request.name + ": " +
                                 FirstLine(result.output));
    }
    return FirstLine(result.output);
}

void DockerCliRuntime::RemoveNetwork(const std::string& network_id) {
    spdlog::info("Removing network: {}", network_id);

    auto result = ExecuteDockerCommand({"network", "rm", network_id});
    if (!result.success) {
        throw core::RuntimeError("failed to remove network " + network_id + ": " +
                                 FirstLine(result.output));
    }
}

// ============================================================================
// OUTPUT PARSING
// ============================================================================

ContainerStats DockerCliRuntime::ParseStatsLine(const std::string& json_line) {
    ContainerStats stats;
    stats.timestamp = std::chrono::system_clock::now();

    try {
        json j = json::parse(json_line);

        stats.cpu_usage_percent = ParsePercent(j.value("CPUPerc", ""));
        stats.memory_usage_percent = ParsePercent(j.value("MemPerc", ""));

        // Format: "123MiB / 2GiB"
        auto [mem_usage, mem_limit] = ParseSizePair(j.value("MemUsage", ""));
        stats.memory_usage_bytes = mem_usage;
        stats.memory_limit_bytes = mem_limit;

        auto [rx, tx] = ParseSizePair(j.value("NetIO", ""));
        stats.network_rx_bytes = rx;
        stats.network_tx_bytes = tx;

        auto [read, write] = ParseSizePair(j.value("BlockIO", ""));
        stats.block_read_bytes = read;
        stats.block_write_bytes = write;

        stats.process_count = ParseInt(StringUtils::Trim(j.value("PIDs", "0"))).value_or(0);
    }
    catch (const json::exception& e) {
        throw core::RuntimeError(std::string("malformed docker stats output: ") + e.what());
    }

    return stats;
}

std::optional<std::int64_t> DockerCliRuntime::ParseSize(const std::string& text) {
    const std::string value = StringUtils::Trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    while (pos < value.size() &&
           (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) {
        ++pos;
    }
    if (pos == 0) {
        return std::nullopt;
    }

    double number = 0.0;
    std::istringstream iss(value.substr(0, pos));
    if (!(iss >> number)) {
        return std::nullopt;
    }

    const std::string unit = StringUtils::Trim(value.substr(pos));
    double multiplier = 0.0;
    if (unit.empty() || unit == "B") multiplier = 1.0;
    else if (unit == "kB" || unit == "KB") multiplier = 1e3;
    else if (unit == "MB") multiplier = 1e6;
    else if (unit == "GB") multiplier = 1e9;
    else if (unit == "TB") multiplier = 1e12;
    else if (unit == "KiB") multiplier = 1024.0;
    else if (unit == "MiB") multiplier = 1024.0 * 1024.0;
    else if (unit == "GiB") multiplier = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "TiB") multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else return std::nullopt;

    return static_cast<std::int64_t>(std::llround(number * multiplier));
}

std::vector<ContainerProcess> DockerCliRuntime::ParseProcessTable(const std::string& output) {
    std::vector<ContainerProcess> processes;
    std::istringstream stream(output);
    std::string line;
    bool header = true;

    while (std::getline(stream, line)) {
        auto fields = StringUtils::SplitWhitespace(line);
        if (fields.empty()) {
            continue;
        }
        if (header) {
            header = false;
            if (fields[0] == "PID") {
                continue;
            }
        }
        if (fields.size() < 6) {
            continue;
        }

        auto pid = ParseInt(fields[0]);
        auto ppid = ParseInt(fields[1]);
        if (!pid || !ppid) {
            continue;
        }

        ContainerProcess process;
        process.pid = *pid;
        process.ppid = *ppid;
        process.user = fields[2];
        process.uid = ParseInt(fields[3]).value_or(-1);
        process.euid = ParseInt(fields[4]).value_or(-1);
        process.command = StringUtils::Join(
            std::vector<std::string>(fields.begin() + 5, fields.end()), " ");
        processes.push_back(std::move(process));
    }

    return processes;
}

// ============================================================================
// HELPERS
// ============================================================================

CommandResult DockerCliRuntime::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::ostringstream cmd;
    cmd << StringUtils::ShellQuote(docker_binary_);

    for (const auto& arg : args) {
        cmd << " " << StringUtils::ShellQuote(arg);
    }

    spdlog::debug("Executing: {}", cmd.str());
    return ExecuteCommand(cmd.str());
}

} // namespace runtime
} // namespace cellguard
