/**
 * @file main.cpp
 * @brief cellguardctl - command-line front end of the isolation subsystem
 *
 * Lets an operator inspect what the isolation layer would do for a
 * workspace (profile, network plan, port publishing, resource presets) and
 * run the security monitor against live containers.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "cellguard/core/errors.hpp"
#include "cellguard/core/isolation_config.hpp"
#include "cellguard/core/isolation_manager.hpp"
#include "cellguard/monitors/security_monitor.hpp"
#include "cellguard/runtime/container_spec.hpp"
#include "cellguard/runtime/docker_cli.hpp"
#include "cellguard/utils/string_utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
using namespace cellguard;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
    g_interrupted = true;
}

} // anonymous namespace

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║   cellguard - workspace isolation & resource governance       ║
║                              v1.0.0                           ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void PrintSection(const std::string& title) {
    std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
    std::cout << "[" << title << "]\n";
}

std::shared_ptr<core::PolicyStore> LoadPolicy(const std::string& config_path) {
    if (config_path.empty()) {
        spdlog::debug("[CONFIG] Using built-in isolation defaults");
        return std::make_shared<core::PolicyStore>();
    }
    spdlog::info("[CONFIG] Loading {}", config_path);
    auto config = std::make_shared<const core::IsolationConfig>(core::LoadIsolationConfig(config_path));
    return std::make_shared<core::PolicyStore>(config);
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunProfile(const std::shared_ptr<core::PolicyStore>& policy,
               const core::Workspace& workspace,
               const std::string& preset,
               const std::string& workload,
               const std::string& image,
               bool show_run_args) {
    core::IsolationManager isolation(policy);
    auto profile = isolation.CreateWorkspaceIsolation(&workspace);

    core::ResourceManager resources(policy);
    if (!preset.empty()) {
        if (!core::ResourcePresetFromString(preset)) {
            throw core::InvalidArgumentError("unknown preset: " + preset);
        }
        profile.resource_limits = resources.GetResourceLimitPreset(preset);
    } else if (!workload.empty()) {
        profile.resource_limits = resources.CalculateOptimalLimits(
            core::WorkloadTypeFromString(workload), {});
    }
    isolation.ValidateIsolation(&profile);

    PrintSection("PROFILE");
    std::cout << json(profile).dump(2) << "\n";

    runtime::ContainerDefinition container;
    container.name = "aicli-" + workspace.id;
    container.image = image;
    container.working_dir = "/workspace";
    runtime::HostConfig host;
    if (!workspace.project_path.empty()) {
        host.binds.push_back(workspace.project_path + ":/workspace");
    }
    isolation.ApplyToContainer(&profile, &container, &host);

    PrintSection("CONTAINER CREATE");
    std::cout << runtime::ToDockerCreateJson(container, host, 2) << "\n";

    if (show_run_args) {
        std::vector<std::string> quoted;
        for (const auto& arg : runtime::BuildRunArguments(container, host)) {
            quoted.push_back(utils::StringUtils::ShellQuote(arg));
        }
        PrintSection("DOCKER RUN");
        std::cout << "docker " << utils::StringUtils::Join(quoted, " ") << "\n";
    }
    return 0;
}

int RunNetwork(const std::shared_ptr<core::PolicyStore>& policy,
               const std::string& workspace_id,
               bool create) {
    std::shared_ptr<runtime::ContainerRuntime> docker;
    if (create) {
        docker = std::make_shared<runtime::DockerCliRuntime>();
        if (!docker->Ping()) {
            spdlog::error("[ERROR] Docker daemon is not reachable");
            return 1;
        }
    }

    core::NetworkManager networks(policy, docker);
    auto request = networks.BuildNetworkCreateRequest(workspace_id);

    PrintSection("NETWORK PLAN");
    std::cout << json(request).dump(2) << "\n";
    std::cout << "bridge: " << core::NetworkManager::BridgeNameFor(workspace_id) << "\n";

    if (create) {
        auto info = networks.CreateWorkspaceNetwork(workspace_id);
        PrintSection("NETWORK CREATED");
        std::cout << json(info).dump(2) << "\n";
    }
    return 0;
}

int RunPorts(const std::shared_ptr<core::PolicyStore>& policy,
             const std::vector<std::string>& mappings,
             const std::string& host_ip,
             bool bind) {
    core::PortMappingRequest request;
    request.host_ip = host_ip;
    request.bind_to_host = bind;

    for (const auto& mapping : mappings) {
        auto parts = utils::StringUtils::Split(mapping, ':');
        if (parts.size() != 2) {
            throw core::InvalidArgumentError("port mapping must be HOST:CONTAINER, got: " + mapping);
        }
        request.port_mappings[parts[0]] = parts[1];
    }

    core::NetworkManager networks(policy);
    networks.ValidatePortMapping(request.port_mappings);
    auto result = networks.CreatePortMapping(&request);

    json out;
    out["ExposedPorts"] = json::object();
    for (const auto& port : result.exposed_ports) {
        out["ExposedPorts"][port] = json::object();
    }
    out["PortBindings"] = result.port_bindings;

    PrintSection("PORTS");
    std::cout << out.dump(2) << "\n";
    return 0;
}

int RunPreset(const std::shared_ptr<core::PolicyStore>& policy, const std::string& name) {
    if (!core::ResourcePresetFromString(name)) {
        spdlog::warn("[WARN] Unknown preset '{}', showing defaults", name);
    }
    core::ResourceManager resources(policy);
    auto limits = resources.GetResourceLimitPreset(name);

    PrintSection("PRESET " + name);
    std::cout << json(limits).dump(2) << "\n";
    return 0;
}

int RunMonitor(const std::shared_ptr<core::PolicyStore>& policy,
               const std::vector<std::string>& watches,
               int interval_seconds,
               int duration_seconds) {
    std::vector<std::pair<std::string, std::string>> targets;
    for (const auto& watch : watches) {
        auto pos = watch.find('=');
        if (pos == std::string::npos || pos == 0 || pos + 1 == watch.size()) {
            throw core::InvalidArgumentError("watch must be WORKSPACE=CONTAINER, got: " + watch);
        }
        targets.emplace_back(watch.substr(0, pos), watch.substr(pos + 1));
    }

    auto docker = std::make_shared<runtime::DockerCliRuntime>();
    if (!docker->Ping()) {
        spdlog::error("[ERROR] Docker daemon is not reachable");
        return 1;
    }

    monitors::SecurityMonitorOptions options;
    options.check_interval = std::chrono::seconds(interval_seconds);

    monitors::SecurityMonitor monitor(policy, docker, options);
    core::ResourceManager resources(policy);
    for (const auto& target : targets) {
        monitor.TrackWorkspace(target.first, target.second, resources.CreateResourceLimits());
        spdlog::info("[MONITOR] Watching {} ({})", target.first, target.second);
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto alerts = monitor.StartMonitoring();
    spdlog::info("[MONITOR] {} workspace(s) tracked, Ctrl-C to stop", targets.size());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration_seconds);
    while (!g_interrupted) {
        if (duration_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        if (auto alert = alerts->ReceiveFor(std::chrono::milliseconds(500))) {
            std::cout << json(*alert).dump() << std::endl;
        } else if (alerts->IsClosed()) {
            break;
        }
    }

    monitor.StopMonitoring();
    while (auto alert = alerts->TryReceive()) {
        std::cout << json(*alert).dump() << std::endl;
    }

    PrintSection("DASHBOARD");
    std::cout << json(monitor.GetSecurityDashboard()).dump(2) << "\n";
    return 0;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"cellguard workspace isolation control"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;
    bool quiet = false;

    app.add_option("-c,--config", config_path, "Isolation config JSON file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("-q,--quiet", quiet, "Suppress the banner");

    // profile
    auto* profile_cmd = app.add_subcommand("profile", "Derive the isolation profile of a workspace");
    core::Workspace workspace;
    std::string preset;
    std::string workload;
    std::string image = "ubuntu:22.04";
    bool show_run_args = false;
    profile_cmd->add_option("workspace", workspace.id, "Workspace ID")->required();
    profile_cmd->add_option("--name", workspace.name, "Workspace display name");
    profile_cmd->add_option("--owner", workspace.owner_id, "Owner ID");
    profile_cmd->add_option("--path", workspace.project_path, "Project directory mounted at /workspace");
    auto* preset_opt = profile_cmd->add_option("--preset", preset, "Resource preset: minimal, small, medium, large");
    profile_cmd->add_option("--workload", workload, "Workload baseline: development, build, test, production")
        ->excludes(preset_opt);
    profile_cmd->add_option("--image", image, "Image of the rendered container create request")
        ->default_val("ubuntu:22.04");
    profile_cmd->add_flag("--run-args", show_run_args, "Print the equivalent docker run command");

    // network
    auto* network_cmd = app.add_subcommand("network", "Show (or create) the network of a workspace");
    std::string network_workspace;
    bool create_network = false;
    network_cmd->add_option("workspace", network_workspace, "Workspace ID")->required();
    network_cmd->add_flag("--create", create_network, "Create the network through docker");

    // ports
    auto* ports_cmd = app.add_subcommand("ports", "Validate and translate port mappings");
    std::vector<std::string> mappings;
    std::string host_ip;
    bool bind_to_host = false;
    ports_cmd->add_option("mappings", mappings, "HOST:CONTAINER[/proto] pairs")->required();
    ports_cmd->add_option("--host-ip", host_ip, "Host address to bind");
    ports_cmd->add_flag("--bind", bind_to_host, "Publish on the host");

    // preset
    auto* preset_cmd = app.add_subcommand("preset", "Show a resource limit preset");
    std::string preset_name;
    preset_cmd->add_option("name", preset_name, "minimal, small, medium or large")->required();

    // monitor
    auto* monitor_cmd = app.add_subcommand("monitor", "Run the security monitor against running containers");
    std::vector<std::string> watches;
    int interval_seconds = 30;
    int duration_seconds = 0;
    monitor_cmd->add_option("--watch", watches, "WORKSPACE=CONTAINER pair, repeatable")->required();
    monitor_cmd->add_option("--interval", interval_seconds, "Seconds between checks")
        ->default_val(30)
        ->check(CLI::PositiveNumber);
    monitor_cmd->add_option("--duration", duration_seconds, "Stop after N seconds (0 = until Ctrl-C)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    // config
    auto* config_cmd = app.add_subcommand("config", "Print the effective isolation config");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (!quiet) {
        PrintBanner();
    }

    try {
        auto policy = LoadPolicy(config_path);

        if (*profile_cmd) {
            return RunProfile(policy, workspace, preset, workload, image, show_run_args);
        }
        if (*network_cmd) {
            return RunNetwork(policy, network_workspace, create_network);
        }
        if (*ports_cmd) {
            return RunPorts(policy, mappings, host_ip, bind_to_host);
        }
        if (*preset_cmd) {
            return RunPreset(policy, preset_name);
        }
        if (*monitor_cmd) {
            return RunMonitor(policy, watches, interval_seconds, duration_seconds);
        }
        if (*config_cmd) {
            std::cout << core::SerializeIsolationConfig(*policy->Get()) << "\n";
            return 0;
        }
        return 0;

    } catch (const core::IsolationError& e) {
        spdlog::error("[{}] {}", core::ErrorCategoryToString(e.Category()), e.what());
        return e.Category() == core::ErrorCategory::POLICY_VIOLATION ? 3 : 2;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
