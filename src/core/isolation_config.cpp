/**
 * @file isolation_config.cpp
 * @brief Isolation policy loading, validation and the shared policy store
 *
 * Configuration files are plain JSON objects keyed by the snake_case field
 * names of IsolationConfig:
 *
 * ```json
 * {
 *   "enable_network_isolation": true,
 *   "blocked_ports": [22, 80, 443],
 *   "default_cpu_limit": 1.0,
 *   "default_memory_limit": 536870912
 * }
 * ```
 *
 * Every load path ends in ValidateIsolationConfig so that an out-of-range
 * value is rejected at startup rather than at container creation.
 *
 * @date 2025
 */

#include "cellguard/core/isolation_config.hpp"
#include "cellguard/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace cellguard {
namespace core {

IsolationConfig DefaultIsolationConfig() {
    return IsolationConfig{};
}

void ValidateIsolationConfig(const IsolationConfig& config) {
    if (!(config.default_cpu_limit > 0.0)) {
        throw ConfigError("default_cpu_limit must be positive");
    }
    if (config.default_memory_limit < kMinimumMemory) {
        throw ConfigError("default_memory_limit too small (minimum 4MB)");
    }
    if (config.default_disk_limit < 0) {
        throw ConfigError("default_disk_limit cannot be negative");
    }
    for (int port : config.blocked_ports) {
        if (port < 1 || port > 65535) {
            throw ConfigError("blocked port " + std::to_string(port) +
                              " is out of valid range (1-65535)");
        }
    }
}

// ============================================================================
// JSON MAPPING
// ============================================================================

void to_json(json& j, const IsolationConfig& config) {
    j = json{
        {"enable_network_isolation", config.enable_network_isolation},
        {"allowed_networks", config.allowed_networks},
        {"blocked_ports", config.blocked_ports},
        {"default_cpu_limit", config.default_cpu_limit},
        {"default_memory_limit", config.default_memory_limit},
        {"default_disk_limit", config.default_disk_limit},
        {"enable_seccomp", config.enable_seccomp},
        {"enable_apparmor", config.enable_apparmor},
        {"disable_privileged", config.disable_privileged},
        {"read_only_root_fs", config.read_only_root_fs},
        {"no_new_privileges", config.no_new_privileges},
        {"enable_audit_log", config.enable_audit_log},
        {"monitor_system_calls", config.monitor_system_calls}
    };
}

void from_json(const json& j, IsolationConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("isolation config must be a JSON object");
    }

    // value() keeps the current member when a key is absent
    config.enable_network_isolation = j.value("enable_network_isolation", config.enable_network_isolation);
    config.allowed_networks = j.value("allowed_networks", config.allowed_networks);
    config.blocked_ports = j.value("blocked_ports", config.blocked_ports);
    config.default_cpu_limit = j.value("default_cpu_limit", config.default_cpu_limit);
    config.default_memory_limit = j.value("default_memory_limit", config.default_memory_limit);
    config.default_disk_limit = j.value("default_disk_limit", config.default_disk_limit);
    config.enable_seccomp = j.value("enable_seccomp", config.enable_seccomp);
    config.enable_apparmor = j.value("enable_apparmor", config.enable_apparmor);
    config.disable_privileged = j.value("disable_privileged", config.disable_privileged);
    config.read_only_root_fs = j.value("read_only_root_fs", config.read_only_root_fs);
    config.no_new_privileges = j.value("no_new_privileges", config.no_new_privileges);
    config.enable_audit_log = j.value("enable_audit_log", config.enable_audit_log);
    config.monitor_system_calls = j.value("monitor_system_calls", config.monitor_system_calls);
}

IsolationConfig ParseIsolationConfig(const std::string& json_text) {
    IsolationConfig config = DefaultIsolationConfig();

    try {
        json j = json::parse(json_text);
        from_json(j, config);
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("invalid isolation config: ") + e.what());
    }

    ValidateIsolationConfig(config);
    return config;
}

IsolationConfig LoadIsolationConfig(const std::filesystem::path& path) {
    spdlog::info("Loading isolation config: {}", path.string());

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    IsolationConfig config = ParseIsolationConfig(buffer.str());

    spdlog::debug("Network isolation: {}", config.enable_network_isolation);
    spdlog::debug("Blocked ports: {}", config.blocked_ports.size());
    spdlog::debug("Default CPU/memory: {} cores / {} bytes",
                  config.default_cpu_limit, config.default_memory_limit);
    return config;
}

std::string SerializeIsolationConfig(const IsolationConfig& config, int indent) {
    json j = config;
    return j.dump(indent);
}

void SaveIsolationConfig(const IsolationConfig& config, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("failed to write config file: " + path.string());
    }
    file << SerializeIsolationConfig(config) << '\n';
    if (!file) {
        throw ConfigError("failed to write config file: " + path.string());
    }
    spdlog::info("Isolation config saved: {}", path.string());
}

// ============================================================================
// POLICY STORE
// ============================================================================

PolicyStore::PolicyStore()
    : config_(std::make_shared<const IsolationConfig>(DefaultIsolationConfig())) {
}

PolicyStore::PolicyStore(std::shared_ptr<const IsolationConfig> config) {
    if (!config) {
        throw InvalidArgumentError("config cannot be nil");
    }
    config_ = std::move(config);
}

std::shared_ptr<const IsolationConfig> PolicyStore::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void PolicyStore::Replace(std::shared_ptr<const IsolationConfig> config) {
    if (!config) {
        throw InvalidArgumentError("config cannot be nil");
    }
    ValidateIsolationConfig(*config);

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
}

} // namespace core
} // namespace cellguard
