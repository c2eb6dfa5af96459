/**
 * @file isolation_config.hpp
 * @brief Process-wide isolation policy and its shared holder
 *
 * IsolationConfig is loaded once at startup (defaults or an operator JSON
 * file) and read by every component. Runtime changes replace the whole value
 * through PolicyStore so readers always see a consistent snapshot.
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cellguard {
namespace core {

/**
 * @struct IsolationConfig
 * @brief Isolation and resource policy for all workspaces
 */
struct IsolationConfig {
    // Network isolation
    bool enable_network_isolation{true};                          ///< Dedicated network per workspace
    std::vector<std::string> allowed_networks{"aicli-network"};  ///< Networks workspaces may join
    std::vector<int> blocked_ports{22, 80, 443, 3000, 8000, 8080}; ///< Host ports never published

    // Resource defaults
    double default_cpu_limit{1.0};                 ///< Cores
    std::int64_t default_memory_limit{512 * kMiB}; ///< Bytes
    std::int64_t default_disk_limit{1 * kGiB};     ///< Bytes

    // Kernel hardening
    bool enable_seccomp{true};
    bool enable_apparmor{true};
    bool disable_privileged{true};
    bool read_only_root_fs{false};
    bool no_new_privileges{true};

    // Auditing
    bool enable_audit_log{true};
    bool monitor_system_calls{false};
};

IsolationConfig DefaultIsolationConfig();

/**
 * @brief Check a configuration for out-of-range values
 * @throws ConfigError describing the first problem found
 */
void ValidateIsolationConfig(const IsolationConfig& config);

/**
 * @brief Parse a JSON document into a configuration
 *
 * Missing keys keep their defaults; unknown keys are ignored.
 *
 * @throws ConfigError on malformed JSON, wrong value types or invalid values
 */
IsolationConfig ParseIsolationConfig(const std::string& json_text);

/**
 * @brief Load and validate a configuration file
 * @throws ConfigError if the file is missing, unreadable or invalid
 */
IsolationConfig LoadIsolationConfig(const std::filesystem::path& path);

std::string SerializeIsolationConfig(const IsolationConfig& config, int indent = 2);

/**
 * @brief Write a configuration as JSON
 * @throws ConfigError if the file cannot be written
 */
void SaveIsolationConfig(const IsolationConfig& config, const std::filesystem::path& path);

void to_json(nlohmann::json& j, const IsolationConfig& config);
void from_json(const nlohmann::json& j, IsolationConfig& config);

/**
 * @class PolicyStore
 * @brief Shared, atomically swappable holder of the active IsolationConfig
 *
 * Readers take a snapshot with Get() and use it for one whole operation.
 * Replace() swaps the entire struct; partial updates are not possible.
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class PolicyStore {
public:
    /// Store holding DefaultIsolationConfig()
    PolicyStore();

    /**
     * @throws InvalidArgumentError if @p config is null
     */
    explicit PolicyStore(std::shared_ptr<const IsolationConfig> config);

    PolicyStore(const PolicyStore&) = delete;
    PolicyStore& operator=(const PolicyStore&) = delete;

    std::shared_ptr<const IsolationConfig> Get() const;

    /**
     * @brief Swap in a new configuration
     * @throws InvalidArgumentError if @p config is null
     * @throws ConfigError if @p config fails validation
     */
    void Replace(std::shared_ptr<const IsolationConfig> config);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const IsolationConfig> config_;
};

} // namespace core
} // namespace cellguard
