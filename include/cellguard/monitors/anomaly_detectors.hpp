/**
 * @file anomaly_detectors.hpp
 * @brief Behavioral detectors run by the security monitor each tick
 *
 * Each detector inspects one watched workspace through the container
 * runtime and returns findings: plain anomalies become alerts, findings
 * carrying a breach go through breach remediation.
 *
 * Built-in detectors:
 * - NetworkTrafficDetector: outbound rate and open connection count
 * - ProcessActivityDetector: privilege escalation, namespace/kernel tooling,
 *   process-count exhaustion
 * - FileAccessDetector: open handles on sensitive paths
 *
 * @date 2025
 */

#pragma once

#include "cellguard/core/isolation_types.hpp"
#include "cellguard/monitors/security_types.hpp"
#include "cellguard/runtime/container_runtime.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cellguard {
namespace monitors {

/**
 * @enum DetectorKind
 * @brief Which monitor check runs a detector
 */
enum class DetectorKind {
    NETWORK,
    PROCESS,
    FILESYSTEM
};

std::string DetectorKindToString(DetectorKind kind);

/**
 * @struct DetectorFinding
 * @brief One observation reported by a detector
 */
struct DetectorFinding {
    AlertType alert_type{AlertType::PROCESS_ANOMALY};
    core::Severity severity{core::Severity::WARNING};
    std::string message;
    std::map<std::string, std::string> data;
    std::optional<SecurityBreach> breach;   ///< Set when the finding is a breach
};

/**
 * @class AnomalyDetector
 * @brief Interface of pluggable behavioral checks
 */
class AnomalyDetector {
public:
    virtual ~AnomalyDetector() = default;

    virtual DetectorKind Kind() const = 0;
    virtual std::string Name() const = 0;

    /**
     * @brief Inspect one workspace
     * @throws std::exception on transient failures (logged by the monitor)
     */
    virtual std::vector<DetectorFinding> Scan(const WatchedWorkspace& workspace) = 0;
};

// ============================================================================
// NETWORK
// ============================================================================

/**
 * @struct NetworkTrafficThresholds
 */
struct NetworkTrafficThresholds {
    std::int64_t tx_bytes_per_sec{100 * core::kMiB};  ///< Outbound rate anomaly
    int max_connections{512};                         ///< Above = suspicious activity
};

/**
 * @class NetworkTrafficDetector
 * @brief Flags exfiltration-like outbound rates and connection floods
 */
class NetworkTrafficDetector : public AnomalyDetector {
public:
    using ConnectionCounter = std::function<std::optional<int>(const WatchedWorkspace&)>;

    /**
     * @param runtime    Runtime used for stats and connection counting
     * @param thresholds Detection thresholds
     * @param counter    Connection counter; default reads /proc/net/tcp{,6}
     *                   inside the container
     */
    NetworkTrafficDetector(std::shared_ptr<runtime::ContainerRuntime> runtime,
                           NetworkTrafficThresholds thresholds = {},
                           ConnectionCounter counter = nullptr);

    DetectorKind Kind() const override { return DetectorKind::NETWORK; }
    std::string Name() const override { return "network_traffic"; }
    std::vector<DetectorFinding> Scan(const WatchedWorkspace& workspace) override;

    /// Count socket rows in /proc/net/tcp style output (header rows skipped)
    static int CountSocketEntries(const std::string& proc_net_output);

private:
    struct TxSample {
        std::int64_t tx_bytes{0};
        std::chrono::system_clock::time_point timestamp;
    };

    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    NetworkTrafficThresholds thresholds_;
    ConnectionCounter counter_;

    std::mutex mutex_;
    std::map<std::string, TxSample> previous_;
};

// ============================================================================
// PROCESS
// ============================================================================

/**
 * @class ProcessActivityDetector
 * @brief Flags escalation, namespace/kernel tooling and PID exhaustion
 */
class ProcessActivityDetector : public AnomalyDetector {
public:
    /**
     * @param runtime             Runtime used to list processes
     * @param exhaustion_ratio    Fraction of the PID ceiling treated as exhaustion
     */
    explicit ProcessActivityDetector(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                     double exhaustion_ratio = 0.9);

    DetectorKind Kind() const override { return DetectorKind::PROCESS; }
    std::string Name() const override { return "process_activity"; }
    std::vector<DetectorFinding> Scan(const WatchedWorkspace& workspace) override;

    /// Effective root without real root
    static bool IsPrivilegeEscalation(const runtime::ContainerProcess& process);

    /// Namespace, mount or kernel-module tooling
    static bool IsSuspiciousCommand(const std::string& command);

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    double exhaustion_ratio_;
};

// ============================================================================
// FILESYSTEM
// ============================================================================

/**
 * @class FileAccessDetector
 * @brief Flags open handles on credentials, keys and host-control paths
 */
class FileAccessDetector : public AnomalyDetector {
public:
    explicit FileAccessDetector(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                std::vector<std::string> extra_patterns = {});

    DetectorKind Kind() const override { return DetectorKind::FILESYSTEM; }
    std::string Name() const override { return "file_access"; }
    std::vector<DetectorFinding> Scan(const WatchedWorkspace& workspace) override;

    bool IsSensitivePath(const std::string& path) const;

    /**
     * @brief Extract link targets from `ls -l /proc/<pid>/fd` output
     *
     * Only absolute paths are returned (sockets, pipes and anon inodes are skipped).
     */
    static std::set<std::string> ParseOpenFiles(const std::string& ls_output);

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    std::vector<std::string> extra_patterns_;
};

} // namespace monitors
} // namespace cellguard
