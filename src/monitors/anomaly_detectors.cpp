/**
 * @file anomaly_detectors.cpp
 * @brief Built-in network, process and filesystem detectors
 *
 * **Detection rules**:
 * | Detector | Condition                                  | Result                             |
 * |----------|--------------------------------------------|------------------------------------|
 * | network  | outbound rate > threshold                  | network_anomaly (warning)          |
 * | network  | non-listening sockets > max_connections    | suspicious_network_activity breach |
 * | process  | euid 0 with non-root real uid              | privilege_escalation breach        |
 * | process  | nsenter/unshare/mount/insmod/... running   | process_anomaly (warning)          |
 * | process  | process count >= ratio x PID ceiling       | resource_exhaustion breach         |
 * | file     | open handle on a sensitive path            | unauthorized_file_access breach    |
 *
 * All inspection happens through the runtime port: `docker stats`, `docker
 * top` and short read-only commands executed inside the container.
 *
 * @date 2025
 */

#include "cellguard/monitors/anomaly_detectors.hpp"
#include "cellguard/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace cellguard {
namespace monitors {

namespace {

using utils::StringUtils;

constexpr std::size_t kMaxEvidenceItems = 10;

const std::set<std::string> kSuspiciousTools = {
    "nsenter", "unshare", "mount", "umount", "insmod", "rmmod",
    "modprobe", "chroot", "capsh", "setcap", "debugfs"
};

const std::vector<std::string> kSensitivePatterns = {
    "password", "credential", "secret", "key", "token",
    ".ssh", ".pgp", ".gpg", "wallet", "private"
};

const std::vector<std::string> kSensitivePaths = {
    "/etc/shadow", "/etc/gshadow", "/etc/sudoers",
    "/proc/kcore", "/var/run/docker.sock", "/run/docker.sock"
};

std::string Basename(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool IsSocketRowIndex(const std::string& token) {
    if (token.size() < 2 || token.back() != ':') {
        return false;
    }
    return std::all_of(token.begin(), token.end() - 1,
                       [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

std::string DetectorKindToString(DetectorKind kind) {
    switch (kind) {
        case DetectorKind::NETWORK:    return "network";
        case DetectorKind::PROCESS:    return "process";
        case DetectorKind::FILESYSTEM: return "filesystem";
    }
    return "unknown";
}

// ============================================================================
// NETWORK TRAFFIC DETECTOR
// ============================================================================

NetworkTrafficDetector::NetworkTrafficDetector(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                               NetworkTrafficThresholds thresholds,
                                               ConnectionCounter counter)
    : runtime_(std::move(runtime))
    , thresholds_(thresholds)
    , counter_(std::move(counter)) {

    if (!counter_) {
        auto rt = runtime_;
        counter_ = [rt](const WatchedWorkspace& workspace) -> std::optional<int> {
            if (!rt) {
                return std::nullopt;
            }
            auto result = rt->Exec(workspace.container_id, {"cat", "/proc/net/tcp", "/proc/net/tcp6"});
            if (result.output.empty()) {
                return std::nullopt;
            }
            return CountSocketEntries(result.output);
        };
    }
}

int NetworkTrafficDetector::CountSocketEntries(const std::string& proc_net_output) {
    std::istringstream stream(proc_net_output);
    std::string line;
    int count = 0;

    while (std::getline(stream, line)) {
        auto fields = StringUtils::SplitWhitespace(line);
        // sl local rem st ...; st 0A = LISTEN
        if (fields.size() < 4 || !IsSocketRowIndex(fields[0])) {
            continue;
        }
        if (fields[3] == "0A") {
            continue;
        }
        ++count;
    }
    return count;
}

std::vector<DetectorFinding> NetworkTrafficDetector::Scan(const WatchedWorkspace& workspace) {
    std::vector<DetectorFinding> findings;
    if (!runtime_) {
        return findings;
    }

    auto stats = runtime_->GetContainerStats(workspace.container_id);
    if (!stats) {
        std::lock_guard<std::mutex> lock(mutex_);
        previous_.erase(workspace.container_id);
        return findings;
    }

    std::int64_t tx_rate = 0;
    bool have_rate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = previous_.find(workspace.container_id);
        if (it != previous_.end()) {
            const double seconds = std::chrono::duration<double>(stats->timestamp - it->second.timestamp).count();
            if (seconds > 0.0 && stats->network_tx_bytes >= it->second.tx_bytes) {
                tx_rate = static_cast<std::int64_t>(
                    static_cast<double>(stats->network_tx_bytes - it->second.tx_bytes) / seconds);
                have_rate = true;
            }
        }
        previous_[workspace.container_id] = TxSample{stats->network_tx_bytes, stats->timestamp};
    }

    if (have_rate && tx_rate > thresholds_.tx_bytes_per_sec) {
        DetectorFinding finding;
        finding.alert_type = AlertType::NETWORK_ANOMALY;
        finding.severity = core::Severity::WARNING;
        finding.message = "Outbound traffic " + std::to_string(tx_rate) +
                          " B/s exceeds " + std::to_string(thresholds_.tx_bytes_per_sec) + " B/s";
        finding.data = {
            {"tx_bytes_per_sec", std::to_string(tx_rate)},
            {"threshold", std::to_string(thresholds_.tx_bytes_per_sec)}
        };
        findings.push_back(std::move(finding));
    }

    auto connections = counter_(workspace);
    if (connections && *connections > thresholds_.max_connections) {
        std::map<std::string, std::string> evidence = {
            {"connection_count", std::to_string(*connections)},
            {"max_connections", std::to_string(thresholds_.max_connections)}
        };

        DetectorFinding finding;
        finding.alert_type = AlertType::SECURITY_BREACH;
        finding.severity = core::Severity::ERROR;
        finding.message = std::to_string(*connections) + " open connections";
        finding.data = evidence;
        finding.breach = MakeBreach("suspicious_network_activity",
                                    "Connection count " + std::to_string(*connections) +
                                    " exceeds " + std::to_string(thresholds_.max_connections),
                                    core::Severity::ERROR, evidence);
        findings.push_back(std::move(finding));
    }

    return findings;
}

// ============================================================================
// PROCESS ACTIVITY DETECTOR
// ============================================================================

ProcessActivityDetector::ProcessActivityDetector(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                                 double exhaustion_ratio)
    : runtime_(std::move(runtime))
    , exhaustion_ratio_(exhaustion_ratio) {
}

bool ProcessActivityDetector::IsPrivilegeEscalation(const runtime::ContainerProcess& process) {
    // uid -1 = unknown, never treated as non-root
    return process.euid == 0 && process.uid > 0;
}

bool ProcessActivityDetector::IsSuspiciousCommand(const std::string& command) {
    auto tokens = StringUtils::SplitWhitespace(command);
    if (tokens.empty()) {
        return false;
    }
    return kSuspiciousTools.count(Basename(tokens[0])) > 0;
}

std::vector<DetectorFinding> ProcessActivityDetector::Scan(const WatchedWorkspace& workspace) {
    std::vector<DetectorFinding> findings;
    if (!runtime_) {
        return findings;
    }

    const auto processes = runtime_->ListProcesses(workspace.container_id);

    std::vector<const runtime::ContainerProcess*> escalated;
    std::vector<std::string> suspicious;
    for (const auto& process : processes) {
        if (IsPrivilegeEscalation(process)) {
            escalated.push_back(&process);
        }
        if (IsSuspiciousCommand(process.command)) {
            suspicious.push_back(std::to_string(process.pid) + ":" + process.command);
        }
    }

    if (!escalated.empty()) {
        const auto& first = *escalated.front();
        std::map<std::string, std::string> evidence = {
            {"pid", std::to_string(first.pid)},
            {"uid", std::to_string(first.uid)},
            {"euid", std::to_string(first.euid)},
            {"command", first.command},
            {"process_count", std::to_string(escalated.size())}
        };

        DetectorFinding finding;
        finding.alert_type = AlertType::SECURITY_BREACH;
        finding.severity = core::Severity::CRITICAL;
        finding.message = "Process " + std::to_string(first.pid) + " running with effective root";
        finding.data = evidence;
        finding.breach = MakeBreach("privilege_escalation",
                                    "Effective UID 0 with real UID " + std::to_string(first.uid) +
                                    " (" + first.command + ")",
                                    core::Severity::CRITICAL, evidence);
        findings.push_back(std::move(finding));
    }

    if (!suspicious.empty()) {
        if (suspicious.size() > kMaxEvidenceItems) {
            suspicious.resize(kMaxEvidenceItems);
        }
        DetectorFinding finding;
        finding.alert_type = AlertType::PROCESS_ANOMALY;
        finding.severity = core::Severity::WARNING;
        finding.message = "Namespace or kernel tooling running: " + StringUtils::Join(suspicious, ", ");
        finding.data = {{"processes", StringUtils::Join(suspicious, ";")}};
        findings.push_back(std::move(finding));
    }

    const std::int64_t pids_limit = workspace.limits.pids_limit;
    if (pids_limit > 0) {
        const auto ceiling = static_cast<std::int64_t>(
            std::ceil(static_cast<double>(pids_limit) * exhaustion_ratio_));
        const auto count = static_cast<std::int64_t>(processes.size());
        if (count >= ceiling) {
            std::map<std::string, std::string> evidence = {
                {"process_count", std::to_string(count)},
                {"pids_limit", std::to_string(pids_limit)}
            };

            DetectorFinding finding;
            finding.alert_type = AlertType::SECURITY_BREACH;
            finding.severity = core::Severity::ERROR;
            finding.message = std::to_string(count) + " of " + std::to_string(pids_limit) + " processes in use";
            finding.data = evidence;
            finding.breach = MakeBreach("resource_exhaustion",
                                        "Process count near PID ceiling",
                                        core::Severity::ERROR, evidence);
            findings.push_back(std::move(finding));
        }
    }

    return findings;
}

// ============================================================================
// FILE ACCESS DETECTOR
// ============================================================================

FileAccessDetector::FileAccessDetector(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                       std::vector<std::string> extra_patterns)
    : runtime_(std::move(runtime)) {
    for (const auto& pattern : extra_patterns) {
        extra_patterns_.push_back(StringUtils::ToLower(pattern));
    }
}

bool FileAccessDetector::IsSensitivePath(const std::string& path) const {
    const std::string lower = StringUtils::ToLower(path);

    for (const auto& sensitive : kSensitivePaths) {
        if (lower == sensitive || StringUtils::StartsWith(lower, sensitive + "/")) {
            return true;
        }
    }

    for (const auto& pattern : kSensitivePatterns) {
        if (StringUtils::Contains(lower, pattern)) {
            return true;
        }
    }

    for (const auto& pattern : extra_patterns_) {
        if (StringUtils::Contains(lower, pattern)) {
            return true;
        }
    }

    return false;
}

std::set<std::string> FileAccessDetector::ParseOpenFiles(const std::string& ls_output) {
    std::set<std::string> files;
    std::istringstream stream(ls_output);
    std::string line;

    while (std::getline(stream, line)) {
        auto arrow = line.find(" -> ");
        if (arrow == std::string::npos) {
            continue;
        }
        std::string target = StringUtils::Trim(line.substr(arrow + 4));
        if (!target.empty() && target.front() == '/') {
            files.insert(target);
        }
    }
    return files;
}

std::vector<DetectorFinding> FileAccessDetector::Scan(const WatchedWorkspace& workspace) {
    std::vector<DetectorFinding> findings;
    if (!runtime_) {
        return findings;
    }

    auto result = runtime_->Exec(workspace.container_id,
                                 {"sh", "-c", "ls -l /proc/[0-9]*/fd 2>/dev/null"});
    if (result.output.empty()) {
        return findings;
    }

    std::vector<std::string> hits;
    for (const auto& path : ParseOpenFiles(result.output)) {
        if (IsSensitivePath(path)) {
            hits.push_back(path);
        }
    }

    if (hits.empty()) {
        return findings;
    }

    spdlog::debug("Sensitive files open in {}: {}", workspace.workspace_id, hits.size());
    if (hits.size() > kMaxEvidenceItems) {
        hits.resize(kMaxEvidenceItems);
    }

    std::map<std::string, std::string> evidence = {
        {"paths", StringUtils::Join(hits, ";")}
    };

    DetectorFinding finding;
    finding.alert_type = AlertType::SECURITY_BREACH;
    finding.severity = core::Severity::ERROR;
    finding.message = "Sensitive files opened: " + StringUtils::Join(hits, ", ");
    finding.data = evidence;
    finding.breach = MakeBreach("unauthorized_file_access",
                                "Open handle on " + hits.front(),
                                core::Severity::ERROR, evidence);
    findings.push_back(std::move(finding));
    return findings;
}

} // namespace monitors
} // namespace cellguard
