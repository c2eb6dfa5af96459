/**
 * @file container_runtime_mock.hpp
 * @brief gmock double of the container runtime port
 */

#pragma once

#include <gmock/gmock.h>

#include "cellguard/runtime/container_runtime.hpp"

namespace cellguard {
namespace runtime {

class ContainerRuntimeMock : public ContainerRuntime {
public:
    MOCK_METHOD(bool, Ping, (), (override));
    MOCK_METHOD(std::string, CreateContainer, (const ContainerDefinition& container, const HostConfig& host),
        (override));
    MOCK_METHOD(void, PauseContainer, (const std::string& container_id), (override));
    MOCK_METHOD(ExecResult, Exec, (const std::string& container_id, const std::vector<std::string>& command),
        (override));
    MOCK_METHOD(std::optional<ContainerStats>, GetContainerStats, (const std::string& container_id), (override));
    MOCK_METHOD(std::vector<ContainerProcess>, ListProcesses, (const std::string& container_id), (override));
    MOCK_METHOD(std::string, CreateNetwork, (const NetworkCreateRequest& request), (override));
    MOCK_METHOD(void, RemoveNetwork, (const std::string& network_id), (override));
};

} // namespace runtime
} // namespace cellguard
