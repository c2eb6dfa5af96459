/**
 * @file metrics_sampler_mock.hpp
 * @brief gmock double of the usage sampler
 */

#pragma once

#include <gmock/gmock.h>

#include "cellguard/monitors/metrics_sampler.hpp"

namespace cellguard {
namespace monitors {

class MetricsSamplerMock : public MetricsSampler {
public:
    MOCK_METHOD(std::optional<core::WorkspaceMetrics>, Sample, (const WatchedWorkspace& workspace), (override));
};

} // namespace monitors
} // namespace cellguard
