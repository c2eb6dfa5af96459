#include <gtest/gtest.h>

#include "cellguard/core/errors.hpp"
#include "cellguard/core/resource_manager.hpp"

namespace cellguard {
namespace core {

using namespace testing;

/*******************************************************************************
 * Suite
 ******************************************************************************/

class ResourceManagerTest : public Test {
protected:
    void SetUp() override { mManager = std::make_unique<ResourceManager>(); }

    static WorkspaceMetrics MakeMetrics(double cpu_percent, std::int64_t memory_usage, std::int64_t memory_limit,
                                        std::int64_t network_io, std::int64_t disk_io)
    {
        WorkspaceMetrics metrics;
        metrics.workspace_id = "ws-1";
        metrics.cpu_percent = cpu_percent;
        metrics.memory_usage = memory_usage;
        metrics.memory_limit = memory_limit;
        metrics.network_rx = network_io / 2;
        metrics.network_tx = network_io - network_io / 2;
        metrics.disk_read = disk_io / 2;
        metrics.disk_write = disk_io - disk_io / 2;
        return metrics;
    }

    std::unique_ptr<ResourceManager> mManager;
};

/*******************************************************************************
 * Tests
 ******************************************************************************/

TEST_F(ResourceManagerTest, DefaultLimitsFollowPolicy)
{
    auto limits = mManager->CreateResourceLimits();

    EXPECT_EQ(limits.cpu_shares, kDefaultCpuShares);
    EXPECT_EQ(limits.cpu_period, kDefaultCpuPeriod);
    EXPECT_EQ(limits.cpu_quota, 100000);
    EXPECT_EQ(limits.memory, 512 * kMiB);
    EXPECT_EQ(limits.memory_swap, limits.memory);
    EXPECT_EQ(limits.pids_limit, 100);
    EXPECT_EQ(limits.io_max_bandwidth, "100m");
    EXPECT_EQ(limits.io_max_iops, 1000);
    EXPECT_DOUBLE_EQ(limits.CpuCores(), 1.0);

    EXPECT_NO_THROW(mManager->ValidateResourceLimits(&limits));
}

TEST_F(ResourceManagerTest, DefaultLimitsTrackPolicyReplacement)
{
    auto policy = std::make_shared<PolicyStore>();
    ResourceManager manager(policy);

    auto config = std::make_shared<IsolationConfig>();
    config->default_cpu_limit = 2.5;
    config->default_memory_limit = 1 * kGiB;
    policy->Replace(config);

    auto limits = manager.CreateResourceLimits();

    EXPECT_EQ(limits.cpu_quota, 250000);
    EXPECT_EQ(limits.memory, 1 * kGiB);
}

TEST_F(ResourceManagerTest, CustomLimitsOverrideOnlyPositiveFields)
{
    ResourceLimitRequest request;
    request.cpu_cores = 2.0;
    request.memory_bytes = 256 * kMiB;

    auto limits = mManager->CreateCustomResourceLimits(request);

    EXPECT_EQ(limits.cpu_quota, 200000);
    EXPECT_EQ(limits.memory, 256 * kMiB);
    EXPECT_EQ(limits.memory_swap, 256 * kMiB);
    EXPECT_EQ(limits.pids_limit, 100);
    EXPECT_EQ(limits.io_max_iops, 1000);
}

TEST_F(ResourceManagerTest, ValidateRejectsNil)
{
    try {
        mManager->ValidateResourceLimits(nullptr);
        FAIL() << "expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_STREQ(e.what(), "resource limits cannot be nil");
    }
}

TEST_F(ResourceManagerTest, ValidateRejectsOutOfRangeFields)
{
    const auto base = mManager->CreateResourceLimits();

    auto limits = base;
    limits.memory = -1;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), InvalidArgumentError);

    limits = base;
    limits.cpu_period = 0;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), InvalidArgumentError);

    limits = base;
    limits.cpu_shares = -5;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), InvalidArgumentError);

    limits = base;
    limits.pids_limit = -1;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), InvalidArgumentError);

    limits = base;
    limits.cpu_quota = -1;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), InvalidArgumentError);
}

TEST_F(ResourceManagerTest, ValidateMemoryPolicy)
{
    auto limits = mManager->CreateResourceLimits();

    limits.memory = 1 * kMiB;
    limits.memory_swap = 1 * kMiB;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), PolicyViolationError);

    limits.memory = kMinimumMemory;
    limits.memory_swap = kMinimumMemory;
    EXPECT_NO_THROW(mManager->ValidateResourceLimits(&limits));

    limits.memory_swap = kUnlimitedSwap;
    EXPECT_NO_THROW(mManager->ValidateResourceLimits(&limits));

    limits.memory = 64 * kMiB;
    limits.memory_swap = 32 * kMiB;
    EXPECT_THROW(mManager->ValidateResourceLimits(&limits), PolicyViolationError);
}

TEST_F(ResourceManagerTest, UsageAboveEveryThresholdYieldsFourViolations)
{
    auto metrics = MakeMetrics(95.0, 900 * kMiB, 1000 * kMiB, 110 * kMiB, 55 * kMiB);

    auto violations = mManager->ValidateResourceUsage(metrics);

    ASSERT_EQ(violations.size(), 4u);
    EXPECT_EQ(violations[0].type, "cpu_high_usage");
    EXPECT_EQ(violations[0].severity, Severity::WARNING);
    EXPECT_EQ(violations[1].type, "memory_high_usage");
    EXPECT_NEAR(violations[1].current_value, 90.0, 0.001);
    EXPECT_EQ(violations[2].type, "network_high_io");
    EXPECT_EQ(violations[2].severity, Severity::INFO);
    EXPECT_EQ(violations[3].type, "disk_high_io");
    EXPECT_EQ(violations[3].severity, Severity::INFO);
}

TEST_F(ResourceManagerTest, UsageAtHalfThresholdsYieldsNothing)
{
    auto metrics = MakeMetrics(45.0, 425 * kMiB, 1000 * kMiB, 50 * kMiB, 25 * kMiB);

    EXPECT_TRUE(mManager->ValidateResourceUsage(metrics).empty());
}

TEST_F(ResourceManagerTest, MemoryCheckSkippedWithoutLimit)
{
    auto metrics = MakeMetrics(10.0, 900 * kMiB, 0, 0, 0);

    EXPECT_TRUE(mManager->ValidateResourceUsage(metrics).empty());
}

TEST_F(ResourceManagerTest, Presets)
{
    auto small = mManager->GetResourceLimitPreset("small");
    EXPECT_EQ(small.cpu_quota, 100000);
    EXPECT_EQ(small.memory, 512 * kMiB);
    EXPECT_EQ(small.pids_limit, 100);

    auto large = mManager->GetResourceLimitPreset("large");
    EXPECT_EQ(large.cpu_quota, 400000);
    EXPECT_EQ(large.memory, 2048 * kMiB);
    EXPECT_EQ(large.pids_limit, 500);

    auto minimal = ResourceManager::GetResourceLimitPreset(ResourcePreset::MINIMAL);
    EXPECT_EQ(minimal.cpu_quota, 50000);
    EXPECT_EQ(minimal.memory, 256 * kMiB);

    EXPECT_EQ(mManager->GetResourceLimitPreset("enormous"), mManager->CreateResourceLimits());
}

TEST_F(ResourceManagerTest, OptimalLimitsWithoutHistoryIsBaseline)
{
    EXPECT_EQ(mManager->CalculateOptimalLimits(WorkloadType::BUILD, {}),
              ResourceManager::WorkloadBaseline(WorkloadType::BUILD));
}

TEST_F(ResourceManagerTest, OptimalLimitsGrowWithObservedUsage)
{
    std::vector<WorkspaceMetrics> history = {
        MakeMetrics(300.0, 2 * kGiB, 4 * kGiB, 0, 0),
        MakeMetrics(300.0, 2 * kGiB, 4 * kGiB, 0, 0),
    };

    auto limits = mManager->CalculateOptimalLimits(WorkloadType::TEST, history);

    // 3 cores observed, 1.5x headroom
    EXPECT_EQ(limits.cpu_quota, 450000);
    EXPECT_GT(limits.memory, 2 * kGiB);
    EXPECT_EQ(limits.memory_swap, limits.memory);
}

TEST_F(ResourceManagerTest, RuntimeResources)
{
    auto limits = mManager->CreateResourceLimits();

    auto resources = mManager->ToRuntimeResources(limits);

    EXPECT_EQ(resources.cpu_quota, limits.cpu_quota);
    EXPECT_EQ(resources.memory, limits.memory);
    EXPECT_EQ(resources.blkio_weight, kDefaultBlkioWeight);
    ASSERT_TRUE(resources.pids_limit.has_value());
    EXPECT_EQ(*resources.pids_limit, 100);
    EXPECT_EQ(resources.device_cgroup_rules.size(), 4u);

    limits.pids_limit = 0;
    EXPECT_FALSE(mManager->ToRuntimeResources(limits).pids_limit.has_value());
}

TEST_F(ResourceManagerTest, WorkloadNames)
{
    EXPECT_EQ(WorkloadTypeFromString("Build"), WorkloadType::BUILD);
    EXPECT_EQ(WorkloadTypeToString(WorkloadType::PRODUCTION), "production");
    EXPECT_THROW(WorkloadTypeFromString("batch"), InvalidArgumentError);
}

} // namespace core
} // namespace cellguard
