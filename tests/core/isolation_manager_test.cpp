#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cellguard/core/errors.hpp"
#include "cellguard/core/isolation_manager.hpp"

#include <algorithm>

namespace cellguard {
namespace core {

using namespace testing;

/*******************************************************************************
 * Suite
 ******************************************************************************/

class IsolationManagerTest : public Test {
protected:
    void SetUp() override
    {
        mPolicy = std::make_shared<PolicyStore>();
        mManager = std::make_unique<IsolationManager>(mPolicy);
        mWorkspace.id = "ws-1";
        mWorkspace.name = "demo";
        mWorkspace.owner_id = "user-1";
    }

    std::shared_ptr<PolicyStore> mPolicy;
    std::unique_ptr<IsolationManager> mManager;
    Workspace mWorkspace;
};

/*******************************************************************************
 * Tests
 ******************************************************************************/

TEST_F(IsolationManagerTest, ProfileFromDefaults)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);

    EXPECT_EQ(profile.workspace_id, "ws-1");
    EXPECT_EQ(profile.network_mode, "custom");
    EXPECT_EQ(profile.network_name, "aicli-workspace-ws-1");
    EXPECT_EQ(profile.isolation_level, IsolationLevel::STANDARD);
    EXPECT_EQ(profile.resource_limits, mManager->Resources().CreateResourceLimits());

    EXPECT_THAT(profile.security_options.capabilities.drop, ElementsAre("ALL"));
    EXPECT_THAT(profile.security_options.capabilities.add,
                UnorderedElementsAre("CHOWN", "DAC_OVERRIDE", "SETGID", "SETUID"));
    EXPECT_EQ(profile.security_options.seccomp_profile, "default");
    EXPECT_EQ(profile.security_options.apparmor_profile, "docker-default");
    EXPECT_TRUE(profile.security_options.no_new_privileges);
    EXPECT_FALSE(profile.security_options.read_only_root_fs);

    EXPECT_TRUE(profile.monitoring.enable_resource_monitoring);
    EXPECT_TRUE(profile.monitoring.enable_filesystem_audit);
    EXPECT_EQ(profile.monitoring.alert_thresholds.cpu_percent, 85.0);
}

TEST_F(IsolationManagerTest, ProfileWithoutNetworkIsolationUsesBridge)
{
    auto config = std::make_shared<IsolationConfig>();
    config->enable_network_isolation = false;
    config->enable_seccomp = false;
    mManager->UpdateConfig(config);

    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);

    EXPECT_EQ(profile.network_mode, "bridge");
    EXPECT_TRUE(profile.security_options.seccomp_profile.empty());
}

TEST_F(IsolationManagerTest, ProfileRejectsNilAndEmpty)
{
    EXPECT_THROW(mManager->CreateWorkspaceIsolation(nullptr), InvalidArgumentError);

    Workspace anonymous;
    EXPECT_THROW(mManager->CreateWorkspaceIsolation(&anonymous), InvalidArgumentError);
}

TEST_F(IsolationManagerTest, ValidateIsolation)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);
    EXPECT_NO_THROW(mManager->ValidateIsolation(&profile));

    EXPECT_THROW(mManager->ValidateIsolation(nullptr), InvalidArgumentError);

    auto broken = profile;
    broken.workspace_id.clear();
    EXPECT_THROW(mManager->ValidateIsolation(&broken), InvalidArgumentError);

    broken = profile;
    broken.network_mode.clear();
    EXPECT_THROW(mManager->ValidateIsolation(&broken), InvalidArgumentError);

    broken = profile;
    broken.resource_limits.memory = 0;
    EXPECT_THROW(mManager->ValidateIsolation(&broken), InvalidArgumentError);

    broken = profile;
    broken.resource_limits.memory = 1 * kMiB;
    broken.resource_limits.memory_swap = 1 * kMiB;
    EXPECT_THROW(mManager->ValidateIsolation(&broken), PolicyViolationError);
}

TEST_F(IsolationManagerTest, ApplyToContainerEndToEnd)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);
    mManager->ValidateIsolation(&profile);

    runtime::ContainerDefinition container;
    runtime::HostConfig host;
    host.privileged = true;

    mManager->ApplyToContainer(&profile, &container, &host);

    EXPECT_THAT(host.cap_drop, Contains("ALL"));
    EXPECT_THAT(host.cap_add, Contains("CHOWN"));
    EXPECT_EQ(host.network_mode, "aicli-workspace-ws-1");
    EXPECT_FALSE(host.privileged);
    EXPECT_FALSE(host.readonly_rootfs);
    EXPECT_THAT(host.security_opt,
                ElementsAre("no-new-privileges:true", "seccomp=default", "apparmor=docker-default"));

    EXPECT_EQ(host.resources.memory, profile.resource_limits.memory);
    EXPECT_EQ(host.resources.cpu_quota, profile.resource_limits.cpu_quota);
    EXPECT_EQ(host.resources.blkio_weight, kDefaultBlkioWeight);

    EXPECT_EQ(container.labels.at("aicli.workspace.id"), "ws-1");
    EXPECT_EQ(container.labels.at("aicli.isolation.level"), "standard");
}

TEST_F(IsolationManagerTest, ApplyToContainerKeepsCallerHardening)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);
    profile.security_options.read_only_root_fs = false;
    profile.security_options.capabilities.drop.clear();
    profile.security_options.capabilities.add.clear();
    profile.resource_limits.pids_limit = 0;

    runtime::ContainerDefinition container;
    runtime::HostConfig host;
    host.readonly_rootfs = true;
    host.cap_drop = {"ALL"};
    host.cap_add = {"NET_BIND_SERVICE"};
    host.resources.pids_limit = 64;

    mManager->ApplyToContainer(&profile, &container, &host);

    EXPECT_TRUE(host.readonly_rootfs);
    EXPECT_THAT(host.cap_drop, ElementsAre("ALL"));
    EXPECT_THAT(host.cap_add, ElementsAre("NET_BIND_SERVICE"));
    ASSERT_TRUE(host.resources.pids_limit.has_value());
    EXPECT_EQ(*host.resources.pids_limit, 64);
    EXPECT_EQ(host.resources.memory, profile.resource_limits.memory);
}

TEST_F(IsolationManagerTest, ApplyToContainerTwiceDoesNotDuplicate)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);

    runtime::ContainerDefinition container;
    runtime::HostConfig host;
    host.security_opt = {"label=disable"};

    mManager->ApplyToContainer(&profile, &container, &host);
    mManager->ApplyToContainer(&profile, &container, &host);

    EXPECT_THAT(host.security_opt, ElementsAre("label=disable", "no-new-privileges:true",
                                               "seccomp=default", "apparmor=docker-default"));
    EXPECT_EQ(std::count(host.resources.device_cgroup_rules.begin(),
                         host.resources.device_cgroup_rules.end(),
                         host.resources.device_cgroup_rules.front()),
              1);
}

TEST_F(IsolationManagerTest, ApplyToContainerRejectsNils)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);
    runtime::ContainerDefinition container;
    runtime::HostConfig host;

    EXPECT_THROW(mManager->ApplyToContainer(nullptr, &container, &host), InvalidArgumentError);
    EXPECT_THROW(mManager->ApplyToContainer(&profile, nullptr, &host), InvalidArgumentError);
    EXPECT_THROW(mManager->ApplyToContainer(&profile, &container, nullptr), InvalidArgumentError);
}

TEST_F(IsolationManagerTest, ApplyToContainerValidatesFirst)
{
    auto profile = mManager->CreateWorkspaceIsolation(&mWorkspace);
    profile.network_mode.clear();

    runtime::ContainerDefinition container;
    runtime::HostConfig host;

    EXPECT_THROW(mManager->ApplyToContainer(&profile, &container, &host), InvalidArgumentError);
    EXPECT_TRUE(host.cap_drop.empty());
    EXPECT_TRUE(container.labels.empty());
}

TEST_F(IsolationManagerTest, UpdateConfigIsSharedWithComponents)
{
    auto config = std::make_shared<IsolationConfig>();
    config->blocked_ports = {9999};
    mManager->UpdateConfig(config);

    EXPECT_TRUE(mManager->Networks().IsPortBlocked(9999));
    EXPECT_FALSE(mManager->Networks().IsPortBlocked(22));
    EXPECT_EQ(mManager->GetConfig().blocked_ports, std::vector<int>{9999});

    EXPECT_THROW(mManager->UpdateConfig(nullptr), InvalidArgumentError);
}

} // namespace core
} // namespace cellguard
