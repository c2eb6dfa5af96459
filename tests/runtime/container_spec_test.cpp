#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "cellguard/runtime/container_spec.hpp"

namespace cellguard {
namespace runtime {

using namespace testing;
using json = nlohmann::json;

/*******************************************************************************
 * Suite
 ******************************************************************************/

class ContainerSpecTest : public Test {
protected:
    void SetUp() override
    {
        mContainer.name = "aicli-ws-1";
        mContainer.image = "ubuntu:22.04";
        mContainer.working_dir = "/workspace";
        mContainer.cmd = {"sleep", "infinity"};
        mContainer.labels["aicli.workspace.id"] = "ws-1";

        mHost.resources.cpu_shares = 1024;
        mHost.resources.cpu_period = 100000;
        mHost.resources.cpu_quota = 50000;
        mHost.resources.memory = 256 * 1024 * 1024;
        mHost.resources.memory_swap = 256 * 1024 * 1024;
        mHost.resources.pids_limit = 50;
        mHost.resources.blkio_weight = 500;
        mHost.resources.device_cgroup_rules = {"c 1:3 rmw"};
        mHost.network_mode = "aicli-workspace-ws-1";
        mHost.cap_drop = {"ALL"};
        mHost.cap_add = {"CHOWN"};
        mHost.security_opt = {"no-new-privileges:true"};
        mHost.port_bindings["8000/tcp"] = {PortBinding{"127.0.0.1", "9000"}};
    }

    ContainerDefinition mContainer;
    HostConfig mHost;
};

/*******************************************************************************
 * Tests
 ******************************************************************************/

TEST_F(ContainerSpecTest, CreateJsonUsesEngineFieldNames)
{
    auto body = json::parse(ToDockerCreateJson(mContainer, mHost, -1));

    EXPECT_EQ(body["Image"], "ubuntu:22.04");
    EXPECT_EQ(body["WorkingDir"], "/workspace");
    EXPECT_EQ(body["Cmd"], json::array({"sleep", "infinity"}));
    EXPECT_EQ(body["Labels"]["aicli.workspace.id"], "ws-1");

    const auto& host = body["HostConfig"];
    EXPECT_EQ(host["Memory"], 256 * 1024 * 1024);
    EXPECT_EQ(host["CpuQuota"], 50000);
    EXPECT_EQ(host["PidsLimit"], 50);
    EXPECT_EQ(host["BlkioWeight"], 500);
    EXPECT_EQ(host["NetworkMode"], "aicli-workspace-ws-1");
    EXPECT_EQ(host["CapDrop"], json::array({"ALL"}));
    EXPECT_EQ(host["Privileged"], false);
    EXPECT_EQ(host["PortBindings"]["8000/tcp"][0]["HostPort"], "9000");
}

TEST_F(ContainerSpecTest, PidsLimitOmittedWhenUnset)
{
    mHost.resources.pids_limit.reset();

    json host = mHost;

    EXPECT_FALSE(host.contains("PidsLimit"));
}

TEST_F(ContainerSpecTest, RunArgumentsEndWithImageAndCommand)
{
    auto args = BuildRunArguments(mContainer, mHost);

    ASSERT_GE(args.size(), 5u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_EQ(args[args.size() - 3], "ubuntu:22.04");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args.back(), "infinity");

    EXPECT_THAT(args, Contains("--cap-drop"));
    EXPECT_THAT(args, Contains("--pids-limit"));
    EXPECT_THAT(args, Contains("127.0.0.1:9000:8000/tcp"));
    EXPECT_THAT(args, Contains("aicli-workspace-ws-1"));
    EXPECT_THAT(args, Contains("no-new-privileges:true"));
}

TEST_F(ContainerSpecTest, NetworkCreateArguments)
{
    NetworkCreateRequest request;
    request.name = "aicli-workspace-ws-1";
    request.driver = "bridge";
    request.ipam_driver = "default";
    request.subnet = "172.20.1.0/24";
    request.gateway = "172.20.1.1";
    request.options["com.docker.network.bridge.enable_icc"] = "false";

    auto args = BuildNetworkCreateArguments(request);

    EXPECT_EQ(args.front(), "network");
    EXPECT_EQ(args.back(), "aicli-workspace-ws-1");
    EXPECT_THAT(args, Not(Contains("--internal")));
    EXPECT_THAT(args, Contains("172.20.1.0/24"));
    EXPECT_THAT(args, Contains("com.docker.network.bridge.enable_icc=false"));

    json body = request;
    EXPECT_EQ(body["IPAM"]["Config"][0]["Gateway"], "172.20.1.1");
}

} // namespace runtime
} // namespace cellguard
