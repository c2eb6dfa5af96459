#include <gtest/gtest.h>

#include "cellguard/core/errors.hpp"
#include "cellguard/core/isolation_config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace cellguard {
namespace core {

using namespace testing;

/*******************************************************************************
 * Suite
 ******************************************************************************/

class IsolationConfigTest : public Test {
protected:
    void SetUp() override
    {
        mPath = std::filesystem::temp_directory_path()
            / ("cellguard_config_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove(mPath, ec);
    }

    std::filesystem::path mPath;
};

/*******************************************************************************
 * Tests
 ******************************************************************************/

TEST_F(IsolationConfigTest, Defaults)
{
    auto config = DefaultIsolationConfig();

    EXPECT_TRUE(config.enable_network_isolation);
    EXPECT_EQ(config.allowed_networks, std::vector<std::string>{"aicli-network"});
    EXPECT_EQ(config.blocked_ports, (std::vector<int>{22, 80, 443, 3000, 8000, 8080}));
    EXPECT_DOUBLE_EQ(config.default_cpu_limit, 1.0);
    EXPECT_EQ(config.default_memory_limit, 512 * kMiB);
    EXPECT_EQ(config.default_disk_limit, 1 * kGiB);
    EXPECT_TRUE(config.enable_seccomp);
    EXPECT_TRUE(config.enable_apparmor);
    EXPECT_TRUE(config.disable_privileged);
    EXPECT_FALSE(config.read_only_root_fs);
    EXPECT_TRUE(config.no_new_privileges);
    EXPECT_TRUE(config.enable_audit_log);
    EXPECT_FALSE(config.monitor_system_calls);

    EXPECT_NO_THROW(ValidateIsolationConfig(config));
}

TEST_F(IsolationConfigTest, ParseKeepsDefaultsForMissingKeys)
{
    auto config = ParseIsolationConfig(R"({"blocked_ports": [2222], "read_only_root_fs": true, "extra": 1})");

    EXPECT_EQ(config.blocked_ports, std::vector<int>{2222});
    EXPECT_TRUE(config.read_only_root_fs);
    EXPECT_EQ(config.default_memory_limit, 512 * kMiB);
    EXPECT_TRUE(config.enable_seccomp);
}

TEST_F(IsolationConfigTest, ParseRejectsBadInput)
{
    EXPECT_THROW(ParseIsolationConfig("{not json"), ConfigError);
    EXPECT_THROW(ParseIsolationConfig("[1, 2]"), ConfigError);
    EXPECT_THROW(ParseIsolationConfig(R"({"blocked_ports": "22"})"), ConfigError);
    EXPECT_THROW(ParseIsolationConfig(R"({"default_cpu_limit": 0})"), ConfigError);
    EXPECT_THROW(ParseIsolationConfig(R"({"default_memory_limit": 1024})"), ConfigError);
    EXPECT_THROW(ParseIsolationConfig(R"({"blocked_ports": [70000]})"), ConfigError);
}

TEST_F(IsolationConfigTest, SaveAndLoad)
{
    auto config = DefaultIsolationConfig();
    config.blocked_ports = {22, 2375};
    config.enable_apparmor = false;
    config.default_cpu_limit = 0.5;

    SaveIsolationConfig(config, mPath);
    auto loaded = LoadIsolationConfig(mPath);

    EXPECT_EQ(loaded.blocked_ports, config.blocked_ports);
    EXPECT_FALSE(loaded.enable_apparmor);
    EXPECT_DOUBLE_EQ(loaded.default_cpu_limit, 0.5);
}

TEST_F(IsolationConfigTest, LoadMissingFileFails)
{
    EXPECT_THROW(LoadIsolationConfig(mPath), ConfigError);
}

TEST_F(IsolationConfigTest, PolicyStoreReplace)
{
    PolicyStore store;
    auto before = store.Get();

    auto updated = std::make_shared<IsolationConfig>();
    updated->enable_audit_log = false;
    store.Replace(updated);

    EXPECT_TRUE(before->enable_audit_log);
    EXPECT_FALSE(store.Get()->enable_audit_log);

    auto invalid = std::make_shared<IsolationConfig>();
    invalid->default_cpu_limit = -1.0;
    EXPECT_THROW(store.Replace(invalid), ConfigError);
    EXPECT_FALSE(store.Get()->enable_audit_log);

    EXPECT_THROW(store.Replace(nullptr), InvalidArgumentError);
    EXPECT_THROW({ PolicyStore rejected(nullptr); }, InvalidArgumentError);
}

} // namespace core
} // namespace cellguard
