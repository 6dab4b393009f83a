#include <gtest/gtest.h>

#include "config_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{

    const char* const kManagedEnv[] = {"DEFAULT_IP",         "DEFAULT_USERNAME", "DEFAULT_PASSWORD",
                                       "DEFAULT_IOT_IP",     "DEFAULT_IOT_PASSWORD", "IOT_PROV_CONFIG",
                                       "IOT_PROV_LOG_LEVEL", "IOT_PROV_LOG_FILE"};

    std::filesystem::path freshDir(const std::string& name)
    {
        auto dir = std::filesystem::temp_directory_path() / "iot_prov_tests" / name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path writeTempSettings(const std::filesystem::path& dir, const std::string& json)
    {
        auto          path = dir / "iot_prov.json";
        std::ofstream ofs(path);
        ofs << json;
        ofs.close();
        return path;
    }

    class ConfigManagerLayers : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            for (auto* key : kManagedEnv)
                ::unsetenv(key);
        }

        void TearDown() override
        {
            for (auto* key : kManagedEnv)
                ::unsetenv(key);
        }
    };

} // namespace

TEST(ConfigManager, AcceptsWellFormedAddresses)
{
    EXPECT_TRUE(config::isValidIpv4Format("192.168.0.1"));
    EXPECT_TRUE(config::isValidIpv4Format("0.0.0.0"));
    EXPECT_TRUE(config::isValidHostPort("192.168.0.1:22"));
    EXPECT_TRUE(config::isValidHostPort("iot2050.local:2222"));
    EXPECT_NO_THROW(config::validateIpv4Format("10.0.0.5"));
    EXPECT_NO_THROW(config::validateHostPort("10.0.0.6:22"));
}

TEST(ConfigManager, RejectsMalformedIpv4)
{
    EXPECT_FALSE(config::isValidIpv4Format("192.168.0"));
    EXPECT_FALSE(config::isValidIpv4Format("192.168.0.1.7"));
    EXPECT_FALSE(config::isValidIpv4Format("256.1.1.1"));
    EXPECT_FALSE(config::isValidIpv4Format("a.b.c.d"));
    EXPECT_FALSE(config::isValidIpv4Format("1..2.3"));
    EXPECT_FALSE(config::isValidIpv4Format("-1.2.3.4"));
    EXPECT_FALSE(config::isValidIpv4Format(""));
}

TEST(ConfigManager, RejectsMalformedHostPort)
{
    EXPECT_FALSE(config::isValidHostPort("192.168.0.1"));
    EXPECT_FALSE(config::isValidHostPort("192.168.0.1:22:1"));
    EXPECT_FALSE(config::isValidHostPort("192.168.0.1:65536"));
    EXPECT_FALSE(config::isValidHostPort("192.168.0.1:0"));
    EXPECT_FALSE(config::isValidHostPort("192.168.0.1:ssh"));
    EXPECT_FALSE(config::isValidHostPort(":22"));
}

TEST(ConfigManager, ValidationMessagesNameTheValue)
{
    try
    {
        config::validateIpv4Format("192.168.0");
        FAIL() << "Expected validation failure";
    }
    catch (const config::ValidationError& ex)
    {
        EXPECT_STREQ(ex.what(), "Invalid IP address format for '192.168.0', expecting something like: 192.168.0.1");
    }

    try
    {
        config::validateHostPort("192.168.0.1");
        FAIL() << "Expected validation failure";
    }
    catch (const config::ValidationError& ex)
    {
        EXPECT_STREQ(ex.what(),
                     "Invalid IOT host format for '192.168.0.1', expecting something like: 192.168.0.1:22");
    }
}

TEST(ConfigManager, HostKeyPolicyNames)
{
    EXPECT_TRUE(config::hostKeyPolicyFromString("accept-new") == config::HostKeyPolicy::AcceptNew);
    EXPECT_TRUE(config::hostKeyPolicyFromString("strict") == config::HostKeyPolicy::Strict);
    EXPECT_FALSE(config::hostKeyPolicyFromString("paranoid").has_value());
    EXPECT_STREQ(config::hostKeyPolicyToString(config::HostKeyPolicy::Ignore), "ignore");
}

TEST_F(ConfigManagerLayers, DefaultsPointAtExecutableDir)
{
    auto                  dir = freshDir("defaults");
    config::ConfigManager mgr(dir.string());
    auto                  settings = mgr.load({});

    EXPECT_EQ(settings.folder, dir.string());
    EXPECT_EQ(settings.tokenFolder, dir.string());
    EXPECT_EQ(settings.iotUsername, "root");
    EXPECT_EQ(settings.settleDelayMs, 5000u);
    EXPECT_EQ(settings.hostKeyPolicy, config::HostKeyPolicy::Ignore);
    EXPECT_EQ(settings.output.influxBucket, "line");
    EXPECT_TRUE(settings.ip.empty());
    EXPECT_FALSE(settings.send);
}

TEST_F(ConfigManagerLayers, FileThenEnvironmentThenCommandLine)
{
    auto dir = freshDir("layers");
    writeTempSettings(dir, R"({
        "ip": "10.0.0.1",
        "username": "file-user",
        "iotHost": "10.0.0.2:22",
        "settleDelayMs": 250,
        "hostKeyPolicy": "accept-new",
        "output": {"bucket": "press"},
        "log": {"level": "debug", "stdout": false}
    })");

    ::setenv("DEFAULT_IP", "10.0.0.3", 1);
    ::setenv("DEFAULT_IOT_PASSWORD", "env-secret", 1);

    config::SettingsOverrides overrides;
    overrides.username = "cli-user";
    overrides.send     = true;

    config::ConfigManager mgr(dir.string());
    auto                  settings = mgr.load(overrides);

    EXPECT_EQ(settings.ip, "10.0.0.3");
    EXPECT_EQ(settings.username, "cli-user");
    EXPECT_EQ(settings.iotHost, "10.0.0.2:22");
    EXPECT_EQ(settings.iotPassword, "env-secret");
    EXPECT_EQ(settings.settleDelayMs, 250u);
    EXPECT_EQ(settings.hostKeyPolicy, config::HostKeyPolicy::AcceptNew);
    EXPECT_EQ(settings.output.influxBucket, "press");
    EXPECT_EQ(settings.output.influxOrganization, "org");
    EXPECT_EQ(settings.log.minimumSeverity, diag::Severity::DEBUG);
    EXPECT_FALSE(settings.log.logToStdout);
    EXPECT_TRUE(settings.send);
    EXPECT_NO_THROW(mgr.validate(settings));
}

TEST_F(ConfigManagerLayers, ExplicitConfigFileWinsOverLocalOne)
{
    auto dir   = freshDir("explicit_local");
    auto other = freshDir("explicit_other");
    writeTempSettings(dir, R"({"ip": "10.0.0.1"})");
    auto explicitPath = writeTempSettings(other, R"({"ip": "10.9.9.9"})");

    config::SettingsOverrides overrides;
    overrides.configFile = explicitPath.string();

    config::ConfigManager mgr(dir.string());
    EXPECT_EQ(mgr.load(overrides).ip, "10.9.9.9");

    ::setenv("IOT_PROV_CONFIG", explicitPath.string().c_str(), 1);
    EXPECT_EQ(mgr.load({}).ip, "10.9.9.9");
}

TEST_F(ConfigManagerLayers, EnvironmentLogSettings)
{
    auto dir = freshDir("env_log");
    ::setenv("IOT_PROV_LOG_LEVEL", "warning", 1);
    ::setenv("IOT_PROV_LOG_FILE", "/tmp/iot_prov_env.log", 1);

    config::ConfigManager mgr(dir.string());
    auto                  settings = mgr.load({});
    EXPECT_EQ(settings.log.minimumSeverity, diag::Severity::WARN);
    ASSERT_TRUE(settings.log.filePath.has_value());
    EXPECT_EQ(*settings.log.filePath, "/tmp/iot_prov_env.log");
}

TEST_F(ConfigManagerLayers, DescribeMasksSecrets)
{
    config::ConfigManager     mgr(freshDir("describe").string());
    config::ProvisionSettings settings;
    settings.ip          = "10.0.0.5";
    settings.password    = "hunter2";
    settings.iotPassword = "";

    auto lines = mgr.describe(settings);
    bool sawIp = false;
    for (const auto& line : lines)
    {
        EXPECT_EQ(line.find("hunter2"), std::string::npos);
        sawIp = sawIp || line == "IP: 10.0.0.5";
    }
    EXPECT_TRUE(sawIp);
    EXPECT_TRUE(std::find(lines.begin(), lines.end(), "Password: ********") != lines.end());
    EXPECT_TRUE(std::find(lines.begin(), lines.end(), "IOT Password: (not set)") != lines.end());
}
