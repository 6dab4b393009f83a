#include <gtest/gtest.h>

#include "config_manager.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace
{

    std::filesystem::path writeTempConfig(const std::string& name, const std::string& json)
    {
        auto dir = std::filesystem::temp_directory_path() / "iot_prov_tests" / "negative";
        std::filesystem::create_directories(dir);
        auto          path = dir / name;
        std::ofstream ofs(path);
        ofs << json;
        ofs.close();
        return path;
    }

    config::ProvisionSettings validSettings()
    {
        config::ProvisionSettings settings;
        settings.ip      = "192.168.0.1";
        settings.iotHost = "192.168.0.2:22";
        return settings;
    }

} // namespace

TEST(ConfigManagerNegative, RejectsMalformedJson)
{
    auto                      path = writeTempConfig("malformed.json", "{\"ip\": \"10.0.0.1\",");
    config::ConfigManager     mgr;
    config::ProvisionSettings settings;
    EXPECT_THROW(mgr.applyFile(settings, path.string()), config::ConfigError);
}

TEST(ConfigManagerNegative, RejectsNonObjectRoot)
{
    auto                      path = writeTempConfig("array_root.json", "[1, 2, 3]");
    config::ConfigManager     mgr;
    config::ProvisionSettings settings;
    EXPECT_THROW(mgr.applyFile(settings, path.string()), config::ConfigError);
}

TEST(ConfigManagerNegative, RejectsUnknownKeys)
{
    auto                      path = writeTempConfig("unknown_key.json", R"({"ip": "10.0.0.1", "ipAddress": "x"})");
    config::ConfigManager     mgr;
    config::ProvisionSettings settings;
    try
    {
        mgr.applyFile(settings, path.string());
        FAIL() << "Expected settings file failure";
    }
    catch (const config::ConfigError& ex)
    {
        const std::string msg = ex.what();
        EXPECT_NE(msg.find("ipAddress"), std::string::npos);
        EXPECT_EQ(ex.file(), path.string());
    }
}

TEST(ConfigManagerNegative, RejectsWrongValueTypes)
{
    config::ConfigManager     mgr;
    config::ProvisionSettings settings;

    auto numericIp = writeTempConfig("numeric_ip.json", R"({"ip": 10})");
    EXPECT_THROW(mgr.applyFile(settings, numericIp.string()), config::ConfigError);

    auto negativeDelay = writeTempConfig("negative_delay.json", R"({"settleDelayMs": -5})");
    EXPECT_THROW(mgr.applyFile(settings, negativeDelay.string()), config::ConfigError);

    auto badLog = writeTempConfig("bad_log.json", R"({"log": {"level": "chatty"}})");
    EXPECT_THROW(mgr.applyFile(settings, badLog.string()), config::ConfigError);

    auto badOutput = writeTempConfig("bad_output.json", R"({"output": {"token": "abc"}})");
    EXPECT_THROW(mgr.applyFile(settings, badOutput.string()), config::ConfigError);

    auto badPolicy = writeTempConfig("bad_policy.json", R"({"hostKeyPolicy": "trust-me"})");
    EXPECT_THROW(mgr.applyFile(settings, badPolicy.string()), config::ConfigError);
}

TEST(ConfigManagerNegative, RejectsSettleDelayBeyondUint32)
{
    config::ConfigManager     mgr;
    config::ProvisionSettings settings;
    settings.settleDelayMs = 1234;

    auto tooLarge = writeTempConfig("huge_delay.json", R"({"settleDelayMs": 4294967296})");
    try
    {
        mgr.applyFile(settings, tooLarge.string());
        FAIL() << "Expected an out of range settle delay to be rejected";
    }
    catch (const config::ConfigError& ex)
    {
        EXPECT_NE(std::string(ex.what()).find("out of range"), std::string::npos);
    }
    EXPECT_EQ(settings.settleDelayMs, 1234u);

    auto largest = writeTempConfig("max_delay.json", R"({"settleDelayMs": 4294967295})");
    mgr.applyFile(settings, largest.string());
    EXPECT_EQ(settings.settleDelayMs, 4294967295u);
}

TEST(ConfigManagerNegative, MissingExplicitFileFails)
{
    config::SettingsOverrides overrides;
    overrides.configFile = "/nonexistent/iot_prov/settings.json";
    config::ConfigManager mgr;
    EXPECT_THROW(mgr.load(overrides), config::ConfigError);
}

TEST(ConfigManagerNegative, RejectsUnknownEnvironmentLogLevel)
{
    ::setenv("IOT_PROV_LOG_LEVEL", "verbose", 1);
    config::ConfigManager     mgr;
    config::ProvisionSettings settings;
    EXPECT_THROW(mgr.applyEnvironment(settings), config::ConfigError);
    ::unsetenv("IOT_PROV_LOG_LEVEL");
}

TEST(ConfigManagerNegative, ValidateRejectsShortIp)
{
    config::ConfigManager mgr;
    auto                  settings = validSettings();
    settings.ip                    = "192.168.0";
    EXPECT_THROW(mgr.validate(settings), config::ValidationError);
}

TEST(ConfigManagerNegative, ValidateRejectsHostWithoutPort)
{
    config::ConfigManager mgr;
    auto                  settings = validSettings();
    settings.iotHost               = "192.168.0.1";
    try
    {
        mgr.validate(settings);
        FAIL() << "Expected validation failure";
    }
    catch (const std::runtime_error& ex)
    {
        const std::string msg = ex.what();
        EXPECT_NE(msg.find("192.168.0.1:22"), std::string::npos);
    }
}

TEST(ConfigManagerNegative, ValidateRejectsEmptyIotUsername)
{
    config::ConfigManager mgr;
    auto                  settings = validSettings();
    settings.iotUsername           = "";
    EXPECT_THROW(mgr.validate(settings), config::ValidationError);
}
