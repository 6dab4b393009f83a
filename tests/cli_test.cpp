#include <gtest/gtest.h>

#include "cli.hpp"

#include <string>
#include <vector>

namespace
{

    cli::ParsedArguments parse(std::vector<const char*> args)
    {
        args.insert(args.begin(), "iot_prov");
        return cli::parseArguments(static_cast<int>(args.size()), args.data());
    }

} // namespace

TEST(Cli, ParsesShortOptions)
{
    auto parsed = parse({"-f", "/data/xml", "-i", "10.0.0.5", "-u", "opc", "-p", "pw", "-w", "iotpw", "-a",
                         "10.0.0.6:22", "-t", "/data/token"});
    const auto& o = parsed.overrides;

    EXPECT_EQ(o.folder.value_or(""), "/data/xml");
    EXPECT_EQ(o.ip.value_or(""), "10.0.0.5");
    EXPECT_EQ(o.username.value_or(""), "opc");
    EXPECT_EQ(o.password.value_or(""), "pw");
    EXPECT_EQ(o.iotPassword.value_or(""), "iotpw");
    EXPECT_EQ(o.iotHost.value_or(""), "10.0.0.6:22");
    EXPECT_EQ(o.tokenFolder.value_or(""), "/data/token");
    EXPECT_FALSE(o.send);
    EXPECT_FALSE(parsed.showHelp);
}

TEST(Cli, ParsesLongOptionsAndFlags)
{
    auto parsed = parse({"--config", "site.json", "--send", "--backup-influx", "--backup-grafana", "--ip",
                         "10.0.0.9"});
    const auto& o = parsed.overrides;

    EXPECT_EQ(o.configFile.value_or(""), "site.json");
    EXPECT_EQ(o.ip.value_or(""), "10.0.0.9");
    EXPECT_TRUE(o.send);
    EXPECT_TRUE(o.backupInflux);
    EXPECT_TRUE(o.backupGrafana);
    EXPECT_FALSE(o.folder.has_value());
}

TEST(Cli, HelpAndVersion)
{
    EXPECT_TRUE(parse({"-h"}).showHelp);
    EXPECT_TRUE(parse({"--version"}).showVersion);

    auto text = cli::usage("/usr/local/bin/iot_prov");
    EXPECT_NE(text.find("Usage: iot_prov [OPTIONS]"), std::string::npos);
    EXPECT_NE(text.find("--backup-grafana"), std::string::npos);
}

TEST(Cli, ParsesEventLogExport)
{
    EXPECT_FALSE(parse({"--send"}).exportLogPath.has_value());
    EXPECT_EQ(parse({"-e", "run.json"}).exportLogPath.value_or(""), "run.json");
    EXPECT_EQ(parse({"--export-log", "/var/log/iot_prov.log"}).exportLogPath.value_or(""), "/var/log/iot_prov.log");
    EXPECT_THROW(parse({"--export-log"}), cli::UsageError);
    EXPECT_NE(cli::usage("iot_prov").find("--export-log <FILE>"), std::string::npos);
}

TEST(Cli, RejectsUnknownOptionAndMissingValue)
{
    EXPECT_THROW(parse({"--frobnicate"}), cli::UsageError);
    EXPECT_THROW(parse({"-i"}), cli::UsageError);
}

TEST(Cli, ListenerSelectionIsOneBasedAndForgiving)
{
    EXPECT_EQ(cli::parseListenerSelection("1,3", 4), (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(cli::parseListenerSelection(" 3 , 1, 3 ", 4), (std::vector<std::size_t>{0, 2}));
    EXPECT_EQ(cli::parseListenerSelection("0,5,x,-1,2", 4), (std::vector<std::size_t>{1}));
    EXPECT_TRUE(cli::parseListenerSelection("", 4).empty());
    EXPECT_TRUE(cli::parseListenerSelection("99999999999999999999", 4).empty());
}

TEST(Cli, ConfirmationAcceptsOnlyY)
{
    EXPECT_TRUE(cli::isYes("y"));
    EXPECT_TRUE(cli::isYes(" Y\r\n"));
    EXPECT_FALSE(cli::isYes("yes"));
    EXPECT_FALSE(cli::isYes(""));
    EXPECT_FALSE(cli::isYes("n"));
}

TEST(Cli, TrimStripsWhitespace)
{
    EXPECT_EQ(cli::trim("  token-abc\n"), "token-abc");
    EXPECT_EQ(cli::trim("\t \n"), "");
}
