#include "cli.hpp"

#include "diagnostic_manager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace cli
{

    namespace
    {
        const char* requireValue(int argc, const char* const* argv, int& i, const std::string& flag)
        {
            if (i + 1 >= argc)
                throw UsageError("Option '" + flag + "' requires a value");
            return argv[++i];
        }
    } // namespace

    std::string trim(const std::string& text)
    {
        const auto* ws    = " \t\r\n";
        auto        first = text.find_first_not_of(ws);
        if (first == std::string::npos)
            return {};
        auto last = text.find_last_not_of(ws);
        return text.substr(first, last - first + 1);
    }

    ParsedArguments parseArguments(int argc, const char* const* argv)
    {
        ParsedArguments parsed;
        auto&           o = parsed.overrides;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "-f" || arg == "--folder")
                o.folder = requireValue(argc, argv, i, arg);
            else if (arg == "-i" || arg == "--ip")
                o.ip = requireValue(argc, argv, i, arg);
            else if (arg == "-u" || arg == "--username")
                o.username = requireValue(argc, argv, i, arg);
            else if (arg == "-p" || arg == "--password")
                o.password = requireValue(argc, argv, i, arg);
            else if (arg == "-w" || arg == "--iot-password")
                o.iotPassword = requireValue(argc, argv, i, arg);
            else if (arg == "-a" || arg == "--iot-host")
                o.iotHost = requireValue(argc, argv, i, arg);
            else if (arg == "-t" || arg == "--token")
                o.tokenFolder = requireValue(argc, argv, i, arg);
            else if (arg == "-c" || arg == "--config")
                o.configFile = requireValue(argc, argv, i, arg);
            else if (arg == "-e" || arg == "--export-log")
                parsed.exportLogPath = requireValue(argc, argv, i, arg);
            else if (arg == "-s" || arg == "--send")
                o.send = true;
            else if (arg == "-b" || arg == "--backup-influx")
                o.backupInflux = true;
            else if (arg == "-g" || arg == "--backup-grafana")
                o.backupGrafana = true;
            else if (arg == "-h" || arg == "--help")
                parsed.showHelp = true;
            else if (arg == "-V" || arg == "--version")
                parsed.showVersion = true;
            else
                throw UsageError("Unknown option '" + arg + "'");
        }
        return parsed;
    }

    std::string usage(const std::string& argv0)
    {
        auto progname = argv0;
        if (auto slash = progname.find_last_of("/\\"); slash != std::string::npos)
            progname = progname.substr(slash + 1);

        std::ostringstream oss;
        oss << kProgramTitle << ' ' << kVersion << "\n"
            << "Generates a config file for Telegraf from XML files in the folder\n\n"
            << "Usage: " << progname << " [OPTIONS]\n\n"
            << "  -f, --folder <FOLDER>              folder containing the XML files\n"
            << "  -i, --ip <IP>                      OPC IP address\n"
            << "  -u, --username <USERNAME>          OPC username\n"
            << "  -p, --password <PASSWORD>          OPC password\n"
            << "  -w, --iot-password <IOT_PASSWORD>  IOT-2050 password\n"
            << "  -a, --iot-host <IOT_HOST>          IOT-2050 host address and port\n"
            << "  -t, --token <TOKEN_FOLDER>         location of the InfluxDB token.txt\n"
            << "  -c, --config <FILE>                JSON settings file\n"
            << "  -s, --send                         send the existing telegraf.conf to the IOT-2050 and quit\n"
            << "  -b, --backup-influx                back up the InfluxDB v2 database from the IOT-2050\n"
            << "  -g, --backup-grafana               back up the Grafana configuration from the IOT-2050\n"
            << "  -e, --export-log <FILE>            write this run's log events to FILE on exit (.json for JSON)\n"
            << "  -h, --help                         print this help\n"
            << "  -V, --version                      print the version\n";
        return oss.str();
    }

    std::vector<std::size_t> parseListenerSelection(const std::string& text, std::size_t fileCount)
    {
        std::vector<std::size_t> indexes;
        std::stringstream        ss(trim(text));
        std::string              item;
        while (std::getline(ss, item, ','))
        {
            item = trim(item);
            if (item.empty() || !std::all_of(item.begin(), item.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; }))
                continue;
            if (item.size() > 9)
                continue;
            auto number = static_cast<std::size_t>(std::stoul(item));
            if (number == 0 || number > fileCount)
                continue;
            indexes.push_back(number - 1);
        }
        std::sort(indexes.begin(), indexes.end());
        indexes.erase(std::unique(indexes.begin(), indexes.end()), indexes.end());
        return indexes;
    }

    bool isYes(const std::string& answer)
    {
        auto t = trim(answer);
        return t == "y" || t == "Y";
    }

    void printProvisionResult(const iot_prov::ProvisionResult& result, std::ostream& out, std::ostream& err)
    {
        if (result.serviceActive)
            return;

        for (const auto& step : result.diagnostics)
        {
            if (step.error)
            {
                err << step.label << " unavailable: " << *step.error << std::endl;
                continue;
            }
            if (trim(step.output).empty())
                continue;
            out << step.label << ":\n\n" << step.output << std::endl;
        }
    }

    int sendExisting(iot_prov::ProvisionEngine& engine, const std::string& folder, std::ostream& out,
                     std::ostream& err)
    {
        try
        {
            auto result = engine.sendConfiguration(folder);
            printProvisionResult(result, out, err);
            return 0;
        }
        catch (const config::ValidationError& ex)
        {
            err << "Error: " << ex.what() << std::endl;
        }
        catch (const iot_prov::remote::RemoteError& ex)
        {
            err << "Failed to send telegraf.conf file and restart Telegraf: " << ex.what() << std::endl;
        }
        return 1;
    }

    std::optional<int> runNonInteractive(const config::ConfigManager& cfgMgr, const config::ProvisionSettings& settings,
                                         iot_prov::ProvisionEngine& engine, std::ostream& out, std::ostream& err)
    {
        try
        {
            cfgMgr.validate(settings);
        }
        catch (const config::ValidationError& ex)
        {
            err << "Error: " << ex.what() << std::endl;
            return 1;
        }

        if (settings.send)
            return sendExisting(engine, settings.folder, out, err);

        if (settings.backupInflux)
        {
            try
            {
                auto result = engine.backupInflux();
                out << "InfluxDB backup completed, " << result.files.size() << " file(s) in "
                    << result.localPath.string() << std::endl;
                return 0;
            }
            catch (const iot_prov::remote::RemoteError& ex)
            {
                err << "Failed to backup InfluxDB: " << ex.what() << std::endl;
                return 1;
            }
        }

        if (settings.backupGrafana)
        {
            try
            {
                engine.backupGrafana();
                out << "Grafana configuration backup completed successfully." << std::endl;
                return 0;
            }
            catch (const iot_prov::remote::RemoteError& ex)
            {
                err << "Failed to backup Grafana configuration: " << ex.what() << std::endl;
                return 1;
            }
        }

        return std::nullopt;
    }

    std::optional<std::vector<std::string>> findXmlFiles(iot_prov::ProvisionEngine& engine, const std::string& folder,
                                                         std::ostream& err)
    {
        std::vector<std::string> files;
        try
        {
            files = engine.scanXmlFiles(folder);
        }
        catch (const config::ValidationError& ex)
        {
            err << "Error: " << ex.what() << std::endl;
            return std::nullopt;
        }

        if (files.empty())
        {
            err << "No XML files found in the folder." << std::endl;
            err << "Aborting." << std::endl;
            return std::nullopt;
        }
        return files;
    }

    bool exportEventLog(const diag::DiagnosticManager& diagMgr, const std::string& path, std::ostream& err)
    {
        const bool asJson = std::filesystem::path(path).extension() == ".json";
        if (!diagMgr.exportRecentEvents(diag::DiagnosticManager::kHistoryLimit, asJson, path))
        {
            err << "Unable to write log export " << path << std::endl;
            return false;
        }
        return true;
    }

} // namespace cli
