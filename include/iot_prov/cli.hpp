#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "provision_engine.hpp"

namespace cli
{

    inline constexpr const char* kProgramTitle = "IOT2050 config handler";
    inline constexpr const char* kVersion      = "0.4";

    class UsageError : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    struct ParsedArguments
    {
        config::SettingsOverrides  overrides;
        std::optional<std::string> exportLogPath;
        bool                       showHelp{false};
        bool                       showVersion{false};
    };

    ParsedArguments parseArguments(int argc, const char* const* argv);

    std::string usage(const std::string& argv0);

    // "1, 3" -> {0, 2}; non-numbers and out-of-range entries are dropped.
    std::vector<std::size_t> parseListenerSelection(const std::string& text, std::size_t fileCount);

    bool isYes(const std::string& answer);

    std::string trim(const std::string& text);

    void printProvisionResult(const iot_prov::ProvisionResult& result, std::ostream& out, std::ostream& err);

    // Uploads <folder>/telegraf.conf and restarts the service. Returns the process exit code.
    int sendExisting(iot_prov::ProvisionEngine& engine, const std::string& folder, std::ostream& out,
                     std::ostream& err);

    /**
     * Validates the settings and runs the flag-driven modes (--send,
     * --backup-influx, --backup-grafana). Returns the exit code when the run
     * is over, or nullopt when the interactive generation flow should follow.
     */
    std::optional<int> runNonInteractive(const config::ConfigManager& cfgMgr, const config::ProvisionSettings& settings,
                                         iot_prov::ProvisionEngine& engine, std::ostream& out, std::ostream& err);

    // XML files of the folder, or nullopt (after reporting on err) when there is nothing to work with.
    std::optional<std::vector<std::string>> findXmlFiles(iot_prov::ProvisionEngine& engine, const std::string& folder,
                                                         std::ostream& err);

    // ".json" destinations get a JSON array, anything else plain log lines.
    bool exportEventLog(const diag::DiagnosticManager& diagMgr, const std::string& path, std::ostream& err);

} // namespace cli
