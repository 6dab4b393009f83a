#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "diagnostic_manager.hpp"

namespace config
{

    class ConfigError : public std::runtime_error
    {
      public:
        ConfigError(const std::string& filePath, int line, const std::string& message);

        int                line() const { return m_line; }
        const std::string& file() const { return m_file; }

      private:
        std::string m_file;
        int         m_line{};
    };

    class ValidationError : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    enum class HostKeyPolicy
    {
        Ignore,
        AcceptNew,
        Strict
    };

    struct OutputConfig
    {
        std::string influxUrl{"http://127.0.0.1:8086"};
        std::string influxOrganization{"org"};
        std::string influxBucket{"line"};
    };

    struct ProvisionSettings
    {
        std::string folder;
        std::string ip;
        std::string username;
        std::string password;
        std::string iotPassword;
        std::string iotHost;
        std::string iotUsername{"root"};
        std::string tokenFolder;
        bool        send{false};
        bool        backupInflux{false};
        bool        backupGrafana{false};

        std::string   backupRoot{"."};
        uint32_t      settleDelayMs{5000};
        HostKeyPolicy hostKeyPolicy{HostKeyPolicy::Ignore};
        OutputConfig  output;
        diag::LogConfig log;
    };

    // Values given on the command line; unset fields leave lower layers alone.
    struct SettingsOverrides
    {
        std::optional<std::string> configFile;
        std::optional<std::string> folder;
        std::optional<std::string> ip;
        std::optional<std::string> username;
        std::optional<std::string> password;
        std::optional<std::string> iotPassword;
        std::optional<std::string> iotHost;
        std::optional<std::string> tokenFolder;
        bool                       send{false};
        bool                       backupInflux{false};
        bool                       backupGrafana{false};
    };

    // Four period-separated segments, each parsable as an 8-bit unsigned integer.
    bool isValidIpv4Format(const std::string& ip);
    // "<host>:<port>" with exactly one colon and a port in 1..65535.
    bool isValidHostPort(const std::string& hostAndPort);

    void validateIpv4Format(const std::string& ip);
    void validateHostPort(const std::string& hostAndPort);

    std::optional<HostKeyPolicy> hostKeyPolicyFromString(const std::string& name);
    const char*                  hostKeyPolicyToString(HostKeyPolicy policy);

    /**
     * Layered settings loader: built-in defaults, then a JSON settings file,
     * then the environment, then command-line overrides. Each layer only
     * replaces the values it actually carries.
     */
    class ConfigManager
    {
      public:
        explicit ConfigManager(std::string executableDir = {});

        ProvisionSettings load(const SettingsOverrides& overrides) const;

        ProvisionSettings defaults() const;
        void              applyFile(ProvisionSettings& settings, const std::string& path) const;
        void              applyEnvironment(ProvisionSettings& settings) const;
        void              applyOverrides(ProvisionSettings& settings, const SettingsOverrides& overrides) const;

        void validate(const ProvisionSettings& settings) const;

        std::vector<std::string> describe(const ProvisionSettings& settings) const;

      private:
        std::optional<std::string> locateSettingsFile(const SettingsOverrides& overrides) const;

        std::string m_executableDir;
    };

} // namespace config
