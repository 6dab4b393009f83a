#include "config_manager.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace config
{

    ConfigError::ConfigError(const std::string& filePath, int line, const std::string& message)
        : std::runtime_error([&]() {
            std::ostringstream oss;
            if (!filePath.empty())
                oss << filePath << ':';
            if (line > 0)
                oss << line << ' ';
            oss << message;
            return oss.str();
        }()),
          m_file(filePath), m_line(line)
    {
    }

    namespace
    {

        using nlohmann::json;

        std::optional<std::string> getEnv(const char* key)
        {
            const char* val = std::getenv(key);
            if (val && *val)
                return std::string(val);
            return std::nullopt;
        }

        bool parseUnsignedSegment(std::string_view text, unsigned long maxValue, unsigned long& out)
        {
            if (text.empty() || text.size() > 5)
                return false;
            unsigned long value = 0;
            for (char c : text)
            {
                if (c < '0' || c > '9')
                    return false;
                value = value * 10 + static_cast<unsigned long>(c - '0');
            }
            if (value > maxValue)
                return false;
            out = value;
            return true;
        }

        std::vector<std::string_view> split(std::string_view text, char sep)
        {
            std::vector<std::string_view> parts;
            std::size_t                   start = 0;
            while (true)
            {
                auto pos = text.find(sep, start);
                if (pos == std::string_view::npos)
                {
                    parts.push_back(text.substr(start));
                    break;
                }
                parts.push_back(text.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }

        [[noreturn]] void throwFileError(const std::string& path, const std::string& message)
        {
            throw ConfigError(path, 0, message);
        }

        void readString(const std::string& path, const json& obj, const char* key, std::string& target)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return;
            if (!it->is_string())
                throwFileError(path, std::string("Setting '") + key + "' must be a string");
            target = it->get<std::string>();
        }

        void checkKeys(const std::string& path, const json& obj, const std::unordered_set<std::string>& allowed,
                       const std::string& scope)
        {
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                if (!allowed.count(it.key()))
                    throwFileError(path, "Unknown setting '" + scope + it.key() + "'");
            }
        }

        void applyLogSection(const std::string& path, const json& logObj, diag::LogConfig& log)
        {
            if (!logObj.is_object())
                throwFileError(path, "Setting 'log' must be an object");
            checkKeys(path, logObj, {"level", "file", "maxFileBytes", "stdout"}, "log.");

            if (auto it = logObj.find("level"); it != logObj.end())
            {
                if (!it->is_string())
                    throwFileError(path, "Setting 'log.level' must be a string");
                auto sev = diag::DiagnosticManager::severityFromString(it->get<std::string>());
                if (!sev)
                    throwFileError(path, "Unknown log level '" + it->get<std::string>() + "'");
                log.minimumSeverity = *sev;
            }
            if (auto it = logObj.find("file"); it != logObj.end())
            {
                if (!it->is_string())
                    throwFileError(path, "Setting 'log.file' must be a string");
                auto file = it->get<std::string>();
                if (file.empty())
                    log.filePath.reset();
                else
                    log.filePath = file;
            }
            if (auto it = logObj.find("maxFileBytes"); it != logObj.end())
            {
                if (!it->is_number_unsigned())
                    throwFileError(path, "Setting 'log.maxFileBytes' must be an unsigned number");
                log.maxFileSizeBytes = it->get<std::size_t>();
            }
            if (auto it = logObj.find("stdout"); it != logObj.end())
            {
                if (!it->is_boolean())
                    throwFileError(path, "Setting 'log.stdout' must be a boolean");
                log.logToStdout = it->get<bool>();
            }
        }

        void applyOutputSection(const std::string& path, const json& outObj, OutputConfig& output)
        {
            if (!outObj.is_object())
                throwFileError(path, "Setting 'output' must be an object");
            checkKeys(path, outObj, {"influxUrl", "organization", "bucket"}, "output.");
            readString(path, outObj, "influxUrl", output.influxUrl);
            readString(path, outObj, "organization", output.influxOrganization);
            readString(path, outObj, "bucket", output.influxBucket);
        }

        std::string mask(const std::string& secret)
        {
            return secret.empty() ? "(not set)" : "********";
        }

    } // namespace

    bool isValidIpv4Format(const std::string& ip)
    {
        auto parts = split(ip, '.');
        if (parts.size() != 4)
            return false;
        for (auto part : parts)
        {
            unsigned long value = 0;
            if (!parseUnsignedSegment(part, 255, value))
                return false;
        }
        return true;
    }

    bool isValidHostPort(const std::string& hostAndPort)
    {
        auto parts = split(hostAndPort, ':');
        if (parts.size() != 2 || parts[0].empty())
            return false;
        unsigned long port = 0;
        if (!parseUnsignedSegment(parts[1], 65535, port))
            return false;
        return port > 0;
    }

    void validateIpv4Format(const std::string& ip)
    {
        if (!isValidIpv4Format(ip))
            throw ValidationError("Invalid IP address format for '" + ip +
                                  "', expecting something like: 192.168.0.1");
    }

    void validateHostPort(const std::string& hostAndPort)
    {
        if (!isValidHostPort(hostAndPort))
            throw ValidationError("Invalid IOT host format for '" + hostAndPort +
                                  "', expecting something like: 192.168.0.1:22");
    }

    std::optional<HostKeyPolicy> hostKeyPolicyFromString(const std::string& name)
    {
        if (name == "ignore")
            return HostKeyPolicy::Ignore;
        if (name == "accept-new")
            return HostKeyPolicy::AcceptNew;
        if (name == "strict")
            return HostKeyPolicy::Strict;
        return std::nullopt;
    }

    const char* hostKeyPolicyToString(HostKeyPolicy policy)
    {
        switch (policy)
        {
        case HostKeyPolicy::Ignore:
            return "ignore";
        case HostKeyPolicy::AcceptNew:
            return "accept-new";
        case HostKeyPolicy::Strict:
            return "strict";
        }
        return "ignore";
    }

    ConfigManager::ConfigManager(std::string executableDir) : m_executableDir(std::move(executableDir))
    {
        if (m_executableDir.empty())
            m_executableDir = std::filesystem::current_path().string();
    }

    ProvisionSettings ConfigManager::defaults() const
    {
        ProvisionSettings settings;
        settings.folder      = m_executableDir;
        settings.tokenFolder = m_executableDir;
        return settings;
    }

    std::optional<std::string> ConfigManager::locateSettingsFile(const SettingsOverrides& overrides) const
    {
        if (overrides.configFile)
            return overrides.configFile;
        if (auto fromEnv = getEnv("IOT_PROV_CONFIG"))
            return fromEnv;

        auto candidate = std::filesystem::path(m_executableDir) / "iot_prov.json";
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
            return candidate.string();
        return std::nullopt;
    }

    void ConfigManager::applyFile(ProvisionSettings& settings, const std::string& path) const
    {
        std::ifstream ifs(path);
        if (!ifs)
            throwFileError(path, "Unable to open settings file");

        json root;
        try
        {
            root = json::parse(ifs);
        }
        catch (const json::parse_error& ex)
        {
            throwFileError(path, std::string("Malformed settings file: ") + ex.what());
        }

        if (!root.is_object())
            throwFileError(path, "Settings file must contain a JSON object");

        checkKeys(path, root,
                  {"folder", "ip", "username", "password", "iotPassword", "iotHost", "iotUsername", "tokenFolder",
                   "backupRoot", "settleDelayMs", "hostKeyPolicy", "output", "log"},
                  "");

        readString(path, root, "folder", settings.folder);
        readString(path, root, "ip", settings.ip);
        readString(path, root, "username", settings.username);
        readString(path, root, "password", settings.password);
        readString(path, root, "iotPassword", settings.iotPassword);
        readString(path, root, "iotHost", settings.iotHost);
        readString(path, root, "iotUsername", settings.iotUsername);
        readString(path, root, "tokenFolder", settings.tokenFolder);
        readString(path, root, "backupRoot", settings.backupRoot);

        if (auto it = root.find("settleDelayMs"); it != root.end())
        {
            if (!it->is_number_unsigned())
                throwFileError(path, "Setting 'settleDelayMs' must be an unsigned number");
            const auto delay = it->get<uint64_t>();
            if (delay > std::numeric_limits<uint32_t>::max())
                throwFileError(path, "Setting 'settleDelayMs' is out of range");
            settings.settleDelayMs = static_cast<uint32_t>(delay);
        }

        if (auto it = root.find("hostKeyPolicy"); it != root.end())
        {
            if (!it->is_string())
                throwFileError(path, "Setting 'hostKeyPolicy' must be a string");
            auto policy = hostKeyPolicyFromString(it->get<std::string>());
            if (!policy)
                throwFileError(path, "Unknown hostKeyPolicy '" + it->get<std::string>() +
                                         "' (expected ignore, accept-new or strict)");
            settings.hostKeyPolicy = *policy;
        }

        if (auto it = root.find("output"); it != root.end())
            applyOutputSection(path, *it, settings.output);
        if (auto it = root.find("log"); it != root.end())
            applyLogSection(path, *it, settings.log);
    }

    void ConfigManager::applyEnvironment(ProvisionSettings& settings) const
    {
        if (auto v = getEnv("DEFAULT_IP"))
            settings.ip = *v;
        if (auto v = getEnv("DEFAULT_USERNAME"))
            settings.username = *v;
        if (auto v = getEnv("DEFAULT_PASSWORD"))
            settings.password = *v;
        if (auto v = getEnv("DEFAULT_IOT_IP"))
            settings.iotHost = *v;
        if (auto v = getEnv("DEFAULT_IOT_PASSWORD"))
            settings.iotPassword = *v;

        if (auto v = getEnv("IOT_PROV_LOG_LEVEL"))
        {
            auto sev = diag::DiagnosticManager::severityFromString(*v);
            if (!sev)
                throw ConfigError("IOT_PROV_LOG_LEVEL", 0, "Unknown log level '" + *v + "'");
            settings.log.minimumSeverity = *sev;
        }
        if (auto v = getEnv("IOT_PROV_LOG_FILE"))
            settings.log.filePath = *v;
    }

    void ConfigManager::applyOverrides(ProvisionSettings& settings, const SettingsOverrides& overrides) const
    {
        if (overrides.folder)
            settings.folder = *overrides.folder;
        if (overrides.ip)
            settings.ip = *overrides.ip;
        if (overrides.username)
            settings.username = *overrides.username;
        if (overrides.password)
            settings.password = *overrides.password;
        if (overrides.iotPassword)
            settings.iotPassword = *overrides.iotPassword;
        if (overrides.iotHost)
            settings.iotHost = *overrides.iotHost;
        if (overrides.tokenFolder)
            settings.tokenFolder = *overrides.tokenFolder;
        settings.send          = overrides.send;
        settings.backupInflux  = overrides.backupInflux;
        settings.backupGrafana = overrides.backupGrafana;
    }

    ProvisionSettings ConfigManager::load(const SettingsOverrides& overrides) const
    {
        auto settings = defaults();
        if (auto file = locateSettingsFile(overrides))
            applyFile(settings, *file);
        applyEnvironment(settings);
        applyOverrides(settings, overrides);
        return settings;
    }

    void ConfigManager::validate(const ProvisionSettings& settings) const
    {
        validateIpv4Format(settings.ip);
        validateHostPort(settings.iotHost);
        if (settings.iotUsername.empty())
            throw ValidationError("IOT username must not be empty");
    }

    std::vector<std::string> ConfigManager::describe(const ProvisionSettings& settings) const
    {
        auto flag = [](bool b) { return std::string(b ? "true" : "false"); };

        return {
            "Current configuration:",
            "=====================",
            "Folder: " + settings.folder,
            "IP: " + settings.ip,
            "Username: " + settings.username,
            "Password: " + mask(settings.password),
            "IOT Host: " + settings.iotHost,
            "IOT Password: " + mask(settings.iotPassword),
            "Token Folder: " + settings.tokenFolder,
            "Send config: " + flag(settings.send),
            "Backup InfluxDB: " + flag(settings.backupInflux),
            "Backup Grafana: " + flag(settings.backupGrafana),
            "Host key policy: " + std::string(hostKeyPolicyToString(settings.hostKeyPolicy)),
            "=====================",
        };
    }

} // namespace config
