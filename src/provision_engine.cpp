#include "provision_engine.hpp"

#include "diagnostic_manager.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace iot_prov
{

    namespace
    {
        constexpr const char* kComponent = "ProvisionEngine";

        std::string trim(const std::string& text)
        {
            const auto* ws    = " \t\r\n";
            auto        first = text.find_first_not_of(ws);
            if (first == std::string::npos)
                return {};
            auto last = text.find_last_not_of(ws);
            return text.substr(first, last - first + 1);
        }
    } // namespace

    ProvisionEngine::ProvisionEngine(RunContext& ctx, diag::DiagnosticManager& diag)
        : m_ctx(ctx), m_diag(diag), m_extractor(&diag)
    {
    }

    std::vector<std::string> ProvisionEngine::scanXmlFiles(const std::string& folder) const
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(folder, ec))
            throw config::ValidationError("Folder '" + folder + "' does not exist or is not a directory");

        std::vector<std::string> files;
        for (const auto& entry : std::filesystem::directory_iterator(folder, ec))
        {
            if (entry.is_regular_file(ec) && entry.path().extension() == ".xml")
                files.push_back(entry.path().string());
        }
        if (ec)
            throw config::ValidationError("Unable to read folder '" + folder + "': " + ec.message());

        std::sort(files.begin(), files.end());
        m_diag.log(diag::Severity::DEBUG, kComponent,
                   "Found " + std::to_string(files.size()) + " XML file(s) in " + folder);
        return files;
    }

    std::optional<std::string> ProvisionEngine::loadToken(const std::string& tokenFolder) const
    {
        auto            path = std::filesystem::path(tokenFolder) / "token.txt";
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return std::nullopt;

        std::ifstream ifs(path);
        if (!ifs)
            throw config::ConfigError(path.string(), 0, "Failed to read InfluxDB token");
        std::ostringstream oss;
        oss << ifs.rdbuf();
        if (ifs.bad())
            throw config::ConfigError(path.string(), 0, "Failed to read InfluxDB token");

        m_diag.log(diag::Severity::INFO, kComponent, "InfluxDB token read from " + path.string());
        return trim(oss.str());
    }

    render::GroupDescriptor ProvisionEngine::describeGroup(const GroupInput& input) const
    {
        auto space = m_extractor.extract(input.xmlPath);

        render::GroupDescriptor group;
        group.groupName        = addrspace::resolveGroupName(input.xmlPath, space);
        group.namespaceNumber  = input.namespaceNumber;
        group.samplingInterval = input.interval.empty() ? render::kDefaultInterval : input.interval;
        group.nodes            = std::move(space.nodes);
        group.mode             = input.mode;

        if (group.nodes.empty())
            m_diag.log(diag::Severity::WARN, kComponent, "No namespace-2 variables found in " + input.xmlPath);
        m_diag.log(diag::Severity::INFO, kComponent,
                   "Group '" + group.groupName + "' (" + render::modeToString(group.mode) + ", " +
                       std::to_string(group.nodes.size()) + " node(s)) from " + input.xmlPath);
        return group;
    }

    RenderedConfig ProvisionEngine::buildConfiguration(const std::vector<GroupInput>& inputs,
                                                       const std::string& token) const
    {
        RenderedConfig           rendered;
        std::vector<std::string> blocks;
        const auto               conn = m_ctx.opcConnection();

        for (const auto& input : inputs)
        {
            blocks.push_back(render::renderGroupBlock(describeGroup(input), conn));
        }

        rendered.content = render::renderDocument(token, blocks, m_ctx.outputSettings());
        return rendered;
    }

    std::filesystem::path ProvisionEngine::writeConfiguration(const std::string& folder, const std::string& content)
    {
        auto          path = std::filesystem::path(folder) / render::kConfigFileName;
        std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!ofs)
            throw std::runtime_error("Unable to create " + path.string());
        ofs << content;
        ofs.close();
        if (!ofs)
            throw std::runtime_error("Failed writing " + path.string());

        m_diag.log(diag::Severity::INFO, kComponent, "Config file generated successfully!");
        return path;
    }

    ProvisioningOrchestrator ProvisionEngine::makeProvisioner() const
    {
        return ProvisioningOrchestrator(m_ctx.connector, m_diag, ServiceProfile{},
                                        std::chrono::milliseconds(m_ctx.settings.settleDelayMs));
    }

    BackupOrchestrator ProvisionEngine::makeBackup() const
    {
        return BackupOrchestrator(m_ctx.connector, m_diag, m_ctx.settings.backupRoot);
    }

    ProvisionResult ProvisionEngine::sendConfiguration(const std::string& folder)
    {
        auto            path = std::filesystem::path(folder) / render::kConfigFileName;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            throw config::ValidationError("telegraf.conf file does not exist in the specified folder.");

        auto provisioner = makeProvisioner();
        return provisioner.run(m_ctx.gatewayTarget(), path.string());
    }

    BackupResult ProvisionEngine::backupInflux(const std::string& date)
    {
        auto backup = makeBackup();
        return backup.backupDatabase(m_ctx.gatewayTarget(), date);
    }

    BackupResult ProvisionEngine::backupGrafana()
    {
        auto backup = makeBackup();
        return backup.backupConfig(m_ctx.gatewayTarget());
    }

} // namespace iot_prov
