#include "backup_orchestrator.hpp"

#include "diagnostic_manager.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace iot_prov
{

    namespace
    {
        constexpr const char* kComponent = "Backup";

        void writeLocalFile(const std::filesystem::path& path, const std::vector<uint8_t>& data)
        {
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            if (!ofs)
                throw remote::TransferError("Unable to create local file " + path.string());
            ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!ofs)
                throw remote::TransferError("Failed writing local file " + path.string());
        }
    } // namespace

    std::string todayLocalDate()
    {
        std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm     tmStruct{};
#if defined(_WIN32)
        localtime_s(&tmStruct, &t);
#else
        localtime_r(&t, &tmStruct);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tmStruct, "%Y-%m-%d");
        return oss.str();
    }

    BackupOrchestrator::BackupOrchestrator(remote::SessionConnector connector, diag::DiagnosticManager& diag,
                                           std::filesystem::path localRoot, BackupProfile profile)
        : m_connector(std::move(connector)), m_diag(diag), m_localRoot(std::move(localRoot)),
          m_profile(std::move(profile))
    {
    }

    BackupResult BackupOrchestrator::backupDatabase(const remote::RemoteTarget& target, const std::string& date)
    {
        const auto stamp        = date.empty() ? todayLocalDate() : date;
        const auto remoteFolder = m_profile.remoteBackupPrefix + stamp;

        auto session = m_connector(target);

        m_diag.log(diag::Severity::INFO, kComponent, "Backing up InfluxDB to " + remoteFolder);
        auto output = session->execCommand(m_profile.backupCommandPrefix + remoteFolder);
        m_diag.log(diag::Severity::INFO, kComponent, "Command output: " + output);

        BackupResult result;
        result.localPath = m_localRoot / (m_profile.localBackupPrefix + stamp);
        std::error_code ec;
        std::filesystem::create_directories(result.localPath, ec);
        if (ec)
            throw remote::TransferError("Unable to create " + result.localPath.string() + ": " + ec.message());

        for (const auto& name : session->listDirectory(remoteFolder))
        {
            auto data = session->downloadFile(remoteFolder + "/" + name);
            writeLocalFile(result.localPath / name, data);
            result.files.push_back(name);
            result.bytes += data.size();
            m_diag.log(diag::Severity::INFO, kComponent,
                       "Copied " + name + " (" + std::to_string(data.size()) + " bytes)");
        }

        m_diag.log(diag::Severity::INFO, kComponent,
                   "Backup completed successfully. Files are located at: " + result.localPath.string());
        return result;
    }

    BackupResult BackupOrchestrator::backupConfig(const remote::RemoteTarget& target)
    {
        auto session = m_connector(target);
        auto data    = session->downloadFile(m_profile.remoteConfigFile);

        BackupResult result;
        result.localPath = m_localRoot / m_profile.localConfigFile;
        writeLocalFile(result.localPath, data);
        result.files.push_back(m_profile.localConfigFile);
        result.bytes = data.size();

        m_diag.log(diag::Severity::INFO, kComponent, "Grafana configuration backed up to " + result.localPath.string());
        return result;
    }

} // namespace iot_prov
