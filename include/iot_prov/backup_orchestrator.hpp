#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "remote_session.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace iot_prov
{

    struct BackupProfile
    {
        std::string remoteBackupPrefix{"/tmp/influx_backup_"};
        std::string localBackupPrefix{"influx_backup_"};
        std::string backupCommandPrefix{"influx backup -p /var/lib/influxdb2 "};
        std::string remoteConfigFile{"/etc/grafana/grafana.ini"};
        std::string localConfigFile{"grafana_backup.ini"};
    };

    struct BackupResult
    {
        std::filesystem::path    localPath;
        std::vector<std::string> files;
        std::size_t              bytes{0};
    };

    /**
     * Pulls data off the gateway. Neither flow cleans up on failure: files
     * already written stay on disk and the error propagates.
     */
    class BackupOrchestrator
    {
      public:
        BackupOrchestrator(remote::SessionConnector connector, diag::DiagnosticManager& diag,
                           std::filesystem::path localRoot = ".", BackupProfile profile = {});

        // date is "YYYY-MM-DD"; empty means today (local time).
        BackupResult backupDatabase(const remote::RemoteTarget& target, const std::string& date = {});

        BackupResult backupConfig(const remote::RemoteTarget& target);

      private:
        remote::SessionConnector m_connector;
        diag::DiagnosticManager& m_diag;
        std::filesystem::path    m_localRoot;
        BackupProfile            m_profile;
    };

    std::string todayLocalDate();

} // namespace iot_prov
