#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "address_space.hpp"
#include "backup_orchestrator.hpp"
#include "config_renderer.hpp"
#include "provisioning_orchestrator.hpp"
#include "run_context.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace iot_prov
{

    // Answers collected per XML file before rendering.
    struct GroupInput
    {
        std::string       xmlPath;
        render::InputMode mode{render::InputMode::Poll};
        std::string       namespaceNumber;
        std::string       interval;
    };

    struct RenderedConfig
    {
        std::string content;
    };

    /**
     * Ties the pieces of one provisioning run together: finds the address
     * space exports, renders them into a telegraf.conf, and hands the result
     * or the backup requests to the remote orchestrators.
     */
    class ProvisionEngine
    {
      public:
        ProvisionEngine(RunContext& ctx, diag::DiagnosticManager& diag);

        std::vector<std::string>   scanXmlFiles(const std::string& folder) const;
        std::optional<std::string> loadToken(const std::string& tokenFolder) const;

        render::GroupDescriptor describeGroup(const GroupInput& input) const;
        RenderedConfig          buildConfiguration(const std::vector<GroupInput>& inputs, const std::string& token) const;
        std::filesystem::path   writeConfiguration(const std::string& folder, const std::string& content);

        ProvisionResult sendConfiguration(const std::string& folder);
        BackupResult    backupInflux(const std::string& date = {});
        BackupResult    backupGrafana();

      private:
        ProvisioningOrchestrator makeProvisioner() const;
        BackupOrchestrator       makeBackup() const;

        RunContext&                      m_ctx;
        diag::DiagnosticManager&         m_diag;
        addrspace::AddressSpaceExtractor m_extractor;
    };

} // namespace iot_prov
