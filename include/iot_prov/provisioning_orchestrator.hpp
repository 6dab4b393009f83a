#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "remote_session.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace iot_prov
{

    // Remote side of the agent service being provisioned.
    struct ServiceProfile
    {
        std::string remoteConfigPath{"/etc/telegraf/telegraf.conf"};
        std::string restartCommand{"sudo systemctl restart telegraf"};
        std::string activeCheckCommand{"systemctl is-active --quiet telegraf && echo 'active' || echo 'failed'"};
        std::string detailedStatusCommand{"sudo systemctl status telegraf"};
        std::string logTailCommand{"tail -n 20 /var/log/telegraf/telegraf.log"};
        std::string errorLogTailCommand{"tail -n 10 /var/log/telegraf/telegraf.log | grep 'E!'"};
    };

    enum class ProvisionState
    {
        Uploading,
        Restarting,
        Verifying,
        Diagnosing,
        Done
    };

    struct DiagnosticStep
    {
        std::string                label;
        std::string                command;
        std::string                output;
        std::optional<std::string> error;
    };

    struct ProvisionResult
    {
        bool                        serviceActive{false};
        std::string                 serviceStatus;
        std::vector<DiagnosticStep> diagnostics;
    };

    /**
     * Upload -> restart -> settle -> verify, and when the service does not
     * come back active, run the diagnostic commands one after another.
     * Upload and restart failures propagate; a failing diagnostic command is
     * recorded on its step and the remaining ones still run.
     */
    class ProvisioningOrchestrator
    {
      public:
        ProvisioningOrchestrator(remote::SessionConnector connector, diag::DiagnosticManager& diag,
                                 ServiceProfile profile = {},
                                 std::chrono::milliseconds settleDelay = std::chrono::seconds(5));

        ProvisionResult run(const remote::RemoteTarget& target, const std::string& localConfigPath);

        ProvisionState state() const { return m_state; }

      private:
        void           transition(ProvisionState next);
        DiagnosticStep runDiagnostic(remote::RemoteSession& session, const std::string& label,
                                     const std::string& command);

        remote::SessionConnector  m_connector;
        diag::DiagnosticManager&  m_diag;
        ServiceProfile            m_profile;
        std::chrono::milliseconds m_settleDelay;
        ProvisionState            m_state{ProvisionState::Done};
    };

    const char* provisionStateToString(ProvisionState state);

} // namespace iot_prov
