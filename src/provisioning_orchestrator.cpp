#include "provisioning_orchestrator.hpp"

#include "diagnostic_manager.hpp"

#include <filesystem>
#include <thread>

namespace iot_prov
{

    namespace
    {
        constexpr const char* kComponent = "Provisioning";

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

    ProvisioningOrchestrator::ProvisioningOrchestrator(remote::SessionConnector connector,
                                                       diag::DiagnosticManager& diag, ServiceProfile profile,
                                                       std::chrono::milliseconds settleDelay)
        : m_connector(std::move(connector)), m_diag(diag), m_profile(std::move(profile)), m_settleDelay(settleDelay)
    {
    }

    void ProvisioningOrchestrator::transition(ProvisionState next)
    {
        m_state = next;
        m_diag.log(diag::Severity::DEBUG, kComponent, std::string("State -> ") + provisionStateToString(next));
    }

    ProvisionResult ProvisioningOrchestrator::run(const remote::RemoteTarget& target,
                                                  const std::string& localConfigPath)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(localConfigPath, ec))
            throw remote::TransferError("Local config file " + localConfigPath + " does not exist");

        transition(ProvisionState::Uploading);
        auto session = m_connector(target);

        m_diag.log(diag::Severity::INFO, kComponent, "Sending file ..");
        session->uploadFile(localConfigPath, m_profile.remoteConfigPath, 0644);
        m_diag.log(diag::Severity::INFO, kComponent, "Uploaded " + localConfigPath + " to " + m_profile.remoteConfigPath);

        transition(ProvisionState::Restarting);
        m_diag.log(diag::Severity::INFO, kComponent, "Restarting telegraf service on the remote host ..");
        session->execCommand(m_profile.restartCommand);

        m_diag.log(diag::Severity::INFO, kComponent, "Waiting for the service to start ..");
        if (m_settleDelay.count() > 0)
            std::this_thread::sleep_for(m_settleDelay);

        transition(ProvisionState::Verifying);
        ProvisionResult result;
        result.serviceStatus = trim(session->execCommand(m_profile.activeCheckCommand));
        result.serviceActive = result.serviceStatus == "active";

        if (result.serviceActive)
        {
            m_diag.log(diag::Severity::INFO, kComponent,
                       "Telegraf service restarted successfully. Current status: " + result.serviceStatus);
            transition(ProvisionState::Done);
            return result;
        }

        m_diag.log(diag::Severity::WARN, kComponent,
                   "Telegraf service restarted, but it's not active. Current status: " + result.serviceStatus);

        transition(ProvisionState::Diagnosing);
        result.diagnostics.push_back(runDiagnostic(*session, "Detailed Telegraf status", m_profile.detailedStatusCommand));
        result.diagnostics.push_back(runDiagnostic(*session, "Recent Telegraf logs", m_profile.logTailCommand));
        result.diagnostics.push_back(
            runDiagnostic(*session, "Latest Telegraf error logs", m_profile.errorLogTailCommand));

        const auto& errors = result.diagnostics.back();
        if (!errors.error && trim(errors.output).empty())
            m_diag.log(diag::Severity::INFO, kComponent, "No recent error logs found for Telegraf.");

        transition(ProvisionState::Done);
        return result;
    }

    DiagnosticStep ProvisioningOrchestrator::runDiagnostic(remote::RemoteSession& session, const std::string& label,
                                                           const std::string& command)
    {
        DiagnosticStep step;
        step.label   = label;
        step.command = command;
        try
        {
            step.output = session.execCommand(command);
            m_diag.log(diag::Severity::DEBUG, kComponent, label + ":\n" + step.output);
        }
        catch (const remote::RemoteError& ex)
        {
            step.error = ex.what();
            m_diag.log(diag::Severity::ERROR, kComponent, label + " unavailable: " + ex.what());
        }
        return step;
    }

    const char* provisionStateToString(ProvisionState state)
    {
        switch (state)
        {
        case ProvisionState::Uploading:
            return "Uploading";
        case ProvisionState::Restarting:
            return "Restarting";
        case ProvisionState::Verifying:
            return "Verifying";
        case ProvisionState::Diagnosing:
            return "Diagnosing";
        case ProvisionState::Done:
            return "Done";
        }
        return "Done";
    }

} // namespace iot_prov
