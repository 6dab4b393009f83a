#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config_manager.hpp"

namespace iot_prov::remote
{

    class RemoteError : public std::runtime_error
    {
      public:
        using std::runtime_error::runtime_error;
    };

    class ConnectError : public RemoteError
    {
      public:
        using RemoteError::RemoteError;
    };

    class AuthError : public RemoteError
    {
      public:
        using RemoteError::RemoteError;
    };

    class TransferError : public RemoteError
    {
      public:
        using RemoteError::RemoteError;
    };

    class ExecError : public RemoteError
    {
      public:
        using RemoteError::RemoteError;
    };

    struct RemoteTarget
    {
        std::string hostAndPort;
        std::string username;
        std::string password;

        std::string host() const;
        uint16_t    port() const;
    };

    /**
     * One authenticated connection to the gateway. Every call blocks until
     * the transport finishes; failures are reported as RemoteError subclasses.
     */
    class RemoteSession
    {
      public:
        virtual ~RemoteSession() = default;

        virtual void uploadFile(const std::string& localPath, const std::string& remotePath, int mode = 0644) = 0;

        // Runs to completion and returns stdout only; exit status is not checked.
        virtual std::string execCommand(const std::string& command) = 0;

        virtual std::vector<std::string> listDirectory(const std::string& remotePath) = 0;

        virtual std::vector<uint8_t> downloadFile(const std::string& remotePath) = 0;
    };

    using SessionConnector = std::function<std::unique_ptr<RemoteSession>(const RemoteTarget&)>;

    struct SshSessionHandles;

    // libssh-backed session: exec channels, SCP for uploads, SFTP for listing and downloads.
    class SshSession : public RemoteSession
    {
      public:
        static std::unique_ptr<SshSession> connect(const RemoteTarget& target,
                                                   config::HostKeyPolicy policy = config::HostKeyPolicy::Ignore);

        ~SshSession() override;

        SshSession(const SshSession&)            = delete;
        SshSession& operator=(const SshSession&) = delete;

        void                     uploadFile(const std::string& localPath, const std::string& remotePath,
                                            int mode = 0644) override;
        std::string              execCommand(const std::string& command) override;
        std::vector<std::string> listDirectory(const std::string& remotePath) override;
        std::vector<uint8_t>     downloadFile(const std::string& remotePath) override;

      private:
        explicit SshSession(std::unique_ptr<SshSessionHandles> handles);

        void verifyHostKey(config::HostKeyPolicy policy, const RemoteTarget& target);
        void authenticate(const RemoteTarget& target);
        void ensureSftp();

        std::unique_ptr<SshSessionHandles> m_handles;
    };

    SessionConnector makeSshConnector(config::HostKeyPolicy policy);

} // namespace iot_prov::remote
