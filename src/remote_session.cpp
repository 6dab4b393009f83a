#include "remote_session.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <type_traits>

#include <fcntl.h>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

namespace iot_prov::remote
{

    struct SshSessionHandles
    {
        ssh_session  session{nullptr};
        sftp_session sftp{nullptr};

        ~SshSessionHandles()
        {
            if (sftp)
                sftp_free(sftp);
            if (session)
            {
                if (ssh_is_connected(session))
                    ssh_disconnect(session);
                ssh_free(session);
            }
        }
    };

    namespace
    {

        struct ChannelDeleter
        {
            void operator()(ssh_channel channel) const
            {
                if (ssh_channel_is_open(channel))
                    ssh_channel_close(channel);
                ssh_channel_free(channel);
            }
        };

        struct ScpDeleter
        {
            void operator()(ssh_scp scp) const
            {
                ssh_scp_close(scp);
                ssh_scp_free(scp);
            }
        };

        struct SftpDirDeleter
        {
            void operator()(sftp_dir dir) const { sftp_closedir(dir); }
        };

        struct SftpFileDeleter
        {
            void operator()(sftp_file file) const { sftp_close(file); }
        };

        struct SftpAttributesDeleter
        {
            void operator()(sftp_attributes attr) const { sftp_attributes_free(attr); }
        };

        using ChannelPtr    = std::unique_ptr<std::remove_pointer_t<ssh_channel>, ChannelDeleter>;
        using ScpPtr        = std::unique_ptr<std::remove_pointer_t<ssh_scp>, ScpDeleter>;
        using SftpDirPtr    = std::unique_ptr<std::remove_pointer_t<sftp_dir>, SftpDirDeleter>;
        using SftpFilePtr   = std::unique_ptr<std::remove_pointer_t<sftp_file>, SftpFileDeleter>;
        using SftpAttrPtr   = std::unique_ptr<std::remove_pointer_t<sftp_attributes>, SftpAttributesDeleter>;

        constexpr std::size_t kReadChunk = 16384;

        std::string sshError(ssh_session session)
        {
            const char* msg = ssh_get_error(session);
            return (msg && *msg) ? msg : "unknown error";
        }

        std::string sftpError(ssh_session session, sftp_session sftp)
        {
            return sshError(session) + " (sftp code " + std::to_string(sftp_get_error(sftp)) + ")";
        }

    } // namespace

    std::string RemoteTarget::host() const
    {
        auto pos = hostAndPort.rfind(':');
        return pos == std::string::npos ? hostAndPort : hostAndPort.substr(0, pos);
    }

    uint16_t RemoteTarget::port() const
    {
        config::validateHostPort(hostAndPort);
        return static_cast<uint16_t>(std::stoul(hostAndPort.substr(hostAndPort.rfind(':') + 1)));
    }

    SshSession::SshSession(std::unique_ptr<SshSessionHandles> handles) : m_handles(std::move(handles)) {}

    SshSession::~SshSession() = default;

    std::unique_ptr<SshSession> SshSession::connect(const RemoteTarget& target, config::HostKeyPolicy policy)
    {
        const auto   host = target.host();
        unsigned int port = target.port();

        auto handles     = std::make_unique<SshSessionHandles>();
        handles->session = ssh_new();
        if (!handles->session)
            throw ConnectError("Unable to allocate SSH session for " + target.hostAndPort);

        ssh_session s = handles->session;
        if (ssh_options_set(s, SSH_OPTIONS_HOST, host.c_str()) != SSH_OK ||
            ssh_options_set(s, SSH_OPTIONS_PORT, &port) != SSH_OK ||
            ssh_options_set(s, SSH_OPTIONS_USER, target.username.c_str()) != SSH_OK)
            throw ConnectError("Unable to configure SSH session for " + target.hostAndPort + ": " + sshError(s));

        if (ssh_connect(s) != SSH_OK)
            throw ConnectError("Unable to connect to " + target.hostAndPort + ": " + sshError(s));

        std::unique_ptr<SshSession> session(new SshSession(std::move(handles)));
        session->verifyHostKey(policy, target);
        session->authenticate(target);
        return session;
    }

    void SshSession::verifyHostKey(config::HostKeyPolicy policy, const RemoteTarget& target)
    {
        if (policy == config::HostKeyPolicy::Ignore)
            return;

        ssh_session s = m_handles->session;
        switch (ssh_session_is_known_server(s))
        {
        case SSH_KNOWN_HOSTS_OK:
            return;
        case SSH_KNOWN_HOSTS_CHANGED:
            throw ConnectError("Host key for " + target.hostAndPort +
                               " changed; connection stopped for security reasons");
        case SSH_KNOWN_HOSTS_OTHER:
            throw ConnectError("Host key for " + target.hostAndPort +
                               " was not found but a key of another type exists");
        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
            if (policy == config::HostKeyPolicy::Strict)
                throw ConnectError("Host key for " + target.hostAndPort + " is not known");
            if (ssh_session_update_known_hosts(s) != SSH_OK)
                throw ConnectError("Unable to record host key for " + target.hostAndPort + ": " + sshError(s));
            return;
        case SSH_KNOWN_HOSTS_ERROR:
            break;
        }
        throw ConnectError("Host key check failed for " + target.hostAndPort + ": " + sshError(s));
    }

    void SshSession::authenticate(const RemoteTarget& target)
    {
        ssh_session s  = m_handles->session;
        int         rc = ssh_userauth_password(s, nullptr, target.password.c_str());
        if (rc != SSH_AUTH_SUCCESS)
            throw AuthError("Authentication as '" + target.username + "' on " + target.hostAndPort +
                            " failed: " + sshError(s));
    }

    void SshSession::uploadFile(const std::string& localPath, const std::string& remotePath, int mode)
    {
        std::ifstream ifs(localPath, std::ios::binary);
        if (!ifs)
            throw TransferError("Unable to read local file " + localPath);
        std::vector<char> contents((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (ifs.bad())
            throw TransferError("Unable to read local file " + localPath);

        auto        slash     = remotePath.rfind('/');
        std::string remoteDir = slash == std::string::npos ? "." : (slash == 0 ? "/" : remotePath.substr(0, slash));
        std::string fileName  = slash == std::string::npos ? remotePath : remotePath.substr(slash + 1);

        ssh_session s = m_handles->session;
        ScpPtr      scp(ssh_scp_new(s, SSH_SCP_WRITE, remoteDir.c_str()));
        if (!scp)
            throw TransferError("Unable to open SCP channel: " + sshError(s));
        if (ssh_scp_init(scp.get()) != SSH_OK)
            throw TransferError("Unable to start SCP transfer to " + remoteDir + ": " + sshError(s));
        if (ssh_scp_push_file(scp.get(), fileName.c_str(), contents.size(), mode) != SSH_OK)
            throw TransferError("Remote rejected " + remotePath + ": " + sshError(s));
        if (!contents.empty() && ssh_scp_write(scp.get(), contents.data(), contents.size()) != SSH_OK)
            throw TransferError("Failed writing " + remotePath + ": " + sshError(s));
    }

    std::string SshSession::execCommand(const std::string& command)
    {
        ssh_session s = m_handles->session;
        ChannelPtr  channel(ssh_channel_new(s));
        if (!channel)
            throw ExecError("Unable to allocate channel for '" + command + "': " + sshError(s));
        if (ssh_channel_open_session(channel.get()) != SSH_OK)
            throw ExecError("Unable to open channel for '" + command + "': " + sshError(s));
        if (ssh_channel_request_exec(channel.get(), command.c_str()) != SSH_OK)
            throw ExecError("Unable to execute '" + command + "': " + sshError(s));

        std::string output;
        char        buf[kReadChunk];
        int         n = 0;
        while ((n = ssh_channel_read(channel.get(), buf, sizeof(buf), 0)) > 0)
            output.append(buf, static_cast<std::size_t>(n));
        if (n < 0)
            throw ExecError("Failed reading output of '" + command + "': " + sshError(s));

        return output;
    }

    void SshSession::ensureSftp()
    {
        if (m_handles->sftp)
            return;

        ssh_session  s    = m_handles->session;
        sftp_session sftp = sftp_new(s);
        if (!sftp)
            throw TransferError("Unable to open SFTP channel: " + sshError(s));
        if (sftp_init(sftp) != SSH_OK)
        {
            auto msg = sftpError(s, sftp);
            sftp_free(sftp);
            throw TransferError("Unable to initialise SFTP: " + msg);
        }
        m_handles->sftp = sftp;
    }

    std::vector<std::string> SshSession::listDirectory(const std::string& remotePath)
    {
        ensureSftp();
        ssh_session  s    = m_handles->session;
        sftp_session sftp = m_handles->sftp;

        SftpDirPtr dir(sftp_opendir(sftp, remotePath.c_str()));
        if (!dir)
            throw TransferError("Unable to list remote directory " + remotePath + ": " + sftpError(s, sftp));

        std::vector<std::string> names;
        while (SftpAttrPtr attr{sftp_readdir(sftp, dir.get())})
        {
            if (!attr->name || attr->type != SSH_FILEXFER_TYPE_REGULAR)
                continue;
            std::string name(attr->name);
            if (name == "." || name == "..")
                continue;
            names.push_back(std::move(name));
        }
        if (!sftp_dir_eof(dir.get()))
            throw TransferError("Listing of " + remotePath + " ended early: " + sftpError(s, sftp));

        std::sort(names.begin(), names.end());
        return names;
    }

    std::vector<uint8_t> SshSession::downloadFile(const std::string& remotePath)
    {
        ensureSftp();
        ssh_session  s    = m_handles->session;
        sftp_session sftp = m_handles->sftp;

        SftpFilePtr file(sftp_open(sftp, remotePath.c_str(), O_RDONLY, 0));
        if (!file)
            throw TransferError("Unable to open remote file " + remotePath + ": " + sftpError(s, sftp));

        std::vector<uint8_t> data;
        uint8_t              buf[kReadChunk];
        ssize_t              n = 0;
        while ((n = sftp_read(file.get(), buf, sizeof(buf))) > 0)
            data.insert(data.end(), buf, buf + n);
        if (n < 0)
            throw TransferError("Failed reading remote file " + remotePath + ": " + sftpError(s, sftp));
        return data;
    }

    SessionConnector makeSshConnector(config::HostKeyPolicy policy)
    {
        return [policy](const RemoteTarget& target) -> std::unique_ptr<RemoteSession>
        { return SshSession::connect(target, policy); };
    }

} // namespace iot_prov::remote
