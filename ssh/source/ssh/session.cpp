#include <ssh/session.hpp>
#include <ssh/sequential.hpp>
#include <ssh/sftp_session.hpp>
#include <log/log.hpp>

#include <fmt/format.h>
#include <libssh/sftp.h>

#include <algorithm>

namespace SecureShell
{
    Session::Session()
        : processingThread_{}
        , session_{}
        , sftpSessions_{}
        , isShutDown_{false}
    {}

    void Session::start()
    {
        processingThread_.start(std::chrono::milliseconds{100});
    }

    void Session::stop()
    {
        processingThread_.stop();
    }

    bool Session::isRunning() const
    {
        return processingThread_.isRunning();
    }

    void Session::shutdown()
    {
        if (isShutDown_)
            return;
        isShutDown_ = true;

        auto done = processingThread_.pushPromiseTask([this]() {
            removeAllSftpSessions();
            session_.disconnect();
        });
        if (!processingThread_.isRunning())
            processingThread_.stop();
        done.wait();
        processingThread_.stop();
    }

    Session::~Session()
    {
        shutdown();
    }

    void Session::sftpSessionRemoveItself(SftpSession* sftpSession)
    {
        auto it = std::find_if(sftpSessions_.begin(), sftpSessions_.end(), [sftpSession](const auto& s) {
            return s.get() == sftpSession;
        });
        if (it != sftpSessions_.end())
            sftpSessions_.erase(it);
    }

    void Session::removeAllSftpSessions()
    {
        auto sessions = std::move(sftpSessions_);
        sftpSessions_.clear();
        for (auto& sftp : sessions)
            sftp->close();
    }

    std::future<std::expected<std::weak_ptr<SftpSession>, SftpError>> Session::createSftpSession()
    {
        return processingThread_.pushPromiseTask([this]() -> std::expected<std::weak_ptr<SftpSession>, SftpError> {
            auto sftp = sftp_new(session_.getCSession());
            if (sftp == nullptr)
            {
                return std::unexpected(SftpError::fromLibrary(session_.getCSession()));
            }

            if (sftp_init(sftp) != SSH_OK)
            {
                auto error = SftpError::fromLibrary(session_.getCSession(), sftp);
                sftp_free(sftp);
                return std::unexpected(std::move(error));
            }

            auto sftpSession = std::make_shared<SftpSession>(this, processingThread_.createStrand(), sftp);
            sftpSessions_.push_back(sftpSession);
            return sftpSession;
        });
    }

    namespace
    {
        char const* authResultToString(int result)
        {
            switch (result)
            {
                case SSH_AUTH_SUCCESS:
                    return "Authentication success";
                case SSH_AUTH_DENIED:
                    return "Authentication denied";
                case SSH_AUTH_ERROR:
                    return "Authentication error";
                case SSH_AUTH_PARTIAL:
                    return "Partial authentication";
                case SSH_AUTH_AGAIN:
                    return "Authentication again";
                default:
                    return "Unknown authentication result";
            }
        }

        std::expected<void, std::string> verifyHost(ssh::Session& session, bool strict)
        {
            switch (ssh_session_is_known_server(session.getCSession()))
            {
                case SSH_KNOWN_HOSTS_OK:
                    return {};
                case SSH_KNOWN_HOSTS_CHANGED:
                    return std::unexpected(std::string{"Host key of the server changed, refusing to connect"});
                case SSH_KNOWN_HOSTS_OTHER:
                    return std::unexpected(std::string{"Server presented a key of another type than known"});
                case SSH_KNOWN_HOSTS_NOT_FOUND:
                case SSH_KNOWN_HOSTS_UNKNOWN:
                    if (strict)
                        return std::unexpected(std::string{"Server is not known and strict host key check is on"});
                    Log::warn("Session: Server is not in the known hosts file.");
                    return {};
                case SSH_KNOWN_HOSTS_ERROR:
                default:
                    return std::unexpected(fmt::format("Failed to verify host: {}", session.getError()));
            }
        }
    }

    std::expected<std::unique_ptr<Session>, std::string>
    makeSession(Persistence::SshSessionOptions const& sessionOptions, AskPassCallback askPass, void* askPassUserData)
    {
        auto session = std::make_unique<Session>();
        auto& sshSession = static_cast<ssh::Session&>(*session);
        auto const& sshOptions = sessionOptions.sshOptions;

        const bool tryAgent = sshOptions.tryAgentForAuthentication.value_or(false);

        auto result = Detail::sequential(
            [&] {
                if (sshOptions.logVerbosity)
                    return sshSession.setOption(SSH_OPTIONS_LOG_VERBOSITY_STR, sshOptions.logVerbosity.value().c_str());
                return 0;
            },
            [&] {
                int port = sessionOptions.port.value_or(22);
                return sshSession.setOption(SSH_OPTIONS_PORT, &port);
            },
            [&] {
                return sshSession.setOption(SSH_OPTIONS_HOST, sessionOptions.host.c_str());
            },
            [&] {
                if (sessionOptions.user.has_value())
                    return sshSession.setOption(SSH_OPTIONS_USER, sessionOptions.user.value().c_str());
                return 0;
            },
            [&] {
                if (sshOptions.sshDirectory.has_value())
                    return sshSession.setOption(
                        SSH_OPTIONS_SSH_DIR, sshOptions.sshDirectory.value().generic_string().c_str());
                return 0;
            },
            [&] {
                if (sshOptions.knownHostsFile.has_value())
                    return sshSession.setOption(
                        SSH_OPTIONS_KNOWNHOSTS, sshOptions.knownHostsFile.value().generic_string().c_str());
                return 0;
            },
            [&] {
                if (sshOptions.connectTimeoutSeconds.has_value())
                {
                    long timeout = sshOptions.connectTimeoutSeconds.value();
                    return sshSession.setOption(SSH_OPTIONS_TIMEOUT, &timeout);
                }
                return 0;
            },
            [&] {
                if (sshOptions.strictHostKeyCheck)
                {
                    int strict = sshOptions.strictHostKeyCheck.value() ? 1 : 0;
                    return sshSession.setOption(SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);
                }
                return 0;
            },
            [&] {
                if (sshOptions.proxyCommand)
                    return sshSession.setOption(SSH_OPTIONS_PROXYCOMMAND, sshOptions.proxyCommand.value().c_str());
                return 0;
            },
            [&] {
                return sshSession.connect();
            });

        if (!result.success())
        {
            return std::unexpected(fmt::format(
                "Failed to connect to {} (step {} of {}): {}",
                sessionOptions.host,
                result.index,
                result.total,
                sshSession.getError()));
        }

        if (auto verified = verifyHost(sshSession, sshOptions.strictHostKeyCheck.value_or(false)); !verified)
            return std::unexpected(verified.error());

        int authResult = SSH_AUTH_DENIED;
        if (tryAgent)
        {
            authResult = ssh_userauth_agent(sshSession.getCSession(), nullptr);
            if (authResult != SSH_AUTH_SUCCESS)
                Log::debug("Session: Agent authentication failed: {}", authResultToString(authResult));
        }

        if (authResult != SSH_AUTH_SUCCESS && sshOptions.usePublicKeyAutoAuth.value_or(false))
            authResult = sshSession.userauthPublickeyAuto();

        if (authResult != SSH_AUTH_SUCCESS && sessionOptions.sshKey)
        {
            const auto sshKey = sessionOptions.sshKey.value();

            ssh_key key{nullptr};
            const auto keyResult = Detail::sequential(
                [&sshKey, &key, askPass, askPassUserData]() {
                    return ssh_pki_import_privkey_file(sshKey.c_str(), nullptr, askPass, askPassUserData, &key);
                },
                [&key, &sshSession]() {
                    return sshSession.userauthPublickey(key);
                });
            if (key != nullptr)
                ssh_key_free(key);
            authResult = keyResult.success() ? SSH_AUTH_SUCCESS : keyResult.result;
            if (authResult != SSH_AUTH_SUCCESS)
                Log::debug("Session: Key authentication with '{}' failed.", sshKey);
        }

        if (authResult != SSH_AUTH_SUCCESS && sessionOptions.password)
            authResult = sshSession.userauthPassword(sessionOptions.password->c_str());

        if (authResult != SSH_AUTH_SUCCESS && askPass != nullptr)
        {
            std::string buf(1024, '\0');
            if (askPass("Password: ", buf.data(), buf.size(), 0, 0, askPassUserData) == 0)
                authResult = sshSession.userauthPassword(buf.c_str());
            std::fill(buf.begin(), buf.end(), '\0');
        }

        if (authResult != SSH_AUTH_SUCCESS)
            return std::unexpected(fmt::format("Failed to authenticate: {}", authResultToString(authResult)));

        return session;
    }
}
