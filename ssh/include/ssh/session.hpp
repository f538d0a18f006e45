#pragma once

#include <ssh/async/processing_thread.hpp>
#include <ssh/sftp_error.hpp>
#include <persistence/state/ssh_session_options.hpp>

#include <libssh/libsshpp.hpp>

#include <expected>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace SecureShell
{
    class SftpSession;

    /**
     * @brief An authenticated ssh connection. Owns the processing thread every libssh call of the connection runs on.
     */
    class Session
    {
      public:
        friend class SftpSession;
        friend class FileStream;

        Session();
        ~Session();
        Session(Session const&) = delete;
        Session& operator=(Session const&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        operator ssh::Session&()
        {
            return session_;
        }

        /**
         * @brief Starts the processing thread.
         */
        void start();

        /**
         * @brief Stops processing but does not close the session.
         */
        void stop();

        bool isRunning() const;

        /**
         * @brief Opens the sftp subsystem. The session must be started.
         */
        std::future<std::expected<std::weak_ptr<SftpSession>, SftpError>> createSftpSession();

        /**
         * @brief Closes all sftp sessions and disconnects. The session is not usable after this.
         */
        void shutdown();

      private:
        void sftpSessionRemoveItself(SftpSession* sftpSession);
        void removeAllSftpSessions();

      private:
        SecureShell::ProcessingThread processingThread_;
        ssh::Session session_;
        std::vector<std::shared_ptr<SftpSession>> sftpSessions_;
        bool isShutDown_;
    };

    using AskPassCallback = int (*)(char const* prompt, char* buf, std::size_t length, int echo, int verify, void* userdata);

    /**
     * @brief Connects and authenticates. Tries the agent, automatic public keys, the configured key, the configured
     * password and finally asks for a password, in that order.
     *
     * @param askPass Asks for key passphrases and passwords. May be null.
     */
    std::expected<std::unique_ptr<Session>, std::string>
    makeSession(Persistence::SshSessionOptions const& sessionOptions, AskPassCallback askPass, void* askPassUserData);
}
