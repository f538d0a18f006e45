#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <fmt/format.h>
#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <string>
#include <utility>

namespace SecureShell
{
    // Failures detected by this wrapper rather than reported by libssh.
    BOOST_DEFINE_ENUM_CLASS(
        WrapperErrors,
        None,
        OwnerNull,
        SharedPtrDestroyed,
        // The server accepted zero bytes of a write.
        ShortWrite,
        FileNull,
        // Tasks are no longer accepted because the sftp session is closing.
        SessionClosed);

    struct SftpError
    {
        std::string message;
        int sshError = 0;
        // One of the SSH_FX_* status codes, 0 if the server sent none.
        int sftpError = 0;
        WrapperErrors wrapperError = WrapperErrors::None;

        static SftpError fromWrapper(WrapperErrors kind, std::string message)
        {
            return SftpError{.message = std::move(message), .wrapperError = kind};
        }

        /// Collects the last error of the ssh session and, if given, of the sftp channel.
        static SftpError fromLibrary(ssh_session session, sftp_session sftp = nullptr)
        {
            return SftpError{
                .message = ssh_get_error(session),
                .sshError = ssh_get_error_code(session),
                .sftpError = sftp != nullptr ? sftp_get_error(sftp) : 0,
            };
        }

        bool raisedByWrapper() const
        {
            return wrapperError != WrapperErrors::None;
        }

        std::string toString() const
        {
            if (raisedByWrapper())
                return fmt::format("{} ({})", message, boost::describe::enum_to_string(wrapperError, "?"));
            return fmt::format("{} (ssh error {}, sftp status {})", message, sshError, sftpError);
        }
    };
}
