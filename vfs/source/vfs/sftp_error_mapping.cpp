#include <vfs/sftp_error_mapping.hpp>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

namespace Vfs
{
    SharedData::ErrorKind errorKindFromSftp(SecureShell::SftpError const& error)
    {
        using enum SharedData::ErrorKind;

        if (error.raisedByWrapper() &&
            error.wrapperError != SecureShell::WrapperErrors::ShortWrite)
            return ConnectionLost;

        switch (error.sftpError)
        {
            case SSH_FX_NO_SUCH_FILE:
            case SSH_FX_NO_SUCH_PATH:
                return NotFound;
            case SSH_FX_PERMISSION_DENIED:
            case SSH_FX_WRITE_PROTECT:
                return PermissionDenied;
            case SSH_FX_FILE_ALREADY_EXISTS:
                return AlreadyExists;
            case SSH_FX_NO_CONNECTION:
            case SSH_FX_CONNECTION_LOST:
                return ConnectionLost;
            case SSH_FX_OK:
                if (error.sshError == SSH_FATAL)
                    return ConnectionLost;
                return Unknown;
            default:
                return Unknown;
        }
    }

    SharedData::Error errorFromSftp(SecureShell::SftpError const& error, std::string const& what)
    {
        return SharedData::Error{
            .kind = errorKindFromSftp(error),
            .message = what,
            .sftpError = error,
        };
    }
}
