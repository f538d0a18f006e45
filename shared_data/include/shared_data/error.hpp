#pragma once

#include <shared_data/shared_data.hpp>
#include <ssh/sftp_error.hpp>
#include <utility/describe.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <system_error>

namespace SecureShell
{
    void to_json(nlohmann::json& j, WrapperErrors const& wrapperErrors);
    void from_json(nlohmann::json const& j, WrapperErrors& wrapperErrors);
    void to_json(nlohmann::json& j, SftpError const& sftpError);
    void from_json(nlohmann::json const& j, SftpError& sftpError);
}

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        ErrorKind,
        NotFound,
        PermissionDenied,
        AlreadyExists,
        NotADirectory,
        IsADirectory,
        NotEmpty,
        ConnectionLost,
        Cancelled,
        EmptySelection,
        // A rename would cross a device or file system boundary.
        CrossDevice,
        InvalidName,
        // Target is the source itself or inside of it.
        InvalidTarget,
        // Backend is in use by another transfer.
        Busy,
        Unknown);

    /**
     * @brief The error type of every fallible backend and transfer operation.
     */
    struct Error
    {
        ErrorKind kind{ErrorKind::Unknown};
        std::string message{};
        std::optional<SecureShell::SftpError> sftpError = std::nullopt;

        std::string toString() const
        {
            const auto enumString = boost::describe::enum_to_string(kind, "INVALID_ENUM_VALUE");
            if (sftpError.has_value())
            {
                if (!message.empty())
                    return fmt::format("{}: {}. {}.", enumString, message, sftpError->toString());
                return fmt::format("{}: {}.", enumString, sftpError->toString());
            }
            if (!message.empty())
                return fmt::format("{}: {}.", enumString, message);
            return enumString;
        }
    };

    inline Error makeError(ErrorKind kind, std::string message)
    {
        return Error{.kind = kind, .message = std::move(message)};
    }

    /**
     * @brief Maps an operating system error of a local file system call to an error kind.
     */
    ErrorKind errorKindFromErrorCode(std::error_code const& ec);

    /**
     * @brief Creates an error from a failed local file system call.
     *
     * @param ec The error code of the call.
     * @param what Describes what was attempted, e.g. "Cannot open '/tmp/a'".
     */
    Error errorFromErrorCode(std::error_code const& ec, std::string const& what);

    void to_json(nlohmann::json& j, Error const& error);
    void from_json(nlohmann::json const& j, Error& error);
}
