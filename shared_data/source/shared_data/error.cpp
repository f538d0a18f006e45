#include <shared_data/error.hpp>

namespace SecureShell
{
    void to_json(nlohmann::json& j, WrapperErrors const& wrapperErrors)
    {
        j = static_cast<int>(wrapperErrors);
    }
    void from_json(nlohmann::json const& j, WrapperErrors& wrapperErrors)
    {
        wrapperErrors = static_cast<WrapperErrors>(j.get<int>());
    }

    void to_json(nlohmann::json& j, SftpError const& sftpError)
    {
        j = nlohmann::json::object();
        j["message"] = sftpError.message;
        j["sshError"] = sftpError.sshError;
        j["sftpError"] = sftpError.sftpError;
        j["wrapperError"] = sftpError.wrapperError;
    }

    void from_json(nlohmann::json const& j, SftpError& sftpError)
    {
        sftpError.message = j.at("message").get<std::string>();
        sftpError.sshError = j.at("sshError").get<int>();
        sftpError.sftpError = j.at("sftpError").get<int>();
        sftpError.wrapperError = j.at("wrapperError").get<WrapperErrors>();
    }
}

namespace SharedData
{
    ErrorKind errorKindFromErrorCode(std::error_code const& ec)
    {
        using enum ErrorKind;

        if (ec == std::errc::no_such_file_or_directory)
            return NotFound;
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
            ec == std::errc::read_only_file_system)
            return PermissionDenied;
        if (ec == std::errc::file_exists)
            return AlreadyExists;
        if (ec == std::errc::not_a_directory)
            return NotADirectory;
        if (ec == std::errc::is_a_directory)
            return IsADirectory;
        if (ec == std::errc::directory_not_empty)
            return NotEmpty;
        if (ec == std::errc::cross_device_link)
            return CrossDevice;
        if (ec == std::errc::device_or_resource_busy)
            return Busy;
        return Unknown;
    }

    Error errorFromErrorCode(std::error_code const& ec, std::string const& what)
    {
        return Error{
            .kind = errorKindFromErrorCode(ec),
            .message = fmt::format("{}: {}", what, ec.message()),
        };
    }

    void to_json(nlohmann::json& j, Error const& error)
    {
        j = nlohmann::json::object();
        j["kind"] = Utility::enumToString(error.kind);
        j["message"] = error.message;
        if (error.sftpError)
            j["sftpError"] = *error.sftpError;
    }
    void from_json(nlohmann::json const& j, Error& error)
    {
        error.kind = Utility::enumFromString<ErrorKind>(j.at("kind").get<std::string>());
        error.message = j.at("message").get<std::string>();
        if (j.contains("sftpError"))
            error.sftpError = j.at("sftpError").get<SecureShell::SftpError>();
        else
            error.sftpError = std::nullopt;
    }
}
