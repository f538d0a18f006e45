#pragma once

#include <shared_data/error.hpp>
#include <ssh/sftp_error.hpp>

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <expected>
#include <future>
#include <string>
#include <type_traits>

namespace Vfs
{
    SharedData::ErrorKind errorKindFromSftp(SecureShell::SftpError const& error);

    /**
     * @brief Creates an error from a failed sftp call.
     *
     * @param what Describes what was attempted, e.g. "Cannot stat '/srv'".
     */
    SharedData::Error errorFromSftp(SecureShell::SftpError const& error, std::string const& what);

    /**
     * @brief Waits for an sftp call to finish. A timeout or a session that went away is a lost connection.
     */
    template <typename T>
    std::expected<T, SharedData::Error> awaitSftp(
        std::future<std::expected<T, SecureShell::SftpError>> future,
        std::chrono::milliseconds timeout,
        std::string const& what)
    {
        if (future.wait_for(timeout) != std::future_status::ready)
        {
            return std::unexpected(SharedData::makeError(
                SharedData::ErrorKind::ConnectionLost, fmt::format("{}: operation timed out", what)));
        }

        try
        {
            auto result = future.get();
            if (!result)
                return std::unexpected(errorFromSftp(result.error(), what));
            if constexpr (std::is_void_v<T>)
                return {};
            else
                return std::move(result).value();
        }
        catch (std::exception const& exc)
        {
            return std::unexpected(
                SharedData::makeError(SharedData::ErrorKind::ConnectionLost, fmt::format("{}: {}", what, exc.what())));
        }
    }
}
