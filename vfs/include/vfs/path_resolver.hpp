#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace Vfs
{
    /**
     * @brief Removes a "scheme://host[:port]" prefix. Returns "/" if nothing follows the host.
     * Input without a scheme is returned unchanged.
     */
    std::string stripRemoteAddressPrefix(std::string_view address);

    /**
     * @brief Resolves a remote address to an absolute POSIX path without "." or ".." segments.
     * ".." at the root stays at the root.
     *
     * @param address Absolute, relative or prefixed with a scheme and host.
     * @param base Resolves relative addresses. Must be absolute.
     */
    std::filesystem::path normalizeRemotePath(std::string_view address, std::filesystem::path const& base);

    /**
     * @brief Appends name to a remote directory with exactly one separator.
     */
    std::filesystem::path joinRemotePath(std::filesystem::path const& directory, std::string const& name);

    /**
     * @brief Resolves a local address against base, lexically, without a trailing separator.
     */
    std::filesystem::path normalizeLocalPath(std::string_view address, std::filesystem::path const& base);

    std::filesystem::path joinLocalPath(std::filesystem::path const& directory, std::string const& name);

    /**
     * @brief True if path equals ancestor or lies below it. Both must be normalized.
     */
    bool isSameOrInside(std::filesystem::path const& path, std::filesystem::path const& ancestor);
}
