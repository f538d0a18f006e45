#include <vfs/path_resolver.hpp>

#include <iterator>
#include <vector>

namespace Vfs
{
    std::string stripRemoteAddressPrefix(std::string_view address)
    {
        const auto schemeEnd = address.find("://");
        if (schemeEnd == std::string_view::npos)
            return std::string{address};

        const auto hostBegin = schemeEnd + 3;
        const auto pathBegin = address.find('/', hostBegin);
        if (pathBegin == std::string_view::npos)
            return "/";
        return std::string{address.substr(pathBegin)};
    }

    std::filesystem::path normalizeRemotePath(std::string_view address, std::filesystem::path const& base)
    {
        const auto stripped = stripRemoteAddressPrefix(address);

        std::string combined{};
        if (stripped.empty() || stripped.front() != '/')
            combined = base.generic_string() + "/" + stripped;
        else
            combined = stripped;

        std::vector<std::string_view> segments{};
        std::string_view rest{combined};
        while (!rest.empty())
        {
            const auto slash = rest.find('/');
            const auto segment = rest.substr(0, slash);
            rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

            if (segment.empty() || segment == ".")
                continue;
            if (segment == "..")
            {
                if (!segments.empty())
                    segments.pop_back();
                continue;
            }
            segments.push_back(segment);
        }

        std::string result{};
        for (auto const& segment : segments)
        {
            result += '/';
            result += segment;
        }
        if (result.empty())
            return "/";
        return result;
    }

    std::filesystem::path joinRemotePath(std::filesystem::path const& directory, std::string const& name)
    {
        auto dir = directory.generic_string();
        while (!dir.empty() && dir.back() == '/')
            dir.pop_back();
        std::string_view trimmedName{name};
        while (!trimmedName.empty() && trimmedName.front() == '/')
            trimmedName.remove_prefix(1);
        return dir + "/" + std::string{trimmedName};
    }

    std::filesystem::path normalizeLocalPath(std::string_view address, std::filesystem::path const& base)
    {
        std::filesystem::path path{std::string{address}};
        if (path.is_relative())
            path = base / path;

        auto normal = path.lexically_normal();
        // "/a/b/" normalizes to "/a/b/" with an empty filename.
        if (!normal.has_filename() && normal.has_relative_path())
            normal = normal.parent_path();
        return normal;
    }

    std::filesystem::path joinLocalPath(std::filesystem::path const& directory, std::string const& name)
    {
        return (directory / name).lexically_normal();
    }

    bool isSameOrInside(std::filesystem::path const& path, std::filesystem::path const& ancestor)
    {
        auto pathIter = path.begin();
        for (auto ancestorIter = ancestor.begin(); ancestorIter != ancestor.end(); ++ancestorIter, ++pathIter)
        {
            // A trailing empty element stems from a trailing separator.
            if (ancestorIter->empty() && std::next(ancestorIter) == ancestor.end())
                return true;
            if (pathIter == path.end() || *pathIter != *ancestorIter)
                return false;
        }
        return true;
    }
}
