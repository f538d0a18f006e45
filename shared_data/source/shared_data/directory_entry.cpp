#include <shared_data/directory_entry.hpp>

#include <fmt/format.h>

namespace SharedData
{
    namespace
    {
        // Only the nine rwx bits travel, as an octal string like "0644".
        std::string permissionsToOctal(std::filesystem::perms permissions)
        {
            return fmt::format("{:04o}", static_cast<unsigned>(permissions & std::filesystem::perms::mask) & 0777u);
        }

        std::filesystem::perms permissionsFromOctal(std::string const& octal)
        {
            return static_cast<std::filesystem::perms>(std::stoul(octal, nullptr, 8) & 0777u);
        }
    }

    void to_json(nlohmann::json& j, DirectoryEntry const& entry)
    {
        j = nlohmann::json::object();
        j["path"] = entry.path.generic_string();
        to_json(j["type"], entry.type);
        j["size"] = entry.size;
        if (entry.permissions != std::filesystem::perms::unknown)
            j["permissions"] = permissionsToOctal(entry.permissions);
        if (entry.mtime)
            j["mtime"] = *entry.mtime;
    }

    void from_json(nlohmann::json const& j, DirectoryEntry& entry)
    {
        entry = {};
        entry.path = j.at("path").get<std::string>();
        from_json(j.at("type"), entry.type);
        entry.size = j.value("size", std::uint64_t{0});
        if (auto iter = j.find("permissions"); iter != j.end() && !iter->is_null())
            entry.permissions = permissionsFromOctal(iter->get<std::string>());
        if (auto iter = j.find("mtime"); iter != j.end() && !iter->is_null())
            entry.mtime = iter->get<std::uint64_t>();
    }
}
