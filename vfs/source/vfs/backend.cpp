#include <vfs/backend.hpp>
#include <log/log.hpp>

#include <utility>

namespace Vfs
{
    BackendLease::BackendLease(Backend* backend)
        : backend_{backend}
    {}

    BackendLease::~BackendLease()
    {
        release();
    }

    BackendLease::BackendLease(BackendLease&& other) noexcept
        : backend_{std::exchange(other.backend_, nullptr)}
    {}

    BackendLease& BackendLease::operator=(BackendLease&& other) noexcept
    {
        if (this != &other)
        {
            release();
            backend_ = std::exchange(other.backend_, nullptr);
        }
        return *this;
    }

    void BackendLease::release()
    {
        if (backend_ != nullptr)
        {
            backend_->leased_.store(false);
            backend_ = nullptr;
        }
    }

    std::optional<BackendLease> Backend::tryLease()
    {
        bool expected = false;
        if (!leased_.compare_exchange_strong(expected, true))
            return std::nullopt;
        return BackendLease{this};
    }

    bool Backend::isLeased() const
    {
        return leased_.load();
    }

    bool Backend::isDirectory(std::filesystem::path const& path)
    {
        const auto entry = stat(path);
        if (!entry)
        {
            if (entry.error().kind != ErrorKind::NotFound)
                Log::debug("Backend: Cannot stat '{}': {}", path.generic_string(), entry.error().toString());
            return false;
        }
        return entry->isDirectory();
    }

    bool Backend::isFile(std::filesystem::path const& path)
    {
        const auto entry = stat(path);
        if (!entry)
        {
            if (entry.error().kind != ErrorKind::NotFound)
                Log::debug("Backend: Cannot stat '{}': {}", path.generic_string(), entry.error().toString());
            return false;
        }
        return entry->isRegularFile();
    }

    std::expected<std::vector<SharedData::DirectoryEntry>, Error> Backend::listAll(std::filesystem::path const& path)
    {
        auto listing = listEntries(path);
        if (!listing)
            return std::unexpected(std::move(listing).error());

        std::vector<SharedData::DirectoryEntry> entries{};
        while (true)
        {
            auto entry = (*listing)->next();
            if (!entry)
                return std::unexpected(std::move(entry).error());
            if (!entry->has_value())
                break;
            entries.push_back(std::move(entry->value()));
        }
        return entries;
    }
}
