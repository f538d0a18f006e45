#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace Utility
{
    class BaseDirectoryWalker
    {
      public:
        virtual ~BaseDirectoryWalker() = default;

        std::uint64_t totalBytes() const
        {
            return totalBytes_;
        }
        std::size_t currentIndex() const
        {
            return currentIndex_;
        }
        virtual std::size_t totalEntries() const = 0;

        virtual bool completed() const = 0;

      protected:
        std::size_t currentIndex_{0};
        std::uint64_t totalBytes_{0};
    };

    /**
     * @brief Breadth first walker over a directory tree. Entries are collected flat, each child refers to its
     * directory by index so the tree can be reconstructed with fullPath.
     *
     * The scanner must never yield "." or "..".
     */
    template <typename EntryT, typename WalkErrorType, typename ScannerT>
    requires std::
        is_invocable_r_v<std::expected<std::vector<EntryT>, WalkErrorType>, ScannerT, std::filesystem::path const&>
        class DeepDirectoryWalker : public BaseDirectoryWalker
    {
      public:
        template <typename ForwardingScannerT = ScannerT>
        requires std::is_same_v<std::decay_t<ForwardingScannerT>, ScannerT>
        DeepDirectoryWalker(std::filesystem::path rootPath, ForwardingScannerT&& scanner)
            : rootPath_{std::move(rootPath)}
            , scanner_{std::forward<ForwardingScannerT>(scanner)}
            , entries_{makeRoot()}
        {}

        std::vector<EntryT> ejectEntries() &&
        {
            return std::move(entries_);
        }

        std::vector<EntryT> const& entries() const
        {
            return entries_;
        }

        std::size_t totalEntries() const override
        {
            return entries_.size();
        }

        void reset()
        {
            entries_ = {makeRoot()};
            currentIndex_ = 0;
            totalBytes_ = 0;
        }

        /**
         * @brief Scans the next directory and accounts all non directories before it.
         *
         * @return std::expected<bool, WalkErrorType> Returns false if there are more entries to process, true if done.
         * On error returns unexpected with the error. The failing directory is skipped on the next call.
         */
        std::expected<bool, WalkErrorType> walk()
        {
            for (; currentIndex_ < entries_.size(); ++currentIndex_)
            {
                auto const& current = entries_[currentIndex_];
                if (current.isRegularFile())
                    totalBytes_ += current.size;
                else if (current.isDirectory())
                    break;
            }

            if (completed())
                return true;

            const auto index = currentIndex_++;
            auto result = scanner_(fullPath(entries_[index]));
            if (!result)
                return std::unexpected(std::move(result).error());

            adoptEntries(std::move(result).value(), index);
            return completed();
        }

        std::filesystem::path fullPath(EntryT const& entry) const
        {
            if (entry.parent)
            {
                const auto parentIndex = entry.parent.value();
                if (parentIndex >= entries_.size())
                    throw std::out_of_range("Parent index is out of range");
                return fullPath(entries_[parentIndex]) / entry.path;
            }
            else
                return entry.path;
        }

        std::expected<void, WalkErrorType> walkAll()
        {
            decltype(walk()) res;
            do
            {
                res = walk();
                if (!res)
                    return std::unexpected(std::move(res).error());
            } while (!res.value());
            return {};
        }

        bool completed() const override
        {
            return currentIndex_ >= entries_.size();
        }

      private:
        EntryT makeRoot() const
        {
            EntryT root{};
            root.path = rootPath_;
            root.type = EntryT::FileType::Directory;
            return root;
        }

        void adoptEntries(std::vector<EntryT>&& newEntries, std::size_t parent)
        {
            entries_.reserve(entries_.size() + newEntries.size());
            for (auto& entry : newEntries)
            {
                entry.parent = parent;
                entries_.push_back(std::move(entry));
            }
        }

      private:
        std::filesystem::path rootPath_;
        ScannerT scanner_;
        std::vector<EntryT> entries_{};
    };
}
