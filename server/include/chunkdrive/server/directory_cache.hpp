#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/collaborators.hpp"
#include "chunkdrive/server/filesystem.hpp"

namespace chunkdrive::server
{

    // Directory listings served by LIST, cached per root-relative directory.
    class DirectoryCache : public CacheInvalidator
    {
    public:
        DirectoryCache(const Filesystem &filesystem, std::chrono::seconds ttl);

        std::vector<chunkdrive::protocol::FileMetadata> list(const std::string &path);

        // Drops the listing of `path_prefix` and of every directory below it.
        void invalidate(const std::string &path_prefix) override;

        std::size_t size() const;

    private:
        struct CachedListing
        {
            std::vector<chunkdrive::protocol::FileMetadata> entries;
            std::chrono::steady_clock::time_point loaded_at;
        };

        static std::string normalize(const std::string &path);

        const Filesystem &filesystem_;
        std::chrono::seconds ttl_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, CachedListing> listings_;
    };

} // namespace chunkdrive::server
