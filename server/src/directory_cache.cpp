#include "chunkdrive/server/directory_cache.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    DirectoryCache::DirectoryCache(const Filesystem &filesystem, std::chrono::seconds ttl)
        : filesystem_(filesystem), ttl_(ttl) {}

    std::vector<chunkdrive::protocol::FileMetadata> DirectoryCache::list(const std::string &path)
    {
        const auto key = normalize(path);
        const auto now = std::chrono::steady_clock::now();
        {
            std::lock_guard lock(mutex_);
            auto it = listings_.find(key);
            if (it != listings_.end() && now - it->second.loaded_at < ttl_)
            {
                return it->second.entries;
            }
        }

        auto entries = filesystem_.list_directory(key);
        std::lock_guard lock(mutex_);
        listings_[key] = CachedListing{.entries = entries, .loaded_at = now};
        return entries;
    }

    void DirectoryCache::invalidate(const std::string &path_prefix)
    {
        const auto prefix = normalize(path_prefix);
        std::size_t dropped = 0;
        std::lock_guard lock(mutex_);
        for (auto it = listings_.begin(); it != listings_.end();)
        {
            const auto &key = it->first;
            const bool below = prefix == "." || key == prefix ||
                               (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0 &&
                                key[prefix.size()] == '/');
            if (below)
            {
                it = listings_.erase(it);
                ++dropped;
            }
            else
            {
                ++it;
            }
        }
        spdlog::debug("Invalidated {} cached listing(s) under {}", dropped, prefix);
    }

    std::size_t DirectoryCache::size() const
    {
        std::lock_guard lock(mutex_);
        return listings_.size();
    }

    std::string DirectoryCache::normalize(const std::string &path)
    {
        auto normal = std::filesystem::path(path.empty() ? "." : path).lexically_normal().generic_string();
        while (normal.size() > 1 && normal.back() == '/')
        {
            normal.pop_back();
        }
        return normal.empty() ? std::string{"."} : normal;
    }

} // namespace chunkdrive::server
