#include "chunkdrive/server/filesystem.hpp"

#include <chrono>

namespace chunkdrive::server
{

    FilesystemError::FilesystemError(chunkdrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr auto kInternalDir = ".chunkdrive";

        std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto sctp = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                       std::chrono::system_clock::now());
            return static_cast<std::uint64_t>(sctp.time_since_epoch().count());
        }

    } // namespace

    Filesystem::Filesystem(std::filesystem::path root) : base_(std::move(root))
    {
        std::filesystem::create_directories(base_);
        base_ = std::filesystem::canonical(base_);
    }

    std::filesystem::path Filesystem::root() const
    {
        return base_;
    }

    bool Filesystem::is_safe(const std::string &path) const
    {
        if (path.empty() || path.find('\0') != std::string::npos)
        {
            return false;
        }
        const std::filesystem::path relative = path;
        if (relative.is_absolute() || relative.has_root_name())
        {
            return false;
        }
        for (const auto &part : relative)
        {
            if (part == "..")
            {
                return false;
            }
        }
        return !is_internal(relative.lexically_normal());
    }

    std::filesystem::path Filesystem::resolve(const std::string &requested) const
    {
        if (!is_safe(requested))
        {
            throw FilesystemError(chunkdrive::ErrorCode::InvalidRequest, "Unsafe path: " + requested);
        }
        auto resolved = (base_ / requested).lexically_normal();
        if (resolved.filename().empty())
        {
            resolved = resolved.parent_path();
        }
        return resolved;
    }

    std::string Filesystem::relative(const std::filesystem::path &absolute) const
    {
        auto rel = absolute.lexically_relative(base_).generic_string();
        if (rel.empty())
        {
            return ".";
        }
        return rel;
    }

    std::vector<chunkdrive::protocol::FileMetadata> Filesystem::list_directory(const std::string &path) const
    {
        const auto target = resolve(path);
        if (!std::filesystem::exists(target))
        {
            throw FilesystemError(chunkdrive::ErrorCode::NotFound, "Path does not exist");
        }
        if (!std::filesystem::is_directory(target))
        {
            throw FilesystemError(chunkdrive::ErrorCode::InvalidRequest, "Target is not a directory");
        }
        std::vector<chunkdrive::protocol::FileMetadata> entries;
        for (const auto &entry : std::filesystem::directory_iterator(target))
        {
            const auto rel = entry.path().lexically_relative(base_);
            if (is_internal(rel))
            {
                continue;
            }
            chunkdrive::protocol::FileMetadata metadata{};
            metadata.path = rel.generic_string();
            metadata.is_directory = entry.is_directory();
            metadata.size = metadata.is_directory ? 0 : entry.file_size();
            metadata.modified_time = to_unix_time(entry.last_write_time());
            entries.push_back(std::move(metadata));
        }
        return entries;
    }

    bool Filesystem::is_internal(const std::filesystem::path &relative)
    {
        auto it = relative.begin();
        return it != relative.end() && *it == kInternalDir;
    }

} // namespace chunkdrive::server
