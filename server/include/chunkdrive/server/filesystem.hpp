#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/collaborators.hpp"

namespace chunkdrive::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(chunkdrive::ErrorCode code, std::string message);

        chunkdrive::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrive::ErrorCode code_;
    };

    // Storage root that final files are published into. Client paths are always
    // relative to the root and may not climb out of it.
    class Filesystem : public PathValidator
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        std::filesystem::path root() const;

        bool is_safe(const std::string &path) const override;

        // Throws FilesystemError(InvalidRequest) for an unsafe path.
        std::filesystem::path resolve(const std::string &requested) const;

        // Root-relative generic form, "." for the root itself.
        std::string relative(const std::filesystem::path &absolute) const;

        std::vector<chunkdrive::protocol::FileMetadata> list_directory(const std::string &path) const;

    private:
        std::filesystem::path base_;

        static bool is_internal(const std::filesystem::path &relative);
    };

} // namespace chunkdrive::server
