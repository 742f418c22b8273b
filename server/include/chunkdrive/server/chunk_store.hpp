#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkdrive::server
{

    class StorageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Staged chunk payloads, one directory per upload: <root>/<upload_id>/chunk_<index>.
    // Writes land in a temporary file first and are renamed into place, so readers
    // never observe a partially written chunk and a retried index simply replaces it.
    class ChunkStore
    {
    public:
        explicit ChunkStore(std::filesystem::path staging_root);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path upload_directory(const std::string &upload_id) const;
        std::filesystem::path chunk_path(const std::string &upload_id, std::uint64_t index) const;

        // Scratch file a merge writes into before publishing the result.
        std::filesystem::path scratch_path(const std::string &upload_id) const;

        void prepare(const std::string &upload_id);

        void write(const std::string &upload_id, std::uint64_t index, std::span<const std::byte> payload);

        std::vector<std::byte> read(const std::string &upload_id, std::uint64_t index) const;

        bool exists(const std::string &upload_id, std::uint64_t index) const;

        std::set<std::uint64_t> list_indices(const std::string &upload_id) const;

        // Upload ids that currently own a staging directory.
        std::vector<std::string> list_uploads() const;

        std::filesystem::file_time_type last_write_time(const std::string &upload_id) const;

        void delete_all(const std::string &upload_id);

    private:
        std::filesystem::path root_;
    };

} // namespace chunkdrive::server
