#include "chunkdrive/server/chunk_store.hpp"

#include <atomic>
#include <charconv>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <thread>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::string_view kChunkPrefix = "chunk_";
        constexpr auto kScratchName = "merged.part";

        void require_upload_id(const std::string &upload_id)
        {
            if (!crypto::is_upload_id(upload_id))
            {
                throw StorageError("Malformed upload id: " + upload_id);
            }
        }

        std::filesystem::path temporary_sibling(const std::filesystem::path &target)
        {
            static std::atomic<std::uint64_t> counter{0};
            std::ostringstream name;
            name << target.filename().string() << ".tmp-" << std::hash<std::thread::id>{}(std::this_thread::get_id())
                 << '-' << counter.fetch_add(1, std::memory_order_relaxed);
            return target.parent_path() / name.str();
        }

        std::optional<std::uint64_t> parse_chunk_index(const std::string &filename)
        {
            if (filename.size() <= kChunkPrefix.size() || filename.compare(0, kChunkPrefix.size(), kChunkPrefix) != 0)
            {
                return std::nullopt;
            }
            const auto *begin = filename.data() + kChunkPrefix.size();
            const auto *end = filename.data() + filename.size();
            std::uint64_t index = 0;
            const auto [ptr, ec] = std::from_chars(begin, end, index);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return index;
        }

    } // namespace

    ChunkStore::ChunkStore(std::filesystem::path staging_root) : root_(std::move(staging_root))
    {
        std::filesystem::create_directories(root_);
    }

    std::filesystem::path ChunkStore::upload_directory(const std::string &upload_id) const
    {
        require_upload_id(upload_id);
        return root_ / upload_id;
    }

    std::filesystem::path ChunkStore::chunk_path(const std::string &upload_id, std::uint64_t index) const
    {
        return upload_directory(upload_id) / (std::string(kChunkPrefix) + std::to_string(index));
    }

    std::filesystem::path ChunkStore::scratch_path(const std::string &upload_id) const
    {
        return upload_directory(upload_id) / kScratchName;
    }

    void ChunkStore::prepare(const std::string &upload_id)
    {
        std::error_code ec;
        std::filesystem::create_directories(upload_directory(upload_id), ec);
        if (ec)
        {
            throw StorageError("Failed to create staging directory for " + upload_id + ": " + ec.message());
        }
    }

    void ChunkStore::write(const std::string &upload_id, std::uint64_t index, std::span<const std::byte> payload)
    {
        prepare(upload_id);
        const auto target = chunk_path(upload_id, index);
        const auto temp = temporary_sibling(target);
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError("Failed to open " + temp.string() + " for writing");
            }
            out.write(reinterpret_cast<const char *>(payload.data()), static_cast<std::streamsize>(payload.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                throw StorageError("Failed to write chunk " + std::to_string(index) + " of " + upload_id);
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            throw StorageError("Failed to publish chunk " + std::to_string(index) + " of " + upload_id + ": " +
                               ec.message());
        }
    }

    std::vector<std::byte> ChunkStore::read(const std::string &upload_id, std::uint64_t index) const
    {
        const auto path = chunk_path(upload_id, index);
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw StorageError("Chunk " + std::to_string(index) + " of " + upload_id + " is not staged");
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw StorageError("Failed to stat " + path.string() + ": " + ec.message());
        }
        std::vector<std::byte> data(static_cast<std::size_t>(size));
        in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != size)
        {
            throw StorageError("Short read on " + path.string());
        }
        return data;
    }

    bool ChunkStore::exists(const std::string &upload_id, std::uint64_t index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(upload_id, index), ec);
    }

    std::set<std::uint64_t> ChunkStore::list_indices(const std::string &upload_id) const
    {
        std::set<std::uint64_t> indices;
        std::error_code ec;
        const auto directory = upload_directory(upload_id);
        if (!std::filesystem::is_directory(directory, ec))
        {
            return indices;
        }
        for (const auto &entry : std::filesystem::directory_iterator(directory, ec))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            if (auto index = parse_chunk_index(entry.path().filename().string()))
            {
                indices.insert(*index);
            }
        }
        if (ec)
        {
            throw StorageError("Failed to enumerate " + directory.string() + ": " + ec.message());
        }
        return indices;
    }

    std::vector<std::string> ChunkStore::list_uploads() const
    {
        std::vector<std::string> uploads;
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            const auto name = entry.path().filename().string();
            if (entry.is_directory() && crypto::is_upload_id(name))
            {
                uploads.push_back(name);
            }
        }
        if (ec)
        {
            throw StorageError("Failed to enumerate staging root " + root_.string() + ": " + ec.message());
        }
        return uploads;
    }

    std::filesystem::file_time_type ChunkStore::last_write_time(const std::string &upload_id) const
    {
        std::error_code ec;
        const auto time = std::filesystem::last_write_time(upload_directory(upload_id), ec);
        if (ec)
        {
            throw StorageError("Failed to stat staging directory of " + upload_id + ": " + ec.message());
        }
        return time;
    }

    void ChunkStore::delete_all(const std::string &upload_id)
    {
        std::error_code ec;
        std::filesystem::remove_all(upload_directory(upload_id), ec);
        if (ec)
        {
            throw StorageError("Failed to remove staging directory of " + upload_id + ": " + ec.message());
        }
    }

} // namespace chunkdrive::server
