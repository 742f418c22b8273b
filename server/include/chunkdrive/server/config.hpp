#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkdrive::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::optional<std::filesystem::path> staging_dir;
        std::size_t worker_threads{0};

        std::uint64_t default_chunk_size{5ULL * 1024 * 1024};
        std::uint64_t max_chunk_size{32ULL * 1024 * 1024};
        std::uint64_t max_chunks{100000};

        std::chrono::seconds upload_timeout{std::chrono::hours{24}};
        std::chrono::seconds janitor_interval{std::chrono::hours{1}};
        std::chrono::seconds janitor_grace{std::chrono::seconds{60}};
        std::chrono::seconds merged_retention{std::chrono::hours{24}};

        std::size_t merge_workers{2};
        std::chrono::milliseconds merge_wait_timeout{std::chrono::seconds{10}};
        std::uint64_t mmap_threshold{100ULL * 1024 * 1024};

        std::optional<std::filesystem::path> log_file;
        bool verbose{false};

        std::filesystem::path resolved_staging_dir() const
        {
            return staging_dir ? *staging_dir : root / ".chunkdrive" / "staging";
        }
    };

} // namespace chunkdrive::server
