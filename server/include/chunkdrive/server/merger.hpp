#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/result.hpp"
#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/collaborators.hpp"
#include "chunkdrive/server/filesystem.hpp"
#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    struct MergeOutcome
    {
        std::string final_path; // relative to the storage root
        std::uint64_t file_size{};
        std::string content_hash;
        bool already_merged{};
    };

    struct MergerOptions
    {
        // Uploads of at least this many bytes are assembled through a shared memory mapping.
        std::uint64_t mmap_threshold{100ULL * 1024 * 1024};
        std::size_t io_buffer_size{2 * 1024 * 1024};
        // Bound on waiting for another merge of the same upload to finish.
        std::chrono::milliseconds wait_timeout{std::chrono::seconds{10}};
        std::uint64_t progress_interval{5};
    };

    struct MergeStats
    {
        std::uint64_t started{};
        std::uint64_t succeeded{};
        std::uint64_t failed{};
        // Merges that found the upload left in Merging by a merge that no longer runs and took it over.
        std::uint64_t overlapping{};
    };

    // Merges of one upload are serialized by a per-upload slot that is held across both
    // the Merging claim and the run, so an upload is only ever Merging while its slot
    // owner is working on it.
    class Merger
    {
    public:
        Merger(SessionRegistry &registry, ChunkStore &chunks, const Filesystem &filesystem, MetadataStore &metadata,
               CacheInvalidator &cache, MergerOptions options);

        // Assembles the staged chunks of a fully received upload into its destination.
        // Idempotent for merged uploads; waits for a concurrent merge of the same upload
        // instead of running a second one.
        Result<MergeOutcome> merge(const std::string &upload_id);

        MergeStats stats() const;

        const MergerOptions &options() const noexcept { return options_; }

    private:
        class MergeSlot;

        bool acquire_slot(const std::string &upload_id, std::chrono::steady_clock::time_point deadline);
        void release_slot(const std::string &upload_id);

        Result<UploadSession> claim(const std::string &upload_id);
        Result<MergeOutcome> run(const UploadSession &session);
        Error incomplete(const UploadSession &session) const;
        Error fail(const UploadSession &session, Error error);

        std::uint64_t write_buffered(const UploadSession &session, const std::filesystem::path &output,
                                     crypto::Hasher &hasher) const;
        std::uint64_t write_mapped(const UploadSession &session, const std::filesystem::path &output,
                                   crypto::Hasher &hasher) const;
        void log_progress(const UploadSession &session, std::uint64_t index) const;

        std::filesystem::path publish(const std::filesystem::path &scratch, const std::filesystem::path &directory,
                                      const std::string &filename) const;
        void notify_collaborators(const UploadSession &session, const std::string &final_path,
                                  const std::string &parent, const std::string &content_hash,
                                  std::chrono::milliseconds duration);

        SessionRegistry &registry_;
        ChunkStore &chunks_;
        const Filesystem &filesystem_;
        MetadataStore &metadata_;
        CacheInvalidator &cache_;
        MergerOptions options_;

        mutable std::mutex mutex_;
        std::condition_variable slot_released_;
        std::unordered_set<std::string> running_;
        MergeStats stats_{};
    };

} // namespace chunkdrive::server
