#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunkdrive/result.hpp"
#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/collaborators.hpp"
#include "chunkdrive/server/janitor.hpp"
#include "chunkdrive/server/merge_queue.hpp"
#include "chunkdrive/server/merger.hpp"
#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    struct CoordinatorOptions
    {
        std::uint64_t default_chunk_size{5ULL * 1024 * 1024};
        std::uint64_t max_chunk_size{32ULL * 1024 * 1024};
        // Upper bound on chunks per upload; rejects sizes that would explode into millions of chunks.
        std::uint64_t max_chunks{100000};
        std::size_t merge_workers{2};
    };

    struct InitializeRequest
    {
        std::string filename;
        std::uint64_t declared_size{};
        std::string target_directory{"."};
        std::optional<std::uint64_t> chunk_size{};
        std::string submitter{"anonymous"};
    };

    struct InitializeResult
    {
        std::string upload_id;
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size{};
    };

    struct ChunkProgress
    {
        std::uint64_t uploaded{};
        std::uint64_t total{};
        bool complete{};
    };

    // Entry point of the chunked upload flow. Accepts chunks in any order and from
    // any number of parallel connections, and schedules exactly one background merge
    // per upload once every chunk has arrived.
    class UploadCoordinator
    {
    public:
        UploadCoordinator(SessionRegistry &registry, ChunkStore &chunks, Merger &merger,
                          const PathValidator &path_validator, Janitor &janitor, CoordinatorOptions options);
        ~UploadCoordinator();

        UploadCoordinator(const UploadCoordinator &) = delete;
        UploadCoordinator &operator=(const UploadCoordinator &) = delete;

        Result<InitializeResult> initialize(const InitializeRequest &request);

        Result<ChunkProgress> upload_chunk(const std::string &upload_id, std::uint64_t chunk_index,
                                           std::span<const std::byte> payload,
                                           const std::optional<std::string> &chunk_hash = std::nullopt);

        Result<protocol::UploadSnapshot> status(const std::string &upload_id) const;

        VoidResult cancel(const std::string &upload_id);

        std::vector<protocol::UploadSnapshot> list(const std::optional<std::string> &submitter = std::nullopt) const;

        using MergeCallback = std::function<void(Result<MergeOutcome>)>;

        // Runs the merge synchronously; used to retry a failed merge.
        Result<MergeOutcome> merge(const std::string &upload_id);

        // Runs the merge on a merge worker and reports the outcome there. The callback is
        // invoked exactly once, inline when the workers are already shut down.
        void merge_async(const std::string &upload_id, MergeCallback on_done);

        // Schedules merges for sessions that were fully received before a restart.
        std::size_t resume_pending_merges();

        bool wait_for_merges(std::chrono::milliseconds timeout) const;

        void shutdown();

        const MergeQueue &merge_queue() const noexcept { return merge_queue_; }

        const CoordinatorOptions &options() const noexcept { return options_; }

    private:
        Result<std::uint64_t> resolve_chunk_size(const InitializeRequest &request) const;
        void run_merge(const std::string &upload_id);

        SessionRegistry &registry_;
        ChunkStore &chunks_;
        Merger &merger_;
        const PathValidator &path_validator_;
        Janitor &janitor_;
        CoordinatorOptions options_;
        MergeQueue merge_queue_;
    };

} // namespace chunkdrive::server
