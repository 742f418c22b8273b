#include "chunkdrive/server/upload_coordinator.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr int kMaxIdAttempts = 8;

        Error not_found(const std::string &upload_id)
        {
            return make_error(ErrorCode::NotFound, "Upload " + upload_id + " does not exist or has expired");
        }

        bool valid_filename(const std::string &filename)
        {
            return !filename.empty() && filename != "." && filename != ".." &&
                   filename.find('/') == std::string::npos && filename.find('\0') == std::string::npos;
        }

        ChunkProgress progress_of(const UploadSession &session)
        {
            return ChunkProgress{
                .uploaded = static_cast<std::uint64_t>(session.received_chunks.size()),
                .total = session.total_chunks,
                .complete = session.all_received(),
            };
        }

    } // namespace

    UploadCoordinator::UploadCoordinator(SessionRegistry &registry, ChunkStore &chunks, Merger &merger,
                                         const PathValidator &path_validator, Janitor &janitor,
                                         CoordinatorOptions options)
        : registry_(registry),
          chunks_(chunks),
          merger_(merger),
          path_validator_(path_validator),
          janitor_(janitor),
          options_(options),
          merge_queue_(options.merge_workers, [this](const std::string &upload_id)
                       { run_merge(upload_id); })
    {
    }

    UploadCoordinator::~UploadCoordinator()
    {
        shutdown();
    }

    Result<InitializeResult> UploadCoordinator::initialize(const InitializeRequest &request)
    {
        if (request.declared_size == 0)
        {
            return make_error(ErrorCode::InvalidRequest, "File size must be positive");
        }
        if (!valid_filename(request.filename))
        {
            return make_error(ErrorCode::InvalidRequest, "Invalid filename", {{"filename", request.filename}});
        }
        const auto target = request.target_directory.empty() ? std::string{"."} : request.target_directory;
        if (!path_validator_.is_safe(target))
        {
            return make_error(ErrorCode::InvalidRequest, "Target directory is not allowed",
                              {{"target_directory", target}});
        }
        auto chunk_size = resolve_chunk_size(request);
        if (!chunk_size)
        {
            return chunk_size.error();
        }
        const auto total_chunks = chunk_count_for(request.declared_size, chunk_size.value());
        if (total_chunks > options_.max_chunks)
        {
            return make_error(ErrorCode::InvalidRequest, "Upload would need too many chunks",
                              {{"total_chunks", total_chunks}, {"max_chunks", options_.max_chunks}});
        }

        try
        {
            janitor_.sweep_if_due();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Opportunistic sweep failed: {}", ex.what());
        }

        auto created_at = Clock::now();
        for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt)
        {
            UploadSession session{};
            session.upload_id = crypto::derive_upload_id(request.filename, request.declared_size, request.submitter,
                                                         created_at);
            session.filename = request.filename;
            session.submitter = request.submitter;
            session.declared_size = request.declared_size;
            session.target_directory = target;
            session.chunk_size = chunk_size.value();
            session.total_chunks = total_chunks;
            session.created_at = created_at;
            session.updated_at = created_at;

            try
            {
                chunks_.prepare(session.upload_id);
            }
            catch (const StorageError &ex)
            {
                return make_error(ErrorCode::StorageError, ex.what());
            }

            auto created = registry_.create(session);
            if (created)
            {
                spdlog::info("Upload {} initialized: {} ({} bytes, {} x {} byte chunks) by {}", session.upload_id,
                             session.filename, session.declared_size, total_chunks, session.chunk_size,
                             session.submitter);
                return InitializeResult{
                    .upload_id = session.upload_id,
                    .total_chunks = total_chunks,
                    .chunk_size = session.chunk_size,
                };
            }
            if (created.code() != ErrorCode::Conflict)
            {
                return created.error();
            }
            // Identical attributes within the same clock tick; nudge the timestamp.
            created_at += std::chrono::nanoseconds{1};
        }
        return make_error(ErrorCode::InternalError, "Could not allocate a unique upload id");
    }

    Result<ChunkProgress> UploadCoordinator::upload_chunk(const std::string &upload_id, std::uint64_t chunk_index,
                                                          std::span<const std::byte> payload,
                                                          const std::optional<std::string> &chunk_hash)
    {
        const auto session = registry_.get(upload_id);
        if (!session || is_terminal(session->status))
        {
            return not_found(upload_id);
        }
        if (chunk_index >= session->total_chunks)
        {
            return make_error(ErrorCode::InvalidRequest, "Chunk index out of range",
                              {{"chunk_index", chunk_index}, {"total_chunks", session->total_chunks}});
        }
        const auto expected = session->expected_chunk_length(chunk_index);
        if (payload.size() != expected)
        {
            return make_error(ErrorCode::ChunkSizeMismatch, "Chunk length does not match the upload layout",
                              {{"chunk_index", chunk_index}, {"expected", expected}, {"actual", payload.size()}});
        }
        if (chunk_hash && !chunk_hash->empty())
        {
            // Digests are lowercase hex; clients may send either case.
            std::string expected_hash = *chunk_hash;
            std::transform(expected_hash.begin(), expected_hash.end(), expected_hash.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            const auto actual = crypto::hash_bytes(payload);
            if (actual != expected_hash)
            {
                spdlog::warn("Upload {}: chunk {} failed integrity check", upload_id, chunk_index);
                return make_error(ErrorCode::IntegrityError, "Chunk hash mismatch",
                                  {{"chunk_index", chunk_index}, {"expected", *chunk_hash}, {"actual", actual}});
            }
        }
        // The staged files are being read by the merge, or already were; a late duplicate changes nothing.
        if (session->status == UploadStatus::AllReceived || session->status == UploadStatus::Merging)
        {
            return progress_of(*session);
        }

        try
        {
            chunks_.write(upload_id, chunk_index, payload);
        }
        catch (const StorageError &ex)
        {
            spdlog::error("Upload {}: failed to stage chunk {}: {}", upload_id, chunk_index, ex.what());
            return make_error(ErrorCode::StorageError, ex.what(), {{"chunk_index", chunk_index}});
        }

        auto receipt = registry_.record_chunk(upload_id, chunk_index);
        if (!receipt)
        {
            return receipt.error();
        }
        const auto &recorded = receipt.value();
        spdlog::debug("Upload {}: chunk {} stored ({}/{})", upload_id, chunk_index, recorded.uploaded,
                      recorded.total);
        if (recorded.became_complete)
        {
            spdlog::info("Upload {} received all {} chunks, scheduling merge", upload_id, recorded.total);
            merge_queue_.enqueue(upload_id);
        }
        return ChunkProgress{
            .uploaded = recorded.uploaded,
            .total = recorded.total,
            .complete = recorded.uploaded == recorded.total,
        };
    }

    Result<protocol::UploadSnapshot> UploadCoordinator::status(const std::string &upload_id) const
    {
        const auto session = registry_.get(upload_id);
        if (!session || session->status == UploadStatus::Cancelled)
        {
            return not_found(upload_id);
        }
        return session->snapshot();
    }

    VoidResult UploadCoordinator::cancel(const std::string &upload_id)
    {
        auto cancelled = registry_.update(upload_id, [&](UploadSession &session) -> std::optional<Error>
                                          {
            if (session.status == UploadStatus::Cancelled)
            {
                return not_found(upload_id);
            }
            if (session.status == UploadStatus::Merging || session.status == UploadStatus::Merged)
            {
                return make_error(ErrorCode::Conflict, "Upload can no longer be cancelled",
                                  {{"status", std::string(to_string(session.status))}});
            }
            session.transition(UploadStatus::Cancelled, Clock::now());
            return std::nullopt; });
        if (!cancelled)
        {
            return cancelled.error();
        }

        try
        {
            chunks_.delete_all(upload_id);
        }
        catch (const StorageError &ex)
        {
            // The directory has no session any more; the janitor removes it as an orphan.
            spdlog::warn("Upload {}: staging cleanup after cancel failed: {}", upload_id, ex.what());
        }
        registry_.remove(upload_id);
        spdlog::info("Upload {} cancelled", upload_id);
        return ok_result();
    }

    std::vector<protocol::UploadSnapshot> UploadCoordinator::list(const std::optional<std::string> &submitter) const
    {
        auto sessions = registry_.list();
        std::sort(sessions.begin(), sessions.end(), [](const UploadSession &lhs, const UploadSession &rhs)
                  { return lhs.created_at < rhs.created_at; });

        std::vector<protocol::UploadSnapshot> snapshots;
        for (const auto &session : sessions)
        {
            if (session.status == UploadStatus::Cancelled || (submitter && session.submitter != *submitter))
            {
                continue;
            }
            snapshots.push_back(session.snapshot(false));
        }
        return snapshots;
    }

    Result<MergeOutcome> UploadCoordinator::merge(const std::string &upload_id)
    {
        spdlog::info("Merge of {} requested", upload_id);
        return merger_.merge(upload_id);
    }

    void UploadCoordinator::merge_async(const std::string &upload_id, MergeCallback on_done)
    {
        spdlog::info("Merge of {} requested", upload_id);
        auto callback = std::make_shared<MergeCallback>(std::move(on_done));
        const bool submitted = merge_queue_.submit([this, upload_id, callback]
                                                   {
            Result<MergeOutcome> merged = make_error(ErrorCode::InternalError, "Merge did not run");
            try
            {
                merged = merger_.merge(upload_id);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Merge of {} raised: {}", upload_id, ex.what());
                merged = make_error(ErrorCode::InternalError, ex.what());
            }
            (*callback)(std::move(merged)); });
        if (!submitted)
        {
            (*callback)(make_error(ErrorCode::StorageError, "Server is shutting down"));
        }
    }

    std::size_t UploadCoordinator::resume_pending_merges()
    {
        std::size_t scheduled = 0;
        for (const auto &session : registry_.list())
        {
            if (session.status == UploadStatus::AllReceived && merge_queue_.enqueue(session.upload_id))
            {
                ++scheduled;
            }
        }
        if (scheduled > 0)
        {
            spdlog::info("Resumed {} pending merge(s)", scheduled);
        }
        return scheduled;
    }

    bool UploadCoordinator::wait_for_merges(std::chrono::milliseconds timeout) const
    {
        return merge_queue_.wait_idle(timeout);
    }

    void UploadCoordinator::shutdown()
    {
        merge_queue_.shutdown();
    }

    Result<std::uint64_t> UploadCoordinator::resolve_chunk_size(const InitializeRequest &request) const
    {
        const auto chunk_size = request.chunk_size.value_or(0) > 0 ? *request.chunk_size : options_.default_chunk_size;
        if (chunk_size == 0)
        {
            return make_error(ErrorCode::InvalidRequest, "Chunk size must be positive");
        }
        if (chunk_size > options_.max_chunk_size)
        {
            return make_error(ErrorCode::InvalidRequest, "Chunk size exceeds the server limit",
                              {{"chunk_size", chunk_size}, {"max_chunk_size", options_.max_chunk_size}});
        }
        return chunk_size;
    }

    void UploadCoordinator::run_merge(const std::string &upload_id)
    {
        auto merged = merger_.merge(upload_id);
        if (!merged)
        {
            const auto &error = merged.error();
            spdlog::warn("Background merge of {} did not complete: {} ({})", upload_id, error.message,
                         to_string(error.code));
        }
    }

} // namespace chunkdrive::server
