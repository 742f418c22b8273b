#include "chunkdrive/server/merger.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::uint64_t kMaxNameAttempts = 10000;

        class UniqueFd
        {
        public:
            explicit UniqueFd(int fd) : fd_(fd) {}
            ~UniqueFd()
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                }
            }

            UniqueFd(const UniqueFd &) = delete;
            UniqueFd &operator=(const UniqueFd &) = delete;

            int get() const noexcept { return fd_; }

        private:
            int fd_;
        };

        class MappedRegion
        {
        public:
            MappedRegion(void *address, std::size_t length) : address_(address), length_(length) {}
            ~MappedRegion()
            {
                ::munmap(address_, length_);
            }

            MappedRegion(const MappedRegion &) = delete;
            MappedRegion &operator=(const MappedRegion &) = delete;

            std::byte *data() const noexcept { return static_cast<std::byte *>(address_); }

        private:
            void *address_;
            std::size_t length_;
        };

        [[noreturn]] void throw_errno(const std::string &what)
        {
            throw std::system_error(errno, std::generic_category(), what);
        }

        std::string disambiguated_name(const std::string &filename, std::uint64_t attempt)
        {
            if (attempt == 0)
            {
                return filename;
            }
            const std::filesystem::path original = filename;
            return original.stem().string() + "_" + std::to_string(attempt) + original.extension().string();
        }

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
            }
        }

    } // namespace

    Merger::Merger(SessionRegistry &registry, ChunkStore &chunks, const Filesystem &filesystem,
                   MetadataStore &metadata, CacheInvalidator &cache, MergerOptions options)
        : registry_(registry),
          chunks_(chunks),
          filesystem_(filesystem),
          metadata_(metadata),
          cache_(cache),
          options_(options)
    {
    }

    class Merger::MergeSlot
    {
    public:
        MergeSlot(Merger &merger, std::string upload_id) : merger_(merger), upload_id_(std::move(upload_id)) {}
        ~MergeSlot() { merger_.release_slot(upload_id_); }

        MergeSlot(const MergeSlot &) = delete;
        MergeSlot &operator=(const MergeSlot &) = delete;

    private:
        Merger &merger_;
        std::string upload_id_;
    };

    Result<MergeOutcome> Merger::merge(const std::string &upload_id)
    {
        const auto deadline = std::chrono::steady_clock::now() + options_.wait_timeout;
        if (!acquire_slot(upload_id, deadline))
        {
            return make_error(ErrorCode::MergeTimeout, "Concurrent merge of " + upload_id + " did not finish in time",
                              {{"waited_ms", options_.wait_timeout.count()}});
        }
        MergeSlot slot(*this, upload_id);

        auto claimed = claim(upload_id);
        if (!claimed)
        {
            return claimed.error();
        }
        const auto &session = claimed.value();
        if (session.status == UploadStatus::Merged)
        {
            return MergeOutcome{
                .final_path = session.final_path.value_or(std::string{}),
                .file_size = session.declared_size,
                .content_hash = session.content_hash.value_or(std::string{}),
                .already_merged = true,
            };
        }
        return run(session);
    }

    MergeStats Merger::stats() const
    {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    bool Merger::acquire_slot(const std::string &upload_id, std::chrono::steady_clock::time_point deadline)
    {
        std::unique_lock lock(mutex_);
        if (running_.contains(upload_id))
        {
            spdlog::info("Upload {} is already merging, waiting for it to finish", upload_id);
        }
        if (!slot_released_.wait_until(lock, deadline, [&]
                                       { return !running_.contains(upload_id); }))
        {
            return false;
        }
        running_.insert(upload_id);
        return true;
    }

    void Merger::release_slot(const std::string &upload_id)
    {
        {
            std::lock_guard lock(mutex_);
            running_.erase(upload_id);
        }
        slot_released_.notify_all();
    }

    Result<UploadSession> Merger::claim(const std::string &upload_id)
    {
        const auto current = registry_.get(upload_id);
        if (!current || current->status == UploadStatus::Cancelled)
        {
            return make_error(ErrorCode::NotFound, "Upload " + upload_id + " does not exist or has expired");
        }
        switch (current->status)
        {
        case UploadStatus::Merged:
            return *current;
        case UploadStatus::Initialized:
        case UploadStatus::InProgress:
            return incomplete(*current);
        case UploadStatus::Merging:
        {
            // Only the slot owner moves an upload into Merging; a merge that died without
            // recording its outcome left this behind.
            spdlog::critical("Upload {} was left merging by an interrupted merge, taking it over", upload_id);
            std::lock_guard lock(mutex_);
            ++stats_.overlapping;
            break;
        }
        default:
            break;
        }

        auto claimed = registry_.update(upload_id, [](UploadSession &session) -> std::optional<Error>
                                        {
            if (session.status != UploadStatus::Merging)
            {
                session.transition(UploadStatus::Merging, Clock::now());
            }
            session.failure.reset();
            return std::nullopt; });
        if (claimed)
        {
            std::lock_guard lock(mutex_);
            ++stats_.started;
        }
        return claimed;
    }

    Error Merger::incomplete(const UploadSession &session) const
    {
        const auto missing = session.missing_chunks();
        try
        {
            const auto staged = chunks_.list_indices(session.upload_id);
            std::vector<std::uint64_t> unrecorded;
            for (const auto index : staged)
            {
                if (index < session.total_chunks && !session.received_chunks.contains(index))
                {
                    unrecorded.push_back(index);
                }
            }
            if (!unrecorded.empty())
            {
                spdlog::warn("Upload {}: {} staged chunk(s) are missing from the session record; registry and "
                             "staging area have diverged",
                             session.upload_id, unrecorded.size());
            }
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Upload {}: could not inspect staging area: {}", session.upload_id, ex.what());
        }
        return make_error(ErrorCode::MissingChunks, "Upload has not received every chunk yet",
                          {{"missing", missing}});
    }

    Error Merger::fail(const UploadSession &session, Error error)
    {
        spdlog::error("Merge of upload {} ({}) failed: {}", session.upload_id, session.filename, error.message);
        auto updated = registry_.update(session.upload_id, [&](UploadSession &current) -> std::optional<Error>
                                        {
            current.transition(UploadStatus::Failed, Clock::now());
            current.failure = error;
            return std::nullopt; });
        if (!updated)
        {
            spdlog::error("Failed to record merge failure of {}: {}", session.upload_id, updated.error().message);
        }
        std::lock_guard lock(mutex_);
        ++stats_.failed;
        return error;
    }

    Result<MergeOutcome> Merger::run(const UploadSession &session)
    {
        const auto started = std::chrono::steady_clock::now();
        spdlog::info("Merging upload {} ({}, {} bytes, {} chunks)", session.upload_id, session.filename,
                     session.declared_size, session.total_chunks);

        std::filesystem::path scratch;
        try
        {
            std::vector<std::uint64_t> missing;
            for (std::uint64_t index = 0; index < session.total_chunks; ++index)
            {
                if (!chunks_.exists(session.upload_id, index))
                {
                    missing.push_back(index);
                }
            }
            if (!missing.empty())
            {
                return fail(session, make_error(ErrorCode::MissingChunks,
                                                std::to_string(missing.size()) + " staged chunk(s) are missing",
                                                {{"missing", missing}}));
            }

            const auto directory = filesystem_.resolve(session.target_directory);
            std::filesystem::create_directories(directory);
            scratch = chunks_.scratch_path(session.upload_id);
            remove_quietly(scratch);

            crypto::Hasher hasher;
            const bool mapped = session.declared_size >= options_.mmap_threshold;
            const auto written = mapped ? write_mapped(session, scratch, hasher)
                                        : write_buffered(session, scratch, hasher);
            // The mapped output is pre-sized, so only the byte count tells a short merge apart.
            const auto actual = mapped ? written : std::filesystem::file_size(scratch);
            if (actual != session.declared_size)
            {
                remove_quietly(scratch);
                return fail(session, make_error(ErrorCode::SizeMismatch, "Merged size differs from the declared size",
                                                {{"expected", session.declared_size}, {"actual", actual}}));
            }
            const auto content_hash = hasher.finish();

            const auto destination = publish(scratch, directory, session.filename);
            const auto final_path = filesystem_.relative(destination);
            const auto parent = filesystem_.relative(directory);
            const auto duration =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            notify_collaborators(session, final_path, parent, content_hash, duration);

            auto merged = registry_.update(session.upload_id, [&](UploadSession &current) -> std::optional<Error>
                                           {
                current.transition(UploadStatus::Merged, Clock::now());
                current.final_path = final_path;
                current.content_hash = content_hash;
                current.failure.reset();
                return std::nullopt; });
            if (!merged)
            {
                spdlog::error("Upload {} was published to {} but its session could not be updated: {}",
                              session.upload_id, final_path, merged.error().message);
            }

            try
            {
                chunks_.delete_all(session.upload_id);
            }
            catch (const StorageError &ex)
            {
                spdlog::warn("Staging cleanup of {} failed, leaving it to the janitor: {}", session.upload_id,
                             ex.what());
            }

            {
                std::lock_guard lock(mutex_);
                ++stats_.succeeded;
            }
            spdlog::info("Merged upload {} into {} ({} bytes, {} ms{})", session.upload_id, final_path,
                         session.declared_size, duration.count(), mapped ? ", mapped" : "");
            return MergeOutcome{
                .final_path = final_path,
                .file_size = session.declared_size,
                .content_hash = content_hash,
                .already_merged = false,
            };
        }
        catch (const FilesystemError &ex)
        {
            return fail(session, make_error(ex.code(), ex.what()));
        }
        catch (const std::exception &ex)
        {
            if (!scratch.empty())
            {
                remove_quietly(scratch);
            }
            return fail(session, make_error(ErrorCode::StorageError, ex.what()));
        }
    }

    std::uint64_t Merger::write_buffered(const UploadSession &session, const std::filesystem::path &output,
                                         crypto::Hasher &hasher) const
    {
        std::vector<char> output_buffer(options_.io_buffer_size);
        std::ofstream out;
        out.rdbuf()->pubsetbuf(output_buffer.data(), static_cast<std::streamsize>(output_buffer.size()));
        out.open(output, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw StorageError("Failed to open merge output " + output.string());
        }

        std::vector<std::byte> block(options_.io_buffer_size);
        std::uint64_t written = 0;
        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            const auto chunk = chunks_.chunk_path(session.upload_id, index);
            std::ifstream in(chunk, std::ios::binary);
            if (!in.is_open())
            {
                throw StorageError("Chunk " + std::to_string(index) + " disappeared during the merge");
            }
            while (in)
            {
                in.read(reinterpret_cast<char *>(block.data()), static_cast<std::streamsize>(block.size()));
                const auto count = static_cast<std::size_t>(in.gcount());
                if (count == 0)
                {
                    break;
                }
                out.write(reinterpret_cast<const char *>(block.data()), static_cast<std::streamsize>(count));
                hasher.update(std::span<const std::byte>(block.data(), count));
                written += count;
            }
            log_progress(session, index);
        }
        out.flush();
        if (!out)
        {
            throw StorageError("Failed to write merge output " + output.string());
        }
        return written;
    }

    std::uint64_t Merger::write_mapped(const UploadSession &session, const std::filesystem::path &output,
                                       crypto::Hasher &hasher) const
    {
        UniqueFd fd(::open(output.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644));
        if (fd.get() < 0)
        {
            throw_errno("Failed to open merge output " + output.string());
        }
        const auto length = static_cast<std::size_t>(session.declared_size);
        if (::ftruncate(fd.get(), static_cast<off_t>(length)) != 0)
        {
            throw_errno("Failed to size merge output " + output.string());
        }
        void *address = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd.get(), 0);
        if (address == MAP_FAILED)
        {
            throw_errno("Failed to map merge output " + output.string());
        }
        MappedRegion region(address, length);

        std::uint64_t written = 0;
        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            const auto chunk = chunks_.chunk_path(session.upload_id, index);
            const auto chunk_length = std::filesystem::file_size(chunk);
            // An oversized chunk is only counted; the size check rejects the result.
            if (written + chunk_length <= session.declared_size)
            {
                std::ifstream in(chunk, std::ios::binary);
                if (!in.is_open())
                {
                    throw StorageError("Chunk " + std::to_string(index) + " disappeared during the merge");
                }
                auto *target = region.data() + written;
                in.read(reinterpret_cast<char *>(target), static_cast<std::streamsize>(chunk_length));
                if (static_cast<std::uint64_t>(in.gcount()) != chunk_length)
                {
                    throw StorageError("Short read on chunk " + std::to_string(index));
                }
                hasher.update(std::span<const std::byte>(target, static_cast<std::size_t>(chunk_length)));
            }
            written += chunk_length;
            log_progress(session, index);
        }
        if (::msync(region.data(), length, MS_SYNC) != 0)
        {
            throw_errno("Failed to flush merge output " + output.string());
        }
        return written;
    }

    void Merger::log_progress(const UploadSession &session, std::uint64_t index) const
    {
        const auto done = index + 1;
        if (options_.progress_interval == 0 ||
            (done % options_.progress_interval != 0 && done != session.total_chunks))
        {
            return;
        }
        spdlog::debug("Merge progress for {}: {}/{} chunks ({:.1f}%)", session.upload_id, done,
                      session.total_chunks,
                      static_cast<double>(done) * 100.0 / static_cast<double>(session.total_chunks));
    }

    std::filesystem::path Merger::publish(const std::filesystem::path &scratch,
                                          const std::filesystem::path &directory,
                                          const std::string &filename) const
    {
        std::filesystem::path destination;
        for (std::uint64_t attempt = 0;; ++attempt)
        {
            if (attempt >= kMaxNameAttempts)
            {
                throw StorageError("No free name for " + filename + " in " + directory.string());
            }
            destination = directory / disambiguated_name(filename, attempt);
            // O_EXCL reserves the name so a concurrent merge into the same directory picks another one.
            const int fd = ::open(destination.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
            if (fd >= 0)
            {
                ::close(fd);
                break;
            }
            if (errno != EEXIST)
            {
                throw_errno("Failed to reserve " + destination.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(scratch, destination, ec);
        if (ec == std::errc::cross_device_link)
        {
            ec.clear();
            std::filesystem::copy_file(scratch, destination, std::filesystem::copy_options::overwrite_existing, ec);
            if (!ec)
            {
                remove_quietly(scratch);
            }
        }
        if (ec)
        {
            remove_quietly(destination);
            throw StorageError("Failed to publish " + destination.string() + ": " + ec.message());
        }
        return destination;
    }

    void Merger::notify_collaborators(const UploadSession &session, const std::string &final_path,
                                      const std::string &parent, const std::string &content_hash,
                                      std::chrono::milliseconds duration)
    {
        try
        {
            metadata_.save_record(FileRecord{
                .path = final_path,
                .size = session.declared_size,
                .content_hash = content_hash,
                .is_directory = false,
                .parent_path = parent,
            });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Metadata store rejected {}: {}", final_path, ex.what());
        }

        try
        {
            metadata_.record_operation(OperationRecord{
                .operation = "upload",
                .path = final_path,
                .submitter = session.submitter,
                .size = session.declared_size,
                .duration = duration,
                .success = true,
            });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to log upload of {}: {}", final_path, ex.what());
        }

        try
        {
            cache_.invalidate(parent);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Cache invalidation for {} failed: {}", parent, ex.what());
        }
    }

} // namespace chunkdrive::server
