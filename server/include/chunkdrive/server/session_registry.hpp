#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkdrive/result.hpp"
#include "chunkdrive/server/upload_session.hpp"

namespace chunkdrive::server
{

    struct ChunkReceipt
    {
        std::uint64_t uploaded{};
        std::uint64_t total{};
        bool newly_recorded{};
        // True for exactly one caller: the one whose chunk completed the bitmap.
        bool became_complete{};
        UploadStatus status{UploadStatus::Initialized};
    };

    // Durable key/value store of upload sessions, one JSON record per upload id.
    //
    // Every upload owns its own mutex; mutations of one upload never wait on
    // another. The map lock is only held to look entries up, insert or erase them.
    class SessionRegistry
    {
    public:
        // Returns an error to reject the mutation; the stored session is then left untouched.
        using Mutation = std::function<std::optional<Error>(UploadSession &)>;
        using Predicate = std::function<bool(const UploadSession &)>;

        explicit SessionRegistry(std::filesystem::path records_dir);

        Result<UploadSession> create(UploadSession session);

        std::optional<UploadSession> get(const std::string &upload_id) const;

        std::vector<UploadSession> list() const;

        // Read-modify-write of a single session under its own lock.
        Result<UploadSession> update(const std::string &upload_id, const Mutation &mutation);

        // Atomically adds the index to the received set and reports the new count.
        Result<ChunkReceipt> record_chunk(const std::string &upload_id, std::uint64_t index);

        bool remove(const std::string &upload_id);

        // Removes the session only if the predicate still holds while its lock is held.
        std::optional<UploadSession> remove_if(const std::string &upload_id, const Predicate &predicate);

        // Retries records whose last write to disk failed; returns how many are still pending.
        std::size_t flush_pending();

        std::size_t size() const;

        const std::filesystem::path &records_dir() const noexcept { return records_dir_; }

    private:
        struct Entry
        {
            std::mutex mutex;
            UploadSession session;
            bool removed{false};
            bool dirty{false};
        };

        std::shared_ptr<Entry> find_entry(const std::string &upload_id) const;
        std::vector<std::shared_ptr<Entry>> snapshot_entries() const;
        void erase_entry(const std::string &upload_id, const std::shared_ptr<Entry> &entry);

        void load_existing();
        std::filesystem::path record_path(const std::string &upload_id) const;
        void persist(const UploadSession &session) const;
        void persist_or_defer(Entry &entry) const;
        void remove_record(const std::string &upload_id) const;

        std::filesystem::path records_dir_;
        mutable std::shared_mutex entries_mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    };

} // namespace chunkdrive::server
