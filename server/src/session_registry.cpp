#include "chunkdrive/server/session_registry.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/chunk_store.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kRecordExtension = ".json";

        Error not_found(const std::string &upload_id)
        {
            return make_error(ErrorCode::NotFound, "Upload " + upload_id + " does not exist or has expired");
        }
    } // namespace

    SessionRegistry::SessionRegistry(std::filesystem::path records_dir) : records_dir_(std::move(records_dir))
    {
        std::filesystem::create_directories(records_dir_);
        load_existing();
    }

    Result<UploadSession> SessionRegistry::create(UploadSession session)
    {
        auto entry = std::make_shared<Entry>();
        entry->session = session;
        std::unique_lock entry_lock(entry->mutex);
        {
            std::unique_lock lock(entries_mutex_);
            if (entries_.contains(session.upload_id))
            {
                return make_error(ErrorCode::Conflict, "Upload " + session.upload_id + " already exists");
            }
            entries_.emplace(session.upload_id, entry);
        }

        try
        {
            persist(session);
        }
        catch (const std::exception &ex)
        {
            entry->removed = true;
            entry_lock.unlock();
            erase_entry(session.upload_id, entry);
            return make_error(ErrorCode::StorageError, ex.what());
        }
        return session;
    }

    std::optional<UploadSession> SessionRegistry::get(const std::string &upload_id) const
    {
        auto entry = find_entry(upload_id);
        if (!entry)
        {
            return std::nullopt;
        }
        std::lock_guard lock(entry->mutex);
        if (entry->removed)
        {
            return std::nullopt;
        }
        return entry->session;
    }

    std::vector<UploadSession> SessionRegistry::list() const
    {
        std::vector<UploadSession> sessions;
        for (const auto &entry : snapshot_entries())
        {
            std::lock_guard lock(entry->mutex);
            if (!entry->removed)
            {
                sessions.push_back(entry->session);
            }
        }
        return sessions;
    }

    Result<UploadSession> SessionRegistry::update(const std::string &upload_id, const Mutation &mutation)
    {
        auto entry = find_entry(upload_id);
        if (!entry)
        {
            return not_found(upload_id);
        }
        std::lock_guard lock(entry->mutex);
        if (entry->removed)
        {
            return not_found(upload_id);
        }

        auto candidate = entry->session;
        try
        {
            if (auto rejection = mutation(candidate))
            {
                return std::move(*rejection);
            }
        }
        catch (const std::logic_error &ex)
        {
            return make_error(ErrorCode::Conflict, ex.what());
        }
        if (candidate.upload_id != upload_id)
        {
            return make_error(ErrorCode::InternalError, "Mutation changed the upload id");
        }

        entry->session = std::move(candidate);
        entry->dirty = true;
        persist_or_defer(*entry);
        return entry->session;
    }

    Result<ChunkReceipt> SessionRegistry::record_chunk(const std::string &upload_id, std::uint64_t index)
    {
        ChunkReceipt receipt{};
        auto updated = update(upload_id, [&](UploadSession &session) -> std::optional<Error>
                              {
            if (is_terminal(session.status))
            {
                return not_found(upload_id);
            }
            if (index >= session.total_chunks)
            {
                return make_error(ErrorCode::InvalidRequest, "Chunk index out of range",
                                  {{"chunk_index", index}, {"total_chunks", session.total_chunks}});
            }
            const bool was_complete = session.all_received();
            receipt.newly_recorded = session.mark_chunk_received(index, Clock::now());
            receipt.became_complete = !was_complete && session.status == UploadStatus::AllReceived;
            return std::nullopt; });
        if (!updated)
        {
            return updated.error();
        }
        const auto &session = updated.value();
        receipt.uploaded = static_cast<std::uint64_t>(session.received_chunks.size());
        receipt.total = session.total_chunks;
        receipt.status = session.status;
        return receipt;
    }

    bool SessionRegistry::remove(const std::string &upload_id)
    {
        return remove_if(upload_id, [](const UploadSession &)
                         { return true; })
            .has_value();
    }

    std::optional<UploadSession> SessionRegistry::remove_if(const std::string &upload_id, const Predicate &predicate)
    {
        auto entry = find_entry(upload_id);
        if (!entry)
        {
            return std::nullopt;
        }
        std::optional<UploadSession> removed;
        {
            std::lock_guard lock(entry->mutex);
            if (entry->removed || !predicate(entry->session))
            {
                return std::nullopt;
            }
            entry->removed = true;
            removed = entry->session;
            try
            {
                remove_record(upload_id);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Failed to delete session record {}: {}", upload_id, ex.what());
            }
            }
        erase_entry(upload_id, entry);
        return removed;
    }

    std::size_t SessionRegistry::flush_pending()
    {
        std::size_t pending = 0;
        for (const auto &entry : snapshot_entries())
        {
            std::lock_guard lock(entry->mutex);
            if (entry->removed || !entry->dirty)
            {
                continue;
            }
            persist_or_defer(*entry);
            if (entry->dirty)
            {
                ++pending;
            }
        }
        return pending;
    }

    std::size_t SessionRegistry::size() const
    {
        std::shared_lock lock(entries_mutex_);
        return entries_.size();
    }

    std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find_entry(const std::string &upload_id) const
    {
        std::shared_lock lock(entries_mutex_);
        auto it = entries_.find(upload_id);
        if (it == entries_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::vector<std::shared_ptr<SessionRegistry::Entry>> SessionRegistry::snapshot_entries() const
    {
        std::shared_lock lock(entries_mutex_);
        std::vector<std::shared_ptr<Entry>> entries;
        entries.reserve(entries_.size());
        for (const auto &[id, entry] : entries_)
        {
            entries.push_back(entry);
        }
        return entries;
    }

    void SessionRegistry::erase_entry(const std::string &upload_id, const std::shared_ptr<Entry> &entry)
    {
        std::unique_lock lock(entries_mutex_);
        auto it = entries_.find(upload_id);
        if (it != entries_.end() && it->second == entry)
        {
            entries_.erase(it);
        }
    }

    void SessionRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(records_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kRecordExtension)
            {
                continue;
            }
            try
            {
                std::ifstream in(entry.path());
                if (!in.is_open())
                {
                    spdlog::warn("Skipping unreadable session record {}", entry.path().string());
                    continue;
                }
                nlohmann::json json;
                in >> json;
                auto session = json.get<UploadSession>();
                if (!crypto::is_upload_id(session.upload_id) || entry.path().stem() != session.upload_id)
                {
                    spdlog::warn("Skipping session record {} with mismatched id", entry.path().string());
                    continue;
                }

                auto loaded = std::make_shared<Entry>();
                if (session.status == UploadStatus::Merging)
                {
                    // The process stopped mid-merge; the scratch output is discarded with the staging area.
                    spdlog::warn("Upload {} was merging when the server stopped; it will be merged again",
                                 session.upload_id);
                    session.status = UploadStatus::AllReceived;
                    loaded->dirty = true;
                }
                loaded->session = std::move(session);
                if (loaded->dirty)
                {
                    persist_or_defer(*loaded);
                }
                entries_[loaded->session.upload_id] = std::move(loaded);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping corrupt session record {}: {}", entry.path().string(), ex.what());
            }
        }
        if (!entries_.empty())
        {
            spdlog::info("Loaded {} upload session(s) from {}", entries_.size(), records_dir_.string());
        }
    }

    std::filesystem::path SessionRegistry::record_path(const std::string &upload_id) const
    {
        return records_dir_ / (upload_id + kRecordExtension);
    }

    void SessionRegistry::persist(const UploadSession &session) const
    {
        const auto path = record_path(session.upload_id);
        auto temp = path;
        temp += ".tmp";
        {
            const nlohmann::json json = session;
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError("Failed to open session record " + temp.string());
            }
            out << json.dump(2);
            out.flush();
            if (!out)
            {
                throw StorageError("Failed to write session record " + temp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec)
        {
            throw StorageError("Failed to replace session record " + path.string() + ": " + ec.message());
        }
    }

    void SessionRegistry::persist_or_defer(Entry &entry) const
    {
        try
        {
            persist(entry.session);
            entry.dirty = false;
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Deferring persistence of upload {}: {}", entry.session.upload_id, ex.what());
        }
    }

    void SessionRegistry::remove_record(const std::string &upload_id) const
    {
        std::error_code ec;
        std::filesystem::remove(record_path(upload_id), ec);
        if (ec)
        {
            throw StorageError("Failed to remove " + record_path(upload_id).string() + ": " + ec.message());
        }
    }

} // namespace chunkdrive::server
