#include "chunkdrive/server/janitor.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    Janitor::Janitor(SessionRegistry &registry, ChunkStore &chunks, JanitorOptions options)
        : registry_(registry), chunks_(chunks), options_(options)
    {
    }

    Janitor::~Janitor()
    {
        stop();
    }

    SweepReport Janitor::sweep(Clock::time_point now)
    {
        std::lock_guard sweep_lock(sweep_mutex_);
        last_sweep_ = now;
        SweepReport report{};

        for (const auto &candidate : registry_.list())
        {
            const auto &upload_id = candidate.upload_id;
            if (candidate.status == UploadStatus::Merged)
            {
                const auto age = now - candidate.updated_at;
                if (age > options_.merged_retention &&
                    registry_.remove_if(upload_id, [](const UploadSession &session)
                                        { return session.status == UploadStatus::Merged; }))
                {
                    ++report.purged_merged;
                    spdlog::debug("Forgot merged upload {}", upload_id);
                }
                try
                {
                    // Normally already gone; left behind when the post-merge cleanup failed.
                    chunks_.delete_all(upload_id);
                }
                catch (const StorageError &ex)
                {
                    ++report.failures;
                    spdlog::warn("Failed to clean staging of merged upload {}: {}", upload_id, ex.what());
                }
                continue;
            }

            if (!is_expired(candidate, now))
            {
                continue;
            }
            // The predicate is re-checked under the session lock so a chunk that arrives
            // between listing and removal keeps the session alive.
            auto removed = registry_.remove_if(upload_id, [&](const UploadSession &session)
                                               { return is_expired(session, now); });
            if (!removed)
            {
                continue;
            }
            ++report.expired;
            try
            {
                chunks_.delete_all(upload_id);
            }
            catch (const StorageError &ex)
            {
                ++report.failures;
                spdlog::error("Failed to reclaim staging of {}: {}", upload_id, ex.what());
                continue;
            }
            const auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - removed->updated_at);
            spdlog::info("Reclaimed expired upload {} ({}, {}/{} chunks, idle {}s)", upload_id, removed->filename,
                         removed->received_chunks.size(), removed->total_chunks, idle.count());
        }

        remove_orphans(report);

        const auto pending = registry_.flush_pending();
        if (pending > 0)
        {
            spdlog::warn("{} session record(s) still could not be written", pending);
        }

        if (report.expired + report.purged_merged + report.orphans_removed + report.failures > 0)
        {
            spdlog::info("Janitor sweep: {} expired, {} merged forgotten, {} orphan(s) removed, {} failure(s)",
                         report.expired, report.purged_merged, report.orphans_removed, report.failures);
        }
        return report;
    }

    bool Janitor::sweep_if_due(Clock::time_point now)
    {
        {
            std::lock_guard sweep_lock(sweep_mutex_);
            if (last_sweep_ != Clock::time_point{} && now - last_sweep_ < options_.opportunistic_interval)
            {
                return false;
            }
        }
        sweep(now);
        return true;
    }

    void Janitor::start(asio::io_context &io_context)
    {
        {
            std::lock_guard lock(timer_mutex_);
            timer_ = std::make_unique<asio::steady_timer>(io_context);
        }
        spdlog::info("Janitor sweeping every {}s (upload timeout {}s)", options_.interval.count(),
                     options_.upload_timeout.count());
        schedule_next();
    }

    void Janitor::stop()
    {
        std::lock_guard lock(timer_mutex_);
        if (timer_)
        {
            timer_->cancel();
            timer_.reset();
        }
    }

    void Janitor::schedule_next()
    {
        std::lock_guard lock(timer_mutex_);
        if (!timer_)
        {
            return;
        }
        timer_->expires_after(options_.interval);
        timer_->async_wait([this](const std::error_code &ec)
                           {
            if (ec)
            {
                return;
            }
            try
            {
                sweep();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Janitor sweep failed: {}", ex.what());
            }
            schedule_next(); });
    }

    bool Janitor::is_expired(const UploadSession &session, Clock::time_point now) const
    {
        if (is_terminal(session.status) || session.status == UploadStatus::Merging)
        {
            return false;
        }
        const auto idle = now - session.updated_at;
        return idle > options_.upload_timeout && idle > options_.grace;
    }

    void Janitor::remove_orphans(SweepReport &report)
    {
        std::vector<std::string> uploads;
        try
        {
            uploads = chunks_.list_uploads();
        }
        catch (const StorageError &ex)
        {
            ++report.failures;
            spdlog::error("Failed to scan staging area: {}", ex.what());
            return;
        }

        const auto now = std::filesystem::file_time_type::clock::now();
        for (const auto &upload_id : uploads)
        {
            if (registry_.get(upload_id))
            {
                continue;
            }
            try
            {
                if (now - chunks_.last_write_time(upload_id) <= options_.grace)
                {
                    continue;
                }
                chunks_.delete_all(upload_id);
                ++report.orphans_removed;
                spdlog::info("Removed orphaned staging directory {}", upload_id);
            }
            catch (const StorageError &ex)
            {
                ++report.failures;
                spdlog::warn("Failed to remove orphaned staging directory {}: {}", upload_id, ex.what());
            }
        }
    }

} // namespace chunkdrive::server
