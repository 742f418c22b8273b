#include "chunkdrive/server/merge_queue.hpp"

#include <asio/post.hpp>
#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    MergeQueue::MergeQueue(std::size_t workers, Job job)
        : job_(std::move(job)), pool_(workers == 0 ? 1 : workers) {}

    MergeQueue::~MergeQueue()
    {
        shutdown();
    }

    bool MergeQueue::enqueue(const std::string &upload_id)
    {
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                spdlog::warn("Merge queue is shut down; upload {} not scheduled", upload_id);
                return false;
            }
            if (!pending_.insert(upload_id).second)
            {
                ++stats_.deduplicated;
                spdlog::debug("Merge for {} already pending", upload_id);
                return false;
            }
            ++stats_.scheduled;
            stats_.in_flight = pending_.size();
        }
        asio::post(pool_, [this, upload_id]
                   { run(upload_id); });
        return true;
    }

    bool MergeQueue::submit(std::function<void()> task)
    {
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                return false;
            }
        }
        asio::post(pool_, [task = std::move(task)]
                   {
            try
            {
                task();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Merge worker task raised: {}", ex.what());
            } });
        return true;
    }

    bool MergeQueue::is_pending(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        return pending_.contains(upload_id);
    }

    bool MergeQueue::wait_idle(std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(mutex_);
        return idle_.wait_for(lock, timeout, [this]
                              { return pending_.empty(); });
    }

    void MergeQueue::shutdown()
    {
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                return;
            }
            stopped_ = true;
        }
        // Lets queued merges finish; an interrupted one is resumed from its record on restart.
        pool_.join();
    }

    MergeQueueStats MergeQueue::stats() const
    {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    void MergeQueue::run(const std::string &upload_id)
    {
        try
        {
            job_(upload_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Merge job for {} raised: {}", upload_id, ex.what());
        }

        std::lock_guard lock(mutex_);
        pending_.erase(upload_id);
        ++stats_.completed;
        stats_.in_flight = pending_.size();
        if (pending_.empty())
        {
            idle_.notify_all();
        }
    }

} // namespace chunkdrive::server
