#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

#include <asio/thread_pool.hpp>

namespace chunkdrive::server
{

    struct MergeQueueStats
    {
        std::uint64_t scheduled{};
        std::uint64_t deduplicated{};
        std::uint64_t completed{};
        std::size_t in_flight{};
    };

    // Bounded pool of merge workers. At most one job per upload id is queued or
    // running at any time; enqueueing an id that is already pending is a no-op.
    class MergeQueue
    {
    public:
        using Job = std::function<void(const std::string &upload_id)>;

        MergeQueue(std::size_t workers, Job job);
        ~MergeQueue();

        MergeQueue(const MergeQueue &) = delete;
        MergeQueue &operator=(const MergeQueue &) = delete;

        // Returns false when a job for this upload is already pending or the queue is shut down.
        bool enqueue(const std::string &upload_id);

        bool is_pending(const std::string &upload_id) const;

        // Runs an arbitrary task on the merge workers, outside of the per-upload dedupe.
        // Returns false once the queue is shut down.
        bool submit(std::function<void()> task);

        // Waits until no job is queued or running.
        bool wait_idle(std::chrono::milliseconds timeout) const;

        void shutdown();

        MergeQueueStats stats() const;

    private:
        void run(const std::string &upload_id);

        Job job_;
        asio::thread_pool pool_;

        mutable std::mutex mutex_;
        mutable std::condition_variable idle_;
        std::unordered_set<std::string> pending_;
        MergeQueueStats stats_{};
        bool stopped_{false};
    };

} // namespace chunkdrive::server
