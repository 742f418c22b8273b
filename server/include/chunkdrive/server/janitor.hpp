#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/session_registry.hpp"

namespace chunkdrive::server
{

    struct JanitorOptions
    {
        // Sessions idle for longer than this are reclaimed.
        std::chrono::seconds upload_timeout{std::chrono::hours{24}};
        std::chrono::seconds interval{std::chrono::hours{1}};
        // Staging directories younger than this are never touched, so a session that is
        // being created while the sweep runs keeps its files.
        std::chrono::seconds grace{std::chrono::seconds{60}};
        // How long a merged session stays answerable to status queries.
        std::chrono::seconds merged_retention{std::chrono::hours{24}};
        // Minimum spacing between sweeps triggered from Initialize.
        std::chrono::seconds opportunistic_interval{std::chrono::seconds{60}};
    };

    struct SweepReport
    {
        std::uint64_t expired{};
        std::uint64_t purged_merged{};
        std::uint64_t orphans_removed{};
        std::uint64_t failures{};
    };

    // Reclaims abandoned uploads and leftover staging directories.
    class Janitor
    {
    public:
        Janitor(SessionRegistry &registry, ChunkStore &chunks, JanitorOptions options);
        ~Janitor();

        Janitor(const Janitor &) = delete;
        Janitor &operator=(const Janitor &) = delete;

        SweepReport sweep(Clock::time_point now = Clock::now());

        // Runs a sweep unless one ran within the opportunistic interval.
        bool sweep_if_due(Clock::time_point now = Clock::now());

        // Schedules periodic sweeps on the given context until stop() is called.
        void start(asio::io_context &io_context);
        void stop();

        const JanitorOptions &options() const noexcept { return options_; }

    private:
        void schedule_next();
        bool is_expired(const UploadSession &session, Clock::time_point now) const;
        void remove_orphans(SweepReport &report);

        SessionRegistry &registry_;
        ChunkStore &chunks_;
        JanitorOptions options_;

        std::mutex sweep_mutex_;
        Clock::time_point last_sweep_{};

        std::mutex timer_mutex_;
        std::unique_ptr<asio::steady_timer> timer_;
    };

} // namespace chunkdrive::server
