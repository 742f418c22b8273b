#include "chunkdrive/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/session.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kListingCacheTtl = std::chrono::seconds{30};
        constexpr auto kSessionsDir = ".sessions";

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          filesystem_(config_.root),
          metadata_store_(filesystem_.root()),
          directory_cache_(filesystem_, kListingCacheTtl),
          chunk_store_(config_.resolved_staging_dir()),
          session_registry_(chunk_store_.root() / kSessionsDir),
          merger_(session_registry_, chunk_store_, filesystem_, metadata_store_, directory_cache_,
                  MergerOptions{
                      .mmap_threshold = config_.mmap_threshold,
                      .wait_timeout = config_.merge_wait_timeout,
                  }),
          janitor_(session_registry_, chunk_store_,
                   JanitorOptions{
                       .upload_timeout = config_.upload_timeout,
                       .interval = config_.janitor_interval,
                       .grace = config_.janitor_grace,
                       .merged_retention = config_.merged_retention,
                   }),
          coordinator_(session_registry_, chunk_store_, merger_, filesystem_, janitor_,
                       CoordinatorOptions{
                           .default_chunk_size = config_.default_chunk_size,
                           .max_chunk_size = config_.max_chunk_size,
                           .max_chunks = config_.max_chunks,
                           .merge_workers = config_.merge_workers,
                       })
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {} (staging {})", config_.address, config_.port,
                     filesystem_.root().string(), chunk_store_.root().string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        janitor_.start(io_context_);
        coordinator_.resume_pending_merges();
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads, {} merge workers", worker_count,
                     config_.merge_workers);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }

        coordinator_.shutdown();
        const auto pending = session_registry_.flush_pending();
        if (pending > 0)
        {
            spdlog::warn("{} session record(s) could not be written before exit", pending);
        }
        spdlog::info("Server stopped");
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{filesystem_, directory_cache_, coordinator_};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        janitor_.stop();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkdrive::server
