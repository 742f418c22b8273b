#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/config.hpp"
#include "chunkdrive/server/directory_cache.hpp"
#include "chunkdrive/server/filesystem.hpp"
#include "chunkdrive/server/janitor.hpp"
#include "chunkdrive/server/merger.hpp"
#include "chunkdrive/server/metadata_store.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/upload_coordinator.hpp"

namespace chunkdrive::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        Filesystem filesystem_;
        JsonMetadataStore metadata_store_;
        DirectoryCache directory_cache_;
        ChunkStore chunk_store_;
        SessionRegistry session_registry_;
        Merger merger_;
        Janitor janitor_;
        UploadCoordinator coordinator_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkdrive::server
