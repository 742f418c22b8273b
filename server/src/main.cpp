#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/server/server.hpp"
#include "chunkdrive/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "chunkdrive server " << chunkdrive::version() << "\n"
                  << "Usage: " << program_name << " --port <PORT> --root <ROOT> [options]\n"
                  << "  --address <ADDRESS>          listen address (default 0.0.0.0)\n"
                  << "  --threads <N>                I/O threads (default: hardware concurrency)\n"
                  << "  --staging <DIR>              chunk staging area (default <ROOT>/.chunkdrive/staging)\n"
                  << "  --chunk-size <BYTES>         default chunk size (default 5242880)\n"
                  << "  --max-chunk-size <BYTES>     largest accepted chunk size (default 33554432)\n"
                  << "  --max-chunks <N>             most chunks per upload (default 100000)\n"
                  << "  --upload-timeout <SECONDS>   idle time before an upload is reclaimed (default 86400)\n"
                  << "  --janitor-interval <SECONDS> sweep interval (default 3600)\n"
                  << "  --grace <SECONDS>            janitor grace window (default 60)\n"
                  << "  --merged-retention <SECONDS> how long merged uploads stay queryable (default 86400)\n"
                  << "  --merge-workers <N>          concurrent merges (default 2)\n"
                  << "  --merge-wait <MILLISECONDS>  wait for a concurrent merge (default 10000)\n"
                  << "  --mmap-threshold <BYTES>     memory-map merges of at least this size (default 104857600)\n"
                  << "  --log <FILE>                 also log to FILE\n"
                  << "  --verbose                    debug logging\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using chunkdrive::server::Server;
    using chunkdrive::server::ServerConfig;

    ServerConfig config;

    using Setter = std::function<void(const std::string &)>;
    const std::vector<std::pair<std::string, Setter>> options{
        {"--port", [&](const std::string &v)
         { config.port = static_cast<std::uint16_t>(std::stoi(v)); }},
        {"--root", [&](const std::string &v)
         { config.root = std::filesystem::path(v); }},
        {"--address", [&](const std::string &v)
         { config.address = v; }},
        {"--threads", [&](const std::string &v)
         { config.worker_threads = static_cast<std::size_t>(std::stoul(v)); }},
        {"--staging", [&](const std::string &v)
         { config.staging_dir = std::filesystem::path(v); }},
        {"--chunk-size", [&](const std::string &v)
         { config.default_chunk_size = std::stoull(v); }},
        {"--max-chunk-size", [&](const std::string &v)
         { config.max_chunk_size = std::stoull(v); }},
        {"--max-chunks", [&](const std::string &v)
         { config.max_chunks = std::stoull(v); }},
        {"--upload-timeout", [&](const std::string &v)
         { config.upload_timeout = std::chrono::seconds(std::stoll(v)); }},
        {"--janitor-interval", [&](const std::string &v)
         { config.janitor_interval = std::chrono::seconds(std::stoll(v)); }},
        {"--grace", [&](const std::string &v)
         { config.janitor_grace = std::chrono::seconds(std::stoll(v)); }},
        {"--merged-retention", [&](const std::string &v)
         { config.merged_retention = std::chrono::seconds(std::stoll(v)); }},
        {"--merge-workers", [&](const std::string &v)
         { config.merge_workers = static_cast<std::size_t>(std::stoul(v)); }},
        {"--merge-wait", [&](const std::string &v)
         { config.merge_wait_timeout = std::chrono::milliseconds(std::stoll(v)); }},
        {"--mmap-threshold", [&](const std::string &v)
         { config.mmap_threshold = std::stoull(v); }},
        {"--log", [&](const std::string &v)
         { config.log_file = std::filesystem::path(v); }},
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "--verbose")
        {
            config.verbose = true;
            continue;
        }

        const auto option = std::find_if(options.begin(), options.end(), [&](const auto &entry)
                                         { return entry.first == arg; });
        if (option == options.end())
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        try
        {
            option->second(*value);
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.default_chunk_size == 0 || config.default_chunk_size > config.max_chunk_size)
    {
        std::cerr << "--chunk-size must be between 1 and --max-chunk-size" << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting chunkdrive server {} on {}:{}", chunkdrive::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
