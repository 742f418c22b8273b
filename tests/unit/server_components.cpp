#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <latch>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/chunk_store.hpp"
#include "chunkdrive/server/directory_cache.hpp"
#include "chunkdrive/server/filesystem.hpp"
#include "chunkdrive/server/merge_queue.hpp"
#include "chunkdrive/server/metadata_store.hpp"
#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/upload_session.hpp"
#include "test_support.hpp"

using namespace chunkdrive;
using namespace chunkdrive::server;
using chunkdrive::test::TempRoot;

namespace
{

    UploadSession make_session(const std::string &filename, std::uint64_t size, std::uint64_t chunk_size)
    {
        UploadSession session{};
        session.created_at = Clock::now();
        session.updated_at = session.created_at;
        session.upload_id = crypto::derive_upload_id(filename, size, "alice", session.created_at);
        session.filename = filename;
        session.submitter = "alice";
        session.declared_size = size;
        session.chunk_size = chunk_size;
        session.total_chunks = chunk_count_for(size, chunk_size);
        return session;
    }

    void test_filesystem_paths()
    {
        TempRoot temp("fs");
        Filesystem fs(temp.path());
        std::filesystem::create_directories(fs.root() / "docs");
        std::filesystem::create_directories(fs.root() / ".chunkdrive" / "staging");

        assert(fs.is_safe("."));
        assert(fs.is_safe("docs/reports"));
        assert(!fs.is_safe(""));
        assert(!fs.is_safe("../forbidden"));
        assert(!fs.is_safe("docs/../../etc"));
        assert(!fs.is_safe("/etc"));
        assert(!fs.is_safe(".chunkdrive/staging"));

        assert(fs.resolve("docs/") == fs.root() / "docs");
        assert(fs.relative(fs.root() / "docs" / "a.txt") == "docs/a.txt");
        assert(fs.relative(fs.root()) == ".");

        bool caught = false;
        try
        {
            (void)fs.resolve("../forbidden");
        }
        catch (const FilesystemError &ex)
        {
            caught = ex.code() == ErrorCode::InvalidRequest;
        }
        assert(caught);

        const auto entries = fs.list_directory(".");
        assert(entries.size() == 1);
        assert(entries[0].path == "docs");
        assert(entries[0].is_directory);

        caught = false;
        try
        {
            (void)fs.list_directory("missing");
        }
        catch (const FilesystemError &ex)
        {
            caught = ex.code() == ErrorCode::NotFound;
        }
        assert(caught);
    }

    void test_chunk_store()
    {
        TempRoot temp("chunks");
        ChunkStore store(temp.path() / "staging");
        const auto session = make_session("a.bin", 10, 4);
        const auto &id = session.upload_id;

        const auto first = test::make_payload(4, 1);
        const auto second = test::make_payload(4, 2);
        store.write(id, 0, first);
        store.write(id, 2, second);
        assert(store.exists(id, 0));
        assert(!store.exists(id, 1));
        assert(store.read(id, 2) == second);
        assert((store.list_indices(id) == std::set<std::uint64_t>{0, 2}));

        // Rewriting an index replaces its content.
        store.write(id, 0, second);
        assert(store.read(id, 0) == second);
        assert(store.list_indices(id).size() == 2);

        const auto uploads = store.list_uploads();
        assert(uploads.size() == 1 && uploads[0] == id);

        store.delete_all(id);
        assert(!std::filesystem::exists(store.upload_directory(id)));
        assert(store.list_indices(id).empty());

        bool caught = false;
        try
        {
            (void)store.chunk_path("../escape", 0);
        }
        catch (const StorageError &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            (void)store.read(id, 0);
        }
        catch (const StorageError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_upload_session_state_machine()
    {
        assert(chunk_count_for(10, 4) == 3);
        assert(chunk_count_for(8, 4) == 2);
        assert(chunk_count_for(0, 4) == 0);
        assert(chunk_length_for(10, 4, 2) == 2);
        assert(chunk_length_for(8, 4, 1) == 4);
        assert(chunk_length_for(10, 4, 3) == 0);

        auto session = make_session("a.bin", 10, 4);
        assert(session.status == UploadStatus::Initialized);
        assert(session.mark_chunk_received(1, Clock::now()));
        assert(session.status == UploadStatus::InProgress);
        assert(!session.mark_chunk_received(1, Clock::now()));
        assert((session.missing_chunks() == std::vector<std::uint64_t>{0, 2}));
        session.mark_chunk_received(0, Clock::now());
        session.mark_chunk_received(2, Clock::now());
        assert(session.status == UploadStatus::AllReceived);

        bool caught = false;
        try
        {
            session.transition(UploadStatus::Merged, Clock::now());
        }
        catch (const std::logic_error &)
        {
            caught = true;
        }
        assert(caught);

        session.transition(UploadStatus::Merging, Clock::now());
        session.transition(UploadStatus::Failed, Clock::now());
        session.failure = make_error(ErrorCode::SizeMismatch, "bad size", {{"expected", 10}, {"actual", 9}});
        session.transition(UploadStatus::Merging, Clock::now());
        assert(!is_transition_allowed(UploadStatus::Merging, UploadStatus::Cancelled));
        assert(!is_transition_allowed(UploadStatus::Merged, UploadStatus::Cancelled));
        assert(is_terminal(UploadStatus::Cancelled));

        const nlohmann::json json = session;
        const auto decoded = json.get<UploadSession>();
        assert(decoded.upload_id == session.upload_id);
        assert(decoded.status == UploadStatus::Merging);
        assert(decoded.received_chunks == session.received_chunks);
        assert(decoded.failure.has_value());
        assert(decoded.failure->details.at("actual") == 9);

        auto broken = json;
        broken["total_chunks"] = 7;
        caught = false;
        try
        {
            (void)broken.get<UploadSession>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);

        const auto snapshot = decoded.snapshot();
        assert(snapshot.status == "merging");
        assert(snapshot.uploaded_chunks == 3);
        assert(snapshot.progress == 100.0);
    }

    void test_registry_parallel_record_chunk()
    {
        TempRoot temp("registry_parallel");
        SessionRegistry registry(temp.path() / "sessions");
        const auto session = make_session("a.bin", 64, 1);
        assert(registry.create(session));
        assert(registry.create(session).code() == ErrorCode::Conflict);

        constexpr int kThreads = 8;
        std::atomic<int> completions{0};
        std::latch ready(kThreads);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t)
        {
            threads.emplace_back([&, t]
                                 {
                ready.arrive_and_wait();
                for (std::uint64_t index = static_cast<std::uint64_t>(t); index < 64; index += kThreads)
                {
                    auto receipt = registry.record_chunk(session.upload_id, index);
                    assert(receipt);
                    if (receipt.value().became_complete)
                    {
                        ++completions;
                    }
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }

        assert(completions == 1);
        const auto stored = registry.get(session.upload_id);
        assert(stored->received_chunks.size() == 64);
        assert(stored->status == UploadStatus::AllReceived);

        auto duplicate = registry.record_chunk(session.upload_id, 3);
        assert(duplicate && !duplicate.value().became_complete && !duplicate.value().newly_recorded);
        assert(registry.record_chunk(session.upload_id, 64).code() == ErrorCode::InvalidRequest);
        assert(registry.record_chunk("0123456789abcdef0123456789abcdef", 0).code() == ErrorCode::NotFound);
    }

    void test_registry_reload()
    {
        TempRoot temp("registry_reload");
        const auto records = temp.path() / "sessions";
        auto merging = make_session("m.bin", 8, 4);
        auto partial = make_session("p.bin", 12, 4);
        {
            SessionRegistry registry(records);
            assert(registry.create(merging));
            assert(registry.create(partial));
            (void)registry.record_chunk(merging.upload_id, 0).value();
            (void)registry.record_chunk(merging.upload_id, 1).value();
            (void)registry.record_chunk(partial.upload_id, 2).value();
            auto claimed = registry.update(merging.upload_id, [](UploadSession &session) -> std::optional<Error>
                                           {
                session.transition(UploadStatus::Merging, Clock::now());
                return std::nullopt; });
            assert(claimed);

            const auto illegal = registry.update(partial.upload_id, [](UploadSession &session) -> std::optional<Error>
                                                 {
                session.transition(UploadStatus::Merged, Clock::now());
                return std::nullopt; });
            assert(illegal.code() == ErrorCode::Conflict);
            assert(registry.get(partial.upload_id)->status == UploadStatus::InProgress);
        }
        {
            std::ofstream corrupt(records / "ffffffffffffffffffffffffffffffff.json");
            corrupt << "{ not json";
        }

        SessionRegistry reloaded(records);
        assert(reloaded.size() == 2);
        const auto resumed = reloaded.get(merging.upload_id);
        assert(resumed->status == UploadStatus::AllReceived);
        assert(resumed->received_chunks.size() == 2);
        const auto restored = reloaded.get(partial.upload_id);
        assert(restored->status == UploadStatus::InProgress);
        assert((restored->received_chunks == std::set<std::uint64_t>{2}));

        assert(reloaded.remove(partial.upload_id));
        assert(!reloaded.get(partial.upload_id));
        assert(!std::filesystem::exists(records / (partial.upload_id + ".json")));
    }

    void test_metadata_store()
    {
        TempRoot temp("metadata");
        {
            JsonMetadataStore store(temp.path());
            store.save_record(FileRecord{
                .path = "docs/a.txt",
                .size = 10,
                .content_hash = "abc",
                .is_directory = false,
                .parent_path = "docs",
            });
            store.save_record(FileRecord{.path = "b.txt", .size = 1, .parent_path = "."});
            store.delete_record("b.txt");
            store.record_operation(OperationRecord{
                .operation = "upload",
                .path = "docs/a.txt",
                .submitter = "alice",
                .size = 10,
                .duration = std::chrono::milliseconds{5},
                .success = true,
            });
        }

        JsonMetadataStore reopened(temp.path());
        const auto record = reopened.find("docs/a.txt");
        assert(record.has_value());
        assert(record->content_hash == "abc");
        assert(record->parent_path == "docs");
        assert(!reopened.find("b.txt"));

        std::ifstream log(temp.path() / ".chunkdrive" / "operations.log");
        std::string line;
        std::getline(log, line);
        const auto entry = nlohmann::json::parse(line);
        assert(entry.at("operation") == "upload");
        assert(entry.at("submitter") == "alice");
    }

    void test_directory_cache()
    {
        TempRoot temp("cache");
        Filesystem fs(temp.path());
        std::filesystem::create_directories(fs.root() / "docs" / "nested");
        DirectoryCache cache(fs, std::chrono::seconds{3600});

        assert(cache.list("docs").size() == 1);
        assert(cache.list("docs/nested").empty());
        assert(cache.list(".").size() == 1);
        assert(cache.size() == 3);

        std::ofstream(fs.root() / "docs" / "new.txt") << "x";
        assert(cache.list("docs/").size() == 1);

        cache.invalidate("docs");
        assert(cache.size() == 1);
        assert(cache.list("docs").size() == 2);

        cache.invalidate(".");
        assert(cache.size() == 0);
    }

    void test_merge_queue_deduplicates()
    {
        std::mutex mutex;
        std::condition_variable released;
        bool open = false;
        std::atomic<int> runs{0};
        MergeQueue queue(2, [&](const std::string &)
                         {
            ++runs;
            std::unique_lock lock(mutex);
            released.wait(lock, [&] { return open; }); });

        assert(queue.enqueue("a"));
        assert(!queue.enqueue("a"));
        assert(queue.enqueue("b"));
        assert(queue.is_pending("a"));
        assert(!queue.wait_idle(std::chrono::milliseconds{20}));
        {
            std::lock_guard lock(mutex);
            open = true;
        }
        released.notify_all();
        assert(queue.wait_idle(std::chrono::seconds{10}));

        const auto stats = queue.stats();
        assert(stats.scheduled == 2);
        assert(stats.deduplicated == 1);
        assert(stats.completed == 2);
        assert(stats.in_flight == 0);
        assert(runs == 2);

        // Once the job finished the same id may be scheduled again.
        assert(queue.enqueue("a"));
        assert(queue.wait_idle(std::chrono::seconds{10}));
        queue.shutdown();
        assert(!queue.enqueue("c"));
    }

} // namespace

void run_server_component_tests()
{
    test_filesystem_paths();
    test_chunk_store();
    test_upload_session_state_machine();
    test_registry_parallel_record_chunk();
    test_registry_reload();
    test_metadata_store();
    test_directory_cache();
    test_merge_queue_deduplicates();
}
