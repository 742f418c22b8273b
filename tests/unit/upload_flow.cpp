#include <algorithm>
#include <cassert>
#include <cctype>
#include <latch>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/server/upload_coordinator.hpp"
#include "test_support.hpp"

using namespace chunkdrive;
using namespace chunkdrive::server;
using chunkdrive::test::Harness;

namespace
{

    std::vector<std::byte> merge_with_order(const std::string &name, const std::vector<std::byte> &payload,
                                            std::uint64_t chunk_size, const std::vector<std::uint64_t> &order)
    {
        Harness harness(name);
        const auto id = harness.start("data.bin", payload.size(), chunk_size);
        const auto last = harness.send(id, payload, chunk_size, order);
        assert(last.complete);
        assert(harness.coordinator.wait_for_merges(std::chrono::seconds{10}));
        const auto session = harness.session(id);
        assert(session.status == UploadStatus::Merged);
        return test::read_file(harness.storage_path(*session.final_path));
    }

    void test_initialize_validation()
    {
        Harness harness("init_validation", test::HarnessOptions{.max_chunk_size = 4096, .max_chunks = 10});
        auto request = [](std::string filename, std::uint64_t size, std::string target,
                          std::optional<std::uint64_t> chunk_size)
        {
            return InitializeRequest{
                .filename = std::move(filename),
                .declared_size = size,
                .target_directory = std::move(target),
                .chunk_size = chunk_size,
                .submitter = "alice",
            };
        };

        assert(harness.coordinator.initialize(request("a.bin", 0, ".", std::nullopt)).code() ==
               ErrorCode::InvalidRequest);
        assert(harness.coordinator.initialize(request("", 10, ".", std::nullopt)).code() ==
               ErrorCode::InvalidRequest);
        assert(harness.coordinator.initialize(request("dir/a.bin", 10, ".", std::nullopt)).code() ==
               ErrorCode::InvalidRequest);
        assert(harness.coordinator.initialize(request("a.bin", 10, "../outside", std::nullopt)).code() ==
               ErrorCode::InvalidRequest);
        assert(harness.coordinator.initialize(request("a.bin", 10, ".chunkdrive", std::nullopt)).code() ==
               ErrorCode::InvalidRequest);
        assert(harness.coordinator.initialize(request("a.bin", 10, ".", 8192)).code() == ErrorCode::InvalidRequest);
        // 11 chunks of 1 byte exceed the limit of 10.
        assert(harness.coordinator.initialize(request("a.bin", 11, ".", 1)).code() == ErrorCode::InvalidRequest);
        assert(harness.registry.size() == 0);

        auto defaulted = harness.coordinator.initialize(request("a.bin", 2500, "docs", std::nullopt));
        assert(defaulted);
        assert(defaulted.value().chunk_size == 1024);
        assert(defaulted.value().total_chunks == 3);
        assert(crypto::is_upload_id(defaulted.value().upload_id));
        assert(std::filesystem::is_directory(harness.chunks.upload_directory(defaulted.value().upload_id)));

        auto explicit_size = harness.coordinator.initialize(request("a.bin", 2500, "docs", 500));
        assert(explicit_size);
        assert(explicit_size.value().total_chunks == 5);
        assert(explicit_size.value().upload_id != defaulted.value().upload_id);

        const auto status = harness.coordinator.status(defaulted.value().upload_id);
        assert(status);
        assert(status.value().status == "initialized");
        assert(status.value().missing_chunks.size() == 3);
        assert(status.value().target_directory == "docs");
    }

    void test_size_invariant()
    {
        const std::vector<std::uint64_t> sizes{1, 2, 999, 1000, 1001, 4096, 65537};
        const std::vector<std::uint64_t> chunk_sizes{1, 3, 1000, 4096, 100000};
        for (const auto size : sizes)
        {
            for (const auto chunk_size : chunk_sizes)
            {
                const auto total = chunk_count_for(size, chunk_size);
                assert(total == (size + chunk_size - 1) / chunk_size);
                std::uint64_t sum = 0;
                for (std::uint64_t index = 0; index < total; ++index)
                {
                    const auto length = chunk_length_for(size, chunk_size, index);
                    assert(length > 0 && length <= chunk_size);
                    sum += length;
                }
                assert(sum == size);
            }
        }
    }

    void test_round_trip()
    {
        Harness harness("round_trip");
        const auto payload = test::make_payload(10000, 11);
        const auto id = harness.start("report.pdf", payload.size(), 1024, "docs/2024", "bob");
        const auto total = chunk_count_for(payload.size(), 1024);

        for (std::uint64_t index = 0; index + 1 < total; ++index)
        {
            const auto progress = harness.coordinator.upload_chunk(id, index, test::chunk_of(payload, 1024, index));
            assert(progress);
            assert(progress.value().uploaded == index + 1);
            assert(progress.value().total == total);
            assert(!progress.value().complete);
        }
        const auto in_progress = harness.coordinator.status(id).value();
        assert(in_progress.status == "in_progress");
        assert((in_progress.missing_chunks == std::vector<std::uint64_t>{total - 1}));
        assert(in_progress.progress > 80.0 && in_progress.progress < 100.0);

        const auto hash = crypto::hash_bytes(test::chunk_of(payload, 1024, total - 1));
        const auto last = harness.coordinator.upload_chunk(id, total - 1, test::chunk_of(payload, 1024, total - 1),
                                                           hash);
        assert(last);
        assert(last.value().complete);
        assert(last.value().uploaded == total);

        assert(harness.coordinator.wait_for_merges(std::chrono::seconds{10}));
        const auto merged = harness.coordinator.status(id).value();
        assert(merged.status == "merged");
        assert(merged.final_path == std::optional<std::string>{"docs/2024/report.pdf"});
        assert(merged.progress == 100.0);

        const auto stored = test::read_file(harness.storage_path("docs/2024/report.pdf"));
        assert(stored.size() == payload.size());
        assert(stored == payload);
        assert(harness.session(id).content_hash == crypto::hash_bytes(payload));

        const auto records = harness.metadata.records();
        assert(records.size() == 1);
        assert(records[0].path == "docs/2024/report.pdf");
        assert(records[0].size == payload.size());
        assert(records[0].content_hash == crypto::hash_bytes(payload));
        assert(!records[0].is_directory);
        assert(records[0].parent_path == "docs/2024");
        const auto operations = harness.metadata.operations();
        assert(operations.size() == 1 && operations[0].submitter == "bob" && operations[0].success);
        assert((harness.cache.invalidated() == std::vector<std::string>{"docs/2024"}));

        assert(!std::filesystem::exists(harness.chunks.upload_directory(id)));

        // A merged upload accepts no more chunks.
        assert(harness.coordinator.upload_chunk(id, 0, test::chunk_of(payload, 1024, 0)).code() ==
               ErrorCode::NotFound);
    }

    void test_idempotent_chunk_writes()
    {
        const auto payload = test::make_payload(3000, 5);
        Harness harness("idempotent");
        const auto id = harness.start("data.bin", payload.size(), 1024);

        const auto first = harness.coordinator.upload_chunk(id, 1, test::chunk_of(payload, 1024, 1)).value();
        const auto second = harness.coordinator.upload_chunk(id, 1, test::chunk_of(payload, 1024, 1)).value();
        assert(first.uploaded == 1);
        assert(second.uploaded == 1);
        assert(harness.session(id).received_chunks.size() == 1);

        harness.send(id, payload, 1024, {0, 0, 2});
        assert(harness.coordinator.wait_for_merges(std::chrono::seconds{10}));
        const auto session = harness.session(id);
        assert(session.status == UploadStatus::Merged);
        assert(test::read_file(harness.storage_path(*session.final_path)) == payload);
        assert(harness.merger.stats().started == 1);
    }

    void test_order_independence()
    {
        const auto payload = test::make_payload(20 * 512 + 17, 23);
        const std::uint64_t chunk_size = 512;
        const auto total = chunk_count_for(payload.size(), chunk_size);

        const auto forward = test::forward_order(total);
        auto reverse = forward;
        std::reverse(reverse.begin(), reverse.end());
        auto shuffled = forward;
        std::mt19937 rng(42);
        std::shuffle(shuffled.begin(), shuffled.end(), rng);

        const auto from_forward = merge_with_order("order_forward", payload, chunk_size, forward);
        assert(from_forward == payload);
        assert(merge_with_order("order_reverse", payload, chunk_size, reverse) == from_forward);
        assert(merge_with_order("order_random", payload, chunk_size, shuffled) == from_forward);

        Harness harness("order_parallel");
        const auto id = harness.start("data.bin", payload.size(), chunk_size);
        constexpr std::uint64_t kThreads = 4;
        std::latch ready(kThreads);
        std::vector<std::thread> threads;
        for (std::uint64_t t = 0; t < kThreads; ++t)
        {
            threads.emplace_back([&, t]
                                 {
                ready.arrive_and_wait();
                for (std::uint64_t index = t; index < total; index += kThreads)
                {
                    auto progress = harness.coordinator.upload_chunk(id, index, test::chunk_of(payload, chunk_size, index));
                    assert(progress);
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(harness.coordinator.wait_for_merges(std::chrono::seconds{10}));
        const auto session = harness.session(id);
        assert(session.status == UploadStatus::Merged);
        assert(test::read_file(harness.storage_path(*session.final_path)) == from_forward);
        assert(harness.merger.stats().started == 1);
    }

    void test_chunk_validation()
    {
        Harness harness("chunk_validation");
        const auto payload = test::make_payload(2500, 3);
        const auto id = harness.start("data.bin", payload.size(), 1024);

        // The last chunk is 452 bytes; a full-size payload for it is rejected.
        const auto oversized = harness.coordinator.upload_chunk(id, 2, test::chunk_of(payload, 1024, 0));
        assert(oversized.code() == ErrorCode::ChunkSizeMismatch);
        assert(oversized.error().details.at("expected") == 452);
        assert(harness.coordinator.upload_chunk(id, 0, test::chunk_of(payload, 1024, 2)).code() ==
               ErrorCode::ChunkSizeMismatch);

        const auto tampered = harness.coordinator.upload_chunk(id, 0, test::chunk_of(payload, 1024, 0),
                                                               crypto::hash_bytes(test::chunk_of(payload, 1024, 1)));
        assert(tampered.code() == ErrorCode::IntegrityError);
        assert(!harness.chunks.exists(id, 0));
        assert(harness.session(id).status == UploadStatus::Initialized);

        auto upper_hash = crypto::hash_bytes(test::chunk_of(payload, 1024, 0));
        std::transform(upper_hash.begin(), upper_hash.end(), upper_hash.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        const auto upper = harness.coordinator.upload_chunk(id, 0, test::chunk_of(payload, 1024, 0), upper_hash);
        assert(upper && upper.value().uploaded == 1);
        assert(harness.chunks.exists(id, 0));

        assert(harness.coordinator.upload_chunk(id, 3, test::chunk_of(payload, 1024, 2)).code() ==
               ErrorCode::InvalidRequest);
        assert(harness.coordinator
                   .upload_chunk("0123456789abcdef0123456789abcdef", 0, test::chunk_of(payload, 1024, 0))
                   .code() == ErrorCode::NotFound);
        assert(harness.coordinator.upload_chunk("not-an-id", 0, test::chunk_of(payload, 1024, 0)).code() ==
               ErrorCode::NotFound);
        assert(harness.coordinator.status("0123456789abcdef0123456789abcdef").code() == ErrorCode::NotFound);
    }

    void test_cancel()
    {
        Harness harness("cancel");
        const auto payload = test::make_payload(4096, 9);
        const auto id = harness.start("data.bin", payload.size(), 1024);
        harness.send(id, payload, 1024, {0, 1});
        assert(harness.chunks.list_indices(id).size() == 2);

        assert(harness.coordinator.cancel(id));
        assert(harness.coordinator.status(id).code() == ErrorCode::NotFound);
        assert(!std::filesystem::exists(harness.chunks.upload_directory(id)));
        assert(!std::filesystem::exists(harness.registry.records_dir() / (id + ".json")));
        assert(harness.coordinator.upload_chunk(id, 2, test::chunk_of(payload, 1024, 2)).code() ==
               ErrorCode::NotFound);
        assert(harness.coordinator.cancel(id).code() == ErrorCode::NotFound);
        assert(harness.coordinator.list().empty());
    }

    void test_list_by_submitter()
    {
        Harness harness("list");
        const auto a = harness.start("a.bin", 100, 10, ".", "alice");
        const auto b = harness.start("b.bin", 100, 10, ".", "bob");
        const auto c = harness.start("c.bin", 100, 10, ".", "alice");

        const auto all = harness.coordinator.list();
        assert(all.size() == 3);
        assert(all[0].missing_chunks.empty());

        const auto alice = harness.coordinator.list(std::string{"alice"});
        assert(alice.size() == 2);
        for (const auto &snapshot : alice)
        {
            assert(snapshot.submitter == "alice");
            assert(snapshot.upload_id == a || snapshot.upload_id == c);
        }
        const auto bob = harness.coordinator.list(std::string{"bob"});
        assert(bob.size() == 1 && bob[0].upload_id == b);
        assert(harness.coordinator.list(std::string{"carol"}).empty());
    }

} // namespace

void run_upload_flow_tests()
{
    test_initialize_validation();
    test_size_invariant();
    test_round_trip();
    test_idempotent_chunk_writes();
    test_order_independence();
    test_chunk_validation();
    test_cancel();
    test_list_by_submitter();
}
