#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/crypto.hpp"
#include "chunkdrive/encoding/base64.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/result.hpp"

using namespace chunkdrive;
using namespace chunkdrive::protocol;

void run_server_component_tests();
void run_upload_flow_tests();
void run_merge_tests();
void run_janitor_tests();

namespace
{

    void test_request_roundtrip()
    {
        UploadInitRequest init{
            .filename = "movie.mkv",
            .file_size = 1ULL << 33,
            .target_directory = "videos",
            .chunk_size = 8 * 1024 * 1024,
            .submitter = "alice",
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadInit;
        envelope.payload = init;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_INIT");
        const auto decoded = json.get<RequestEnvelope>();
        assert(decoded.command == Command::UploadInit);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_init = decoded.payload.get<UploadInitRequest>();
        assert(decoded_init.file_size == init.file_size);
        assert(decoded_init.target_directory == "videos");

        // Optional fields fall back to their defaults.
        const auto minimal = nlohmann::json{{"filename", "a.txt"}, {"file_size", 3}}.get<UploadInitRequest>();
        assert(minimal.target_directory == ".");
        assert(minimal.chunk_size == 0);
        assert(minimal.submitter == "anonymous");

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"cmd", "FORMAT_DISK"}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_error_response_carries_details()
    {
        const auto error = make_error(ErrorCode::SizeMismatch, "Merged size differs",
                                      {{"expected", 10}, {"actual", 9}});
        const auto envelope = make_error_response(error, std::string("r-1"));
        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::SizeMismatch));
        assert(json.at("payload").at("expected") == 10);

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::SizeMismatch);
        assert(decoded.message == "Merged size differs");
        assert(decoded.request_id == std::optional<std::string>{"r-1"});

        const auto ok = nlohmann::json(make_ok_response({{"pong", true}}, std::nullopt));
        assert(ok.at("status") == "OK");
        assert(!ok.contains("id"));
    }

    void test_snapshot_serialization()
    {
        UploadSnapshot snapshot{
            .upload_id = "0123456789abcdef0123456789abcdef",
            .filename = "a.bin",
            .submitter = "bob",
            .target_directory = ".",
            .file_size = 10,
            .chunk_size = 4,
            .total_chunks = 3,
            .uploaded_chunks = 2,
            .missing_chunks = {1},
            .status = "failed",
            .progress = 66.7,
            .created_at = 1700000000000,
            .updated_at = 1700000001000,
            .final_path = std::nullopt,
            .failure = make_error(ErrorCode::MissingChunks, "gap", {{"missing", {1}}}),
        };

        const auto json = nlohmann::json(snapshot);
        assert(!json.contains("final_path"));
        assert(json.at("failure").at("code") == "missing_chunks");
        const auto decoded = json.get<UploadSnapshot>();
        assert(decoded.missing_chunks == snapshot.missing_chunks);
        assert(decoded.status == "failed");
        assert(decoded.failure && decoded.failure->code == ErrorCode::MissingChunks);
        assert(decoded.failure->details.at("missing").at(0) == 1);
        assert(decoded.updated_at == snapshot.updated_at);
    }

    void test_chunk_request()
    {
        const std::array<std::byte, 5> raw{std::byte{'c'}, std::byte{'h'}, std::byte{'u'}, std::byte{'n'},
                                           std::byte{'k'}};
        UploadChunkRequest chunk{
            .upload_id = "0123456789abcdef0123456789abcdef",
            .chunk_index = 4,
            .data_base64 = encoding::encode_base64(raw),
            .chunk_hash = crypto::hash_bytes(raw),
        };
        assert(chunk.data_base64 == "Y2h1bms=");

        const auto json = nlohmann::json(chunk);
        assert(json.contains("data"));
        const auto decoded = json.get<UploadChunkRequest>();
        assert(decoded.chunk_index == 4);
        assert(decoded.chunk_hash == chunk.chunk_hash);
        const auto bytes = encoding::decode_base64(decoded.data_base64);
        assert(bytes && bytes->size() == raw.size());
        assert(std::equal(bytes->begin(), bytes->end(), raw.begin()));

        auto without_hash = json;
        without_hash.erase("chunk_hash");
        assert(!without_hash.get<UploadChunkRequest>().chunk_hash);
    }

    void test_base64()
    {
        assert(encoding::encode_base64({}).empty());
        const auto empty = encoding::decode_base64("");
        assert(empty && empty->empty());

        const auto wrapped = encoding::decode_base64("Y2h1\nbms=");
        assert(wrapped && wrapped->size() == 5);
        assert(!encoding::decode_base64("Y2h1bms*"));
        assert(!encoding::decode_base64("not base64!"));
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::UploadStatus;
        envelope.payload = UploadRef{.upload_id = "0123456789abcdef0123456789abcdef"};

        const auto frame = encode_frame(nlohmann::json(envelope));
        const std::array<std::uint8_t, kFrameHeaderSize> header{frame[0], frame[1], frame[2], frame[3]};
        assert(decode_frame_header(header) == frame.size() - kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_envelope = decoded->message.get<RequestEnvelope>();
        assert(decoded_envelope.command == Command::UploadStatus);
        assert(decoded_envelope.payload.get<UploadRef>().upload_id == "0123456789abcdef0123456789abcdef");

        const std::array<std::uint8_t, 4> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)try_decode_frame(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_error_codes_and_result()
    {
        assert(to_string(ErrorCode::ChunkSizeMismatch) == "chunk_size_mismatch");
        assert(to_string(ErrorCode::MergeTimeout) == "merge_timeout");
        assert(error_code_from_int(to_int(ErrorCode::Conflict)) == ErrorCode::Conflict);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
        assert(is_transient(ErrorCode::StorageError));
        assert(is_transient(ErrorCode::MergeTimeout));
        assert(!is_transient(ErrorCode::IntegrityError));
        assert(!is_transient(ErrorCode::NotFound));

        Result<int> value{42};
        assert(value.ok() && value.code() == ErrorCode::Ok);
        assert(value.value() == 42);

        Result<int> failed{make_error(ErrorCode::NotFound, "gone")};
        assert(!failed);
        assert(failed.code() == ErrorCode::NotFound);
        assert(failed.error().message == "gone");
        bool caught = false;
        try
        {
            (void)failed.value();
        }
        catch (const std::logic_error &)
        {
            caught = true;
        }
        assert(caught);

        assert(ok_result().ok());
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        assert(crypto::hash_stream(stream) == chunk_hash);

        crypto::Hasher hasher;
        hasher.update(std::span<const std::byte>(chunk).first(1));
        hasher.update(std::span<const std::byte>(chunk).subspan(1));
        assert(hasher.finish() == chunk_hash);

        const auto file_path = std::filesystem::temp_directory_path() / "chunkdrive_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);
        std::filesystem::remove(file_path);

        const auto at = std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}};
        const auto id = crypto::derive_upload_id("a.bin", 10, "alice", at);
        assert(crypto::is_upload_id(id));
        assert(id == crypto::derive_upload_id("a.bin", 10, "alice", at));
        assert(id != crypto::derive_upload_id("a.bin", 10, "bob", at));
        assert(id != crypto::derive_upload_id("a.bin", 10, "alice", at + std::chrono::nanoseconds{1}));
        assert(!crypto::is_upload_id("0123456789ABCDEF0123456789ABCDEF"));
        assert(!crypto::is_upload_id("../0123456789abcdef0123456789abc"));
        assert(!crypto::is_upload_id(""));
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_error_response_carries_details();
        test_snapshot_serialization();
        test_chunk_request();
        test_base64();
        test_framing();
        test_error_codes_and_result();
        test_crypto();
        run_server_component_tests();
        run_upload_flow_tests();
        run_merge_tests();
        run_janitor_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All chunkdrive unit tests passed\n";
    return 0;
}
