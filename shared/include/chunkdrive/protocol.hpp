/**
 * chunkdrive - Wire protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/result.hpp"

namespace chunkdrive::protocol
{

    enum class Command : std::uint8_t
    {
        UploadInit,
        UploadChunk,
        UploadStatus,
        UploadCancel,
        UploadList,
        UploadMerge,
        List,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id);
    ResponseEnvelope make_error_response(const Error &error, const std::optional<std::string> &request_id);

    struct FileMetadata
    {
        std::string path;
        std::uint64_t size{};
        std::uint64_t modified_time{};
        bool is_directory{};
    };

    void to_json(nlohmann::json &json, const FileMetadata &metadata);
    void from_json(const nlohmann::json &json, FileMetadata &metadata);

    struct ListRequest
    {
        std::string path;
    };

    void to_json(nlohmann::json &json, const ListRequest &request);
    void from_json(const nlohmann::json &json, ListRequest &request);

    struct UploadInitRequest
    {
        std::string filename;
        std::uint64_t file_size{};
        std::string target_directory{"."};
        std::uint64_t chunk_size{}; // 0 selects the server default
        std::string submitter;
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string upload_id;
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::uint64_t chunk_index{};
        std::string data_base64;
        std::optional<std::string> chunk_hash{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    struct UploadChunkResponse
    {
        std::uint64_t uploaded{};
        std::uint64_t total{};
        bool complete{};
    };

    void to_json(nlohmann::json &json, const UploadChunkResponse &response);
    void from_json(const nlohmann::json &json, UploadChunkResponse &response);

    // Payload of UPLOAD_STATUS, UPLOAD_CANCEL and UPLOAD_MERGE.
    struct UploadRef
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadRef &request);
    void from_json(const nlohmann::json &json, UploadRef &request);

    struct UploadListRequest
    {
        std::optional<std::string> submitter{};
    };

    void to_json(nlohmann::json &json, const UploadListRequest &request);
    void from_json(const nlohmann::json &json, UploadListRequest &request);

    struct UploadSnapshot
    {
        std::string upload_id;
        std::string filename;
        std::string submitter;
        std::string target_directory;
        std::uint64_t file_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t uploaded_chunks{};
        std::vector<std::uint64_t> missing_chunks;
        std::string status;
        double progress{};
        std::int64_t created_at{}; // milliseconds since the unix epoch
        std::int64_t updated_at{};
        std::optional<std::string> final_path{};
        std::optional<Error> failure{};
    };

    void to_json(nlohmann::json &json, const UploadSnapshot &snapshot);
    void from_json(const nlohmann::json &json, UploadSnapshot &snapshot);

    struct MergeResponse
    {
        std::string final_path;
        std::uint64_t file_size{};
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const MergeResponse &response);
    void from_json(const nlohmann::json &json, MergeResponse &response);

} // namespace chunkdrive::protocol
