#include "chunkdrive/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkdrive::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 8> kCommandMappings{{
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadStatus, "UPLOAD_STATUS"},
            {Command::UploadCancel, "UPLOAD_CANCEL"},
            {Command::UploadList, "UPLOAD_LIST"},
            {Command::UploadMerge, "UPLOAD_MERGE"},
            {Command::List, "LIST"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", std::string(to_string(envelope.command))},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", std::string(to_string(envelope.kind))},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(json.value("error", 0u)));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = optional_string(json, "id");
    }

    ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Ok;
        envelope.error = ErrorCode::Ok;
        envelope.payload = std::move(payload);
        envelope.request_id = request_id;
        return envelope;
    }

    ResponseEnvelope make_error_response(const Error &error, const std::optional<std::string> &request_id)
    {
        ResponseEnvelope envelope;
        envelope.kind = ResponseKind::Error;
        envelope.error = error.code;
        envelope.message = error.message;
        envelope.payload = error.details;
        envelope.request_id = request_id;
        return envelope;
    }

    void to_json(nlohmann::json &json, const FileMetadata &metadata)
    {
        json = {
            {"path", metadata.path},
            {"size", metadata.size},
            {"mtime", metadata.modified_time},
            {"is_dir", metadata.is_directory},
        };
    }

    void from_json(const nlohmann::json &json, FileMetadata &metadata)
    {
        metadata.path = json.at("path").get<std::string>();
        metadata.size = json.value("size", 0ULL);
        metadata.modified_time = json.value("mtime", 0ULL);
        metadata.is_directory = json.value("is_dir", false);
    }

    void to_json(nlohmann::json &json, const ListRequest &request)
    {
        json = {{"path", request.path}};
    }

    void from_json(const nlohmann::json &json, ListRequest &request)
    {
        request.path = json.value("path", std::string{"."});
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"file_size", request.file_size},
            {"target_directory", request.target_directory},
            {"chunk_size", request.chunk_size},
            {"submitter", request.submitter},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.file_size = json.at("file_size").get<std::uint64_t>();
        request.target_directory = json.value("target_directory", std::string{"."});
        request.chunk_size = json.value("chunk_size", 0ULL);
        request.submitter = json.value("submitter", std::string{"anonymous"});
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"total_chunks", response.total_chunks},
            {"chunk_size", response.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"chunk_index", request.chunk_index},
            {"data", request.data_base64},
        };
        if (request.chunk_hash)
        {
            json["chunk_hash"] = *request.chunk_hash;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.chunk_index = json.at("chunk_index").get<std::uint64_t>();
        request.data_base64 = json.at("data").get<std::string>();
        request.chunk_hash = optional_string(json, "chunk_hash");
    }

    void to_json(nlohmann::json &json, const UploadChunkResponse &response)
    {
        json = {
            {"uploaded", response.uploaded},
            {"total", response.total},
            {"complete", response.complete},
        };
    }

    void from_json(const nlohmann::json &json, UploadChunkResponse &response)
    {
        response.uploaded = json.value("uploaded", 0ULL);
        response.total = json.value("total", 0ULL);
        response.complete = json.value("complete", false);
    }

    void to_json(nlohmann::json &json, const UploadRef &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadRef &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const UploadListRequest &request)
    {
        json = nlohmann::json::object();
        if (request.submitter)
        {
            json["submitter"] = *request.submitter;
        }
    }

    void from_json(const nlohmann::json &json, UploadListRequest &request)
    {
        request.submitter = optional_string(json, "submitter");
    }

    void to_json(nlohmann::json &json, const UploadSnapshot &snapshot)
    {
        json = {
            {"upload_id", snapshot.upload_id},
            {"filename", snapshot.filename},
            {"submitter", snapshot.submitter},
            {"target_directory", snapshot.target_directory},
            {"file_size", snapshot.file_size},
            {"chunk_size", snapshot.chunk_size},
            {"total_chunks", snapshot.total_chunks},
            {"uploaded_chunks", snapshot.uploaded_chunks},
            {"missing_chunks", snapshot.missing_chunks},
            {"status", snapshot.status},
            {"progress", snapshot.progress},
            {"created_at", snapshot.created_at},
            {"updated_at", snapshot.updated_at},
        };
        if (snapshot.final_path)
        {
            json["final_path"] = *snapshot.final_path;
        }
        if (snapshot.failure)
        {
            json["failure"] = *snapshot.failure;
        }
    }

    void from_json(const nlohmann::json &json, UploadSnapshot &snapshot)
    {
        snapshot.upload_id = json.at("upload_id").get<std::string>();
        snapshot.filename = json.value("filename", std::string{});
        snapshot.submitter = json.value("submitter", std::string{});
        snapshot.target_directory = json.value("target_directory", std::string{"."});
        snapshot.file_size = json.value("file_size", 0ULL);
        snapshot.chunk_size = json.value("chunk_size", 0ULL);
        snapshot.total_chunks = json.value("total_chunks", 0ULL);
        snapshot.uploaded_chunks = json.value("uploaded_chunks", 0ULL);
        snapshot.missing_chunks = json.value("missing_chunks", std::vector<std::uint64_t>{});
        snapshot.status = json.value("status", std::string{});
        snapshot.progress = json.value("progress", 0.0);
        snapshot.created_at = json.value("created_at", 0LL);
        snapshot.updated_at = json.value("updated_at", 0LL);
        snapshot.final_path = optional_string(json, "final_path");
        if (auto it = json.find("failure"); it != json.end() && it->is_object())
        {
            snapshot.failure = it->get<Error>();
        }
        else
        {
            snapshot.failure.reset();
        }
    }

    void to_json(nlohmann::json &json, const MergeResponse &response)
    {
        json = {
            {"final_path", response.final_path},
            {"file_size", response.file_size},
            {"content_hash", response.content_hash},
        };
    }

    void from_json(const nlohmann::json &json, MergeResponse &response)
    {
        response.final_path = json.at("final_path").get<std::string>();
        response.file_size = json.value("file_size", 0ULL);
        response.content_hash = json.value("content_hash", std::string{});
    }

} // namespace chunkdrive::protocol
