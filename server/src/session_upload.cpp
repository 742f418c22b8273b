#include "chunkdrive/server/session.hpp"

#include <asio/post.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/encoding/base64.hpp"

namespace chunkdrive::server
{

    void Session::handle_upload_init(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::UploadInitRequest request;
        try
        {
            request = envelope.payload.get<chunkdrive::protocol::UploadInitRequest>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        auto initialized = services_.coordinator.initialize(InitializeRequest{
            .filename = request.filename,
            .declared_size = request.file_size,
            .target_directory = request.target_directory,
            .chunk_size = request.chunk_size > 0 ? std::optional<std::uint64_t>{request.chunk_size} : std::nullopt,
            .submitter = request.submitter,
        });
        if (!initialized)
        {
            send_error(initialized.error(), envelope.request_id);
            return;
        }
        const auto &result = initialized.value();
        const chunkdrive::protocol::UploadInitResponse response{
            .upload_id = result.upload_id,
            .total_chunks = result.total_chunks,
            .chunk_size = result.chunk_size,
        };
        send_response(chunkdrive::protocol::make_ok_response(response, envelope.request_id));
    }

    void Session::handle_upload_chunk(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::UploadChunkRequest request;
        try
        {
            request = envelope.payload.get<chunkdrive::protocol::UploadChunkRequest>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        const auto data = chunkdrive::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, "Invalid chunk data", envelope.request_id);
            return;
        }

        auto progress = services_.coordinator.upload_chunk(request.upload_id, request.chunk_index, *data,
                                                           request.chunk_hash);
        if (!progress)
        {
            send_error(progress.error(), envelope.request_id);
            return;
        }
        const chunkdrive::protocol::UploadChunkResponse response{
            .uploaded = progress.value().uploaded,
            .total = progress.value().total,
            .complete = progress.value().complete,
        };
        send_response(chunkdrive::protocol::make_ok_response(response, envelope.request_id));
    }

    void Session::handle_upload_status(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::UploadRef request;
        try
        {
            request = envelope.payload.get<chunkdrive::protocol::UploadRef>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        auto snapshot = services_.coordinator.status(request.upload_id);
        if (!snapshot)
        {
            send_error(snapshot.error(), envelope.request_id);
            return;
        }
        send_response(chunkdrive::protocol::make_ok_response(snapshot.value(), envelope.request_id));
    }

    void Session::handle_upload_cancel(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::UploadRef request;
        try
        {
            request = envelope.payload.get<chunkdrive::protocol::UploadRef>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        auto cancelled = services_.coordinator.cancel(request.upload_id);
        if (!cancelled)
        {
            send_error(cancelled.error(), envelope.request_id);
            return;
        }
        send_response(chunkdrive::protocol::make_ok_response({{"upload_id", request.upload_id}, {"cancelled", true}},
                                                             envelope.request_id));
    }

    void Session::handle_upload_list(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::UploadListRequest request;
        try
        {
            request = envelope.payload.get<chunkdrive::protocol::UploadListRequest>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        nlohmann::json payload;
        payload["uploads"] = services_.coordinator.list(request.submitter);
        send_response(chunkdrive::protocol::make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::handle_upload_merge(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::UploadRef request;
        try
        {
            request = envelope.payload.get<chunkdrive::protocol::UploadRef>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what(), envelope.request_id);
            return;
        }

        spdlog::info("{} requested merge of {}", remote_endpoint(), request.upload_id);
        // A merge can wait on a concurrent one and then stream a large file; it runs on the
        // merge workers and this connection reads nothing further until the reply is sent.
        defer_reply();
        auto self = shared_from_this();
        services_.coordinator.merge_async(
            request.upload_id,
            [this, self, request_id = envelope.request_id](chunkdrive::Result<MergeOutcome> merged)
            {
                asio::post(socket_.get_executor(), [this, self, request_id, merged = std::move(merged)]
                           {
                    if (!merged)
                    {
                        spdlog::debug("{} <- error {}: {}", remote_endpoint(), chunkdrive::to_string(merged.code()),
                                      merged.error().message);
                        finish_deferred(chunkdrive::protocol::make_error_response(merged.error(), request_id));
                        return;
                    }
                    const chunkdrive::protocol::MergeResponse response{
                        .final_path = merged.value().final_path,
                        .file_size = merged.value().file_size,
                        .content_hash = merged.value().content_hash,
                    };
                    finish_deferred(chunkdrive::protocol::make_ok_response(response, request_id)); });
            });
    }

} // namespace chunkdrive::server
