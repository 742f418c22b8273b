#include "chunkdrive/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <stdexcept>
#include <string>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"

#include <spdlog/spdlog.h>

namespace chunkdrive::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    Session::~Session()
    {
        spdlog::debug("Connection state released");
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size = chunkdrive::protocol::decode_frame_header(header_buffer_);
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             if (payload_size > chunkdrive::protocol::kMaxFramePayload)
                             {
                                 // The stream cannot be resynchronised after an oversized frame.
                                 spdlog::warn("{} sent a {} byte frame, closing", remote_endpoint(), payload_size);
                                 stop();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(chunkdrive::ErrorCode::InvalidRequest, ex.what());
                             }
                             buffer_.clear();
                             buffer_.shrink_to_fit();
                             if (!reply_pending_)
                             {
                                 read_frame_header();
                                 return;
                             }
                             // A deferred reply may complete on another thread; whichever side
                             // finishes second resumes reading.
                             reply_pending_ = false;
                             if (deferred_steps_.fetch_add(1) == 1)
                             {
                                 read_frame_header();
                             }
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        chunkdrive::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkdrive::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkdrive::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case chunkdrive::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        case chunkdrive::protocol::Command::List:
            handle_list(envelope);
            break;
        case chunkdrive::protocol::Command::UploadInit:
            handle_upload_init(envelope);
            break;
        case chunkdrive::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case chunkdrive::protocol::Command::UploadStatus:
            handle_upload_status(envelope);
            break;
        case chunkdrive::protocol::Command::UploadCancel:
            handle_upload_cancel(envelope);
            break;
        case chunkdrive::protocol::Command::UploadList:
            handle_upload_list(envelope);
            break;
        case chunkdrive::protocol::Command::UploadMerge:
            handle_upload_merge(envelope);
            break;
        default:
            send_error(chunkdrive::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const chunkdrive::protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(chunkdrive::protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                  }
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to send response to {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Session::defer_reply()
    {
        reply_pending_ = true;
        deferred_steps_.store(0);
    }

    void Session::finish_deferred(const chunkdrive::protocol::ResponseEnvelope &envelope)
    {
        send_response(envelope);
        if (deferred_steps_.fetch_add(1) == 1)
        {
            read_frame_header();
        }
    }

    void Session::send_error(chunkdrive::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        send_error(chunkdrive::make_error(code, std::move(message)), request_id);
    }

    void Session::send_error(const chunkdrive::Error &error, const std::optional<std::string> &request_id)
    {
        spdlog::debug("{} <- error {}: {}", remote_endpoint(), chunkdrive::to_string(error.code), error.message);
        send_response(chunkdrive::protocol::make_error_response(error, request_id));
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        try
        {
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
        catch (const std::exception &)
        {
            return "unknown";
        }
    }

} // namespace chunkdrive::server
