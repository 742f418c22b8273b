#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/result.hpp"
#include "chunkdrive/server/directory_cache.hpp"
#include "chunkdrive/server/filesystem.hpp"
#include "chunkdrive/server/upload_coordinator.hpp"

namespace chunkdrive::server
{

    struct ServerServices
    {
        Filesystem &filesystem;
        DirectoryCache &directory_cache;
        UploadCoordinator &coordinator;
    };

    // One client connection. Requests are processed in the order they arrive.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const chunkdrive::protocol::ResponseEnvelope &envelope);
        // The current request is answered later from another thread; reading pauses until then.
        void defer_reply();
        // Sends the deferred reply and resumes reading.
        void finish_deferred(const chunkdrive::protocol::ResponseEnvelope &envelope);
        void send_error(chunkdrive::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void send_error(const chunkdrive::Error &error, const std::optional<std::string> &request_id);

        // Command handlers
        void handle_ping(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_list(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_init(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_status(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_cancel(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_list(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_merge(const chunkdrive::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, chunkdrive::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        bool closed_{false};
        bool reply_pending_{false};
        std::atomic<int> deferred_steps_{0};
    };

} // namespace chunkdrive::server
