#include "chunkdrive/server/session.hpp"

#include <nlohmann/json.hpp>

#include "chunkdrive/version.hpp"

namespace chunkdrive::server
{

    void Session::handle_ping(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        const auto stats = services_.coordinator.merge_queue().stats();
        nlohmann::json payload{
            {"version", chunkdrive::version()},
            {"merges_in_flight", stats.in_flight},
        };
        send_response(chunkdrive::protocol::make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::handle_list(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<chunkdrive::protocol::ListRequest>();
            nlohmann::json payload;
            payload["path"] = request.path;
            payload["entries"] = services_.directory_cache.list(request.path);
            send_response(chunkdrive::protocol::make_ok_response(std::move(payload), envelope.request_id));
        }
        catch (const FilesystemError &fs)
        {
            send_error(fs.code(), fs.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

} // namespace chunkdrive::server
