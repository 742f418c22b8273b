#include "chunkdrive/result.hpp"

namespace chunkdrive
{

    void to_json(nlohmann::json &json, const Error &error)
    {
        json = {
            {"code", std::string(to_string(error.code))},
            {"error", to_int(error.code)},
            {"message", error.message},
            {"details", error.details},
        };
    }

    void from_json(const nlohmann::json &json, Error &error)
    {
        error.code = error_code_from_int(static_cast<std::uint16_t>(json.value("error", 0u)));
        error.message = json.value("message", std::string{});
        error.details = json.value("details", nlohmann::json::object());
    }

} // namespace chunkdrive
