/**
 * chunkdrive - Tagged success/error result returned across component boundaries.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive
{

    struct Error
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
        nlohmann::json details{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const Error &error);
    void from_json(const nlohmann::json &json, Error &error);

    inline Error make_error(ErrorCode code, std::string message, nlohmann::json details = nlohmann::json::object())
    {
        return Error{.code = code, .message = std::move(message), .details = std::move(details)};
    }

    template <typename T>
    class Result
    {
    public:
        Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
        Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

        bool ok() const noexcept { return storage_.index() == 0; }
        explicit operator bool() const noexcept { return ok(); }

        ErrorCode code() const noexcept
        {
            return ok() ? ErrorCode::Ok : std::get<1>(storage_).code;
        }

        T &value() &
        {
            ensure_value();
            return std::get<0>(storage_);
        }

        const T &value() const &
        {
            ensure_value();
            return std::get<0>(storage_);
        }

        T &&value() &&
        {
            ensure_value();
            return std::get<0>(std::move(storage_));
        }

        const Error &error() const
        {
            if (ok())
            {
                throw std::logic_error("Result holds a value, not an error");
            }
            return std::get<1>(storage_);
        }

    private:
        void ensure_value() const
        {
            if (!ok())
            {
                const auto &error = std::get<1>(storage_);
                throw std::logic_error("Result holds error " + std::string(to_string(error.code)) + ": " +
                                       error.message);
            }
        }

        std::variant<T, Error> storage_;
    };

    using VoidResult = Result<std::monostate>;

    inline VoidResult ok_result()
    {
        return VoidResult{std::monostate{}};
    }

} // namespace chunkdrive
