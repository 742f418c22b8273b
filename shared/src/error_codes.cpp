#include "chunkdrive/error_codes.hpp"

#include <array>

namespace chunkdrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidRequest, "invalid_request"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::ChunkSizeMismatch, "chunk_size_mismatch"},
            {ErrorCode::IntegrityError, "integrity_error"},
            {ErrorCode::MissingChunks, "missing_chunks"},
            {ErrorCode::SizeMismatch, "size_mismatch"},
            {ErrorCode::MergeTimeout, "merge_timeout"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::StorageError, "storage_error"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    bool is_transient(ErrorCode code) noexcept
    {
        return code == ErrorCode::StorageError || code == ErrorCode::MergeTimeout;
    }

} // namespace chunkdrive
