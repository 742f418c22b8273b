/**
 * chunkdrive - Error taxonomy shared by the upload core and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunkdrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidRequest = 2,
        NotFound = 3,
        ChunkSizeMismatch = 4,
        IntegrityError = 5,
        MissingChunks = 6,
        SizeMismatch = 7,
        MergeTimeout = 8,
        Conflict = 9,
        StorageError = 10,
        Unsupported = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Errors a client may resolve by retrying the same request unchanged.
    bool is_transient(ErrorCode code) noexcept;

} // namespace chunkdrive
