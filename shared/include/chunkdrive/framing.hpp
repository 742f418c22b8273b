/**
 * chunkdrive - Length-prefixed JSON framing (4-byte big-endian size, then UTF-8 JSON).
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkdrive::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Large enough for a base64 encoded chunk at the maximum accepted chunk size.
    inline constexpr std::uint32_t kMaxFramePayload = 64u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header) noexcept;

    // Throws std::length_error for a header announcing more than kMaxFramePayload.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace chunkdrive::protocol
