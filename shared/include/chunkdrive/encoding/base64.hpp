#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkdrive::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Whitespace is ignored; malformed input yields std::nullopt.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace chunkdrive::encoding
