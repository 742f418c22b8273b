#include "chunkdrive/encoding/base64.hpp"

#include <sodium.h>

#include "chunkdrive/crypto.hpp"

namespace chunkdrive::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
        constexpr const char *kIgnoredCharacters = " \t\r\n";
    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        const auto encoded_length = sodium_base64_encoded_len(data.size(), kVariant);
        std::string output(encoded_length, '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        // encoded_len accounts for the trailing NUL
        output.resize(encoded_length - 1);
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output((input.size() / 4 + 1) * 3);
        std::size_t decoded_length = 0;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), kIgnoredCharacters, &decoded_length, nullptr, kVariant) != 0)
        {
            return std::nullopt;
        }
        output.resize(decoded_length);
        return output;
    }

} // namespace chunkdrive::encoding
