#include "chunkdrive/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace chunkdrive::crypto
{

    namespace
    {

        constexpr std::size_t kUploadIdBytes = 16;

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        Hasher hasher;
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return hasher.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    Hasher::Hasher()
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void Hasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Hasher already finished");
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string Hasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("Hasher already finished");
        }
        finished_ = true;
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string derive_upload_id(std::string_view filename, std::uint64_t declared_size, std::string_view submitter,
                                 std::chrono::system_clock::time_point created_at)
    {
        ensure_initialized_once();
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(created_at.time_since_epoch()).count();
        std::string material;
        material.reserve(filename.size() + submitter.size() + 48);
        material.append(filename);
        material.push_back('\0');
        material.append(std::to_string(declared_size));
        material.push_back('\0');
        material.append(submitter);
        material.push_back('\0');
        material.append(std::to_string(nanos));

        std::array<unsigned char, kUploadIdBytes> digest{};
        if (crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char *>(material.data()),
                               material.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    bool is_upload_id(std::string_view value) noexcept
    {
        if (value.size() != kUploadIdBytes * 2)
        {
            return false;
        }
        for (const char ch : value)
        {
            const bool digit = ch >= '0' && ch <= '9';
            const bool lower_hex = ch >= 'a' && ch <= 'f';
            if (!digit && !lower_hex)
            {
                return false;
            }
        }
        return true;
    }

} // namespace chunkdrive::crypto
