/**
 * chunkdrive - Hashing helpers built on libsodium (BLAKE2b, hex encoded).
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace chunkdrive::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Incremental hash used while a merge streams chunks into the output file.
    class Hasher
    {
    public:
        Hasher();

        void update(std::span<const std::byte> data);

        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

    // Opaque identifier derived from the upload's defining attributes; 32 lowercase hex characters.
    std::string derive_upload_id(std::string_view filename, std::uint64_t declared_size, std::string_view submitter,
                                 std::chrono::system_clock::time_point created_at);

    bool is_upload_id(std::string_view value) noexcept;

} // namespace chunkdrive::crypto
