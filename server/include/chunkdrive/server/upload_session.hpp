#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/protocol.hpp"
#include "chunkdrive/result.hpp"

namespace chunkdrive::server
{

    enum class UploadStatus : std::uint8_t
    {
        Initialized,
        InProgress,
        AllReceived,
        Merging,
        Merged,
        Failed,
        Cancelled
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    // Merged and Cancelled accept no further writes.
    bool is_terminal(UploadStatus status) noexcept;

    bool is_transition_allowed(UploadStatus from, UploadStatus to) noexcept;

    // ceil(declared_size / chunk_size); zero when either argument is zero.
    std::uint64_t chunk_count_for(std::uint64_t declared_size, std::uint64_t chunk_size) noexcept;

    std::uint64_t chunk_length_for(std::uint64_t declared_size, std::uint64_t chunk_size, std::uint64_t index) noexcept;

    using Clock = std::chrono::system_clock;

    struct UploadSession
    {
        std::string upload_id;
        std::string filename;
        std::string submitter;
        std::uint64_t declared_size{};
        std::string target_directory{"."};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::set<std::uint64_t> received_chunks;
        UploadStatus status{UploadStatus::Initialized};
        Clock::time_point created_at{};
        Clock::time_point updated_at{};
        std::optional<std::string> final_path;
        std::optional<std::string> content_hash;
        std::optional<Error> failure;

        std::uint64_t expected_chunk_length(std::uint64_t index) const noexcept;

        bool all_received() const noexcept { return received_chunks.size() == total_chunks; }

        std::vector<std::uint64_t> missing_chunks() const;

        // Adds the index and advances Initialized -> InProgress -> AllReceived.
        // Returns true only when the index was not already present.
        bool mark_chunk_received(std::uint64_t index, Clock::time_point now);

        // Throws std::logic_error for a transition the state machine forbids.
        void transition(UploadStatus next, Clock::time_point now);

        protocol::UploadSnapshot snapshot(bool include_missing = true) const;
    };

    void to_json(nlohmann::json &json, const UploadSession &session);
    void from_json(const nlohmann::json &json, UploadSession &session);

} // namespace chunkdrive::server
