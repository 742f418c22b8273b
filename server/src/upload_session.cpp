#include "chunkdrive/server/upload_session.hpp"

#include <array>
#include <stdexcept>

namespace chunkdrive::server
{

    namespace
    {

        struct StatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 7> kStatusMappings{{
            {UploadStatus::Initialized, "initialized"},
            {UploadStatus::InProgress, "in_progress"},
            {UploadStatus::AllReceived, "all_received"},
            {UploadStatus::Merging, "merging"},
            {UploadStatus::Merged, "merged"},
            {UploadStatus::Failed, "failed"},
            {UploadStatus::Cancelled, "cancelled"},
        }};

        struct Transition
        {
            UploadStatus from;
            UploadStatus to;
        };

        constexpr std::array<Transition, 10> kTransitions{{
            {UploadStatus::Initialized, UploadStatus::InProgress},
            {UploadStatus::InProgress, UploadStatus::AllReceived},
            {UploadStatus::AllReceived, UploadStatus::Merging},
            {UploadStatus::Merging, UploadStatus::Merged},
            {UploadStatus::Merging, UploadStatus::Failed},
            {UploadStatus::Failed, UploadStatus::Merging},
            {UploadStatus::Initialized, UploadStatus::Cancelled},
            {UploadStatus::InProgress, UploadStatus::Cancelled},
            {UploadStatus::AllReceived, UploadStatus::Cancelled},
            {UploadStatus::Failed, UploadStatus::Cancelled},
        }};

        std::int64_t to_millis(Clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        Clock::time_point from_millis(std::int64_t millis)
        {
            return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
        }

    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_terminal(UploadStatus status) noexcept
    {
        return status == UploadStatus::Merged || status == UploadStatus::Cancelled;
    }

    bool is_transition_allowed(UploadStatus from, UploadStatus to) noexcept
    {
        for (const auto &transition : kTransitions)
        {
            if (transition.from == from && transition.to == to)
            {
                return true;
            }
        }
        return false;
    }

    std::uint64_t chunk_count_for(std::uint64_t declared_size, std::uint64_t chunk_size) noexcept
    {
        if (declared_size == 0 || chunk_size == 0)
        {
            return 0;
        }
        return declared_size / chunk_size + (declared_size % chunk_size == 0 ? 0 : 1);
    }

    std::uint64_t chunk_length_for(std::uint64_t declared_size, std::uint64_t chunk_size, std::uint64_t index) noexcept
    {
        const auto total = chunk_count_for(declared_size, chunk_size);
        if (index >= total)
        {
            return 0;
        }
        if (index + 1 == total)
        {
            return declared_size - index * chunk_size;
        }
        return chunk_size;
    }

    std::uint64_t UploadSession::expected_chunk_length(std::uint64_t index) const noexcept
    {
        return chunk_length_for(declared_size, chunk_size, index);
    }

    std::vector<std::uint64_t> UploadSession::missing_chunks() const
    {
        std::vector<std::uint64_t> missing;
        auto received = received_chunks.begin();
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            if (received != received_chunks.end() && *received == index)
            {
                ++received;
                continue;
            }
            missing.push_back(index);
        }
        return missing;
    }

    bool UploadSession::mark_chunk_received(std::uint64_t index, Clock::time_point now)
    {
        if (index >= total_chunks)
        {
            throw std::out_of_range("Chunk index outside of the upload");
        }
        const bool inserted = received_chunks.insert(index).second;
        updated_at = now;
        if (status == UploadStatus::Initialized)
        {
            transition(UploadStatus::InProgress, now);
        }
        if (status == UploadStatus::InProgress && all_received())
        {
            transition(UploadStatus::AllReceived, now);
        }
        return inserted;
    }

    void UploadSession::transition(UploadStatus next, Clock::time_point now)
    {
        if (!is_transition_allowed(status, next))
        {
            throw std::logic_error("Illegal upload transition " + std::string(to_string(status)) + " -> " +
                                   std::string(to_string(next)));
        }
        status = next;
        updated_at = now;
    }

    protocol::UploadSnapshot UploadSession::snapshot(bool include_missing) const
    {
        protocol::UploadSnapshot result{
            .upload_id = upload_id,
            .filename = filename,
            .submitter = submitter,
            .target_directory = target_directory,
            .file_size = declared_size,
            .chunk_size = chunk_size,
            .total_chunks = total_chunks,
            .uploaded_chunks = static_cast<std::uint64_t>(received_chunks.size()),
            .missing_chunks = include_missing ? missing_chunks() : std::vector<std::uint64_t>{},
            .status = std::string(to_string(status)),
            .progress = total_chunks == 0 ? 0.0
                                          : static_cast<double>(received_chunks.size()) * 100.0 /
                                                static_cast<double>(total_chunks),
            .created_at = to_millis(created_at),
            .updated_at = to_millis(updated_at),
            .final_path = final_path,
            .failure = failure,
        };
        return result;
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        json = {
            {"upload_id", session.upload_id},
            {"filename", session.filename},
            {"submitter", session.submitter},
            {"declared_size", session.declared_size},
            {"target_directory", session.target_directory},
            {"chunk_size", session.chunk_size},
            {"total_chunks", session.total_chunks},
            {"received_chunks", session.received_chunks},
            {"status", std::string(to_string(session.status))},
            {"created_at", to_millis(session.created_at)},
            {"updated_at", to_millis(session.updated_at)},
        };
        if (session.final_path)
        {
            json["final_path"] = *session.final_path;
        }
        if (session.content_hash)
        {
            json["content_hash"] = *session.content_hash;
        }
        if (session.failure)
        {
            json["failure"] = *session.failure;
        }
    }

    void from_json(const nlohmann::json &json, UploadSession &session)
    {
        session.upload_id = json.at("upload_id").get<std::string>();
        session.filename = json.at("filename").get<std::string>();
        session.submitter = json.value("submitter", std::string{});
        session.declared_size = json.at("declared_size").get<std::uint64_t>();
        session.target_directory = json.value("target_directory", std::string{"."});
        session.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        session.total_chunks = json.at("total_chunks").get<std::uint64_t>();
        if (session.total_chunks != chunk_count_for(session.declared_size, session.chunk_size))
        {
            throw std::runtime_error("Session record has an inconsistent chunk layout");
        }
        session.received_chunks.clear();
        for (const auto index : json.value("received_chunks", std::vector<std::uint64_t>{}))
        {
            if (index >= session.total_chunks)
            {
                throw std::runtime_error("Session record lists a chunk outside of the upload");
            }
            session.received_chunks.insert(index);
        }
        const auto status_label = json.at("status").get<std::string>();
        const auto status = upload_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown upload status: " + status_label);
        }
        session.status = *status;
        session.created_at = from_millis(json.value("created_at", 0LL));
        session.updated_at = from_millis(json.value("updated_at", 0LL));
        session.final_path.reset();
        session.content_hash.reset();
        session.failure.reset();
        if (auto it = json.find("final_path"); it != json.end() && it->is_string())
        {
            session.final_path = it->get<std::string>();
        }
        if (auto it = json.find("content_hash"); it != json.end() && it->is_string())
        {
            session.content_hash = it->get<std::string>();
        }
        if (auto it = json.find("failure"); it != json.end() && it->is_object())
        {
            session.failure = it->get<Error>();
        }
    }

} // namespace chunkdrive::server
