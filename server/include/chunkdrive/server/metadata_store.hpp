#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkdrive/server/collaborators.hpp"

namespace chunkdrive::server
{

    void to_json(nlohmann::json &json, const FileRecord &record);
    void from_json(const nlohmann::json &json, FileRecord &record);

    // File-backed metadata store: <root>/.chunkdrive/files.json holds one record per
    // path, <root>/.chunkdrive/operations.log receives one JSON line per operation.
    class JsonMetadataStore : public MetadataStore
    {
    public:
        explicit JsonMetadataStore(std::filesystem::path root_directory);

        void save_record(const FileRecord &record) override;
        void delete_record(const std::string &path) override;
        void record_operation(const OperationRecord &operation) override;

        std::optional<FileRecord> find(const std::string &path) const;

    private:
        void load_locked() const;
        void persist_locked() const;

        std::filesystem::path database_path_;
        std::filesystem::path operations_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::map<std::string, FileRecord> records_;
    };

} // namespace chunkdrive::server
