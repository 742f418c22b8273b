#include "chunkdrive/server/metadata_store.hpp"

#include <fstream>
#include <stdexcept>

namespace chunkdrive::server
{

    namespace
    {
        constexpr auto kMetadataDir = ".chunkdrive";
        constexpr auto kFilesDatabase = "files.json";
        constexpr auto kOperationsLog = "operations.log";
    } // namespace

    void to_json(nlohmann::json &json, const FileRecord &record)
    {
        json = {
            {"path", record.path},
            {"size", record.size},
            {"hash", record.content_hash},
            {"is_dir", record.is_directory},
            {"parent", record.parent_path},
        };
    }

    void from_json(const nlohmann::json &json, FileRecord &record)
    {
        record.path = json.at("path").get<std::string>();
        record.size = json.value("size", 0ULL);
        record.content_hash = json.value("hash", std::string{});
        record.is_directory = json.value("is_dir", false);
        record.parent_path = json.value("parent", std::string{"."});
    }

    JsonMetadataStore::JsonMetadataStore(std::filesystem::path root_directory)
        : database_path_(root_directory / kMetadataDir / kFilesDatabase),
          operations_path_(root_directory / kMetadataDir / kOperationsLog)
    {
        std::filesystem::create_directories(root_directory / kMetadataDir);
    }

    void JsonMetadataStore::save_record(const FileRecord &record)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        records_[record.path] = record;
        persist_locked();
    }

    void JsonMetadataStore::delete_record(const std::string &path)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        if (records_.erase(path) > 0)
        {
            persist_locked();
        }
    }

    void JsonMetadataStore::record_operation(const OperationRecord &operation)
    {
        const nlohmann::json line = {
            {"operation", operation.operation},
            {"path", operation.path},
            {"submitter", operation.submitter},
            {"size", operation.size},
            {"duration_ms", operation.duration.count()},
            {"success", operation.success},
            {"at", std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count()},
        };
        std::lock_guard lock(mutex_);
        std::ofstream out(operations_path_, std::ios::app);
        if (!out.is_open())
        {
            throw std::runtime_error("Failed to open operation log " + operations_path_.string());
        }
        out << line.dump() << '\n';
    }

    std::optional<FileRecord> JsonMetadataStore::find(const std::string &path) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        auto it = records_.find(path);
        if (it == records_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void JsonMetadataStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        records_.clear();
        if (std::filesystem::exists(database_path_))
        {
            std::ifstream in(database_path_);
            if (in.is_open())
            {
                nlohmann::json json;
                in >> json;
                if (json.is_object())
                {
                    for (const auto &[key, value] : json.items())
                    {
                        records_[key] = value.get<FileRecord>();
                    }
                }
            }
        }
        loaded_ = true;
    }

    void JsonMetadataStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[path, record] : records_)
        {
            json[path] = record;
        }
        std::ofstream out(database_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Failed to open metadata database " + database_path_.string());
        }
        out << json.dump(2);
    }

} // namespace chunkdrive::server
