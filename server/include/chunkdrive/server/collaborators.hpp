#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkdrive::server
{

    struct FileRecord
    {
        std::string path;
        std::uint64_t size{};
        std::string content_hash;
        bool is_directory{};
        std::string parent_path;
    };

    struct OperationRecord
    {
        std::string operation;
        std::string path;
        std::string submitter;
        std::uint64_t size{};
        std::chrono::milliseconds duration{};
        bool success{};
    };

    class PathValidator
    {
    public:
        virtual ~PathValidator() = default;

        virtual bool is_safe(const std::string &path) const = 0;
    };

    class MetadataStore
    {
    public:
        virtual ~MetadataStore() = default;

        virtual void save_record(const FileRecord &record) = 0;
        virtual void delete_record(const std::string &path) = 0;
        virtual void record_operation(const OperationRecord &operation) = 0;
    };

    class CacheInvalidator
    {
    public:
        virtual ~CacheInvalidator() = default;

        virtual void invalidate(const std::string &path_prefix) = 0;
    };

} // namespace chunkdrive::server
