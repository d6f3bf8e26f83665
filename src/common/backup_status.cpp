#include "common/backup_status.hpp"
#include "common/utils.hpp"

using json = nlohmann::json;

void to_json(json& j, const BackupMetadata& metadata) {
    j = json{
        {"id", metadata.id},
        {"created_at", utils::formatIso8601(metadata.createdAt)},
        {"config_name", metadata.configName},
        {"archive_filename", metadata.archiveFilename},
        {"size_bytes", metadata.sizeBytes},
        {"checksum", metadata.checksum},
        {"hostname", metadata.hostname},
        {"source_path", metadata.sourcePath},
        {"files_count", metadata.filesCount},
        {"compressed", metadata.compressed}
    };
}

bool isPlainArchiveFilename(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

void from_json(const json& j, BackupMetadata& metadata) {
    j.at("id").get_to(metadata.id);
    j.at("config_name").get_to(metadata.configName);
    j.at("archive_filename").get_to(metadata.archiveFilename);
    if (!isPlainArchiveFilename(metadata.archiveFilename)) {
        throw BackupError(ErrorCode::IntegrityError, "Invalid archive_filename: " + metadata.archiveFilename);
    }
    j.at("size_bytes").get_to(metadata.sizeBytes);
    j.at("checksum").get_to(metadata.checksum);

    std::string createdAt = j.at("created_at").get<std::string>();
    if (!utils::parseIso8601(createdAt, metadata.createdAt)) {
        throw BackupError(ErrorCode::IntegrityError, "Invalid created_at timestamp: " + createdAt);
    }

    // Records written before these fields existed still load
    metadata.hostname = j.value("hostname", "");
    metadata.sourcePath = j.value("source_path", "");
    metadata.filesCount = j.value("files_count", static_cast<uint64_t>(0));
    metadata.compressed = j.value("compressed", true);
}
