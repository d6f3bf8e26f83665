#pragma once

#include "common/backup_status.hpp"
#include <string>
#include <vector>
#include <optional>

// One JSON record per succeeded backup, stored beside its archive as
// <destination>/<archive_filename>.json. Records are written with
// write-temp-then-rename so readers never see a partial record.
class MetadataStore {
public:
    explicit MetadataStore(const std::string& directory);

    // Throws BackupError(ConfigError) if the id or record file already exists
    void append(const BackupMetadata& record);

    // Newest first; ties on created_at are broken by id, descending.
    // An empty configName lists every config.
    std::vector<BackupMetadata> list(const std::string& configName = "") const;

    std::optional<BackupMetadata> find(const std::string& id) const;
    std::optional<BackupMetadata> findByArchive(const std::string& archiveFilename) const;

    // Idempotent: returns false when no record has this id
    bool remove(const std::string& id);

    std::string recordPath(const BackupMetadata& record) const;
    std::string archivePath(const BackupMetadata& record) const;
    const std::string& getDirectory() const { return directory_; }

    static void sortNewestFirst(std::vector<BackupMetadata>& records);

private:
    std::vector<BackupMetadata> loadAll() const;

    std::string directory_;
};
