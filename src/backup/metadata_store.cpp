#include "backup/metadata_store.hpp"
#include "common/error.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string kRecordSuffix = ".json";

bool isRecordFile(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    std::string name = entry.path().filename().string();
    return name.size() > kRecordSuffix.size() && name[0] != '.' &&
           name.compare(name.size() - kRecordSuffix.size(), kRecordSuffix.size(), kRecordSuffix) == 0;
}

} // namespace

MetadataStore::MetadataStore(const std::string& directory)
    : directory_(directory) {
}

void MetadataStore::sortNewestFirst(std::vector<BackupMetadata>& records) {
    std::sort(records.begin(), records.end(),
              [](const BackupMetadata& a, const BackupMetadata& b) {
                  if (a.createdAt != b.createdAt) {
                      return a.createdAt > b.createdAt;
                  }
                  return a.id > b.id;
              });
}

std::string MetadataStore::recordPath(const BackupMetadata& record) const {
    return (fs::path(directory_) / (record.archiveFilename + kRecordSuffix)).string();
}

std::string MetadataStore::archivePath(const BackupMetadata& record) const {
    return (fs::path(directory_) / record.archiveFilename).string();
}

void MetadataStore::append(const BackupMetadata& record) {
    if (record.id.empty() || record.archiveFilename.empty()) {
        throw BackupError(ErrorCode::ConfigError, "Metadata record needs an id and an archive filename");
    }
    if (!isPlainArchiveFilename(record.archiveFilename)) {
        throw BackupError(ErrorCode::ConfigError, "Invalid archive filename: " + record.archiveFilename);
    }
    if (find(record.id)) {
        throw BackupError(ErrorCode::ConfigError, "Metadata record already exists: " + record.id);
    }

    std::string path = recordPath(record);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        throw BackupError(ErrorCode::ConfigError, "Metadata file already exists: " + path);
    }

    json j = record;
    file_utils::writeFileAtomic(path, j.dump(2) + "\n");
    Logger::debug("Wrote metadata record " + record.id + " to " + path);
}

std::vector<BackupMetadata> MetadataStore::loadAll() const {
    std::vector<BackupMetadata> records;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return records;
    }

    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!isRecordFile(*it)) {
            continue;
        }

        std::ifstream file(it->path());
        if (!file.is_open()) {
            // Removed between listing and opening
            continue;
        }

        try {
            json j;
            file >> j;
            records.push_back(j.get<BackupMetadata>());
        } catch (const json::exception& e) {
            Logger::warning("Skipping unreadable metadata file " + it->path().string() + ": " + e.what());
        } catch (const BackupError& e) {
            Logger::warning("Skipping invalid metadata file " + it->path().string() + ": " + e.what());
        }
    }

    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to scan " + directory_ + ": " + ec.message());
    }
    return records;
}

std::vector<BackupMetadata> MetadataStore::list(const std::string& configName) const {
    std::vector<BackupMetadata> records = loadAll();
    if (!configName.empty()) {
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&configName](const BackupMetadata& r) {
                                         return r.configName != configName;
                                     }),
                      records.end());
    }
    sortNewestFirst(records);
    return records;
}

std::optional<BackupMetadata> MetadataStore::find(const std::string& id) const {
    for (auto& record : loadAll()) {
        if (record.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

std::optional<BackupMetadata> MetadataStore::findByArchive(const std::string& archiveFilename) const {
    for (auto& record : loadAll()) {
        if (record.archiveFilename == archiveFilename) {
            return record;
        }
    }
    return std::nullopt;
}

bool MetadataStore::remove(const std::string& id) {
    auto record = find(id);
    if (!record) {
        return false;
    }

    std::error_code ec;
    bool removed = fs::remove(recordPath(*record), ec);
    if (ec) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to remove metadata record " + id + ": " + ec.message());
    }
    if (removed) {
        Logger::debug("Removed metadata record " + id);
    }
    return removed;
}
