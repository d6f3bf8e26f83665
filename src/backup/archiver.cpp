#include "backup/archiver.hpp"
#include "common/checksum.hpp"
#include "common/error.hpp"
#include "common/file_lock.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <cstring>
#include <cerrno>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ArchiveEntry = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        if (slash > start) {
            parts.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

// Returns 1 for a regular file, 0 for anything else written or skipped
uint64_t addEntry(struct archive* a, const fs::path& path, const std::string& name) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            Logger::warning("File vanished during backup: " + path.string());
            return 0;
        }
        throw BackupError(ErrorCode::IOError, "Failed to stat " + path.string() + ": " + strerror(errno));
    }

    if (!S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode) && !S_ISLNK(st.st_mode)) {
        Logger::warning("Skipping special file " + path.string());
        return 0;
    }

    ArchiveEntry entry(archive_entry_new(), &archive_entry_free);
    if (!entry) {
        throw BackupError(ErrorCode::IOError, "Failed to allocate archive entry");
    }
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), name.c_str());

    if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            throw BackupError(ErrorCode::IOError, "Failed to read link " + path.string() + ": " + ec.message());
        }
        archive_entry_set_symlink(entry.get(), target.c_str());
    }

    std::ifstream in;
    if (S_ISREG(st.st_mode)) {
        in.open(path, std::ios::binary);
        if (!in.is_open()) {
            throw BackupError(ErrorCode::IOError, "Failed to open " + path.string() + ": " + strerror(errno));
        }
    }

    if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to write header for " + name + ": " + archive_error_string(a));
    }

    if (!S_ISREG(st.st_mode)) {
        return 0;
    }

    std::array<char, 64 * 1024> buffer{};
    int64_t total = 0;
    while (in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize n = in.gcount();
        if (n <= 0) {
            break;
        }
        if (archive_write_data(a, buffer.data(), static_cast<size_t>(n)) < 0) {
            throw BackupError(ErrorCode::IOError,
                              "Failed to write data for " + name + ": " + archive_error_string(a));
        }
        total += n;
    }
    if (in.bad()) {
        throw BackupError(ErrorCode::IOError, "Failed while reading " + path.string());
    }
    if (total != static_cast<int64_t>(st.st_size)) {
        Logger::warning("File changed size during backup: " + path.string());
    }
    return 1;
}

} // namespace

Archiver::Archiver(const BackupConfig& config, HookRunner hookRunner)
    : config_(config)
    , hookRunner_(hookRunner) {
}

std::string Archiver::archiveFilename(const BackupConfig& config,
                                      const std::string& host,
                                      std::chrono::system_clock::time_point timestamp) {
    return config.name + "_" + host + "_" + utils::formatFileTimestamp(timestamp) +
           (config.compression ? ".tar.gz" : ".tar");
}

std::string Archiver::lockPath(const BackupConfig& config) {
    return (fs::path(config.destinationDir) / ("." + config.name + ".lock")).string();
}

bool Archiver::isExcluded(const std::string& relativePath, const std::vector<std::string>& patterns) {
    if (relativePath.empty() || patterns.empty()) {
        return false;
    }

    std::vector<std::string> parts = splitPath(relativePath);
    for (std::string pattern : patterns) {
        while (pattern.size() > 1 && pattern.back() == '/') {
            pattern.pop_back();
        }
        if (pattern.empty()) {
            continue;
        }

        if (pattern[0] == '/') {
            if (fnmatch(pattern.c_str() + 1, relativePath.c_str(), FNM_PATHNAME) == 0) {
                return true;
            }
            continue;
        }

        std::string suffix;
        for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
            suffix = suffix.empty() ? *it : *it + "/" + suffix;
            if (fnmatch(pattern.c_str(), suffix.c_str(), FNM_PATHNAME) == 0) {
                return true;
            }
        }
    }
    return false;
}

void Archiver::validateSource() const {
    std::error_code ec;
    if (!fs::exists(config_.sourcePath, ec)) {
        throw BackupError(ErrorCode::ConfigError, "Source path does not exist: " + config_.sourcePath);
    }
    if (!fs::is_directory(config_.sourcePath, ec)) {
        throw BackupError(ErrorCode::ConfigError, "Source path is not a directory: " + config_.sourcePath);
    }
}

void Archiver::reportStatus(const std::string& status) {
    Logger::debug("[" + config_.name + "] " + status);
    if (statusCallback_) {
        statusCallback_(status);
    }
}

uint64_t Archiver::writeArchive(const std::string& tempPath, const std::atomic<bool>& cancelled) {
    ArchiveWriter a(archive_write_new(), &archive_write_free);
    if (!a) {
        throw BackupError(ErrorCode::IOError, "Failed to allocate archive writer");
    }

    if (config_.compression) {
        archive_write_add_filter_gzip(a.get());
        std::string level = std::to_string(config_.compressionLevel);
        if (archive_write_set_filter_option(a.get(), "gzip", "compression-level", level.c_str()) < ARCHIVE_WARN) {
            throw BackupError(ErrorCode::ConfigError,
                              std::string("Invalid compression level: ") + archive_error_string(a.get()));
        }
    } else {
        archive_write_add_filter_none(a.get());
    }
    archive_write_set_format_pax_restricted(a.get());

    if (archive_write_open_filename(a.get(), tempPath.c_str()) != ARCHIVE_OK) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to open archive for writing: " + std::string(archive_error_string(a.get())));
    }

    fs::path source = fs::absolute(config_.sourcePath).lexically_normal();
    if (source.filename().empty()) {
        source = source.parent_path();
    }
    // Entries live under the source directory's own name, like `tar -C parent name`
    std::string rootName = source.filename().string();
    if (rootName.empty()) {
        rootName = "root";
    }
    addEntry(a.get(), source, rootName);

    fs::path destination = fs::absolute(config_.destinationDir);
    uint64_t files = 0;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
        if (cancelled) {
            throw BackupError(ErrorCode::Cancelled, "Backup of '" + config_.name + "' cancelled");
        }

        const fs::path& path = it->path();
        std::string rel = path.lexically_relative(source).generic_string();

        std::error_code typeEc;
        bool isDir = it->is_directory(typeEc) && !it->is_symlink(typeEc);
        if (isExcluded(rel, config_.excludePatterns) ||
            (isDir && fs::equivalent(path, destination, typeEc))) {
            if (isDir) {
                it.disable_recursion_pending();
            }
            Logger::debug("Excluded " + rel);
            continue;
        }

        files += addEntry(a.get(), path, rootName + "/" + rel);
    }
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to walk " + source.string() + ": " + ec.message());
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to finish archive: " + std::string(archive_error_string(a.get())));
    }
    return files;
}

ArchiveResult Archiver::run(const std::string& backupId,
                            const std::atomic<bool>& cancelled,
                            std::chrono::system_clock::time_point startedAt) {
    validateBackupConfig(config_);
    if (!config_.enabled) {
        throw BackupError(ErrorCode::ConfigError, "Backup config '" + config_.name + "' is disabled");
    }
    validateSource();

    std::error_code ec;
    fs::create_directories(config_.destinationDir, ec);
    if (ec) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to create destination " + config_.destinationDir + ": " + ec.message());
    }

    FileLock lock(lockPath(config_));
    if (!lock.tryLock()) {
        throw BackupError(ErrorCode::IOError, "A backup of '" + config_.name + "' is already running");
    }

    if (config_.preHook.isSet()) {
        reportStatus("Running pre-hook");
        hookRunner_.runChecked(config_.preHook, "pre-hook");
    }
    if (cancelled) {
        throw BackupError(ErrorCode::Cancelled, "Backup of '" + config_.name + "' cancelled");
    }

    MetadataStore store(config_.destinationDir);
    auto timestamp = utils::truncateToSeconds(startedAt);
    std::string host = utils::getHostname();
    std::string filename = archiveFilename(config_, host, timestamp);
    std::string finalPath = (fs::path(config_.destinationDir) / filename).string();
    std::string sidecarPath = Checksum::sidecarPath(finalPath);

    if (fs::exists(finalPath, ec) || fs::exists(sidecarPath, ec) || store.findByArchive(filename)) {
        throw BackupError(ErrorCode::ConfigError, "Backup name collision: " + filename);
    }

    ArchiveResult result;
    result.archivePath = finalPath;

    BackupMetadata& metadata = result.metadata;
    metadata.id = backupId;
    metadata.createdAt = timestamp;
    metadata.configName = config_.name;
    metadata.archiveFilename = filename;
    metadata.hostname = host;
    metadata.sourcePath = fs::absolute(config_.sourcePath).string();
    metadata.compressed = config_.compression;

    std::string tempPath = file_utils::tempPathFor(finalPath, "partial");
    bool renamed = false;
    try {
        reportStatus("Writing archive " + filename);
        metadata.filesCount = writeArchive(tempPath, cancelled);
        if (cancelled) {
            throw BackupError(ErrorCode::Cancelled, "Backup of '" + config_.name + "' cancelled");
        }

        file_utils::syncFile(tempPath);
        if (rename(tempPath.c_str(), finalPath.c_str()) != 0) {
            throw BackupError(ErrorCode::IOError,
                              "Failed to move archive into place: " + std::string(strerror(errno)));
        }
        renamed = true;

        reportStatus("Computing checksum");
        metadata.checksum = Checksum::sha256File(finalPath);
        metadata.sizeBytes = file_utils::fileSize(finalPath);
        Checksum::writeSidecar(finalPath, metadata.checksum);

        store.append(metadata);
    } catch (const std::exception& e) {
        Logger::error("Backup of '" + config_.name + "' failed, removing partial files: " + e.what());
        file_utils::removeIfExists(tempPath);
        if (renamed) {
            file_utils::removeIfExists(sidecarPath);
            file_utils::removeIfExists(finalPath);
        }
        throw;
    }

    Logger::info("Created backup " + filename + " (" + std::to_string(metadata.sizeBytes) +
                 " bytes, " + std::to_string(metadata.filesCount) + " files)");

    if (config_.postHook.isSet()) {
        reportStatus("Running post-hook");
        try {
            hookRunner_.runChecked(config_.postHook, "post-hook");
        } catch (const BackupError& e) {
            // The backup itself is complete; surface the failure as a warning
            Logger::warning(e.what());
            result.warnings.push_back(e.what());
        }
    }

    return result;
}
