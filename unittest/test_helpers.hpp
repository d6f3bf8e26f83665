#pragma once

#include "common/backup_status.hpp"
#include "common/utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_helpers {

namespace fs = std::filesystem;

// mkdtemp directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/sysbackup_test_XXXXXX";
        char* dir = mkdtemp(tmpl);
        if (!dir) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = dir;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str(const std::string& child = "") const {
        return child.empty() ? path_.string() : (path_ / child).string();
    }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline bool isEmptyDirectory(const fs::path& path) {
    return fs::is_directory(path) && fs::directory_iterator(path) == fs::directory_iterator();
}

// Deterministic, poorly compressible bytes
inline std::string pseudoRandom(size_t size, uint32_t seed) {
    std::string data(size, '\0');
    uint32_t state = seed;
    for (auto& c : data) {
        state = state * 1664525u + 1013904223u;
        c = static_cast<char>(state >> 24);
    }
    return data;
}

inline utils::TimePoint at(const std::string& iso) {
    utils::TimePoint tp;
    if (!utils::parseIso8601(iso, tp)) {
        throw std::runtime_error("bad timestamp " + iso);
    }
    return tp;
}

inline BackupMetadata makeRecord(const std::string& id,
                                 const std::string& createdAt,
                                 uint64_t size,
                                 const std::string& configName = "home") {
    BackupMetadata record;
    record.id = id;
    record.createdAt = at(createdAt);
    record.configName = configName;
    record.archiveFilename = configName + "_host_" + utils::formatFileTimestamp(record.createdAt) + "_" + id + ".tar.gz";
    record.sizeBytes = size;
    record.checksum = std::string(64, 'a');
    record.hostname = "host";
    return record;
}

struct TarEntry {
    std::string name;
    std::string content;
    unsigned int type = AE_IFREG;
    std::string link;       // symlink text or hard link target
    bool hardlink = false;
};

inline void writeTar(const std::string& path, const std::vector<TarEntry>& entries, bool gzip = true) {
    std::unique_ptr<struct archive, decltype(&archive_write_free)> a(archive_write_new(), &archive_write_free);
    if (gzip) {
        archive_write_add_filter_gzip(a.get());
    } else {
        archive_write_add_filter_none(a.get());
    }
    archive_write_set_format_pax_restricted(a.get());
    if (archive_write_open_filename(a.get(), path.c_str()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(a.get()));
    }

    for (const auto& e : entries) {
        std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(),
                                                                                   &archive_entry_free);
        archive_entry_set_pathname(entry.get(), e.name.c_str());
        archive_entry_set_filetype(entry.get(), e.type);
        archive_entry_set_perm(entry.get(), e.type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_mtime(entry.get(), 1700000000, 0);
        if (e.hardlink) {
            archive_entry_set_hardlink(entry.get(), e.link.c_str());
            archive_entry_set_size(entry.get(), 0);
        } else if (e.type == AE_IFLNK) {
            archive_entry_set_symlink(entry.get(), e.link.c_str());
            archive_entry_set_size(entry.get(), 0);
        } else {
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(e.content.size()));
        }
        if (archive_write_header(a.get(), entry.get()) < ARCHIVE_WARN) {
            throw std::runtime_error(archive_error_string(a.get()));
        }
        if (e.type == AE_IFREG && !e.hardlink && !e.content.empty()) {
            archive_write_data(a.get(), e.content.data(), e.content.size());
        }
    }
    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(a.get()));
    }
}

// Entry name -> content ("" for non-regular entries, the link text for symlinks)
inline std::map<std::string, std::string> readTar(const std::string& path) {
    std::map<std::string, std::string> result;
    std::unique_ptr<struct archive, decltype(&archive_read_free)> a(archive_read_new(), &archive_read_free);
    archive_read_support_filter_all(a.get());
    archive_read_support_format_tar(a.get());
    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(a.get()));
    }

    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        std::string name = archive_entry_pathname(entry);
        std::string content;
        if (archive_entry_filetype(entry) == AE_IFLNK) {
            content = archive_entry_symlink(entry);
        } else {
            char buf[8192];
            la_ssize_t n;
            while ((n = archive_read_data(a.get(), buf, sizeof(buf))) > 0) {
                content.append(buf, static_cast<size_t>(n));
            }
        }
        result[name] = content;
    }
    return result;
}

// Relative path -> content for every regular file and symlink under root
inline std::map<std::string, std::string> snapshotTree(const fs::path& root) {
    std::map<std::string, std::string> result;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        std::string rel = it->path().lexically_relative(root).generic_string();
        if (it->is_symlink()) {
            result[rel] = "-> " + fs::read_symlink(it->path()).string();
        } else if (it->is_regular_file()) {
            result[rel] = readFile(it->path());
        } else if (it->is_directory()) {
            result[rel + "/"] = "";
        }
    }
    return result;
}

} // namespace test_helpers
