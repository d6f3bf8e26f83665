#include "restore/restore_manager.hpp"
#include "common/error.hpp"
#include "common/file_lock.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <map>
#include <memory>
#include <system_error>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
    void reset() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown error";
}

ArchiveReader openArchive(const std::string& path) {
    ArchiveReader a(archive_read_new(), &archive_read_free);
    if (!a) {
        throw BackupError(ErrorCode::IOError, "Failed to allocate archive reader");
    }
    archive_read_support_filter_all(a.get());
    archive_read_support_format_tar(a.get());
    if (archive_read_open_filename(a.get(), path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        throw BackupError(ErrorCode::IntegrityError, "Cannot open archive " + path + ": " + archiveError(a.get()));
    }
    return a;
}

fs::path stripTrailingSeparator(fs::path p) {
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

// Relative, '..'-free form of an archive member name
fs::path sanitizeEntryName(const std::string& name) {
    if (name.empty()) {
        throw BackupError(ErrorCode::SecurityError, "Archive entry with an empty name");
    }
    if (name[0] == '/') {
        throw BackupError(ErrorCode::SecurityError, "Absolute path in archive: " + name);
    }
    fs::path p(name);
    for (const auto& part : p) {
        if (part == "..") {
            throw BackupError(ErrorCode::SecurityError, "Parent directory reference in archive: " + name);
        }
    }
    return stripTrailingSeparator(p);
}

// Entries may not be placed beneath a symlink that the archive itself creates
void checkNoLinkPrefix(const fs::path& rel, const std::set<std::string>& symlinks, const std::string& name) {
    fs::path prefix;
    for (const auto& part : rel.parent_path()) {
        prefix /= part;
        if (symlinks.count(prefix.generic_string())) {
            throw BackupError(ErrorCode::SecurityError, "Archive entry passes through a symbolic link: " + name);
        }
    }
}

// Walks a relative link target from the link's directory. Stepping above the
// root, or backing out of a component that is a symlink (archived or already
// on disk), counts as an escape, as does a target that resolves outside root.
void checkSymlinkTarget(const fs::path& root, const fs::path& rel, const std::string& target,
                        const std::set<std::string>& symlinks, const std::string& name) {
    if (target.empty()) {
        throw BackupError(ErrorCode::SecurityError, "Symbolic link with an empty target: " + name);
    }
    if (target[0] == '/') {
        throw BackupError(ErrorCode::SecurityError, "Symbolic link to an absolute path: " + name + " -> " + target);
    }

    auto isLink = [&root, &symlinks](const fs::path& current) {
        std::error_code ec;
        return symlinks.count(current.generic_string()) > 0 ||
               fs::is_symlink(fs::symlink_status(root / current, ec));
    };

    std::vector<std::string> stack;
    for (const auto& part : rel.parent_path()) {
        stack.push_back(part.string());
    }
    for (const auto& part : fs::path(target)) {
        std::string component = part.string();
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            fs::path current;
            for (const auto& s : stack) {
                current /= s;
            }
            if (stack.empty() || isLink(current)) {
                throw BackupError(ErrorCode::SecurityError,
                                  "Symbolic link escapes the destination: " + name + " -> " + target);
            }
            stack.pop_back();
            continue;
        }
        stack.push_back(component);
    }

    fs::path resolved = root;
    for (const auto& s : stack) {
        resolved /= s;
    }
    std::error_code ec;
    fs::path canonicalRoot = fs::weakly_canonical(root, ec);
    fs::path canonicalTarget;
    if (!ec) {
        canonicalTarget = fs::weakly_canonical(resolved, ec);
    }
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to resolve link target " + resolved.string() + ": " + ec.message());
    }
    if (!RestoreManager::isWithinRoot(canonicalRoot, canonicalTarget)) {
        throw BackupError(ErrorCode::SecurityError,
                          "Symbolic link resolves outside the destination: " + name + " -> " + target);
    }
}

void writeAll(int fd, const char* data, size_t size, const std::string& path) {
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw BackupError(ErrorCode::IOError, "Failed to write " + path + ": " + strerror(errno));
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
}

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // namespace

RestoreManager::RestoreManager(const std::string& archivePath,
                               const std::string& destination,
                               RestoreOptions options)
    : archivePath_(archivePath)
    , root_(stripTrailingSeparator(fs::absolute(destination)))
    , options_(options) {
}

RestoreManager::~RestoreManager() = default;

bool RestoreManager::isWithinRoot(const fs::path& root, const fs::path& candidate) {
    fs::path rel = stripTrailingSeparator(candidate).lexically_relative(stripTrailingSeparator(root));
    if (rel.empty()) {
        return false;
    }
    return *rel.begin() != "..";
}

std::string RestoreManager::resolveEntryPath(const std::string& root, const std::string& entryName) {
    fs::path rootPath = stripTrailingSeparator(fs::absolute(root));
    fs::path rel = sanitizeEntryName(entryName);
    fs::path resolved = rel == "." ? rootPath : stripTrailingSeparator(rootPath / rel);

    if (!isWithinRoot(rootPath, resolved)) {
        throw BackupError(ErrorCode::SecurityError, "Archive entry resolves outside the destination: " + entryName);
    }

    // Symlinks already on disk under the root could redirect the write
    std::error_code ec;
    fs::path canonicalRoot = fs::weakly_canonical(rootPath, ec);
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to resolve " + rootPath.string() + ": " + ec.message());
    }
    fs::path canonicalParent = fs::weakly_canonical(resolved.parent_path(), ec);
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to resolve " + resolved.string() + ": " + ec.message());
    }
    if (resolved != rootPath && !isWithinRoot(canonicalRoot, canonicalParent)) {
        throw BackupError(ErrorCode::SecurityError,
                          "Archive entry resolves outside the destination through a link: " + entryName);
    }
    return resolved.string();
}

void RestoreManager::planEntry(struct archive_entry* entry,
                               PlannedEntry& planned,
                               std::set<std::string>& symlinks,
                               std::map<std::string, bool>& plannedTargets) {
    fs::path rel = sanitizeEntryName(planned.name);
    planned.relative = rel;
    planned.target = resolveEntryPath(root_.string(), planned.name);
    planned.type = archive_entry_filetype(entry);
    planned.perm = archive_entry_perm(entry) & 0777;
    planned.mtime = archive_entry_mtime(entry);

    if (rel == "." && planned.type != AE_IFDIR) {
        throw BackupError(ErrorCode::SecurityError, "Archive entry would replace the destination root: " + planned.name);
    }

    const char* hardlink = archive_entry_hardlink(entry);
    if (hardlink) {
        planned.hardlink = true;
        planned.hardlinkName = hardlink;
        planned.linkTarget = resolveEntryPath(root_.string(), hardlink);
    } else if (planned.type == AE_IFLNK) {
        const char* target = archive_entry_symlink(entry);
        planned.linkTarget = target ? target : "";
        // Link checks run once every archived symlink is known
        symlinks.insert(rel.generic_string());
    } else if (planned.type != AE_IFDIR && planned.type != AE_IFREG) {
        Logger::warning("Skipping unsupported archive entry " + planned.name);
        planned.skip = true;
        return;
    }

    if (options_.overwrite) {
        return;
    }

    bool isDir = planned.type == AE_IFDIR && !planned.hardlink;
    auto earlier = plannedTargets.find(planned.target.string());
    if (earlier != plannedTargets.end()) {
        if (!(isDir && earlier->second)) {
            throw BackupError(ErrorCode::IOError, "Archive contains " + planned.name + " more than once");
        }
    } else if (pathExists(planned.target)) {
        std::error_code ec;
        bool existingDir = fs::is_directory(fs::symlink_status(planned.target, ec));
        if (!(isDir && existingDir)) {
            throw BackupError(ErrorCode::IOError, "Destination already exists: " + planned.target.string());
        }
    }
    plannedTargets.emplace(planned.target.string(), isDir);
}

void RestoreManager::checkLinks(std::vector<PlannedEntry>& plan,
                                const std::set<std::string>& symlinks,
                                RestoreOutcome& outcome) {
    for (auto& planned : plan) {
        if (planned.skip) {
            continue;
        }
        try {
            checkNoLinkPrefix(planned.relative, symlinks, planned.name);
            if (planned.hardlink) {
                fs::path linkRel = sanitizeEntryName(planned.hardlinkName);
                checkNoLinkPrefix(linkRel, symlinks, planned.hardlinkName);
                if (symlinks.count(linkRel.generic_string())) {
                    throw BackupError(ErrorCode::SecurityError, "Hard link to a symbolic link: " + planned.name);
                }
            } else if (planned.type == AE_IFLNK) {
                checkSymlinkTarget(root_, planned.relative, planned.linkTarget, symlinks, planned.name);
            }
        } catch (const BackupError& e) {
            if (!options_.bestEffort) {
                throw;
            }
            Logger::warning("Skipping archive entry: " + std::string(e.what()));
            planned.skip = true;
            outcome.skippedEntries.push_back(planned.name + ": " + e.what());
        }
    }
}

std::vector<RestoreManager::PlannedEntry> RestoreManager::scan(RestoreOutcome& outcome) {
    ArchiveReader a = openArchive(archivePath_);
    std::vector<PlannedEntry> plan;
    std::set<std::string> symlinks;
    std::map<std::string, bool> plannedTargets;  // target -> is a directory

    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            throw BackupError(ErrorCode::IntegrityError, "Corrupt archive " + archivePath_ + ": " + archiveError(a.get()));
        }

        PlannedEntry planned;
        const char* name = archive_entry_pathname(entry);
        planned.name = name ? name : "";

        try {
            planEntry(entry, planned, symlinks, plannedTargets);
        } catch (const BackupError& e) {
            if (!options_.bestEffort) {
                throw;
            }
            Logger::warning("Skipping archive entry: " + std::string(e.what()));
            planned.skip = true;
            outcome.skippedEntries.push_back(planned.name + ": " + e.what());
        }
        plan.push_back(planned);

        if (archive_read_data_skip(a.get()) < ARCHIVE_WARN) {
            throw BackupError(ErrorCode::IntegrityError, "Corrupt archive " + archivePath_ + ": " + archiveError(a.get()));
        }
    }

    checkLinks(plan, symlinks, outcome);
    return plan;
}

void RestoreManager::createDirectories(const fs::path& dir) {
    std::vector<fs::path> missing;
    for (fs::path p = dir; !p.empty() && !pathExists(p); p = p.parent_path()) {
        missing.push_back(p);
        if (p == p.parent_path()) {
            break;
        }
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        if (mkdir(it->c_str(), 0755) != 0 && errno != EEXIST) {
            throw BackupError(ErrorCode::IOError, "Failed to create directory " + it->string() + ": " + strerror(errno));
        }
        created_.push_back(*it);
    }
}

void RestoreManager::removeExisting(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (!fs::exists(status) || fs::is_directory(status)) {
        return;
    }
    fs::remove(path, ec);
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to replace " + path.string() + ": " + ec.message());
    }
}

uint64_t RestoreManager::writeFile(struct archive* a, const PlannedEntry& planned, const std::atomic<bool>* cancelled) {
    createDirectories(planned.target.parent_path());

    std::string temp = file_utils::tempPathFor(planned.target.string(), "restore");
    FileDescriptor fd(open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (fd.get() < 0) {
        throw BackupError(ErrorCode::IOError, "Failed to create " + temp + ": " + strerror(errno));
    }
    pendingTemp_ = temp;

    std::array<char, 64 * 1024> buffer{};
    uint64_t total = 0;
    while (true) {
        if (cancelled && *cancelled) {
            throw BackupError(ErrorCode::Cancelled, "Restore cancelled");
        }
        la_ssize_t n = archive_read_data(a, buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            throw BackupError(ErrorCode::IntegrityError,
                              "Failed to read " + planned.name + " from archive: " + archiveError(a));
        }
        writeAll(fd.get(), buffer.data(), static_cast<size_t>(n), temp);
        total += static_cast<uint64_t>(n);
    }

    if (fchmod(fd.get(), planned.perm) != 0) {
        Logger::warning("Failed to set mode on " + planned.target.string() + ": " + strerror(errno));
    }
    if (close(fd.release()) != 0) {
        throw BackupError(ErrorCode::IOError, "Failed to close " + temp + ": " + strerror(errno));
    }

    struct timespec times[2];
    times[0].tv_sec = planned.mtime;
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (utimensat(AT_FDCWD, temp.c_str(), times, 0) != 0) {
        Logger::warning("Failed to set times on " + planned.target.string() + ": " + strerror(errno));
    }

    bool existed = pathExists(planned.target);
    if (rename(temp.c_str(), planned.target.c_str()) != 0) {
        throw BackupError(ErrorCode::IOError,
                          "Failed to move " + planned.target.string() + " into place: " + strerror(errno));
    }
    pendingTemp_.clear();
    if (!existed) {
        created_.push_back(planned.target);
    }
    return total;
}

void RestoreManager::extract(const std::vector<PlannedEntry>& plan,
                             const std::atomic<bool>* cancelled,
                             RestoreOutcome& outcome) {
    ArchiveReader a = openArchive(archivePath_);
    createDirectories(root_);

    std::vector<std::pair<fs::path, mode_t>> directoryModes;
    size_t index = 0;
    struct archive_entry* entry = nullptr;
    while (true) {
        if (cancelled && *cancelled) {
            throw BackupError(ErrorCode::Cancelled, "Restore cancelled");
        }

        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            throw BackupError(ErrorCode::IntegrityError, "Corrupt archive " + archivePath_ + ": " + archiveError(a.get()));
        }
        if (index >= plan.size()) {
            throw BackupError(ErrorCode::IntegrityError, "Archive changed during restore: " + archivePath_);
        }

        const PlannedEntry& planned = plan[index++];
        if (planned.skip) {
            continue;
        }

        if (planned.hardlink) {
            createDirectories(planned.target.parent_path());
            bool existed = pathExists(planned.target);
            removeExisting(planned.target);
            if (link(planned.linkTarget.c_str(), planned.target.c_str()) != 0) {
                throw BackupError(ErrorCode::IOError,
                                  "Failed to create hard link " + planned.target.string() + ": " + strerror(errno));
            }
            if (!existed) {
                created_.push_back(planned.target);
            }
        } else if (planned.type == AE_IFDIR) {
            createDirectories(planned.target);
            directoryModes.emplace_back(planned.target, planned.perm);
        } else if (planned.type == AE_IFLNK) {
            createDirectories(planned.target.parent_path());
            bool existed = pathExists(planned.target);
            removeExisting(planned.target);
            if (symlink(planned.linkTarget.c_str(), planned.target.c_str()) != 0) {
                throw BackupError(ErrorCode::IOError,
                                  "Failed to create symbolic link " + planned.target.string() + ": " + strerror(errno));
            }
            if (!existed) {
                created_.push_back(planned.target);
            }
        } else {
            outcome.bytesWritten += writeFile(a.get(), planned, cancelled);
        }
        outcome.entriesWritten++;
    }

    // Deepest first, after their contents are in place
    for (auto it = directoryModes.rbegin(); it != directoryModes.rend(); ++it) {
        if (chmod(it->first.c_str(), it->second) != 0) {
            Logger::warning("Failed to set mode on " + it->first.string() + ": " + strerror(errno));
        }
    }
}

void RestoreManager::rollback() {
    if (!pendingTemp_.empty()) {
        file_utils::removeIfExists(pendingTemp_);
        pendingTemp_.clear();
    }

    for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
        std::error_code ec;
        fs::remove(*it, ec);
        if (ec) {
            Logger::warning("Rollback could not remove " + it->string() + ": " + ec.message());
        }
    }
    if (!created_.empty()) {
        Logger::info("Rolled back " + std::to_string(created_.size()) + " restored paths under " + root_.string());
    }
    created_.clear();
}

RestoreOutcome RestoreManager::restore(const std::atomic<bool>* cancelled) {
    RestoreOutcome outcome;
    created_.clear();
    pendingTemp_.clear();

    Logger::info("Restoring " + archivePath_ + " to " + root_.string());

    try {
        std::error_code ec;
        if (!fs::is_regular_file(archivePath_, ec)) {
            throw BackupError(ErrorCode::IOError, "Archive does not exist: " + archivePath_);
        }

        std::unique_ptr<ArchivePin> pin;
        try {
            pin = std::make_unique<ArchivePin>(archivePath_);
        } catch (const BackupError& e) {
            Logger::warning("Restoring without a pin on " + archivePath_ + ": " + e.what());
        }

        std::vector<PlannedEntry> plan = scan(outcome);
        if (cancelled && *cancelled) {
            throw BackupError(ErrorCode::Cancelled, "Restore cancelled");
        }
        extract(plan, cancelled, outcome);
        outcome.success = true;
    } catch (const BackupError& e) {
        rollback();
        outcome.success = false;
        outcome.errorCode = e.code();
        outcome.error = e.what();
    } catch (const fs::filesystem_error& e) {
        rollback();
        outcome.success = false;
        outcome.errorCode = ErrorCode::IOError;
        outcome.error = e.what();
    }

    if (outcome.success) {
        Logger::info("Restored " + std::to_string(outcome.entriesWritten) + " entries (" +
                     std::to_string(outcome.bytesWritten) + " bytes) to " + root_.string());
    } else {
        outcome.entriesWritten = 0;
        outcome.bytesWritten = 0;
        Logger::error("Restore of " + archivePath_ + " failed (" + errorCodeToString(outcome.errorCode) +
                      "): " + outcome.error);
    }
    return outcome;
}
