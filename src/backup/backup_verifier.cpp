#include "backup/backup_verifier.hpp"
#include "backup/metadata_store.hpp"
#include "common/checksum.hpp"
#include "common/error.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace {

using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

constexpr la_int64_t kEndOfArchiveBytes = 2 * 512;

bool hasSuffix(const std::string& name, const std::string& suffix) {
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isArchiveFile(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    std::string name = entry.path().filename().string();
    return name[0] != '.' && (hasSuffix(name, ".tar.gz") || hasSuffix(name, ".tar"));
}

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown error";
}

} // namespace

BackupVerifier::BackupVerifier(const std::string& archivePath, const std::string& expectedChecksum)
    : archivePath_(archivePath)
    , expectedChecksum_(expectedChecksum) {
    std::transform(expectedChecksum_.begin(), expectedChecksum_.end(), expectedChecksum_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    result_.archivePath = archivePath;
}

BackupVerifier::~BackupVerifier() = default;

bool BackupVerifier::initialize() {
    std::error_code ec;
    if (!fs::is_regular_file(archivePath_, ec)) {
        result_.errors.push_back("Archive does not exist: " + archivePath_);
        return false;
    }

    try {
        result_.sizeBytes = file_utils::fileSize(archivePath_);
    } catch (const BackupError& e) {
        result_.errors.push_back(e.what());
        return false;
    }
    return true;
}

VerificationResult BackupVerifier::verify() {
    result_ = VerificationResult();
    result_.archivePath = archivePath_;
    result_.verifiedAt = std::chrono::system_clock::now();

    Logger::info("Verifying " + archivePath_);

    if (initialize()) {
        verifyChecksum();
        verifyStructure();
    }

    result_.isValid = result_.checksumOk && result_.extractable;
    if (result_.isValid) {
        Logger::info("Archive " + archivePath_ + " is valid (" + std::to_string(result_.entriesCount) + " entries)");
    } else {
        for (const auto& error : result_.errors) {
            Logger::error("Verification of " + archivePath_ + ": " + error);
        }
    }
    return result_;
}

void BackupVerifier::verifyChecksum() {
    std::string reference;
    try {
        auto sidecar = Checksum::readSidecar(archivePath_);
        if (sidecar) {
            reference = *sidecar;
        }
    } catch (const BackupError& e) {
        result_.errors.push_back(e.what());
        return;
    }

    if (reference.empty()) {
        reference = expectedChecksum_;
    }
    if (reference.empty()) {
        result_.errors.push_back("no checksum reference");
        return;
    }
    result_.checksumAvailable = true;

    std::string actual;
    try {
        actual = Checksum::sha256File(archivePath_);
    } catch (const BackupError& e) {
        result_.errors.push_back(e.what());
        return;
    }

    if (actual != reference) {
        result_.errors.push_back("Checksum mismatch: expected " + reference + ", got " + actual);
        return;
    }
    result_.checksumOk = true;
}

void BackupVerifier::verifyStructure() {
    ArchiveReader a(archive_read_new(), &archive_read_free);
    if (!a) {
        result_.errors.push_back("Failed to allocate archive reader");
        return;
    }
    archive_read_support_filter_all(a.get());
    archive_read_support_format_tar(a.get());

    if (archive_read_open_filename(a.get(), archivePath_.c_str(), 64 * 1024) != ARCHIVE_OK) {
        result_.errors.push_back("Cannot open archive: " + archiveError(a.get()));
        return;
    }

    uint64_t entries = 0;
    struct archive_entry* entry = nullptr;
    while (true) {
        la_int64_t entryEnd = archive_filter_bytes(a.get(), 0);
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) {
            // The tar reader also reports EOF when the input stops on a header
            // boundary; only the two zero blocks mark a complete archive
            if (archive_filter_bytes(a.get(), 0) - entryEnd < kEndOfArchiveBytes) {
                result_.errors.push_back("Missing end-of-archive marker after " + std::to_string(entries) +
                                         " entries (truncated)");
                result_.entriesCount = entries;
                return;
            }
            break;
        }
        if (r < ARCHIVE_WARN) {
            result_.errors.push_back("Corrupt archive after " + std::to_string(entries) +
                                     " entries: " + archiveError(a.get()));
            result_.entriesCount = entries;
            return;
        }

        std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        const void* buffer = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while ((r = archive_read_data_block(a.get(), &buffer, &size, &offset)) == ARCHIVE_OK) {
        }
        if (r < ARCHIVE_WARN) {
            result_.errors.push_back("Corrupt data in entry '" + name + "': " + archiveError(a.get()));
            result_.entriesCount = entries;
            return;
        }
        ++entries;
    }

    result_.entriesCount = entries;
    if (entries == 0) {
        result_.errors.push_back("Archive is empty");
        return;
    }
    result_.extractable = true;
}

VerificationResult BackupVerifier::getResult() const {
    return result_;
}

std::map<std::string, VerificationResult> BackupVerifier::verifyAll(const std::string& directory) {
    std::map<std::string, VerificationResult> results;

    std::map<std::string, std::string> idsByArchive;
    for (const auto& record : MetadataStore(directory).list()) {
        idsByArchive[record.archiveFilename] = record.id;
    }

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw BackupError(ErrorCode::IOError, "Not a directory: " + directory);
    }
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!isArchiveFile(*it)) {
            continue;
        }
        std::string path = it->path().string();
        auto found = idsByArchive.find(it->path().filename().string());
        std::string key = found != idsByArchive.end() ? found->second : path;

        results[key] = BackupVerifier(path).verify();
    }
    if (ec) {
        throw BackupError(ErrorCode::IOError, "Failed to scan " + directory + ": " + ec.message());
    }

    size_t valid = std::count_if(results.begin(), results.end(),
                                 [](const std::pair<const std::string, VerificationResult>& r) {
                                     return r.second.isValid;
                                 });
    Logger::info("Verified " + std::to_string(results.size()) + " archives in " + directory +
                 ", " + std::to_string(valid) + " valid");
    return results;
}
