#pragma once

#include "common/backup_status.hpp"
#include <map>
#include <string>

// Read-only integrity check of one archive: digest against the sidecar (or a
// caller supplied digest) plus a full decode of every entry and data block.
class BackupVerifier {
public:
    explicit BackupVerifier(const std::string& archivePath, const std::string& expectedChecksum = "");
    ~BackupVerifier();

    // Never throws; problems are reported in the result's errors
    VerificationResult verify();
    VerificationResult getResult() const;

    // Every archive in a destination directory, keyed by backup id when a
    // metadata record names it, otherwise by path. Throws BackupError(IOError)
    // when the directory cannot be read.
    static std::map<std::string, VerificationResult> verifyAll(const std::string& directory);

private:
    bool initialize();
    void verifyChecksum();
    void verifyStructure();

    std::string archivePath_;
    std::string expectedChecksum_;
    VerificationResult result_;
};
