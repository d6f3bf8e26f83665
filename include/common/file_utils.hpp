#pragma once

#include <string>
#include <cstdint>

namespace file_utils {

// Hidden temp sibling for path; never matches the archive, sidecar or record suffixes
std::string tempPathFor(const std::string& path, const std::string& tag = "tmp");

// Write content to a temp sibling, fsync it and rename it over path.
// Throws BackupError(IOError) on failure; the temp file is removed first.
void writeFileAtomic(const std::string& path, const std::string& content);

// fsync an existing file by path
void syncFile(const std::string& path);

// Remove path if present. Returns false (and logs) only when removal failed.
bool removeIfExists(const std::string& path);

uint64_t fileSize(const std::string& path);

} // namespace file_utils
