#pragma once

#include <string>
#include <optional>

// SHA-256 digests and the "<hex-digest>  <archive-basename>" sidecar file
class Checksum {
public:
    static std::string sha256File(const std::string& path);
    static std::string sha256String(const std::string& data);

    static std::string sidecarPath(const std::string& archivePath);
    static std::string formatSidecar(const std::string& digest, const std::string& archiveBasename);

    // Atomic write of <archive>.sha256
    static void writeSidecar(const std::string& archivePath, const std::string& digest);

    // nullopt when no sidecar exists. A malformed sidecar, or one naming a
    // different archive, throws BackupError(IntegrityError).
    static std::optional<std::string> readSidecar(const std::string& archivePath);

    static bool isHexDigest(const std::string& digest);
};
