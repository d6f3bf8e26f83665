#include "common/checksum.hpp"
#include "common/error.hpp"
#include "common/file_utils.hpp"
#include <openssl/evp.h>
#include <array>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <iomanip>

namespace {

constexpr size_t kDigestHexLength = 64;
const char* const kSidecarSuffix = ".sha256";

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext newSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw BackupError(ErrorCode::IOError, "Failed to initialize hashing context");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw BackupError(ErrorCode::IOError, "Failed to initialize SHA-256 context");
    }
    return ctx;
}

std::string finishHex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &digestLen) != 1) {
        throw BackupError(ErrorCode::IOError, "Failed to finalize SHA-256");
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace

std::string Checksum::sha256File(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw BackupError(ErrorCode::IOError, "Failed to open for hashing: " + path);
    }

    auto ctx = newSha256Context();
    std::array<char, 1 << 15> buffer{};
    while (in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if (read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(read)) != 1) {
            throw BackupError(ErrorCode::IOError, "Failed while computing SHA-256 of " + path);
        }
    }
    if (!in.eof()) {
        throw BackupError(ErrorCode::IOError, "Failed while reading " + path);
    }

    return finishHex(ctx.get());
}

std::string Checksum::sha256String(const std::string& data) {
    auto ctx = newSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw BackupError(ErrorCode::IOError, "Failed while computing SHA-256");
    }
    return finishHex(ctx.get());
}

std::string Checksum::sidecarPath(const std::string& archivePath) {
    return archivePath + kSidecarSuffix;
}

std::string Checksum::formatSidecar(const std::string& digest, const std::string& archiveBasename) {
    return digest + "  " + archiveBasename + "\n";
}

void Checksum::writeSidecar(const std::string& archivePath, const std::string& digest) {
    std::string basename = std::filesystem::path(archivePath).filename().string();
    file_utils::writeFileAtomic(sidecarPath(archivePath), formatSidecar(digest, basename));
}

std::optional<std::string> Checksum::readSidecar(const std::string& archivePath) {
    std::string path = sidecarPath(archivePath);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw BackupError(ErrorCode::IOError, "Failed to open checksum file: " + path);
    }

    std::string line;
    std::getline(in, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // sha256sum format: digest, two spaces (or space + '*' for binary mode), name
    auto sep = line.find(' ');
    if (sep == std::string::npos) {
        throw BackupError(ErrorCode::IntegrityError, "Malformed checksum file: " + path);
    }
    std::string digest = line.substr(0, sep);
    std::string name = line.substr(sep + 1);
    if (!name.empty() && (name[0] == ' ' || name[0] == '*')) {
        name.erase(0, 1);
    }

    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!isHexDigest(digest)) {
        throw BackupError(ErrorCode::IntegrityError, "Malformed digest in checksum file: " + path);
    }

    std::string expectedName = std::filesystem::path(archivePath).filename().string();
    if (name != expectedName) {
        throw BackupError(ErrorCode::IntegrityError,
                          "Checksum file " + path + " names '" + name + "', expected '" + expectedName + "'");
    }
    return digest;
}

bool Checksum::isHexDigest(const std::string& digest) {
    return digest.size() == kDigestHexLength &&
           std::all_of(digest.begin(), digest.end(),
                       [](unsigned char c) { return std::isxdigit(c) && !std::isupper(c); });
}
