#include <gtest/gtest.h>
#include "common/checksum.hpp"
#include "common/error.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

namespace {

ErrorCode readSidecarError(const std::string& archivePath) {
    try {
        Checksum::readSidecar(archivePath);
    } catch (const BackupError& e) {
        return e.code();
    }
    return ErrorCode::None;
}

} // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        archivePath_ = tmp_.str("home_host_20240101_000000.tar.gz");
        writeFile(archivePath_, "archive bytes");
    }

    TempDir tmp_;
    std::string archivePath_;
};

TEST_F(ChecksumTest, KnownDigests) {
    EXPECT_EQ(Checksum::sha256String(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Checksum::sha256String("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, FileDigestMatchesContent) {
    std::string data = pseudoRandom(100000, 7);
    writeFile(tmp_.path() / "data.bin", data);
    EXPECT_EQ(Checksum::sha256File(tmp_.str("data.bin")), Checksum::sha256String(data));
}

TEST_F(ChecksumTest, MissingFileIsIOError) {
    try {
        Checksum::sha256File(tmp_.str("missing"));
        FAIL() << "expected BackupError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IOError);
    }
}

TEST_F(ChecksumTest, SidecarFormat) {
    std::string digest = Checksum::sha256File(archivePath_);
    Checksum::writeSidecar(archivePath_, digest);

    EXPECT_EQ(Checksum::sidecarPath(archivePath_), archivePath_ + ".sha256");
    EXPECT_EQ(readFile(archivePath_ + ".sha256"), digest + "  home_host_20240101_000000.tar.gz\n");

    auto read = Checksum::readSidecar(archivePath_);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, digest);
}

TEST_F(ChecksumTest, MissingSidecar) {
    EXPECT_FALSE(Checksum::readSidecar(archivePath_).has_value());
}

TEST_F(ChecksumTest, AcceptsBinaryMarkerAndUppercase) {
    std::string digest = Checksum::sha256File(archivePath_);
    std::string upper = digest;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    writeFile(archivePath_ + ".sha256", upper + " *home_host_20240101_000000.tar.gz\n");

    auto read = Checksum::readSidecar(archivePath_);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, digest);
}

TEST_F(ChecksumTest, MalformedSidecarIsIntegrityError) {
    writeFile(archivePath_ + ".sha256", "not-a-digest  home_host_20240101_000000.tar.gz\n");
    EXPECT_EQ(readSidecarError(archivePath_), ErrorCode::IntegrityError);

    writeFile(archivePath_ + ".sha256", "garbage");
    EXPECT_EQ(readSidecarError(archivePath_), ErrorCode::IntegrityError);
}

TEST_F(ChecksumTest, SidecarForAnotherArchiveIsIntegrityError) {
    writeFile(archivePath_ + ".sha256", std::string(64, 'b') + "  other.tar.gz\n");
    EXPECT_EQ(readSidecarError(archivePath_), ErrorCode::IntegrityError);
}

TEST_F(ChecksumTest, HexDigestValidation) {
    EXPECT_TRUE(Checksum::isHexDigest(std::string(64, 'f')));
    EXPECT_FALSE(Checksum::isHexDigest(std::string(64, 'F')));
    EXPECT_FALSE(Checksum::isHexDigest(std::string(63, 'a')));
    EXPECT_FALSE(Checksum::isHexDigest(std::string(64, 'g')));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
