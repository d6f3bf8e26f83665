#include <gtest/gtest.h>
#include "backup/archiver.hpp"
#include "backup/backup_job.hpp"
#include "backup/metadata_store.hpp"
#include "common/checksum.hpp"
#include "common/error.hpp"
#include "common/file_lock.hpp"
#include "test_helpers.hpp"
#include <regex>

using namespace test_helpers;
namespace fs = std::filesystem;

namespace {

// Everything in dir that is part of a backup (archive, sidecar, record or temp)
std::vector<std::string> backupArtifacts(const fs::path& dir) {
    std::vector<std::string> names;
    if (!fs::exists(dir)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.size() > 5 && name.compare(name.size() - 5, 5, ".lock") == 0) {
            continue;
        }
        names.push_back(name);
    }
    return names;
}

ErrorCode runError(Archiver& archiver, const std::atomic<bool>& cancelled, utils::TimePoint startedAt) {
    try {
        archiver.run("job-1", cancelled, startedAt);
    } catch (const BackupError& e) {
        return e.code();
    }
    return ErrorCode::None;
}

} // namespace

class ArchiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = tmp_.path() / "src";
        writeFile(source_ / "a.txt", "alpha");
        writeFile(source_ / "sub" / "b.txt", "bravo");
        writeFile(source_ / "sub" / "scratch.tmp", "temp");
        writeFile(source_ / "node_modules" / "pkg" / "index.js", "js");
        fs::create_directories(source_ / "empty");
        fs::create_symlink("a.txt", source_ / "link");

        config_.name = "home";
        config_.sourcePath = source_.string();
        config_.destinationDir = tmp_.str("dest");
        config_.excludePatterns = {"*.tmp", "node_modules"};
    }

    TempDir tmp_;
    fs::path source_;
    BackupConfig config_;
    std::atomic<bool> notCancelled_{false};
    HookRunner fastKill_{std::chrono::milliseconds(200)};
};

TEST_F(ArchiverTest, CreatesArchiveSidecarAndRecord) {
    auto startedAt = at("2024-03-10T12:34:56Z");
    ArchiveResult result = Archiver(config_).run("job-1", notCancelled_, startedAt);

    std::string host = utils::getHostname();
    std::string expectedName = "home_" + host + "_20240310_123456.tar.gz";
    EXPECT_EQ(result.metadata.archiveFilename, expectedName);
    EXPECT_EQ(result.archivePath, (fs::path(config_.destinationDir) / expectedName).string());
    EXPECT_TRUE(fs::exists(result.archivePath));

    // Checksum in the record, the sidecar and the bytes on disk all agree
    std::string digest = Checksum::sha256File(result.archivePath);
    EXPECT_EQ(result.metadata.checksum, digest);
    auto sidecar = Checksum::readSidecar(result.archivePath);
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(*sidecar, digest);

    auto record = MetadataStore(config_.destinationDir).find("job-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->configName, "home");
    EXPECT_EQ(record->createdAt, startedAt);
    EXPECT_EQ(record->sizeBytes, fs::file_size(result.archivePath));
    EXPECT_EQ(record->filesCount, 2u);
    EXPECT_EQ(record->hostname, host);
    EXPECT_TRUE(record->compressed);

    EXPECT_EQ(backupArtifacts(config_.destinationDir).size(), 3u);
}

TEST_F(ArchiverTest, StoresEntriesUnderSourceName) {
    ArchiveResult result = Archiver(config_).run("job-1", notCancelled_, at("2024-03-10T12:00:00Z"));
    auto entries = readTar(result.archivePath);

    EXPECT_EQ(entries["src/a.txt"], "alpha");
    EXPECT_EQ(entries["src/sub/b.txt"], "bravo");
    EXPECT_EQ(entries["src/link"], "a.txt");
    // The pax writer marks directories with a trailing '/'
    EXPECT_TRUE(entries.count("src/empty/") || entries.count("src/empty"));
    EXPECT_FALSE(entries.count("src/sub/scratch.tmp"));
    EXPECT_FALSE(entries.count("src/node_modules/") || entries.count("src/node_modules"));
    EXPECT_FALSE(entries.count("src/node_modules/pkg/index.js"));
}

TEST_F(ArchiverTest, UncompressedArchive) {
    config_.compression = false;
    ArchiveResult result = Archiver(config_).run("job-1", notCancelled_, at("2024-03-10T12:00:00Z"));

    EXPECT_EQ(fs::path(result.archivePath).extension(), ".tar");
    EXPECT_FALSE(result.metadata.compressed);
    EXPECT_EQ(readTar(result.archivePath)["src/a.txt"], "alpha");
}

TEST_F(ArchiverTest, DestinationInsideSourceIsSkipped) {
    config_.destinationDir = (source_ / "backups").string();
    ArchiveResult result = Archiver(config_).run("job-1", notCancelled_, at("2024-03-10T12:00:00Z"));

    auto entries = readTar(result.archivePath);
    for (const auto& entry : entries) {
        EXPECT_EQ(entry.first.find("src/backups"), std::string::npos) << entry.first;
    }
    EXPECT_EQ(entries["src/a.txt"], "alpha");
}

TEST_F(ArchiverTest, ExcludeMatching) {
    std::vector<std::string> patterns = {"*.tmp", "cache", "/build", "logs/*.log"};
    EXPECT_TRUE(Archiver::isExcluded("x.tmp", patterns));
    EXPECT_TRUE(Archiver::isExcluded("deep/dir/x.tmp", patterns));
    EXPECT_TRUE(Archiver::isExcluded("cache", patterns));
    EXPECT_TRUE(Archiver::isExcluded("home/cache", patterns));
    EXPECT_TRUE(Archiver::isExcluded("build", patterns));
    EXPECT_FALSE(Archiver::isExcluded("src/build", patterns));
    EXPECT_TRUE(Archiver::isExcluded("app/logs/today.log", patterns));
    EXPECT_FALSE(Archiver::isExcluded("app/today.log", patterns));
    EXPECT_FALSE(Archiver::isExcluded("notes.txt", patterns));
    EXPECT_FALSE(Archiver::isExcluded("notes.txt", {}));
}

TEST_F(ArchiverTest, PreHookTimeoutLeavesNoArchive) {
    config_.preHook.command = "sleep 30";
    config_.preHook.timeout = std::chrono::seconds(1);

    BackupJob job(config_, fastKill_);
    EXPECT_FALSE(job.start());
    EXPECT_TRUE(job.isFailed());
    EXPECT_EQ(job.getErrorCode(), ErrorCode::HookTimeoutError);
    EXPECT_TRUE(job.getArchivePath().empty());
    EXPECT_TRUE(backupArtifacts(config_.destinationDir).empty());
}

TEST_F(ArchiverTest, PreHookFailureLeavesNoArchive) {
    config_.preHook.command = "exit 1";

    BackupJob job(config_, fastKill_);
    EXPECT_FALSE(job.start());
    EXPECT_EQ(job.getErrorCode(), ErrorCode::HookFailedError);
    EXPECT_TRUE(backupArtifacts(config_.destinationDir).empty());
}

TEST_F(ArchiverTest, PreHookRunsBeforeArchiving) {
    config_.preHook.command = "echo dumped > " + (source_ / "dump.sql").string();

    BackupJob job(config_, fastKill_);
    ASSERT_TRUE(job.start());
    EXPECT_EQ(readTar(job.getArchivePath())["src/dump.sql"], "dumped\n");
}

TEST_F(ArchiverTest, PostHookFailureIsAWarning) {
    config_.postHook.command = "exit 5";

    BackupJob job(config_, fastKill_);
    EXPECT_TRUE(job.start());
    EXPECT_TRUE(job.isSucceeded());
    ASSERT_EQ(job.getWarnings().size(), 1u);
    EXPECT_NE(job.getWarnings()[0].find("post-hook"), std::string::npos);
    EXPECT_TRUE(fs::exists(job.getArchivePath()));
}

TEST_F(ArchiverTest, JobReportsResult) {
    BackupJob job(config_);
    EXPECT_EQ(job.getState(), Job::State::PENDING);
    ASSERT_TRUE(job.start());

    EXPECT_EQ(job.getState(), Job::State::SUCCEEDED);
    EXPECT_EQ(job.getMetadata().id, job.getId());
    EXPECT_EQ(job.getMetadata().filesCount, 2u);
    EXPECT_GE(job.getDurationSeconds(), 0.0);
    EXPECT_FALSE(job.start());
}

TEST_F(ArchiverTest, DisabledConfigIsRejected) {
    config_.enabled = false;
    Archiver archiver(config_);
    EXPECT_EQ(runError(archiver, notCancelled_, at("2024-03-10T12:00:00Z")), ErrorCode::ConfigError);
}

TEST_F(ArchiverTest, MissingSourceIsConfigError) {
    config_.sourcePath = tmp_.str("nope");
    Archiver archiver(config_);
    EXPECT_EQ(runError(archiver, notCancelled_, at("2024-03-10T12:00:00Z")), ErrorCode::ConfigError);
    EXPECT_TRUE(backupArtifacts(config_.destinationDir).empty());
}

TEST_F(ArchiverTest, NameCollisionIsConfigError) {
    auto startedAt = at("2024-03-10T12:00:00Z");
    Archiver(config_).run("job-1", notCancelled_, startedAt);

    Archiver archiver(config_);
    try {
        archiver.run("job-2", notCancelled_, startedAt);
        FAIL() << "expected BackupError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigError);
    }
    EXPECT_EQ(MetadataStore(config_.destinationDir).list().size(), 1u);
}

TEST_F(ArchiverTest, ConcurrentRunIsRefused) {
    fs::create_directories(config_.destinationDir);
    FileLock held(Archiver::lockPath(config_));
    ASSERT_TRUE(held.tryLock());

    Archiver archiver(config_);
    try {
        archiver.run("job-1", notCancelled_, at("2024-03-10T12:00:00Z"));
        FAIL() << "expected BackupError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IOError);
        EXPECT_NE(std::string(e.what()).find("already running"), std::string::npos);
    }
}

TEST_F(ArchiverTest, CancelledRunLeavesNothing) {
    std::atomic<bool> cancelled{true};
    Archiver archiver(config_);
    EXPECT_EQ(runError(archiver, cancelled, at("2024-03-10T12:00:00Z")), ErrorCode::Cancelled);
    EXPECT_TRUE(backupArtifacts(config_.destinationDir).empty());

    BackupJob job(config_);
    job.cancel();
    EXPECT_FALSE(job.start());
    EXPECT_EQ(job.getErrorCode(), ErrorCode::Cancelled);
}

TEST_F(ArchiverTest, FilenameFormat) {
    std::string name = Archiver::archiveFilename(config_, "web-01", at("2023-12-31T23:59:59Z"));
    EXPECT_EQ(name, "home_web-01_20231231_235959.tar.gz");
    EXPECT_TRUE(std::regex_match(name, std::regex(R"(home_[\w-]+_\d{8}_\d{6}\.tar\.gz)")));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
