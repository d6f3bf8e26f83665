#include <gtest/gtest.h>
#include "backup/metadata_store.hpp"
#include "common/error.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

class MetadataStoreTest : public ::testing::Test {
protected:
    TempDir tmp_;
    MetadataStore store_{tmp_.str()};
};

TEST_F(MetadataStoreTest, ListsNewestFirst) {
    store_.append(makeRecord("b", "2024-03-02T10:00:00Z", 100));
    store_.append(makeRecord("a", "2024-03-01T10:00:00Z", 100));
    store_.append(makeRecord("c", "2024-03-03T10:00:00Z", 100));

    auto records = store_.list("home");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].id, "c");
    EXPECT_EQ(records[1].id, "b");
    EXPECT_EQ(records[2].id, "a");
}

TEST_F(MetadataStoreTest, TiesBrokenById) {
    store_.append(makeRecord("id1", "2024-03-01T10:00:00Z", 1));
    store_.append(makeRecord("id2", "2024-03-01T10:00:00Z", 1));

    auto records = store_.list();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "id2");
    EXPECT_EQ(records[1].id, "id1");
}

TEST_F(MetadataStoreTest, FiltersByConfig) {
    store_.append(makeRecord("a", "2024-03-01T10:00:00Z", 1, "home"));
    store_.append(makeRecord("b", "2024-03-01T11:00:00Z", 1, "etc"));

    EXPECT_EQ(store_.list("home").size(), 1u);
    EXPECT_EQ(store_.list("etc").size(), 1u);
    EXPECT_EQ(store_.list().size(), 2u);
    EXPECT_TRUE(store_.list("other").empty());
}

TEST_F(MetadataStoreTest, RecordFileSitsBesideArchive) {
    BackupMetadata record = makeRecord("a", "2024-03-01T10:00:00Z", 42);
    store_.append(record);

    std::string path = store_.recordPath(record);
    EXPECT_EQ(path, tmp_.str(record.archiveFilename + ".json"));
    auto j = nlohmann::json::parse(readFile(path));
    EXPECT_EQ(j["id"], "a");
    EXPECT_EQ(j["created_at"], "2024-03-01T10:00:00Z");
    EXPECT_EQ(j["config_name"], "home");
    EXPECT_EQ(j["size_bytes"], 42);
}

TEST_F(MetadataStoreTest, DuplicateIdIsConfigError) {
    store_.append(makeRecord("a", "2024-03-01T10:00:00Z", 1));
    try {
        store_.append(makeRecord("a", "2024-03-02T10:00:00Z", 1));
        FAIL() << "expected BackupError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ConfigError);
    }
}

TEST_F(MetadataStoreTest, RemoveIsIdempotent) {
    BackupMetadata record = makeRecord("a", "2024-03-01T10:00:00Z", 1);
    store_.append(record);

    EXPECT_TRUE(store_.remove("a"));
    EXPECT_FALSE(store_.remove("a"));
    EXPECT_FALSE(store_.find("a").has_value());
    EXPECT_FALSE(std::filesystem::exists(store_.recordPath(record)));
}

TEST_F(MetadataStoreTest, SkipsUnreadableRecords) {
    store_.append(makeRecord("a", "2024-03-01T10:00:00Z", 1));
    writeFile(tmp_.path() / "broken.tar.gz.json", "{ truncated");
    writeFile(tmp_.path() / "badtime.tar.gz.json",
              R"({"id":"x","created_at":"yesterday","config_name":"home",)"
              R"("archive_filename":"badtime.tar.gz","size_bytes":1,"checksum":"00"})");
    writeFile(tmp_.path() / ".hidden.json", "{}");

    auto records = store_.list();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "a");
}

TEST_F(MetadataStoreTest, SkipsRecordsNamingFilesOutsideTheDirectory) {
    store_.append(makeRecord("a", "2024-03-01T10:00:00Z", 1));
    const char* names[] = {"../victim.txt", "sub/dir.tar.gz", "..", ".", ""};
    int n = 0;
    for (const char* name : names) {
        nlohmann::json j = makeRecord("bad" + std::to_string(n), "2024-02-01T10:00:00Z", 1);
        j["archive_filename"] = name;
        writeFile(tmp_.path() / ("bad" + std::to_string(n++) + ".tar.gz.json"), j.dump());
    }

    auto records = store_.list();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "a");
    EXPECT_FALSE(store_.find("bad0").has_value());
}

TEST_F(MetadataStoreTest, AppendRejectsPathLikeArchiveFilename) {
    BackupMetadata record = makeRecord("a", "2024-03-01T10:00:00Z", 1);
    record.archiveFilename = "../escape.tar.gz";
    EXPECT_THROW(store_.append(record), BackupError);
    EXPECT_TRUE(store_.list().empty());

    EXPECT_TRUE(isPlainArchiveFilename("home_host_20240301_100000.tar.gz"));
    EXPECT_FALSE(isPlainArchiveFilename("a/b.tar"));
    EXPECT_FALSE(isPlainArchiveFilename(".."));
}

TEST_F(MetadataStoreTest, FindByIdAndArchive) {
    BackupMetadata record = makeRecord("a", "2024-03-01T10:00:00Z", 1);
    store_.append(record);

    auto byId = store_.find("a");
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->archiveFilename, record.archiveFilename);
    EXPECT_EQ(byId->createdAt, record.createdAt);

    EXPECT_TRUE(store_.findByArchive(record.archiveFilename).has_value());
    EXPECT_FALSE(store_.findByArchive("nope.tar.gz").has_value());
}

TEST_F(MetadataStoreTest, MissingDirectoryListsNothing) {
    MetadataStore store(tmp_.str("does-not-exist"));
    EXPECT_TRUE(store.list().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
