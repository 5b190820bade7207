#include <gtest/gtest.h>
#include <storage/credential_file.hpp>
#include <core/time_utils.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <set>

namespace fs = std::filesystem;

class CredentialFileTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path db_path;

    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        test_dir = fs::temp_directory_path() / ("crab_file_test_" + name);
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        db_path = test_dir / "credentials.json";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& p, const std::string& content) {
        std::ofstream(p, std::ios::binary) << content;
    }

    std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }

    CredentialStore one_entry_store() {
        CredentialStore store;
        store.upsert_entry(CredentialEntry::create("github", "alice", "s3cr3t"));
        return store;
    }
};

TEST_F(CredentialFileTest, LoadMissingFileIsEmpty) {
    CredentialFile db(db_path);
    EXPECT_FALSE(db.exists());

    auto loaded = db.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_TRUE(loaded.value.empty());
    EXPECT_FALSE(db.exists());
}

TEST_F(CredentialFileTest, SaveThenLoad) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());
    EXPECT_TRUE(db.exists());

    auto loaded = CredentialFile(db_path).load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    ASSERT_EQ(loaded.value.size(), 1u);

    const CredentialEntry* entry = loaded.value.find_entry("github");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->account(), "alice");
    EXPECT_EQ(entry->secret(), "s3cr3t");
    EXPECT_EQ(entry->created_at(), entry->updated_at());
    EXPECT_EQ(loaded.value.version(), "1.0");
}

TEST_F(CredentialFileTest, SaveCreatesMissingDirectories) {
    CredentialFile db(test_dir / "nested" / ".crab" / "credentials.json");
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());
    EXPECT_TRUE(db.exists());
}

TEST_F(CredentialFileTest, SaveReplacesPreviousContents) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    CredentialStore empty;
    ASSERT_TRUE(db.save(empty).is_ok());

    auto loaded = db.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value.empty());
}

TEST_F(CredentialFileTest, SaveLeavesNoTemporaryFile) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    for (const auto& entry : fs::directory_iterator(test_dir)) {
        EXPECT_EQ(entry.path().extension().string(), ".json") << entry.path();
    }
}

#ifndef _WIN32
TEST_F(CredentialFileTest, SavedFileIsOwnerOnly) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    auto perms = fs::status(db_path).permissions();
    EXPECT_TRUE((perms & fs::perms::all) == (fs::perms::owner_read | fs::perms::owner_write));
}
#endif

TEST_F(CredentialFileTest, CorruptFileIsAnError) {
    write_file(db_path, "this is { not a database");
    CredentialFile db(db_path);

    auto loaded = db.load();
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Deserialization);
    // The damaged file is left for the user to inspect.
    EXPECT_EQ(read_file(db_path), "this is { not a database");
}

TEST_F(CredentialFileTest, WrongShapeIsAnError) {
    write_file(db_path, "{\"entries\": [{\"service\": \"github\"}], \"version\": \"1.0\"}");
    auto loaded = CredentialFile(db_path).load();
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Deserialization);
}

TEST_F(CredentialFileTest, DirectoryInPlaceOfFileIsIoError) {
    fs::create_directories(db_path);
    CredentialFile db(db_path);
    EXPECT_FALSE(db.exists());

    auto saved = db.save(one_entry_store());
    EXPECT_TRUE(saved.is_err());
    EXPECT_EQ(saved.kind, ErrorKind::Io);
}

TEST_F(CredentialFileTest, LoadFromDirectoryIsIoError) {
    fs::create_directories(db_path);
    CredentialFile db(db_path);

    auto loaded = db.load();
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Io);
}

TEST_F(CredentialFileTest, SavedFileIsIndentedJson) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    std::string text = read_file(db_path);
    EXPECT_EQ(text.rfind("{\n  \"entries\": [", 0), 0u) << text;
    EXPECT_NE(text.find("\n  \"version\": \"1.0\"\n}"), std::string::npos) << text;
}

TEST_F(CredentialFileTest, SaveRefusesNonUtf8AndKeepsOldFile) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());
    std::string before = read_file(db_path);

    CredentialStore bad;
    bad.upsert_entry(CredentialEntry::create("svc", "acct", "\xe9t\xe9"));
    auto saved = db.save(bad);
    EXPECT_TRUE(saved.is_err());
    EXPECT_EQ(saved.kind, ErrorKind::Serialization);
    EXPECT_EQ(read_file(db_path), before);
}

TEST_F(CredentialFileTest, BackupWithoutDatabase) {
    CredentialFile db(db_path);
    auto backup = db.backup();
    EXPECT_TRUE(backup.is_err());
    EXPECT_EQ(backup.kind, ErrorKind::DatabaseNotFound);
    EXPECT_TRUE(db.list_backups().empty());
}

TEST_F(CredentialFileTest, BackupCopiesDatabase) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    int64_t before = unix_now();
    auto backup = db.backup();
    ASSERT_TRUE(backup.is_ok()) << backup.error;

    EXPECT_EQ(backup.value.parent_path().string(), test_dir.string());
    std::string name = backup.value.filename().string();
    EXPECT_EQ(name.rfind("credentials_", 0), 0u) << name;
    EXPECT_EQ(name.substr(name.size() - 9), ".json.bak") << name;

    std::string stamp = name.substr(12, name.size() - 12 - 9);
    EXPECT_GE(std::stoll(stamp), before);

    EXPECT_EQ(read_file(backup.value), read_file(db_path));
    EXPECT_TRUE(db.exists());
}

TEST_F(CredentialFileTest, RepeatedBackupsNeverOverwrite) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    std::set<fs::path> made;
    for (int i = 0; i < 3; i++) {
        auto backup = db.backup();
        ASSERT_TRUE(backup.is_ok()) << backup.error;
        made.insert(backup.value);
    }
    EXPECT_EQ(made.size(), 3u);

    auto listed = db.list_backups();
    ASSERT_EQ(listed.size(), 3u);
    for (const auto& p : listed) {
        EXPECT_TRUE(made.count(p)) << p;
    }
}

TEST_F(CredentialFileTest, ListBackupsOrdersByTimeAndIgnoresOthers) {
    write_file(test_dir / "credentials_1700000200.json.bak", "{}");
    write_file(test_dir / "credentials_1700000100_1.json.bak", "{}");
    write_file(test_dir / "credentials_1700000100.json.bak", "{}");
    write_file(test_dir / "credentials_latest.json.bak", "{}");
    write_file(test_dir / "other_1700000100.json.bak", "{}");
    write_file(test_dir / "credentials.json.lock", "");

    auto listed = CredentialFile(db_path).list_backups();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0].filename().string(), "credentials_1700000100.json.bak");
    EXPECT_EQ(listed[1].filename().string(), "credentials_1700000100_1.json.bak");
    EXPECT_EQ(listed[2].filename().string(), "credentials_1700000200.json.bak");
}

TEST_F(CredentialFileTest, RemoveDeletesDatabaseOnly) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());
    auto backup = db.backup();
    ASSERT_TRUE(backup.is_ok());

    ASSERT_TRUE(db.remove().is_ok());
    EXPECT_FALSE(db.exists());
    EXPECT_TRUE(fs::exists(backup.value));

    auto loaded = db.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value.empty());
}

TEST_F(CredentialFileTest, RemoveWithoutDatabase) {
    auto removed = CredentialFile(db_path).remove();
    EXPECT_TRUE(removed.is_err());
    EXPECT_EQ(removed.kind, ErrorKind::DatabaseNotFound);
}

TEST_F(CredentialFileTest, MetadataReportsSizeAndTime) {
    CredentialFile db(db_path);
    ASSERT_TRUE(db.save(one_entry_store()).is_ok());

    auto meta = db.metadata();
    ASSERT_TRUE(meta.is_ok()) << meta.error;
    EXPECT_EQ(meta.value.size, fs::file_size(db_path));
    EXPECT_LT(std::llabs(meta.value.last_modified - unix_now()), 60);
}

TEST_F(CredentialFileTest, MetadataWithoutDatabase) {
    auto meta = CredentialFile(db_path).metadata();
    EXPECT_TRUE(meta.is_err());
    EXPECT_EQ(meta.kind, ErrorKind::Io);
}

TEST_F(CredentialFileTest, LockIsExclusive) {
    CredentialFile db(db_path);

    auto first = db.lock();
    ASSERT_TRUE(first.is_ok()) << first.error;

    auto second = CredentialFile(db_path).lock();
    EXPECT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::Locked);

    first.value.reset();
    auto third = db.lock();
    EXPECT_TRUE(third.is_ok()) << third.error;
}

#ifndef _WIN32
TEST_F(CredentialFileTest, DefaultPathLivesUnderHome) {
    const char* old_home = std::getenv("HOME");
    std::string saved = old_home ? old_home : "";
    setenv("HOME", test_dir.c_str(), 1);

    auto path = CredentialFile::resolve_default_path();

    if (old_home) setenv("HOME", saved.c_str(), 1);
    else unsetenv("HOME");

    ASSERT_TRUE(path.is_ok()) << path.error;
    EXPECT_EQ(path.value.string(), (test_dir / ".crab" / "credentials.json").string());
}
#endif
