#include <gtest/gtest.h>
#include <core/credential_store.hpp>
#include <core/constants.hpp>

static CredentialEntry make(const std::string& service, const std::string& account = "user",
                            const std::string& secret = "pw") {
    return CredentialEntry::restore(service, account, secret, 1700000000, 1700000000);
}

TEST(CredentialStore, NewStoreIsEmpty) {
    CredentialStore store;
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.version(), DATABASE_VERSION);
    EXPECT_TRUE(store.list_services().empty());
}

TEST(CredentialStore, AddThenFind) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice", "s3cr3t")).is_ok());

    const CredentialEntry* found = store.find_entry("github");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->account(), "alice");
    EXPECT_EQ(found->secret(), "s3cr3t");
    EXPECT_EQ(store.size(), 1u);
}

TEST(CredentialStore, LookupIsExactAndCaseSensitive) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("GitHub")).is_ok());

    EXPECT_EQ(store.find_entry("github"), nullptr);
    EXPECT_EQ(store.find_entry("GitHub "), nullptr);
    EXPECT_NE(store.find_entry("GitHub"), nullptr);
}

TEST(CredentialStore, AddRejectsDuplicateService) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice")).is_ok());

    auto r = store.add_entry(make("github", "mallory"));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DuplicateService);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find_entry("github")->account(), "alice");
}

TEST(CredentialStore, ListKeepsInsertionOrder) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("zeta")).is_ok());
    ASSERT_TRUE(store.add_entry(make("alpha")).is_ok());
    ASSERT_TRUE(store.add_entry(make("mid")).is_ok());

    std::vector<std::string> expected = {"zeta", "alpha", "mid"};
    EXPECT_EQ(store.list_services(), expected);
}

TEST(CredentialStore, RemoveMissingIsNoOp) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github")).is_ok());

    EXPECT_FALSE(store.remove_entry("gitlab"));
    EXPECT_EQ(store.size(), 1u);
}

TEST(CredentialStore, RemoveDropsEntry) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github")).is_ok());
    ASSERT_TRUE(store.add_entry(make("gitlab")).is_ok());

    EXPECT_TRUE(store.remove_entry("github"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find_entry("github"), nullptr);
    EXPECT_NE(store.find_entry("gitlab"), nullptr);
}

TEST(CredentialStore, EditEntryChangesStoredValue) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice", "old")).is_ok());

    CredentialEntry* handle = store.edit_entry("github");
    ASSERT_NE(handle, nullptr);
    handle->update_secret("new");

    EXPECT_EQ(store.find_entry("github")->secret(), "new");
    EXPECT_EQ(store.edit_entry("missing"), nullptr);
}

TEST(CredentialStore, UpsertReplacesInPlace) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice")).is_ok());
    ASSERT_TRUE(store.add_entry(make("gitlab", "bob")).is_ok());

    EXPECT_TRUE(store.upsert_entry(make("github", "carol", "fresh")));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.entries()[0].service(), "github");
    EXPECT_EQ(store.entries()[0].account(), "carol");
    EXPECT_EQ(store.entries()[0].secret(), "fresh");
}

TEST(CredentialStore, UpsertAppendsNewService) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github")).is_ok());

    EXPECT_FALSE(store.upsert_entry(make("gitlab")));
    std::vector<std::string> expected = {"github", "gitlab"};
    EXPECT_EQ(store.list_services(), expected);
}

TEST(CredentialStore, OverwriteLeavesSingleFreshEntry) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice", "one")).is_ok());
    int64_t old_updated = store.find_entry("github")->updated_at();

    store.upsert_entry(CredentialEntry::create("github", "bob", "two"));

    EXPECT_EQ(store.size(), 1u);
    const CredentialEntry* entry = store.find_entry("github");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->account(), "bob");
    EXPECT_EQ(entry->secret(), "two");
    EXPECT_GT(entry->updated_at(), old_updated);
}

TEST(CredentialStore, RemoveThenAddLeavesSingleFreshEntry) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice", "one")).is_ok());
    int64_t old_updated = store.find_entry("github")->updated_at();

    EXPECT_TRUE(store.remove_entry("github"));
    ASSERT_TRUE(store.add_entry(CredentialEntry::create("github", "alice", "two")).is_ok());

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find_entry("github")->secret(), "two");
    EXPECT_GT(store.find_entry("github")->updated_at(), old_updated);
}

TEST(CredentialStore, UpdateEntryWritesBack) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice")).is_ok());

    auto r = store.update_entry("github", [](CredentialEntry& e) { e.update_account("dave"); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.account(), "dave");
    EXPECT_EQ(store.find_entry("github")->account(), "dave");
    EXPECT_GE(store.find_entry("github")->updated_at(), store.find_entry("github")->created_at());
}

TEST(CredentialStore, UpdateEntryMissingService) {
    CredentialStore store;
    bool called = false;
    auto r = store.update_entry("github", [&](CredentialEntry&) { called = true; });

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::CredentialNotFound);
    EXPECT_FALSE(called);
}

TEST(CredentialStore, UpdateEntryRejectsRenameOntoExisting) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github", "alice")).is_ok());
    ASSERT_TRUE(store.add_entry(make("gitlab", "bob")).is_ok());

    auto r = store.update_entry("github", [](CredentialEntry& e) {
        e.update_service("gitlab");
        e.update_account("changed");
    });

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DuplicateService);
    std::vector<std::string> expected = {"github", "gitlab"};
    EXPECT_EQ(store.list_services(), expected);
    EXPECT_EQ(store.find_entry("github")->account(), "alice");
}

TEST(CredentialStore, UpdateEntryRenamesToFreeName) {
    CredentialStore store;
    ASSERT_TRUE(store.add_entry(make("github")).is_ok());
    ASSERT_TRUE(store.add_entry(make("gitlab")).is_ok());

    auto r = store.update_entry("github", [](CredentialEntry& e) { e.update_service("codeberg"); });
    ASSERT_TRUE(r.is_ok());

    std::vector<std::string> expected = {"codeberg", "gitlab"};
    EXPECT_EQ(store.list_services(), expected);
}

TEST(CredentialStore, LegacyDuplicatesLoadAndCollapse) {
    std::vector<CredentialEntry> entries = {make("github", "first"), make("gitlab"),
                                            make("github", "second")};
    auto store = CredentialStore::from_entries(entries, "1.0");

    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(store.find_entry("github")->account(), "first");

    EXPECT_TRUE(store.upsert_entry(make("github", "third")));
    std::vector<std::string> expected = {"github", "gitlab"};
    EXPECT_EQ(store.list_services(), expected);
    EXPECT_EQ(store.find_entry("github")->account(), "third");
}

TEST(CredentialStore, RemoveDropsEveryDuplicate) {
    auto store = CredentialStore::from_entries({make("github"), make("github"), make("gitlab")},
                                               "1.0");
    EXPECT_TRUE(store.remove_entry("github"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.find_entry("github"), nullptr);
}

TEST(CredentialStore, FromEntriesKeepsVersion) {
    auto store = CredentialStore::from_entries({}, "0.9");
    EXPECT_EQ(store.version(), "0.9");
    EXPECT_TRUE(store.empty());
}
