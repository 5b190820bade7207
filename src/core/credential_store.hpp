#pragma once

#include <string>
#include <vector>
#include <functional>
#include "credential_entry.hpp"
#include "types.hpp"

// In-memory, insertion-ordered collection of credentials for one user.
//
// Service names are unique inside the store: add_entry refuses a duplicate,
// upsert_entry replaces, update_entry refuses a rename onto another entry.
// A database written by an older build may still contain duplicates; those
// load fine, lookups then see the first match and remove_entry drops all.
class CredentialStore {
public:
    CredentialStore();

    // Rebuild a persisted store verbatim, duplicates included.
    static CredentialStore from_entries(std::vector<CredentialEntry> entries,
                                        std::string version);

    // Append. Fails with DuplicateService if the service is already stored.
    Result<void> add_entry(CredentialEntry entry);

    // Replace the entry for entry.service() in place, or append if there is
    // none. Returns true if an existing entry was replaced.
    bool upsert_entry(CredentialEntry entry);

    // First entry whose service matches exactly, or nullptr.
    const CredentialEntry* find_entry(const std::string& service) const;

    // Mutable handle into the store. No copy is made; changes are visible to
    // later lookups. The handle is invalidated by add/upsert/remove.
    CredentialEntry* edit_entry(const std::string& service);

    // Hand a copy of the entry to `mutate` and write the result back.
    // Fails with CredentialNotFound if there is no such service, or with
    // DuplicateService if the mutator renamed it onto another stored service
    // (the store is left unchanged in both cases).
    Result<CredentialEntry> update_entry(const std::string& service,
                                         const std::function<void(CredentialEntry&)>& mutate);

    // Remove every entry for `service`. Returns whether anything was removed.
    bool remove_entry(const std::string& service);

    // Service names in insertion order.
    std::vector<std::string> list_services() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<CredentialEntry>& entries() const { return entries_; }

    const std::string& version() const { return version_; }

private:
    std::vector<CredentialEntry>::iterator find_it(const std::string& service);

    std::vector<CredentialEntry> entries_;
    std::string version_;
};
