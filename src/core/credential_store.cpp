#include "credential_store.hpp"
#include "constants.hpp"
#include <algorithm>
#include <iterator>

CredentialStore::CredentialStore() : version_(DATABASE_VERSION) {}

CredentialStore CredentialStore::from_entries(std::vector<CredentialEntry> entries,
                                              std::string version) {
    CredentialStore store;
    store.entries_ = std::move(entries);
    store.version_ = std::move(version);
    return store;
}

std::vector<CredentialEntry>::iterator CredentialStore::find_it(const std::string& service) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const CredentialEntry& e) { return e.service() == service; });
}

Result<void> CredentialStore::add_entry(CredentialEntry entry) {
    if (find_entry(entry.service())) {
        return Result<void>::Err(ErrorKind::DuplicateService,
                                 "Service '" + entry.service() + "' already exists");
    }
    entries_.push_back(std::move(entry));
    return Result<void>::Ok();
}

bool CredentialStore::upsert_entry(CredentialEntry entry) {
    auto it = find_it(entry.service());
    if (it == entries_.end()) {
        entries_.push_back(std::move(entry));
        return false;
    }

    std::string service = entry.service();
    *it = std::move(entry);

    // Leftover duplicates from an older database collapse into the one slot.
    auto next = std::next(it);
    entries_.erase(std::remove_if(next, entries_.end(),
                                  [&](const CredentialEntry& e) { return e.service() == service; }),
                   entries_.end());
    return true;
}

const CredentialEntry* CredentialStore::find_entry(const std::string& service) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const CredentialEntry& e) { return e.service() == service; });
    return it == entries_.end() ? nullptr : &*it;
}

CredentialEntry* CredentialStore::edit_entry(const std::string& service) {
    auto it = find_it(service);
    return it == entries_.end() ? nullptr : &*it;
}

Result<CredentialEntry> CredentialStore::update_entry(
        const std::string& service,
        const std::function<void(CredentialEntry&)>& mutate) {
    auto it = find_it(service);
    if (it == entries_.end()) {
        return Result<CredentialEntry>::Err(ErrorKind::CredentialNotFound,
                                            "No credential found for '" + service + "'");
    }

    CredentialEntry updated = *it;
    mutate(updated);

    if (updated.service() != service) {
        bool taken = std::any_of(entries_.begin(), entries_.end(),
                                 [&](const CredentialEntry& e) {
                                     return &e != &*it && e.service() == updated.service();
                                 });
        if (taken) {
            return Result<CredentialEntry>::Err(
                ErrorKind::DuplicateService,
                "Service '" + updated.service() + "' already exists");
        }
    }

    *it = updated;
    return Result<CredentialEntry>::Ok(std::move(updated));
}

bool CredentialStore::remove_entry(const std::string& service) {
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const CredentialEntry& e) { return e.service() == service; }),
                   entries_.end());
    return entries_.size() < before;
}

std::vector<std::string> CredentialStore::list_services() const {
    std::vector<std::string> services;
    services.reserve(entries_.size());
    for (const auto& e : entries_) {
        services.push_back(e.service());
    }
    return services;
}
