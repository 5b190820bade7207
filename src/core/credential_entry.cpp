#include "credential_entry.hpp"
#include "time_utils.hpp"
#include <algorithm>

CredentialEntry CredentialEntry::create(std::string service, std::string account,
                                        std::string secret) {
    int64_t now = unix_now();
    return restore(std::move(service), std::move(account), std::move(secret), now, now);
}

CredentialEntry CredentialEntry::restore(std::string service, std::string account,
                                         std::string secret, int64_t created_at,
                                         int64_t updated_at) {
    CredentialEntry e;
    e.service_ = std::move(service);
    e.account_ = std::move(account);
    e.secret_ = std::move(secret);
    e.created_at_ = created_at;
    e.updated_at_ = updated_at;
    return e;
}

void CredentialEntry::update_service(std::string service) {
    service_ = std::move(service);
    touch();
}

void CredentialEntry::update_account(std::string account) {
    account_ = std::move(account);
    touch();
}

void CredentialEntry::update_secret(std::string secret) {
    secret_ = std::move(secret);
    touch();
}

// A wall clock stepped backwards must not move updated_at behind a value we
// already wrote, or behind created_at.
void CredentialEntry::touch() {
    updated_at_ = std::max({unix_now(), updated_at_, created_at_});
}
