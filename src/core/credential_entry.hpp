#pragma once

#include <string>
#include <cstdint>

// One stored credential. created_at is fixed at creation; every update_*
// call refreshes updated_at, so updated_at >= created_at always holds.
//
// Updates refresh the timestamp even when the new value equals the old one.
// Callers that want "unchanged means untouched" compare before calling.
class CredentialEntry {
public:
    CredentialEntry() = default;

    // New entry stamped with the current time.
    static CredentialEntry create(std::string service, std::string account,
                                  std::string secret);

    // Rebuild a persisted entry with its original timestamps.
    static CredentialEntry restore(std::string service, std::string account,
                                   std::string secret, int64_t created_at,
                                   int64_t updated_at);

    const std::string& service() const { return service_; }
    const std::string& account() const { return account_; }
    const std::string& secret() const { return secret_; }
    int64_t created_at() const { return created_at_; }
    int64_t updated_at() const { return updated_at_; }

    void update_service(std::string service);
    void update_account(std::string account);
    void update_secret(std::string secret);

private:
    void touch();

    std::string service_;
    std::string account_;
    std::string secret_;
    int64_t created_at_ = 0;
    int64_t updated_at_ = 0;
};
