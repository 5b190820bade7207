#include "database_codec.hpp"
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <limits>
#include <vector>

// ordered_json keeps keys in the order they are written, so the file reads
// service, account, secret, created_at, updated_at.
using json = nlohmann::ordered_json;

namespace {

constexpr int JSON_INDENT = 2;

struct FieldError {
    std::string message;
};

std::string require_string(const json& parent, const char* key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        throw FieldError{fmt::format("{}: missing field '{}'", where, key)};
    }
    if (!it->is_string()) {
        throw FieldError{fmt::format("{}: field '{}' must be a string", where, key)};
    }
    return it->get<std::string>();
}

int64_t require_integer(const json& parent, const char* key, const std::string& where) {
    auto it = parent.find(key);
    if (it == parent.end()) {
        throw FieldError{fmt::format("{}: missing field '{}'", where, key)};
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw FieldError{fmt::format("{}: field '{}' is out of range", where, key)};
        }
        return static_cast<int64_t>(value);
    }
    if (!it->is_number_integer()) {
        throw FieldError{fmt::format("{}: field '{}' must be an integer", where, key)};
    }
    return it->get<int64_t>();
}

CredentialEntry decode_entry(const json& node, size_t index) {
    std::string where = fmt::format("entries[{}]", index);
    if (!node.is_object()) {
        throw FieldError{where + ": must be an object"};
    }

    std::string service = require_string(node, "service", where);
    std::string account = require_string(node, "account", where);
    std::string secret = require_string(node, "secret", where);
    int64_t created_at = require_integer(node, "created_at", where);
    int64_t updated_at = require_integer(node, "updated_at", where);

    if (updated_at < created_at) {
        throw FieldError{fmt::format("{}: updated_at ({}) is earlier than created_at ({})",
                                     where, updated_at, created_at)};
    }
    return CredentialEntry::restore(std::move(service), std::move(account), std::move(secret),
                                    created_at, updated_at);
}

} // namespace

Result<std::string> serialize_store(const CredentialStore& store) {
    json root;
    root["entries"] = json::array();
    for (const auto& e : store.entries()) {
        json entry;
        entry["service"] = e.service();
        entry["account"] = e.account();
        entry["secret"] = e.secret();
        entry["created_at"] = e.created_at();
        entry["updated_at"] = e.updated_at();
        root["entries"].push_back(std::move(entry));
    }
    root["version"] = store.version();

    try {
        // dump() refuses strings that are not valid UTF-8 rather than
        // rewriting them.
        return Result<std::string>::Ok(root.dump(JSON_INDENT) + "\n");
    } catch (const json::exception& e) {
        return Result<std::string>::Err(ErrorKind::Serialization,
                                        std::string("Data serialization failed: ") + e.what());
    }
}

Result<CredentialStore> deserialize_store(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return Result<CredentialStore>::Err(ErrorKind::Deserialization,
                                            std::string("Malformed database: ") + e.what());
    }

    if (!root.is_object()) {
        return Result<CredentialStore>::Err(ErrorKind::Deserialization,
                                            "Malformed database: top level must be an object");
    }

    try {
        auto entries = root.find("entries");
        if (entries == root.end()) {
            throw FieldError{"missing field 'entries'"};
        }
        if (!entries->is_array()) {
            throw FieldError{"field 'entries' must be an array"};
        }
        std::string version = require_string(root, "version", "database");

        std::vector<CredentialEntry> decoded;
        decoded.reserve(entries->size());
        size_t index = 0;
        for (const auto& node : *entries) {
            decoded.push_back(decode_entry(node, index++));
        }
        return Result<CredentialStore>::Ok(
            CredentialStore::from_entries(std::move(decoded), std::move(version)));
    } catch (const FieldError& e) {
        return Result<CredentialStore>::Err(ErrorKind::Deserialization,
                                            "Malformed database: " + e.message);
    } catch (const json::exception& e) {
        return Result<CredentialStore>::Err(ErrorKind::Deserialization,
                                            std::string("Malformed database: ") + e.what());
    }
}
