#pragma once

#include <string>
#include <core/credential_store.hpp>
#include <core/types.hpp>

// JSON text form of a CredentialStore, written with two-space indentation:
//
//   {
//     "entries": [
//       {"service": "...", "account": "...", "secret": "...",
//        "created_at": <int>, "updated_at": <int>}, ...
//     ],
//     "version": "1.0"
//   }
//
// Every key is mandatory. Strings must be JSON strings and timestamps JSON
// integers; anything else is rejected rather than defaulted.

// Fails with Serialization if a field is not valid UTF-8.
Result<std::string> serialize_store(const CredentialStore& store);

// Fails with Deserialization, naming the offending entry and field.
Result<CredentialStore> deserialize_store(const std::string& text);
