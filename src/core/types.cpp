#include "types.hpp"
#include "constants.hpp"

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return EXIT_OK;
        case ErrorKind::DatabaseNotFound:     return EXIT_DATABASE_NOT_FOUND;
        case ErrorKind::CredentialNotFound:   return EXIT_CREDENTIAL_NOT_FOUND;
        case ErrorKind::CredentialsNotStored: return EXIT_CREDENTIALS_NOT_STORED;
        case ErrorKind::Io:                   return EXIT_IO;
        case ErrorKind::Deserialization:      return EXIT_DESERIALIZATION;
        case ErrorKind::PathResolution:       return EXIT_PATH_RESOLUTION;
        case ErrorKind::Serialization:        return EXIT_SERIALIZATION;
        case ErrorKind::DuplicateService:     return EXIT_DUPLICATE_SERVICE;
        case ErrorKind::Locked:               return EXIT_LOCKED;
        case ErrorKind::Config:               return EXIT_CONFIG;
        case ErrorKind::InvalidArgument:      return EXIT_USAGE;
        case ErrorKind::UserCancelled:        return EXIT_CANCELLED;
    }
    return EXIT_IO;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "none";
        case ErrorKind::DatabaseNotFound:     return "database-not-found";
        case ErrorKind::CredentialNotFound:   return "credential-not-found";
        case ErrorKind::CredentialsNotStored: return "credentials-not-stored";
        case ErrorKind::Io:                   return "io";
        case ErrorKind::Deserialization:      return "deserialization";
        case ErrorKind::PathResolution:       return "path-resolution";
        case ErrorKind::Serialization:        return "serialization";
        case ErrorKind::DuplicateService:     return "duplicate-service";
        case ErrorKind::Locked:               return "locked";
        case ErrorKind::Config:               return "config";
        case ErrorKind::InvalidArgument:      return "invalid-argument";
        case ErrorKind::UserCancelled:        return "user-cancelled";
    }
    return "unknown";
}
