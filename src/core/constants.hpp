#pragma once

#include <cstdint>

// ── Version ─────────────────────────────────────────────────
constexpr const char* CRAB_VERSION          = "0.2.0";
constexpr const char* DATABASE_VERSION      = "1.0";    // format tag written to every database

// ── Locations ───────────────────────────────────────────────
// Everything lives under ~/.crab unless the config overrides the database.
constexpr const char* CRAB_DIR_NAME         = ".crab";
constexpr const char* DATABASE_FILE_NAME    = "credentials.json";
constexpr const char* CONFIG_FILE_NAME      = "config.yaml";
constexpr const char* DEBUG_LOG_FILE_NAME   = "crab_debug.log";
constexpr const char* BACKUP_EXTENSION      = ".bak";
constexpr const char* LOCK_EXTENSION        = ".lock";
constexpr const char* TEMP_EXTENSION        = ".tmp";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_CONFIG_PATH       = "CRAB_CONFIG";
constexpr const char* ENV_DEBUG             = "CRAB_DEBUG";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                       = 0;
constexpr int EXIT_DATABASE_NOT_FOUND       = 1;
constexpr int EXIT_CREDENTIAL_NOT_FOUND     = 2;
constexpr int EXIT_CREDENTIALS_NOT_STORED   = 3;
constexpr int EXIT_IO                       = 4;
constexpr int EXIT_DESERIALIZATION          = 5;
constexpr int EXIT_PATH_RESOLUTION          = 6;
constexpr int EXIT_SERIALIZATION            = 7;
constexpr int EXIT_DUPLICATE_SERVICE        = 8;
constexpr int EXIT_LOCKED                   = 9;
constexpr int EXIT_CONFIG                   = 10;
constexpr int EXIT_USAGE                    = 64;   // sysexits EX_USAGE
constexpr int EXIT_CANCELLED                = 100;  // Ctrl+C convention

// ── Messages ────────────────────────────────────────────────
constexpr const char* DATABASE_NOT_FOUND_MSG =
    "Database file not found. Use 'add' command to create your first entry.";

// ── Prompts ─────────────────────────────────────────────────
constexpr int SECRET_INPUT_TIMEOUT_MS       = 60000;  // give up on a silent secret prompt after 60s
constexpr int MAX_BACKUP_COLLISIONS         = 1000;   // counter suffixes tried in one second
