// src/core/registry/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/ArchiveError.hpp"

namespace dca {

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw ArchiveError(ErrorKind::kRegistryFailure, "SQLite exec failed: " + msg);
    }
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw ArchiveError(ErrorKind::kRegistryFailure,
                               "Cannot create registry directory '" + parent.string() + "': " + ec.message());
        }
    }

    std::ifstream in(schemaPath);
    if (!in) throw ArchiveError(ErrorKind::kMissingConfiguration, "Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw ArchiveError(ErrorKind::kRegistryFailure, "Failed to open DB: " + msg);
    }

    try {
        // Pragmas: concurrency + durability + integrity
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=FULL;");
        execAll(db, "PRAGMA foreign_keys=ON;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        // CREATE TABLE IF NOT EXISTS only, safe to re-apply
        execAll(db, buf.str());

        execAll(db, "PRAGMA user_version=1;");

        sqlite3_close(db);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

} // namespace dca
