// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/errors/GatewayError.hpp"

using rdg::ErrorKind;
using rdg::GatewayError;

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw GatewayError(ErrorKind::StorageFailure, "SQLite exec failed: " + msg);
    }
}

static bool hasColumn(sqlite3* db, const char* table, const char* column) {
    sqlite3_stmt* st = nullptr;
    const std::string sql = std::string("PRAGMA table_info(") + table + ");";
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw GatewayError(ErrorKind::StorageFailure, std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
    }
    bool found = false;
    while (sqlite3_step(st) == SQLITE_ROW) {
        const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(st, 1));
        if (name && std::string(name) == column) { found = true; break; }
    }
    sqlite3_finalize(st);
    return found;
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

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
        throw GatewayError(ErrorKind::StorageFailure, "Failed to open DB: " + msg);
    }

    try {
        // Pragmas: concurrency + durability + integrity
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        execAll(db, "PRAGMA foreign_keys=ON;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        // Load schema file and apply (safe: CREATE ... IF NOT EXISTS)
        std::ifstream in(schemaPath);
        if (!in) throw GatewayError(ErrorKind::ConfigError, "Cannot open schema file: " + schemaPath);
        std::ostringstream buf; buf << in.rdbuf();
        execAll(db, buf.str());

        // v2: files remember the chunk size they were uploaded with
        if (!hasColumn(db, "files", "chunk_size")) {
            execAll(db, "ALTER TABLE files ADD COLUMN chunk_size INTEGER NOT NULL DEFAULT 0;");
            spdlog::info("catalog upgraded: files.chunk_size added");
        }

        execAll(db, "PRAGMA user_version=2;");

        sqlite3_close(db);
        spdlog::debug("schema applied to {}", dbPath);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}
