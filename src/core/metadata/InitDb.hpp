#pragma once
#include <string>

// Creates the database file if needed, applies connection pragmas and the
// (idempotent) schema. Throws on any SQLite failure.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);
