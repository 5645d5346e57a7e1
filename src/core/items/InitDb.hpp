#pragma once
#include <string>

namespace wam {

// Opens (creating if needed) the SQLite file at dbPath, applies pragmas and
// the schema file. Idempotent. Throws std::runtime_error on failure.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace wam
