#pragma once
#include <string>

namespace dca {

// Creates or upgrades the registry schema at dbPath. Idempotent.
// Throws ArchiveError(kRegistryFailure).
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace dca
