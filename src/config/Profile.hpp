#pragma once
#include <optional>
#include <string>

namespace dca {

// Registry connection settings read from a JSON profile file.
struct Profile {
  std::string                databasePath;
  std::optional<std::string> schemaPath;
  std::optional<std::string> summaryCommand;
};

// Resolves `name` to $DCA_CONFIG/.dicom_archive/<name> and reads it.
// Throws ArchiveError(kMissingConfiguration) or ArchiveError(kInvalidArgument).
Profile load_profile(const std::string& name);

Profile load_profile_file(const std::string& path);

// Profile's schema, else ./schema.sql, else src/core/registry/schema.sql.
std::string find_schema_path(const Profile& profile);

} // namespace dca
