#include "Profile.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

#include "Options.hpp"
#include "core/ArchiveError.hpp"

using nlohmann::json;

namespace dca {

static bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Profile load_profile(const std::string& name) {
  const std::string root = get_env_or("DCA_CONFIG", "");
  if (root.empty()) {
    throw ArchiveError(ErrorKind::kMissingConfiguration, "Environment variable 'DCA_CONFIG' not set");
  }

  const std::string path = (std::filesystem::path(root) / ".dicom_archive" / name).string();
  if (!ends_with(path, ".json")) {
    throw ArchiveError(ErrorKind::kInvalidArgument,
                       "'" + path + "' does not appear to be a JSON profile. "
                       "Try using 'database_config.json' instead.");
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ArchiveError(ErrorKind::kMissingConfiguration,
                       "'" + name + "' does not exist in '" + root + "/.dicom_archive'.");
  }
  return load_profile_file(path);
}

Profile load_profile_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ArchiveError(ErrorKind::kMissingConfiguration, "Cannot read profile '" + path + "'");

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ArchiveError(ErrorKind::kMissingConfiguration,
                       "Profile '" + path + "' is not valid JSON: " + e.what());
  }

  Profile p;
  try {
    const json db = j.value("database", json::object());
    p.databasePath = db.value("path", std::string());
    if (db.contains("schema") && db["schema"].is_string()) {
      p.schemaPath = db["schema"].get<std::string>();
    }
    if (j.contains("summary_command") && j["summary_command"].is_string()) {
      p.summaryCommand = j["summary_command"].get<std::string>();
    }
  } catch (const json::exception& e) {
    throw ArchiveError(ErrorKind::kMissingConfiguration,
                       "Profile '" + path + "' is malformed: " + e.what());
  }

  if (p.databasePath.empty()) {
    throw ArchiveError(ErrorKind::kMissingConfiguration,
                       "Profile '" + path + "' has no 'database.path'");
  }
  // Relative database paths are relative to the profile file.
  std::filesystem::path dbPath(p.databasePath);
  if (dbPath.is_relative()) {
    p.databasePath = (std::filesystem::path(path).parent_path() / dbPath).string();
  }
  return p;
}

std::string find_schema_path(const Profile& profile) {
  namespace fs = std::filesystem;
  if (profile.schemaPath) return *profile.schemaPath;

  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/registry/schema.sql")
  };
  for (const auto& p : candidates) {
    std::error_code ec;
    if (fs::exists(p, ec)) return p.string();
  }
  throw ArchiveError(ErrorKind::kMissingConfiguration,
                     "schema.sql not found (looked in the working directory and src/core/registry)");
}

} // namespace dca
