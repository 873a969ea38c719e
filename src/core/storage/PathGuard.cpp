#include "PathGuard.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <filesystem>
#include <system_error>

#include "core/ArchiveError.hpp"

namespace dca {

void PathGuard::checkCreateFile(const std::string& path) const {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(path, ec))) return;

  if (!overwrite_) {
    throw ArchiveError(ErrorKind::kTargetExists,
                       "File or directory '" + path + "' already exists. "
                       "Use option '--overwrite' to overwrite it.");
  }
  spdlog::warn("Overwriting '{}'", path);
}

void PathGuard::ensureDirectory(const std::string& dir) const {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(dir, ec))) {
    spdlog::info("Creating directory '{}'", dir);
    if (!fs::create_directory(dir, ec) && ec) {
      throw ArchiveError(ErrorKind::kDirectoryUnusable,
                         "Cannot create directory '" + dir + "': " + ec.message());
    }
    return;
  }
  if (!fs::is_directory(dir, ec) || ::access(dir.c_str(), W_OK) != 0) {
    throw ArchiveError(ErrorKind::kDirectoryUnusable,
                       "Path '" + dir + "' exists but is not a writable directory.");
  }
}

} // namespace dca
