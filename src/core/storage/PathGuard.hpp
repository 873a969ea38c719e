#pragma once
#include <string>

namespace dca {

// No-clobber policy for every artifact the archiver writes.
class PathGuard {
public:
  explicit PathGuard(bool overwrite) : overwrite_(overwrite) {}

  // Throws ArchiveError(kTargetExists) if `path` exists and overwriting is off.
  // With overwriting on, an existing path produces one warning.
  void checkCreateFile(const std::string& path) const;

  // Creates `dir` if missing. An existing path that is not a writable
  // directory throws ArchiveError(kDirectoryUnusable).
  void ensureDirectory(const std::string& dir) const;

  bool overwrite() const { return overwrite_; }

private:
  bool overwrite_;
};

} // namespace dca
