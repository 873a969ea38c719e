#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/Date.hpp"

namespace dca {

struct ArchiveName {
  std::string directory;      // target dir, or target/<year> when bucketed
  std::string fileName;       // DCM_[<date>_]<base>.tar
  bool        yearBucket = false;
  std::vector<std::string> advisories;

  std::string path() const { return directory + "/" + fileName; }
};

// Pure: same inputs, same result. Creating the year directory is left to
// PathGuard::ensureDirectory.
ArchiveName resolve_archive_name(const std::string& targetDir,
                                 const std::string& baseName,
                                 const std::optional<Date>& scanDate,
                                 bool useToday,
                                 bool yearBucket);

} // namespace dca
