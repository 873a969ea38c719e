#include "ArchiveNaming.hpp"

namespace dca {

ArchiveName resolve_archive_name(const std::string& targetDir,
                                 const std::string& baseName,
                                 const std::optional<Date>& scanDate,
                                 bool useToday,
                                 bool yearBucket) {
  ArchiveName out;

  if (!scanDate && !useToday) {
    out.advisories.push_back(
      "No scan date was found in the DICOMs, consider using argument '--today' "
      "to use today's date as the scan date.");
  }

  if (yearBucket && !scanDate) {
    out.advisories.push_back(
      "Argument '--year' was provided but no scan date was found in the DICOMs, "
      "the argument will be ignored.");
  }

  if (yearBucket && scanDate) {
    out.directory = targetDir + "/" + std::to_string(scanDate->year);
    out.yearBucket = true;
  } else {
    out.directory = targetDir;
  }

  if (scanDate) {
    out.fileName = "DCM_" + format_date(*scanDate) + "_" + baseName + ".tar";
  } else {
    out.fileName = "DCM_" + baseName + ".tar";
  }
  return out;
}

} // namespace dca
