#include "RegistrySynchronizer.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "core/ArchiveError.hpp"

namespace dca {

void RegistrySynchronizer::checkPrecondition(const std::string& studyUid) {
  spdlog::info("Checking database presence");
  existing_ = registry_.findByStudyUid(studyUid);
  checked_ = true;

  if (mode_ == RegistryMode::kInsert && existing_) {
    throw ArchiveError(ErrorKind::kInsertConflict,
                       "Study '" + studyUid + "' is already inserted in the database\n"
                       "Previous archiving log:\n" + existing_->archive_log);
  }
  if (mode_ == RegistryMode::kUpdate && !existing_) {
    throw ArchiveError(ErrorKind::kUpdateConflict,
                       "No study '" + studyUid + "' found in the database");
  }
  if (mode_ == RegistryMode::kCheckOnly && existing_) {
    spdlog::info("Study '{}' is already archived at '{}'", studyUid, existing_->archive_location);
  }
}

void RegistrySynchronizer::commit(const ProvenanceLog& log, const Summary& summary) {
  if (!checked_) {
    throw std::logic_error("RegistrySynchronizer::commit before checkPrecondition");
  }
  if (!log.archive_checksum) {
    throw std::logic_error("RegistrySynchronizer::commit without archive checksum");
  }

  switch (mode_) {
    case RegistryMode::kCheckOnly:
      return;
    case RegistryMode::kInsert:
      spdlog::info("Inserting DICOM archive in the database");
      registry_.insertArchive(log, summary);
      return;
    case RegistryMode::kUpdate:
      spdlog::info("Updating DICOM archive in the database");
      registry_.updateArchive(*existing_, log, summary);
      return;
  }
}

} // namespace dca
