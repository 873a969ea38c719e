#pragma once
#include <optional>
#include <string>

#include "ArchiveRegistry.hpp"

namespace dca {

enum class RegistryMode {
  kCheckOnly,   // profile given, no --db-* flag: look up and report only
  kInsert,
  kUpdate,
};

// Enforces insert-requires-absent / update-requires-present for one run.
// checkPrecondition() must run before any archive bytes are written;
// commit() runs once the bundle is sealed and hashed.
class RegistrySynchronizer {
public:
  RegistrySynchronizer(ArchiveRegistry& registry, RegistryMode mode)
    : registry_(registry), mode_(mode) {}

  // Throws ArchiveError(kInsertConflict) with the previous archiving log, or
  // ArchiveError(kUpdateConflict).
  void checkPrecondition(const std::string& studyUid);

  // Requires checkPrecondition() and a log carrying the archive checksum.
  void commit(const ProvenanceLog& log, const Summary& summary);

  RegistryMode mode() const { return mode_; }
  const std::optional<StudyRecord>& existing() const { return existing_; }

private:
  ArchiveRegistry& registry_;
  RegistryMode mode_;
  bool checked_ = false;
  std::optional<StudyRecord> existing_;
};

} // namespace dca
