#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/archive/ProvenanceLog.hpp"
#include "core/summary/Summary.hpp"

namespace dca {

// Registry row for one study. archive_log is the text form of the
// provenance log that produced the current archive.
struct StudyRecord {
  int64_t     id = 0;
  std::string study_uid;
  std::string archive_location;
  std::string archive_log;
  std::string archive_md5_sum;
  int64_t     first_archived_at = 0;
  int64_t     last_archived_at  = 0;
  int64_t     update_count      = 0;
};

// SQLite-backed registry of sealed archives, keyed by study UID.
class ArchiveRegistry {
public:
  // Never creates the database file. A read-only registry serves lookups only.
  explicit ArchiveRegistry(const std::string& dbPath, bool readOnly = false);
  ~ArchiveRegistry();

  ArchiveRegistry(const ArchiveRegistry&) = delete;
  ArchiveRegistry& operator=(const ArchiveRegistry&) = delete;

  std::optional<StudyRecord> findByStudyUid(const std::string& studyUid);

  // Throws ArchiveError(kInsertConflict), with the registered archive's log,
  // if the study is already registered.
  int64_t insertArchive(const ProvenanceLog& log, const Summary& summary);

  // Throws ArchiveError(kUpdateConflict) if `existing` is no longer present.
  void updateArchive(const StudyRecord& existing,
                     const ProvenanceLog& log,
                     const Summary& summary);

  void appendHistory(int64_t archive_id,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at,
                     const std::string& actor);

private:
  void exec(const char* sql);
  void replaceChildren(int64_t archive_id, const Summary& summary);

  void* db_; // sqlite3*
};

} // namespace dca
