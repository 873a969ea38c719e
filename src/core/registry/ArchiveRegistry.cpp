#include "ArchiveRegistry.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <ctime>

#include "core/ArchiveError.hpp"

using nlohmann::json;

namespace dca {

namespace {

// Owns one prepared statement.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw ArchiveError(ErrorKind::kRegistryFailure, "prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  void bind(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }
  void bindOptional(int i, const std::optional<Date>& d) {
    if (d) bind(i, format_date(*d));
    else sqlite3_bind_null(st_, i);
  }

  int step() { return sqlite3_step(st_); }

  std::string text(int col) const {
    const unsigned char* p = sqlite3_column_text(st_, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
  }

private:
  sqlite3_stmt* st_ = nullptr;
};

// Rolls back unless commit() was reached.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { run("BEGIN IMMEDIATE;"); }
  ~Transaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() { run("COMMIT;"); done_ = true; }

private:
  void run(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string msg = err ? err : "unknown error";
      sqlite3_free(err);
      throw ArchiveError(ErrorKind::kRegistryFailure, std::string(sql) + " failed: " + msg);
    }
  }

  sqlite3* db_;
  bool done_ = false;
};

int64_t now_epoch() { return static_cast<int64_t>(std::time(nullptr)); }

// Columns shared by INSERT and UPDATE, bound from position `i`.
int bind_archive_fields(Statement& st, int i, const ProvenanceLog& log, const Summary& s) {
  st.bind(i++, log.target_path);
  st.bind(i++, log.source_path);
  st.bindOptional(i++, s.scan_date);
  st.bind(i++, s.patient_id);
  st.bind(i++, s.patient_name);
  st.bind(i++, s.patient_sex);
  st.bindOptional(i++, s.patient_birth_date);
  st.bind(i++, s.scanner_manufacturer);
  st.bind(i++, s.scanner_model);
  st.bind(i++, s.scanner_serial_number);
  st.bind(i++, s.scanner_software_version);
  st.bind(i++, s.institution_name);
  st.bind(i++, static_cast<int64_t>(s.acquisitions.size()));
  st.bind(i++, static_cast<int64_t>(s.files.size()));
  st.bind(i++, log.tarball_checksum.hex);
  st.bind(i++, log.zipball_checksum.hex);
  st.bind(i++, log.archive_checksum ? log.archive_checksum->hex : std::string());
  st.bind(i++, log_to_string(log));
  st.bind(i++, summary_to_json(s).dump());
  st.bind(i++, log.creating_user);
  st.bind(i++, static_cast<int64_t>(log.summary_version));
  st.bind(i++, static_cast<int64_t>(log.archive_version));
  return i;
}

} // namespace

ArchiveRegistry::ArchiveRegistry(const std::string& dbPath, bool readOnly) : db_(nullptr) {
  sqlite3* db = nullptr;
  const int flags = readOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
  if (sqlite3_open_v2(dbPath.c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw ArchiveError(ErrorKind::kRegistryFailure, "failed to open registry '" + dbPath + "': " + msg);
  }
  db_ = db;
  try {
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

ArchiveRegistry::~ArchiveRegistry() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void ArchiveRegistry::exec(const char* sql) {
  auto* db = static_cast<sqlite3*>(db_);
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw ArchiveError(ErrorKind::kRegistryFailure, "SQLite exec failed: " + msg);
  }
}

std::optional<StudyRecord> ArchiveRegistry::findByStudyUid(const std::string& studyUid) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    SELECT id, study_uid, archive_location, archive_log, archive_md5_sum,
           first_archived_at, last_archived_at, update_count
    FROM dicom_archive WHERE study_uid = ?
  )SQL");
  st.bind(1, studyUid);

  const int rc = st.step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw ArchiveError(ErrorKind::kRegistryFailure,
                       std::string("findByStudyUid failed: ") + sqlite3_errmsg(db));
  }

  StudyRecord r;
  r.id                = sqlite3_column_int64(st.get(), 0);
  r.study_uid         = st.text(1);
  r.archive_location  = st.text(2);
  r.archive_log       = st.text(3);
  r.archive_md5_sum   = st.text(4);
  r.first_archived_at = sqlite3_column_int64(st.get(), 5);
  r.last_archived_at  = sqlite3_column_int64(st.get(), 6);
  r.update_count      = sqlite3_column_int64(st.get(), 7);
  return r;
}

int64_t ArchiveRegistry::insertArchive(const ProvenanceLog& log, const Summary& summary) {
  auto* db = static_cast<sqlite3*>(db_);
  const int64_t now = now_epoch();

  Transaction tx(db);
  Statement st(db, R"SQL(
    INSERT INTO dicom_archive
      (study_uid, archive_location, source_location, scan_date,
       patient_id, patient_name, patient_sex, patient_birth_date,
       scanner_manufacturer, scanner_model, scanner_serial_number, scanner_software_version,
       institution_name, acquisition_count, dicom_file_count,
       tarball_md5_sum, zipball_md5_sum, archive_md5_sum,
       archive_log, summary_json, creating_user, summary_version, archive_version,
       first_archived_at, last_archived_at)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, summary.study_uid);
  i = bind_archive_fields(st, i, log, summary);
  st.bind(i++, now);
  st.bind(i++, now);

  const int rc = st.step();
  if (rc == SQLITE_CONSTRAINT &&
      sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
    // Lost a race with a concurrent insert; report the winner's log.
    std::string message = "Study '" + summary.study_uid + "' is already inserted in the database";
    if (const auto winner = findByStudyUid(summary.study_uid)) {
      message += "\nPrevious archiving log:\n" + winner->archive_log;
    }
    throw ArchiveError(ErrorKind::kInsertConflict, message);
  }
  if (rc != SQLITE_DONE) {
    throw ArchiveError(ErrorKind::kRegistryFailure,
                       std::string("insertArchive failed: ") + sqlite3_errmsg(db));
  }
  const int64_t archive_id = sqlite3_last_insert_rowid(db);

  replaceChildren(archive_id, summary);
  appendHistory(archive_id, "INSERTED", log_to_json(log).dump(), now, log.creating_user);
  tx.commit();

  spdlog::debug("Registered study '{}' as archive #{}", summary.study_uid, archive_id);
  return archive_id;
}

void ArchiveRegistry::updateArchive(const StudyRecord& existing,
                                    const ProvenanceLog& log,
                                    const Summary& summary) {
  auto* db = static_cast<sqlite3*>(db_);
  const int64_t now = now_epoch();

  Transaction tx(db);
  Statement st(db, R"SQL(
    UPDATE dicom_archive SET
      archive_location = ?, source_location = ?, scan_date = ?,
      patient_id = ?, patient_name = ?, patient_sex = ?, patient_birth_date = ?,
      scanner_manufacturer = ?, scanner_model = ?, scanner_serial_number = ?,
      scanner_software_version = ?, institution_name = ?,
      acquisition_count = ?, dicom_file_count = ?,
      tarball_md5_sum = ?, zipball_md5_sum = ?, archive_md5_sum = ?,
      archive_log = ?, summary_json = ?, creating_user = ?,
      summary_version = ?, archive_version = ?,
      last_archived_at = ?, update_count = update_count + 1
    WHERE id = ? AND study_uid = ?
  )SQL");
  int i = bind_archive_fields(st, 1, log, summary);
  st.bind(i++, now);
  st.bind(i++, existing.id);
  st.bind(i++, existing.study_uid);

  if (st.step() != SQLITE_DONE) {
    throw ArchiveError(ErrorKind::kRegistryFailure,
                       std::string("updateArchive failed: ") + sqlite3_errmsg(db));
  }
  if (sqlite3_changes(db) == 0) {
    throw ArchiveError(ErrorKind::kUpdateConflict,
                       "No study '" + existing.study_uid + "' found in the database");
  }

  replaceChildren(existing.id, summary);
  json details = log_to_json(log);
  details["previous_archive_location"] = existing.archive_location;
  details["previous_archive_md5_sum"]  = existing.archive_md5_sum;
  appendHistory(existing.id, "UPDATED", details.dump(), now, log.creating_user);
  tx.commit();
}

void ArchiveRegistry::replaceChildren(int64_t archive_id, const Summary& summary) {
  auto* db = static_cast<sqlite3*>(db_);

  for (const char* sql : {"DELETE FROM dicom_archive_series WHERE archive_id = ?",
                          "DELETE FROM dicom_archive_file WHERE archive_id = ?"}) {
    Statement del(db, sql);
    del.bind(1, archive_id);
    if (del.step() != SQLITE_DONE) {
      throw ArchiveError(ErrorKind::kRegistryFailure,
                         std::string("clearing archive children failed: ") + sqlite3_errmsg(db));
    }
  }

  Statement series(db, R"SQL(
    INSERT INTO dicom_archive_series
      (archive_id, series_uid, series_number, series_description, modality, file_count)
    VALUES (?,?,?,?,?,?)
  )SQL");
  for (const auto& a : summary.acquisitions) {
    sqlite3_reset(series.get());
    series.bind(1, archive_id);
    series.bind(2, a.series_uid);
    series.bind(3, a.series_number);
    series.bind(4, a.series_description);
    series.bind(5, a.modality);
    series.bind(6, a.file_count);
    if (series.step() != SQLITE_DONE) {
      throw ArchiveError(ErrorKind::kRegistryFailure,
                         std::string("inserting series failed: ") + sqlite3_errmsg(db));
    }
  }

  Statement files(db, R"SQL(
    INSERT INTO dicom_archive_file (archive_id, file_name, md5_sum, series_uid)
    VALUES (?,?,?,?)
  )SQL");
  for (const auto& f : summary.files) {
    sqlite3_reset(files.get());
    files.bind(1, archive_id);
    files.bind(2, f.file_name);
    files.bind(3, f.md5_sum);
    files.bind(4, f.series_uid);
    if (files.step() != SQLITE_DONE) {
      throw ArchiveError(ErrorKind::kRegistryFailure,
                         std::string("inserting file failed: ") + sqlite3_errmsg(db));
    }
  }
}

void ArchiveRegistry::appendHistory(int64_t archive_id,
                                    const std::string& event,
                                    const std::string& details_json,
                                    int64_t at,
                                    const std::string& actor) {
  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO dicom_archive_history (archive_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL");
  st.bind(1, archive_id);
  st.bind(2, event);
  st.bind(3, details_json);
  st.bind(4, at);
  st.bind(5, actor);
  if (st.step() != SQLITE_DONE) {
    throw ArchiveError(ErrorKind::kRegistryFailure,
                       std::string("appendHistory failed: ") + sqlite3_errmsg(db));
  }
}

} // namespace dca
