#include "ProvenanceLog.hpp"

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "core/ArchiveError.hpp"
#include "core/Date.hpp"

using nlohmann::json;

namespace dca {

static std::string current_user() {
  if (const char* v = std::getenv("USER")) return v;
  if (const passwd* pw = ::getpwuid(::geteuid())) return pw->pw_name;
  return "unknown";
}

ProvenanceLog make_provenance_log(const std::string& sourcePath,
                                  const std::string& targetPath,
                                  const Checksum& tarball,
                                  const Checksum& zipball) {
  ProvenanceLog log;
  log.source_path = sourcePath;
  log.target_path = targetPath;

  utsname un{};
  if (::uname(&un) == 0) {
    log.creating_host = un.nodename;
    log.host_os       = un.sysname;
  } else {
    log.creating_host = "unknown";
    log.host_os       = "unknown";
  }
  log.creating_user    = current_user();
  log.archive_date     = utc_timestamp_now();
  log.tarball_checksum = tarball;
  log.zipball_checksum = zipball;
  return log;
}

std::string log_to_string(const ProvenanceLog& log) {
  std::ostringstream oss;
  auto line = [&](const char* label, const std::string& value) {
    oss << "* " << std::left << std::setw(33) << label << ":    " << value << "\n";
  };
  line("Taken from dir",                  log.source_path);
  line("Archive target location",         log.target_path);
  line("Name of creating host",           log.creating_host);
  line("Name of host OS",                 log.host_os);
  line("Created by user",                 log.creating_user);
  line("Archived on",                     log.archive_date);
  line("dicomSummary version",            std::to_string(log.summary_version));
  line("dicomTar version",                std::to_string(log.archive_version));
  line("md5sum for DICOM tarball",        log.tarball_checksum.toString());
  line("md5sum for DICOM tarball gzipped", log.zipball_checksum.toString());
  if (log.archive_checksum) {
    line("md5sum for complete archive",   log.archive_checksum->toString());
  }
  return oss.str();
}

void write_log_file(const std::string& path, const ProvenanceLog& log) {
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) throw ArchiveError(ErrorKind::kIoFailure, "Cannot open log file '" + path + "'");
  os << log_to_string(log);
  os.flush();
  if (!os) throw ArchiveError(ErrorKind::kIoFailure, "Failed writing log file '" + path + "'");
}

json log_to_json(const ProvenanceLog& log) {
  return json{
    {"source_path",      log.source_path},
    {"target_path",      log.target_path},
    {"creating_host",    log.creating_host},
    {"host_os",          log.host_os},
    {"creating_user",    log.creating_user},
    {"archive_date",     log.archive_date},
    {"summary_version",  log.summary_version},
    {"archive_version",  log.archive_version},
    {"tarball_md5_sum",  log.tarball_checksum.hex},
    {"zipball_md5_sum",  log.zipball_checksum.hex},
    {"archive_md5_sum",  log.archive_checksum ? json(log.archive_checksum->hex) : json(nullptr)}
  };
}

} // namespace dca
