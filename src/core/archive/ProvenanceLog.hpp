#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/storage/Checksum.hpp"

namespace dca {

constexpr int kSummaryVersion = 2;
constexpr int kArchiveVersion = 2;

// What was archived, where, and with which checksums.
struct ProvenanceLog {
  std::string source_path;
  std::string target_path;
  std::string creating_host;
  std::string host_os;
  std::string creating_user;
  std::string archive_date;
  int         summary_version = kSummaryVersion;
  int         archive_version = kArchiveVersion;
  Checksum    tarball_checksum;
  Checksum    zipball_checksum;
  // Filled in once the bundle is sealed.
  std::optional<Checksum> archive_checksum;
};

// Captures host, OS, user and time of the current process.
ProvenanceLog make_provenance_log(const std::string& sourcePath,
                                  const std::string& targetPath,
                                  const Checksum& tarball,
                                  const Checksum& zipball);

std::string log_to_string(const ProvenanceLog& log);

void write_log_file(const std::string& path, const ProvenanceLog& log);

nlohmann::json log_to_json(const ProvenanceLog& log);

} // namespace dca
