#include "core/archive/ProvenanceLog.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

namespace {

dca::ProvenanceLog SampleLog() {
  return dca::make_provenance_log("/data/Subj01", "/archive/DCM_Subj01.tar",
                                  {"11111111111111111111111111111111", "Subj01.tar"},
                                  {"22222222222222222222222222222222", "Subj01.tar.gz"});
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Provenance log records paths, host and checksums", "[archive][log]") {
  const dca::ProvenanceLog log = SampleLog();
  REQUIRE(log.source_path == "/data/Subj01");
  REQUIRE(log.target_path == "/archive/DCM_Subj01.tar");
  REQUIRE_FALSE(log.creating_host.empty());
  REQUIRE_FALSE(log.creating_user.empty());
  REQUIRE(log.archive_date.size() == 19);
  REQUIRE_FALSE(log.archive_checksum.has_value());
}

TEST_CASE("Text rendering omits the archive checksum until it is known", "[archive][log]") {
  dca::ProvenanceLog log = SampleLog();
  const std::string before = dca::log_to_string(log);
  REQUIRE(Contains(before, "Taken from dir"));
  REQUIRE(Contains(before, "/data/Subj01"));
  REQUIRE(Contains(before, "11111111111111111111111111111111 Subj01.tar"));
  REQUIRE(Contains(before, "22222222222222222222222222222222 Subj01.tar.gz"));
  REQUIRE_FALSE(Contains(before, "complete archive"));

  log.archive_checksum = dca::Checksum{"33333333333333333333333333333333", "DCM_Subj01.tar"};
  const std::string after = dca::log_to_string(log);
  REQUIRE(Contains(after, "md5sum for complete archive"));
  REQUIRE(Contains(after, "33333333333333333333333333333333 DCM_Subj01.tar"));
  REQUIRE(dca::log_to_json(log)["archive_md5_sum"] == "33333333333333333333333333333333");
}

TEST_CASE("Log file holds the text rendering", "[archive][log]") {
  dca::tests::common::TempDir dir("dca-log");
  const dca::ProvenanceLog log = SampleLog();
  const auto path = dir.path() / "Subj01.log";
  dca::write_log_file(path.string(), log);
  REQUIRE(dca::tests::common::ReadFileToString(path) == dca::log_to_string(log));
}
