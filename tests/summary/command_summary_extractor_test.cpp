#include "core/summary/SummaryExtractor.hpp"
#include "core/ArchiveError.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

namespace {

std::string MakeScript(const dca::tests::common::TempDir& dir, const std::string& body) {
  const auto path = dir.path() / "summary.sh";
  dca::tests::common::WriteFile(path, "#!/bin/sh\n" + body);
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path.string();
}

} // namespace

TEST_CASE("Command extractor parses the command's JSON output", "[summary][extractor]") {
  dca::tests::common::TempDir dir("dca-extractor");
  // Echo the source argument back as the patient id to prove it was passed.
  const std::string script = MakeScript(
      dir, "printf '{\"study_uid\":\"1.2.3\",\"scan_date\":\"2024-08-27\",\"patient\":{\"id\":\"%s\"}}' \"$1\"\n");

  dca::CommandSummaryExtractor extractor(script);
  const dca::Summary s = extractor.extract("/data/Subj 01");
  REQUIRE(s.study_uid == "1.2.3");
  REQUIRE(s.patient_id == "/data/Subj 01");
  REQUIRE(s.scan_date.has_value());
}

TEST_CASE("Command extractor failures are extraction failures", "[summary][extractor]") {
  dca::tests::common::TempDir dir("dca-extractor");

  auto kind_of = [](dca::SummaryExtractor& e) {
    try {
      e.extract("/data/Subj01");
    } catch (const dca::ArchiveError& err) {
      return err.kind();
    }
    FAIL("expected ArchiveError");
    return dca::ErrorKind::kIoFailure;
  };

  SECTION("non-zero exit") {
    dca::CommandSummaryExtractor e(MakeScript(dir, "echo '{\"study_uid\":\"1\"}'\nexit 3\n"));
    REQUIRE(kind_of(e) == dca::ErrorKind::kExtractionFailure);
  }
  SECTION("no output") {
    dca::CommandSummaryExtractor e(MakeScript(dir, "exit 0\n"));
    REQUIRE(kind_of(e) == dca::ErrorKind::kExtractionFailure);
  }
  SECTION("not JSON") {
    dca::CommandSummaryExtractor e(MakeScript(dir, "echo 'study 1.2.3'\n"));
    REQUIRE(kind_of(e) == dca::ErrorKind::kExtractionFailure);
  }
}
