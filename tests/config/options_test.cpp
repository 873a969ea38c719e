#include "config/Options.hpp"
#include "core/ArchiveError.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>

using dca::tests::common::TempDir;

namespace {

dca::ErrorKind KindOf(const std::vector<std::string>& args) {
  try {
    dca::validate_options(dca::parse_options(args));
  } catch (const dca::ArchiveError& e) {
    return e.kind();
  }
  FAIL("expected ArchiveError");
  return dca::ErrorKind::kIoFailure;
}

// Keeps the environment from leaking into parse_options.
struct ClearEnv {
  ClearEnv() {
    ::unsetenv("DCA_PROFILE");
    ::unsetenv("DCA_SUMMARY_COMMAND");
  }
};

} // namespace

TEST_CASE("Flags and positional paths are parsed", "[config][options]") {
  ClearEnv env;
  const auto o = dca::parse_options(std::vector<std::string>{
      "--profile", "prod.json", "--today", "--year", "--overwrite", "--db-update",
      "--verbose", "/data/Subj01", "/archive"});

  REQUIRE(o.profile == std::optional<std::string>("prod.json"));
  REQUIRE(o.request.sourceDir == "/data/Subj01");
  REQUIRE(o.request.targetDir == "/archive");
  REQUIRE(o.request.useToday);
  REQUIRE(o.request.yearBucket);
  REQUIRE(o.request.overwrite);
  REQUIRE(o.request.verbose);
  REQUIRE(o.registryMode() == dca::RegistryMode::kUpdate);
}

TEST_CASE("Named --source and --target match positional ones", "[config][options]") {
  ClearEnv env;
  const auto o = dca::parse_options(
      std::vector<std::string>{"--target", "/archive", "--source", "/data/Subj01"});
  REQUIRE(o.request.sourceDir == "/data/Subj01");
  REQUIRE(o.request.targetDir == "/archive");
  REQUIRE_FALSE(o.profile.has_value());
  REQUIRE(o.registryMode() == dca::RegistryMode::kCheckOnly);
}

TEST_CASE("Environment fills in profile and summary command", "[config][options]") {
  ClearEnv env;
  ::setenv("DCA_PROFILE", "env.json", 1);
  ::setenv("DCA_SUMMARY_COMMAND", "my_summary", 1);
  const auto o = dca::parse_options(std::vector<std::string>{"/a", "/b"});
  ::unsetenv("DCA_PROFILE");
  ::unsetenv("DCA_SUMMARY_COMMAND");

  REQUIRE(o.profile == std::optional<std::string>("env.json"));
  REQUIRE(o.summaryCommand == "my_summary");
}

TEST_CASE("Conflicting or incomplete flags are invalid arguments", "[config][options]") {
  ClearEnv env;
  TempDir dir("dca-options");
  const std::string d = dir.str();

  REQUIRE(KindOf({"--db-insert", "--db-update", "--profile", "p.json", d, d}) ==
          dca::ErrorKind::kInvalidArgument);
  REQUIRE(KindOf({"--db-insert", d, d}) == dca::ErrorKind::kInvalidArgument);
  REQUIRE(KindOf({"--bogus", d, d}) == dca::ErrorKind::kInvalidArgument);
  REQUIRE(KindOf({"--profile"}) == dca::ErrorKind::kInvalidArgument);
  REQUIRE(KindOf({d, d, d}) == dca::ErrorKind::kInvalidArgument);
}

TEST_CASE("Source and target must be usable directories", "[config][options]") {
  ClearEnv env;
  TempDir dir("dca-options");
  const std::string d = dir.str();
  const std::string missing = (dir.path() / "missing").string();
  const std::string file = (dir.path() / "file").string();
  dca::tests::common::WriteFile(file, "x");

  REQUIRE(KindOf({missing, d}) == dca::ErrorKind::kInvalidArgument);
  REQUIRE(KindOf({d, missing}) == dca::ErrorKind::kInvalidArgument);
  REQUIRE(KindOf({file, d}) == dca::ErrorKind::kInvalidArgument);
  REQUIRE_NOTHROW(dca::validate_options(dca::parse_options(std::vector<std::string>{d, d})));
}
