#include "core/storage/PathGuard.hpp"
#include "core/ArchiveError.hpp"

#include "common/log_capture.hpp"
#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using dca::tests::common::LogCapture;
using dca::tests::common::TempDir;

TEST_CASE("Guard refuses an existing path without overwrite", "[storage][guard]") {
  TempDir dir("dca-guard");
  const auto existing = dir.path() / "Subj01.tar";
  dca::tests::common::WriteFile(existing, "x");

  const dca::PathGuard guard(false);
  try {
    guard.checkCreateFile(existing.string());
    FAIL("expected TargetExists");
  } catch (const dca::ArchiveError& e) {
    REQUIRE(e.kind() == dca::ErrorKind::kTargetExists);
    REQUIRE(std::string(e.what()).find("--overwrite") != std::string::npos);
  }
}

TEST_CASE("Guard allows an existing path with overwrite and warns once", "[storage][guard]") {
  TempDir dir("dca-guard");
  const auto existing = dir.path() / "Subj01.tar";
  dca::tests::common::WriteFile(existing, "x");

  LogCapture capture;
  const dca::PathGuard guard(true);
  REQUIRE_NOTHROW(guard.checkCreateFile(existing.string()));
  REQUIRE(capture.count(spdlog::level::warn) == 1);
  REQUIRE(capture.contains(spdlog::level::warn, existing.string()));
}

TEST_CASE("Guard accepts fresh paths silently under both policies", "[storage][guard]") {
  TempDir dir("dca-guard");
  LogCapture capture;
  REQUIRE_NOTHROW(dca::PathGuard(false).checkCreateFile((dir.path() / "new.tar").string()));
  REQUIRE_NOTHROW(dca::PathGuard(true).checkCreateFile((dir.path() / "new.tar").string()));
  REQUIRE(capture.count(spdlog::level::warn) == 0);
}

TEST_CASE("Guard creates a missing year directory", "[storage][guard]") {
  TempDir dir("dca-guard");
  const auto year = dir.path() / "2024";
  dca::PathGuard(false).ensureDirectory(year.string());
  REQUIRE(std::filesystem::is_directory(year));

  // Existing writable directory is fine.
  REQUIRE_NOTHROW(dca::PathGuard(false).ensureDirectory(year.string()));
}

TEST_CASE("Guard rejects an unusable year path", "[storage][guard]") {
  TempDir dir("dca-guard");
  const auto year = dir.path() / "2024";
  dca::tests::common::WriteFile(year, "not a directory");

  try {
    dca::PathGuard(true).ensureDirectory(year.string());
    FAIL("expected DirectoryUnusable");
  } catch (const dca::ArchiveError& e) {
    REQUIRE(e.kind() == dca::ErrorKind::kDirectoryUnusable);
  }
}
