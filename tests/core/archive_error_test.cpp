#include "core/ArchiveError.hpp"

#include <catch2/catch_test_macros.hpp>

#include <set>

TEST_CASE("Each error kind maps to its own exit status", "[core][errors]") {
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kInvalidArgument) == 3);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kMissingConfiguration) == 4);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kTargetExists) == 5);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kDirectoryUnusable) == 6);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kInsertConflict) == 7);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kUpdateConflict) == 8);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kIoFailure) == 9);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kExtractionFailure) == 10);
  REQUIRE(dca::exit_code_for(dca::ErrorKind::kRegistryFailure) == 11);
}

TEST_CASE("Exit statuses never collide with success or unexpected failure", "[core][errors]") {
  const dca::ErrorKind kinds[] = {
    dca::ErrorKind::kInvalidArgument, dca::ErrorKind::kMissingConfiguration,
    dca::ErrorKind::kTargetExists,    dca::ErrorKind::kDirectoryUnusable,
    dca::ErrorKind::kInsertConflict,  dca::ErrorKind::kUpdateConflict,
    dca::ErrorKind::kIoFailure,       dca::ErrorKind::kExtractionFailure,
    dca::ErrorKind::kRegistryFailure,
  };
  std::set<int> codes;
  for (auto kind : kinds) {
    const int code = dca::exit_code_for(kind);
    REQUIRE(code != 0);
    REQUIRE(code != 2);
    codes.insert(code);
  }
  REQUIRE(codes.size() == sizeof(kinds) / sizeof(kinds[0]));
}

TEST_CASE("ArchiveError carries kind and message", "[core][errors]") {
  const dca::ArchiveError e(dca::ErrorKind::kTargetExists, "'/a' already exists");
  REQUIRE(e.kind() == dca::ErrorKind::kTargetExists);
  REQUIRE(std::string(e.what()) == "'/a' already exists");
  REQUIRE(std::string(dca::to_string(e.kind())) == "target exists");
}
