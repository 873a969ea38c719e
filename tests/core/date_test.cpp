#include "core/Date.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("parse_date accepts ISO and DICOM DA forms", "[core][date]") {
  const auto iso = dca::parse_date("2024-08-27");
  REQUIRE(iso.has_value());
  REQUIRE(iso->year == 2024);
  REQUIRE(iso->month == 8);
  REQUIRE(iso->day == 27);

  const auto da = dca::parse_date("20240827");
  REQUIRE(da.has_value());
  REQUIRE(*da == *iso);
}

TEST_CASE("parse_date rejects malformed and impossible dates", "[core][date]") {
  REQUIRE_FALSE(dca::parse_date("").has_value());
  REQUIRE_FALSE(dca::parse_date("2024-8-27").has_value());
  REQUIRE_FALSE(dca::parse_date("2024/08/27").has_value());
  REQUIRE_FALSE(dca::parse_date("2023-02-29").has_value());
  REQUIRE_FALSE(dca::parse_date("2024-13-01").has_value());
  REQUIRE(dca::parse_date("2024-02-29").has_value());
}

TEST_CASE("format_date pads to YYYY-MM-DD", "[core][date]") {
  REQUIRE(dca::format_date(dca::Date{2024, 8, 27}) == "2024-08-27");
  REQUIRE(dca::format_date(dca::Date{999, 1, 2}) == "0999-01-02");
}
