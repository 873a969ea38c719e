#pragma once
#include <optional>
#include <string>

namespace dca {

// Calendar date as found in DICOM headers; no time zone attached.
struct Date {
  int year  = 0;
  int month = 0;
  int day   = 0;

  bool operator==(const Date& o) const {
    return year == o.year && month == o.month && day == o.day;
  }
  bool operator!=(const Date& o) const { return !(*this == o); }
};

// Accepts "YYYY-MM-DD" and the DICOM DA form "YYYYMMDD".
std::optional<Date> parse_date(const std::string& text);

// "YYYY-MM-DD"
std::string format_date(const Date& d);

Date today_local();

// "YYYY-MM-DD HH:MM:SS" in UTC, used for archive timestamps.
std::string utc_timestamp_now();

} // namespace dca
