#include "Date.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dca {

static bool all_digits(const std::string& s) {
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return !s.empty();
}

static bool is_leap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static bool valid(const Date& d) {
  static const int kDays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (d.year < 1 || d.month < 1 || d.month > 12 || d.day < 1) return false;
  int max = kDays[d.month - 1];
  if (d.month == 2 && is_leap(d.year)) max = 29;
  return d.day <= max;
}

std::optional<Date> parse_date(const std::string& text) {
  std::string y, m, d;
  if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
    y = text.substr(0, 4); m = text.substr(5, 2); d = text.substr(8, 2);
  } else if (text.size() == 8) {
    y = text.substr(0, 4); m = text.substr(4, 2); d = text.substr(6, 2);
  } else {
    return std::nullopt;
  }
  if (!all_digits(y) || !all_digits(m) || !all_digits(d)) return std::nullopt;

  Date out{std::stoi(y), std::stoi(m), std::stoi(d)};
  if (!valid(out)) return std::nullopt;
  return out;
}

std::string format_date(const Date& d) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << d.year << '-'
      << std::setw(2) << d.month << '-'
      << std::setw(2) << d.day;
  return oss.str();
}

Date today_local() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string utc_timestamp_now() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

} // namespace dca
