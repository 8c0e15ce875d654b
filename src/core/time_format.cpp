#include "catalog/core/time_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace catalog {

namespace chr = std::chrono;

std::string format_utc(Timestamp ts) {
  const auto time = chr::system_clock::to_time_t(chr::floor<chr::seconds>(ts));
  std::tm utc_time{};
#if defined(_WIN32)
  gmtime_s(&utc_time, &time);
#else
  gmtime_r(&time, &utc_time);
#endif
  std::ostringstream oss;
  oss << std::put_time(&utc_time, kModifiedTimeFormat);
  return oss.str();
}

std::optional<chr::sys_seconds> parse_utc(const std::string &text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  std::string rest;
  std::getline(iss, rest);
  if (rest != " UTC") {
    return std::nullopt;
  }

  chr::year_month_day ymd{chr::year(tm.tm_year + 1900), chr::month(static_cast<unsigned>(tm.tm_mon + 1)),
                          chr::day(static_cast<unsigned>(tm.tm_mday))};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  return chr::sys_days(ymd) + chr::hours(tm.tm_hour) + chr::minutes(tm.tm_min) + chr::seconds(tm.tm_sec);
}

std::string format_date(chr::sys_days day) {
  chr::year_month_day ymd(day);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day());
  return oss.str();
}

unsigned iso_week_number(chr::sys_days day) {
  // The ISO week belongs to the year that contains its Thursday
  const unsigned iso_weekday = chr::weekday(day).iso_encoding();  // Mon=1 .. Sun=7
  const chr::sys_days thursday = day - chr::days(iso_weekday - 1) + chr::days(3);
  const chr::year iso_year = chr::year_month_day(thursday).year();
  const chr::sys_days year_start = chr::sys_days(iso_year / chr::January / 1);
  return static_cast<unsigned>((thursday - year_start).count() / 7 + 1);
}

unsigned weekday_from_sunday(chr::sys_days day) {
  return chr::weekday(day).c_encoding();
}

}  // namespace catalog
