/**
 * @file calendar.hpp
 * @brief Proleptic Gregorian civil time <-> UTC seconds, ISO-8601 text.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include "solargen/core/constants.hpp"
#include "solargen/core/types.hpp"

namespace solargen::core::calendar {

/**
 * @brief Broken-down wall-clock time (no zone; read as UTC).
 */
struct CivilTime {
  int year{1970};
  unsigned month{1};
  unsigned day{1};
  int hour{};
  int minute{};
  double second{};
};

inline int days_from_civil(int y, const unsigned m, const unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

inline CivilTime civil_from_days(int z) {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  CivilTime out{};
  out.day = doy - (153U * mp + 2U) / 5U + 1U;
  out.month = mp < 10U ? mp + 3U : mp - 9U;
  out.year = static_cast<int>(yoe) + era * 400 + static_cast<int>(out.month <= 2U);
  return out;
}

inline double civil_to_utc_seconds(const CivilTime& t) {
  return static_cast<double>(days_from_civil(t.year, t.month, t.day)) * constants::kSecondsPerDay +
         static_cast<double>(t.hour) * constants::kSecondsPerHour + static_cast<double>(t.minute) * 60.0 + t.second;
}

inline CivilTime utc_seconds_to_civil(const double utc_seconds) {
  const double days = std::floor(utc_seconds / constants::kSecondsPerDay);
  CivilTime out = civil_from_days(static_cast<int>(days));
  const double sod = utc_seconds - days * constants::kSecondsPerDay;
  out.hour = static_cast<int>(sod / constants::kSecondsPerHour);
  out.minute = static_cast<int>((sod - out.hour * constants::kSecondsPerHour) / 60.0);
  out.second = sod - out.hour * constants::kSecondsPerHour - out.minute * 60.0;
  return out;
}

/**
 * @brief Parse `YYYY-MM-DD[THH:MM[:SS[.fff]]][Z]`; a space may replace `T`.
 */
inline std::optional<Epoch> parse_iso8601(std::string_view text) {
  if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
    text.remove_suffix(1);
  }
  const std::string s(text);
  CivilTime t{};
  double second = 0.0;
  char sep = 'T';
  const int n = std::sscanf(s.c_str(), "%d-%u-%u%c%d:%d:%lf", &t.year, &t.month, &t.day, &sep, &t.hour, &t.minute,
                            &second);
  if (n != 3 && n != 6 && n != 7) {
    return std::nullopt;
  }
  if (n > 3 && sep != 'T' && sep != ' ') {
    return std::nullopt;
  }
  if (t.month < 1U || t.month > 12U || t.day < 1U || t.day > 31U || t.hour < 0 || t.hour > 23 || t.minute < 0 ||
      t.minute > 59 || second < 0.0 || second >= 61.0) {
    return std::nullopt;
  }
  t.second = second;
  return Epoch{civil_to_utc_seconds(t)};
}

inline std::string format_iso8601(const Epoch& epoch) {
  const CivilTime t = utc_seconds_to_civil(epoch.utc_seconds);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", t.year, t.month, t.day, t.hour, t.minute,
                static_cast<int>(t.second));
  return std::string(buf);
}

}  // namespace solargen::core::calendar
