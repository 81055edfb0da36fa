#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

// UTC instant with the precision PostgreSQL and MySQL keep for timestamps.
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

namespace TimeUtils {

inline Timestamp nowUtc() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
}

// Accepts "YYYY-MM-DD", optionally followed by 'T' or ' ' and
// "HH:MM[:SS[.ffffff]]", optionally followed by 'Z', "+hh", "+hhmm" or
// "+hh:mm". Fractions beyond microseconds are truncated. Returns nullopt
// for anything else, including out-of-range fields.
std::optional<Timestamp> parseIso8601(const std::string &text);

// Always "YYYY-MM-DDTHH:MM:SS.ffffffZ".
std::string formatIso8601(Timestamp ts);

// "YYYY-MM-DD HH:MM:SS.ffffff" in UTC, for engines without zone suffixes.
std::string formatSqlDateTime(Timestamp ts);

} // namespace TimeUtils

#endif
