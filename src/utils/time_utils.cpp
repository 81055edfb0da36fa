#include "utils/time_utils.h"
#include <cctype>
#include <cstdio>

namespace {

// Howard Hinnant's days_from_civil / civil_from_days.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t &y, unsigned &m, unsigned &d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp + (mp < 10 ? 3 : -9);
  y += m <= 2;
}

bool isLeap(int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned daysInMonth(int64_t y, unsigned m) {
  static const unsigned days[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeap(y))
    return 29;
  return days[m - 1];
}

class Cursor {
public:
  explicit Cursor(const std::string &text) : text_(text) {}

  bool atEnd() const { return pos_ >= text_.size(); }
  char peek() const { return atEnd() ? '\0' : text_[pos_]; }
  void advance() { ++pos_; }

  bool consume(char c) {
    if (peek() != c)
      return false;
    ++pos_;
    return true;
  }

  bool digits(size_t count, int &out) {
    if (pos_ + count > text_.size())
      return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
      char c = text_[pos_ + i];
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return false;
      value = value * 10 + (c - '0');
    }
    pos_ += count;
    out = value;
    return true;
  }

private:
  const std::string &text_;
  size_t pos_ = 0;
};

struct DateTimeParts {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

void splitTimestamp(Timestamp ts, DateTimeParts &parts, int64_t &micros) {
  int64_t total = ts.time_since_epoch().count();
  int64_t perDay = int64_t(86400) * 1000000;
  int64_t days = total / perDay;
  int64_t rem = total % perDay;
  if (rem < 0) {
    rem += perDay;
    --days;
  }
  int64_t y;
  unsigned m, d;
  civilFromDays(days, y, m, d);
  parts.year = static_cast<int>(y);
  parts.month = static_cast<int>(m);
  parts.day = static_cast<int>(d);
  int64_t secs = rem / 1000000;
  micros = rem % 1000000;
  parts.hour = static_cast<int>(secs / 3600);
  parts.minute = static_cast<int>((secs % 3600) / 60);
  parts.second = static_cast<int>(secs % 60);
}

} // namespace

namespace TimeUtils {

std::optional<Timestamp> parseIso8601(const std::string &text) {
  Cursor cur(text);
  DateTimeParts p;
  if (!cur.digits(4, p.year) || !cur.consume('-') || !cur.digits(2, p.month) ||
      !cur.consume('-') || !cur.digits(2, p.day))
    return std::nullopt;
  if (p.month < 1 || p.month > 12 || p.day < 1 ||
      p.day > static_cast<int>(daysInMonth(p.year, p.month)))
    return std::nullopt;

  int64_t micros = 0;
  int64_t offsetSeconds = 0;

  if (!cur.atEnd()) {
    if (!cur.consume('T') && !cur.consume(' '))
      return std::nullopt;
    if (!cur.digits(2, p.hour) || !cur.consume(':') || !cur.digits(2, p.minute))
      return std::nullopt;
    if (cur.consume(':')) {
      if (!cur.digits(2, p.second))
        return std::nullopt;
      if (cur.consume('.')) {
        int scale = 100000;
        bool any = false;
        while (std::isdigit(static_cast<unsigned char>(cur.peek()))) {
          micros += (cur.peek() - '0') * scale;
          scale /= 10;
          any = true;
          cur.advance();
        }
        if (!any)
          return std::nullopt;
      }
    }
    if (p.hour > 23 || p.minute > 59 || p.second > 59)
      return std::nullopt;

    if (cur.consume('Z')) {
      // UTC
    } else if (cur.peek() == '+' || cur.peek() == '-') {
      int sign = cur.peek() == '-' ? -1 : 1;
      cur.advance();
      int oh = 0, om = 0;
      if (!cur.digits(2, oh))
        return std::nullopt;
      if (cur.consume(':')) {
        if (!cur.digits(2, om))
          return std::nullopt;
      } else if (!cur.atEnd()) {
        if (!cur.digits(2, om))
          return std::nullopt;
      }
      if (oh > 23 || om > 59)
        return std::nullopt;
      offsetSeconds = sign * (oh * 3600 + om * 60);
    }
    if (!cur.atEnd())
      return std::nullopt;
  }

  int64_t days = daysFromCivil(p.year, static_cast<unsigned>(p.month),
                               static_cast<unsigned>(p.day));
  int64_t seconds = days * 86400 + p.hour * 3600 + p.minute * 60 + p.second -
                    offsetSeconds;
  return Timestamp(std::chrono::microseconds(seconds * 1000000 + micros));
}

std::string formatIso8601(Timestamp ts) {
  DateTimeParts p;
  int64_t micros = 0;
  splitTimestamp(ts, p, micros);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                p.year, p.month, p.day, p.hour, p.minute, p.second,
                static_cast<long long>(micros));
  return buffer;
}

std::string formatSqlDateTime(Timestamp ts) {
  DateTimeParts p;
  int64_t micros = 0;
  splitTimestamp(ts, p, micros);
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%06lld",
                p.year, p.month, p.day, p.hour, p.minute, p.second,
                static_cast<long long>(micros));
  return buffer;
}

} // namespace TimeUtils
