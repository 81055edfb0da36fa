#include "support/TestRunner.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"

namespace {
long long epochMicros(const std::optional<Timestamp> &ts) {
  return ts ? static_cast<long long>(ts->time_since_epoch().count()) : -1;
}
} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "TIME AND STRING UTILITIES" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Parses the forms source engines return", [&]() {
    const long long expected = 1709287200LL * 1000000; // 2024-03-01 10:00 UTC
    runner.assertEquals(expected,
                        epochMicros(TimeUtils::parseIso8601(
                            "2024-03-01T10:00:00Z")),
                        "ISO with Z");
    runner.assertEquals(expected,
                        epochMicros(TimeUtils::parseIso8601(
                            "2024-03-01 10:00:00")),
                        "Space separator, no zone");
    runner.assertEquals(expected,
                        epochMicros(TimeUtils::parseIso8601(
                            "2024-03-01 12:00:00+02")),
                        "PostgreSQL +hh offset");
    runner.assertEquals(expected,
                        epochMicros(TimeUtils::parseIso8601(
                            "2024-03-01T05:30:00-04:30")),
                        "Negative +hh:mm offset");
    runner.assertEquals(expected,
                        epochMicros(TimeUtils::parseIso8601(
                            "2024-03-01T11:00:00+0100")),
                        "+hhmm offset");
    runner.assertEquals(expected,
                        epochMicros(TimeUtils::parseIso8601("2024-03-01T10:00")),
                        "Seconds are optional");
  });

  runner.runTest("Fractions keep microseconds and truncate the rest", [&]() {
    auto ts = TimeUtils::parseIso8601("2024-03-01T10:00:00.1234567Z");
    runner.assertTrue(ts.has_value(), "Parsed");
    runner.assertEquals("2024-03-01T10:00:00.123456Z",
                        TimeUtils::formatIso8601(*ts),
                        "Seventh digit dropped");
    auto ms = TimeUtils::parseIso8601("2024-03-01 10:00:00.5");
    runner.assertEquals("2024-03-01 10:00:00.500000",
                        TimeUtils::formatSqlDateTime(*ms),
                        "Short fraction scaled");
  });

  runner.runTest("Date only means midnight UTC", [&]() {
    auto ts = TimeUtils::parseIso8601("2000-02-29");
    runner.assertTrue(ts.has_value(), "Leap day accepted");
    runner.assertEquals("2000-02-29T00:00:00.000000Z",
                        TimeUtils::formatIso8601(*ts), "Midnight");
  });

  runner.runTest("Rejects malformed and out-of-range values", [&]() {
    runner.assertFalse(TimeUtils::parseIso8601("").has_value(), "Empty");
    runner.assertFalse(TimeUtils::parseIso8601("yesterday").has_value(),
                       "Words");
    runner.assertFalse(TimeUtils::parseIso8601("2023-02-29").has_value(),
                       "Not a leap year");
    runner.assertFalse(TimeUtils::parseIso8601("2024-13-01").has_value(),
                       "Month 13");
    runner.assertFalse(TimeUtils::parseIso8601("2024-03-01T24:00:00").has_value(),
                       "Hour 24");
    runner.assertFalse(TimeUtils::parseIso8601("2024-03-01T10:00:00.").has_value(),
                       "Dangling decimal point");
    runner.assertFalse(TimeUtils::parseIso8601("2024-03-01T10:00:00Zjunk").has_value(),
                       "Trailing text");
    runner.assertFalse(TimeUtils::parseIso8601("1709287200").has_value(),
                       "Epoch seconds");
  });

  runner.runTest("Formatting before the epoch", [&]() {
    auto ts = TimeUtils::parseIso8601("1969-12-31T23:59:59.999999Z");
    runner.assertEquals(-1, epochMicros(ts), "One microsecond before epoch");
    runner.assertEquals("1969-12-31T23:59:59.999999Z",
                        TimeUtils::formatIso8601(*ts), "Round trips");
  });

  runner.runTest("Ordering follows the instant, not the text", [&]() {
    auto a = TimeUtils::parseIso8601("2024-03-01T10:00:00+02:00");
    auto b = TimeUtils::parseIso8601("2024-03-01T09:00:00Z");
    runner.assertTrue(*a < *b, "08:00Z is before 09:00Z");
  });

  runner.runTest("String helpers", [&]() {
    runner.assertEquals("orders", StringUtils::unqualifiedName("public.orders"),
                        "Schema dropped");
    runner.assertEquals("orders", StringUtils::unqualifiedName("orders"),
                        "Bare name kept");
    runner.assertEquals("a''b", StringUtils::replaceAll("a'b", "'", "''"),
                        "replaceAll");
    const unsigned char bytes[] = {0x0a, 0xff};
    runner.assertEquals("0aff", StringUtils::toHex(bytes, sizeof(bytes)),
                        "toHex is lowercase");
    std::string uuid = StringUtils::randomUuid();
    runner.assertEquals(36, uuid.size(), "UUID length");
    runner.assertEquals("4", uuid.substr(14, 1), "Version 4");
    runner.assertTrue(uuid != StringUtils::randomUuid(), "UUIDs differ");
  });

  runner.printSummary();
  return 0;
}
