#pragma once
#include <array>
#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace plaindate {

enum class DayOfWeek {
  Sunday = 0,
  Monday = 1,
  Tuesday = 2,
  Wednesday = 3,
  Thursday = 4,
  Friday = 5,
  Saturday = 6,
};

// Whole seconds since 1970-01-01T00:00:00Z; covers every year an int can hold.
using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;
using NowFunction = std::function<Instant()>;

// Real wall clock floored to the second, default source for PlainDate::today().
Instant systemNow();

class DateError : public std::runtime_error {
public:
  DateError(const std::string& message, std::string input);

  const std::string& input() const { return input_; }

private:
  std::string input_;
};

// Wrong number of components, or a component that is not an integer.
class MalformedInput : public DateError {
public:
  MalformedInput(const std::string& message, std::string input, std::string token);

  const std::string& token() const { return token_; }

private:
  std::string token_;
};

// Well-formed text whose fields are not a calendar date.
class InvalidDate : public DateError {
public:
  InvalidDate(const std::string& message, std::string input);
};

// A civil date (proleptic Gregorian), no time of day, no time zone.
// Construction never validates; see isValid().
class PlainDate {
public:
  PlainDate() = default;
  PlainDate(int year, int month, int day);

  int year() const { return year_; }
  int month() const { return month_; }
  int day() const { return day_; }

  // Calendar fields of `instant` as seen in the host's local time zone.
  static PlainDate fromLocalInstant(Instant instant);
  // Calendar fields of `instant` as seen in UTC.
  static PlainDate fromUTCInstant(Instant instant);

  // Parses "YYYY-MM-DD". Throws MalformedInput or InvalidDate, unless a
  // fallback is given, in which case the fallback is returned as-is.
  static PlainDate fromISOString(std::string_view isoString,
                                 std::optional<PlainDate> fallback = std::nullopt);

  static std::array<int, 12> daysInMonth(int year);
  // 0 when month is outside 1..12.
  static int daysInMonth(int year, int month);
  static bool isLeapYear(int year);

  // Local calendar date of now().
  static PlainDate today(const NowFunction& now = systemNow);

  bool isValid() const;

  // Month and day padded to two digits, year printed as-is.
  std::string toISOString() const;
  // Local midnight of this date, or the first local instant of the day when
  // a DST transition skips midnight.
  Instant toLocalInstant() const;
  // UTC midnight of this date.
  Instant toUTCInstant() const;

  PlainDate clone() const { return *this; }

  // Years past the int range wrap around.
  PlainDate addDays(int days) const;
  PlainDate subDays(int days) const;

  DayOfWeek getDayOfWeek() const;
  std::string getDayOfWeekStr() const;

  // Signed number of days from this date to `to`.
  long long getDaysDifference(const PlainDate& to) const;

  bool isEqual(const PlainDate& date) const;
  bool isBefore(const PlainDate& date) const;
  bool isAfter(const PlainDate& date) const;
  bool isBeforeOrEqual(const PlainDate& date) const;
  bool isAfterOrEqual(const PlainDate& date) const;
  // Inclusive on both ends; swapped bounds are accepted.
  bool isInInterval(const PlainDate& from, const PlainDate& to) const;

private:
  int year_ = 0;
  int month_ = 0;
  int day_ = 0;
};

bool operator==(const PlainDate& a, const PlainDate& b);
bool operator!=(const PlainDate& a, const PlainDate& b);
bool operator<(const PlainDate& a, const PlainDate& b);
std::ostream& operator<<(std::ostream& os, const PlainDate& date);

} // namespace plaindate
