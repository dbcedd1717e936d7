#include "plaindate/PlainDate.hpp"
#include <charconv>
#include <ctime>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace plaindate {

static constexpr std::array<std::string_view, 7> kWeekdays = {
  "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
};

Instant systemNow() {
  return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

DateError::DateError(const std::string& message, std::string input)
  : std::runtime_error(message), input_(std::move(input)) {}

MalformedInput::MalformedInput(const std::string& message, std::string input, std::string token)
  : DateError(message, std::move(input)), token_(std::move(token)) {}

InvalidDate::InvalidDate(const std::string& message, std::string input)
  : DateError(message, std::move(input)) {}

PlainDate::PlainDate(int year, int month, int day) : year_(year), month_(month), day_(day) {}

static constexpr long long kSecondsPerDay = 86400;

static std::time_t to_time_t(Instant instant) {
  return static_cast<std::time_t>(instant.time_since_epoch().count());
}

static PlainDate from_tm(const std::tm& t) {
  return PlainDate(t.tm_year + 1900, t.tm_mon + 1, t.tm_mday);
}

PlainDate PlainDate::fromLocalInstant(Instant instant) {
  const std::time_t tt = to_time_t(instant);
  std::tm t{};
  if (localtime_r(&tt, &t) == nullptr) {
    throw std::out_of_range("instant out of range for local calendar fields");
  }
  return from_tm(t);
}

PlainDate PlainDate::fromUTCInstant(Instant instant) {
  const std::time_t tt = to_time_t(instant);
  std::tm t{};
  if (gmtime_r(&tt, &t) == nullptr) {
    throw std::out_of_range("instant out of range for UTC calendar fields");
  }
  return from_tm(t);
}

static std::vector<std::string_view> split_dash(std::string_view s) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    const size_t pos = s.find('-', start);
    if (pos == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

// Accepts the canonical decimal form of an int, or that form with one
// extra leading '0' ("05", "00", "012"). Anything else is rejected.
static bool parse_int_token(std::string_view tok, int& out) {
  if (tok.empty()) return false;
  int value = 0;
  const char* end = tok.data() + tok.size();
  const auto [ptr, ec] = std::from_chars(tok.data(), end, value);
  if (ec != std::errc() || ptr != end) return false;

  const std::string canonical = std::to_string(value);
  if (tok != canonical && tok != "0" + canonical) return false;
  out = value;
  return true;
}

static PlainDate parse_iso_or_throw(std::string_view isoString) {
  const std::string input(isoString);
  const auto parts = split_dash(isoString);
  if (parts.size() != 3) {
    throw MalformedInput("Expression '" + input + "' is not a valid ISO string", input, input);
  }

  int fields[3] = {0, 0, 0};
  for (size_t i = 0; i < parts.size(); ++i) {
    if (!parse_int_token(parts[i], fields[i])) {
      const std::string token(parts[i]);
      throw MalformedInput("Expression '" + token + "' in '" + input + "' is not valid", input, token);
    }
  }

  const PlainDate out(fields[0], fields[1], fields[2]);
  if (!out.isValid()) {
    throw InvalidDate("Expression '" + input + "' is not a valid date", input);
  }
  return out;
}

PlainDate PlainDate::fromISOString(std::string_view isoString, std::optional<PlainDate> fallback) {
  if (!fallback) return parse_iso_or_throw(isoString);
  try {
    return parse_iso_or_throw(isoString);
  } catch (const DateError&) {
    return *fallback;
  }
}

std::array<int, 12> PlainDate::daysInMonth(int year) {
  return {31, isLeapYear(year) ? 29 : 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
}

int PlainDate::daysInMonth(int year, int month) {
  if (month < 1 || month > 12) return 0;
  return daysInMonth(year)[month - 1];
}

bool PlainDate::isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

PlainDate PlainDate::today(const NowFunction& now) {
  return fromLocalInstant(now());
}

bool PlainDate::isValid() const {
  if (year_ < 1 || month_ < 1 || month_ > 12 || day_ < 1) return false;
  return day_ <= daysInMonth(year_, month_);
}

static void append_2digits(std::ostringstream& oss, int v) {
  if (v < 10) oss << '0';
  oss << v;
}

std::string PlainDate::toISOString() const {
  std::ostringstream oss;
  oss << year_ << '-';
  append_2digits(oss, month_);
  oss << '-';
  append_2digits(oss, day_);
  return oss.str();
}

Instant PlainDate::toLocalInstant() const {
  std::tm t{};
  t.tm_year = year_ - 1900;
  t.tm_mon = month_ - 1;
  t.tm_mday = day_;
  t.tm_isdst = -1; // let the C library pick the offset in force that day
  std::time_t tt = std::mktime(&t);
  if (tt == static_cast<std::time_t>(-1)) {
    throw std::out_of_range("date " + toISOString() + " has no local time representation");
  }
  // Midnight skipped by a DST jump may resolve to the evening before;
  // move forward to the first instant of the requested day.
  const long long secsOfDay = t.tm_hour * 3600LL + t.tm_min * 60LL + t.tm_sec;
  if (secsOfDay >= kSecondsPerDay / 2) tt += static_cast<std::time_t>(kSecondsPerDay - secsOfDay);
  return Instant(std::chrono::seconds(tt));
}

Instant PlainDate::toUTCInstant() const {
  const long long days = PlainDate(1970, 1, 1).getDaysDifference(*this);
  return Instant(std::chrono::seconds(days * kSecondsPerDay));
}

// Day counts and fields are widened so that huge offsets and out-of-range
// fields never overflow; the year wraps when converted back to int.
static PlainDate add_days(long long year, long long month, long long day, long long days) {
  while (days > 0) {
    const long long monthDays = PlainDate::daysInMonth(static_cast<int>(year), static_cast<int>(month));
    if (days > monthDays - day) {
      days -= monthDays - day + 1;
      day = 1;
      if (++month > 12) {
        month = 1;
        ++year;
      }
    } else {
      day += days;
      days = 0;
    }
  }
  return PlainDate(static_cast<int>(year), static_cast<int>(month), static_cast<int>(day));
}

static PlainDate sub_days(long long year, long long month, long long day, long long days) {
  while (days > 0) {
    if (day > days) {
      day -= days;
      days = 0;
    } else {
      days -= day;
      if (--month < 1) {
        month = 12;
        --year;
      }
      day = PlainDate::daysInMonth(static_cast<int>(year), static_cast<int>(month));
    }
  }
  return PlainDate(static_cast<int>(year), static_cast<int>(month), static_cast<int>(day));
}

PlainDate PlainDate::addDays(int days) const {
  if (days < 0) return sub_days(year_, month_, day_, -static_cast<long long>(days));
  return add_days(year_, month_, day_, days);
}

PlainDate PlainDate::subDays(int days) const {
  if (days < 0) return add_days(year_, month_, day_, -static_cast<long long>(days));
  return sub_days(year_, month_, day_, days);
}

DayOfWeek PlainDate::getDayOfWeek() const {
  // 1970-01-01 was a Thursday
  const long long diff = PlainDate(1970, 1, 1).getDaysDifference(*this);
  const long long index = ((static_cast<long long>(DayOfWeek::Thursday) + diff % 7) % 7 + 7) % 7;
  return static_cast<DayOfWeek>(index);
}

std::string PlainDate::getDayOfWeekStr() const {
  return std::string(kWeekdays[static_cast<size_t>(getDayOfWeek())]);
}

long long PlainDate::getDaysDifference(const PlainDate& to) const {
  if (isAfter(to)) return -to.getDaysDifference(*this);

  if (year_ == to.year_) {
    if (month_ == to.month_) return static_cast<long long>(to.day_) - day_;

    long long total = static_cast<long long>(daysInMonth(year_, month_)) - day_;
    for (int m = month_ + 1; m < to.month_; ++m) total += daysInMonth(year_, m);
    return total + to.day_;
  }

  long long total = getDaysDifference(PlainDate(year_, 12, 31)) + 1;
  for (int y = year_ + 1; y < to.year_; ++y) total += isLeapYear(y) ? 366 : 365;
  return total + PlainDate(to.year_, 1, 1).getDaysDifference(to);
}

bool PlainDate::isEqual(const PlainDate& date) const {
  return year_ == date.year_ && month_ == date.month_ && day_ == date.day_;
}

bool PlainDate::isBefore(const PlainDate& date) const {
  if (year_ != date.year_) return year_ < date.year_;
  if (month_ != date.month_) return month_ < date.month_;
  return day_ < date.day_;
}

bool PlainDate::isAfter(const PlainDate& date) const {
  return !isBefore(date) && !isEqual(date);
}

bool PlainDate::isBeforeOrEqual(const PlainDate& date) const {
  return isBefore(date) || isEqual(date);
}

bool PlainDate::isAfterOrEqual(const PlainDate& date) const {
  return isAfter(date) || isEqual(date);
}

bool PlainDate::isInInterval(const PlainDate& from, const PlainDate& to) const {
  if (to.isBefore(from)) return isInInterval(to, from);
  return isAfterOrEqual(from) && isBeforeOrEqual(to);
}

bool operator==(const PlainDate& a, const PlainDate& b) {
  return a.isEqual(b);
}

bool operator!=(const PlainDate& a, const PlainDate& b) {
  return !a.isEqual(b);
}

bool operator<(const PlainDate& a, const PlainDate& b) {
  return a.isBefore(b);
}

std::ostream& operator<<(std::ostream& os, const PlainDate& date) {
  return os << date.toISOString();
}

} // namespace plaindate
