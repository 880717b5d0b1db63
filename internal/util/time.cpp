#include "time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "errors.hpp"

namespace stockcount::util {

namespace {

bool ReadDigits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool Expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

[[noreturn]] void Malformed(std::string_view text) {
  throw ValidationError("malformed timestamp: '" + std::string(text) + "'");
}

} // namespace

TimePoint SystemClock::Now() const {
  return std::chrono::system_clock::now();
}

TimePoint Now() {
  return std::chrono::system_clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms));
}

std::string FormatIso8601(TimePoint tp) {
  const auto ms      = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::time_t secs   = static_cast<std::time_t>(ms / 1000);
  int         millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    secs -= 1;
  }

  std::tm utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

TimePoint ParseIso8601(std::string_view text) {
  std::size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
      !ReadDigits(text, pos, 2, day)) {
    Malformed(text);
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
    Malformed(text);
  }
  ++pos;
  if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') ||
      !ReadDigits(text, pos, 2, second)) {
    Malformed(text);
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    Malformed(text);
  }

  // fractional seconds, truncated to milliseconds
  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) millis = millis * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) Malformed(text);
    for (; digits < 3; ++digits) millis *= 10;
  }

  int offset_minutes = 0;
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int off_h = 0, off_m = 0;
      if (!ReadDigits(text, pos, 2, off_h) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, off_m)) {
        Malformed(text);
      }
      offset_minutes = (off_h * 60 + off_m) * (zone == '+' ? 1 : -1);
    } else {
      Malformed(text);
    }
  }
  if (pos != text.size()) Malformed(text);

  std::tm utc{};
  utc.tm_year = year - 1900;
  utc.tm_mon  = month - 1;
  utc.tm_mday = day;
  utc.tm_hour = hour;
  utc.tm_min  = minute;
  utc.tm_sec  = second;

  const std::time_t secs = timegm(&utc);
  return TimePoint{} + std::chrono::seconds(secs) - std::chrono::minutes(offset_minutes) + std::chrono::milliseconds(millis);
}

} // namespace stockcount::util
