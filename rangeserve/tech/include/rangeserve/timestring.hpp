#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "rangeserve/timedef.hpp"

namespace rangeserve {

// "Sun, 06 Nov 1994 08:49:37 GMT"
inline constexpr std::size_t kRFC7231DateStrLen = 29;

namespace detail {

constexpr char *write2(char *out, unsigned value) {
  out[0] = static_cast<char>('0' + ((value / 10U) % 10U));
  out[1] = static_cast<char>('0' + (value % 10U));
  return out + 2;
}

constexpr char *write3chars(char *out, const char *src) {
  out[0] = src[0];
  out[1] = src[1];
  out[2] = src[2];
  return out + 3;
}

}  // namespace detail

/// Writes the IMF-fixdate (RFC 7231 section 7.1.1.1) representation of 'timePoint' into 'out',
/// independently of the current locale, and returns a pointer after the last char written.
/// The buffer should have a space of at least kRFC7231DateStrLen chars.
constexpr char *TimeToStringRFC7231(SysTimePoint timePoint, char *out) {
  constexpr const char *kWeekDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  constexpr const char *kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  const std::chrono::weekday weekDay{daysFloor};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(timePoint - daysFloor)};

  out = detail::write3chars(out, kWeekDays[weekDay.c_encoding()]);
  *out++ = ',';
  *out++ = ' ';
  out = detail::write2(out, static_cast<unsigned>(ymd.day()));
  *out++ = ' ';
  out = detail::write3chars(out, kMonths[static_cast<unsigned>(ymd.month()) - 1U]);
  *out++ = ' ';
  const auto year = static_cast<unsigned>(static_cast<int>(ymd.year()));
  out = detail::write2(out, year / 100U);
  out = detail::write2(out, year % 100U);
  *out++ = ' ';
  out = detail::write2(out, static_cast<unsigned>(hms.hours().count()));
  *out++ = ':';
  out = detail::write2(out, static_cast<unsigned>(hms.minutes().count()));
  *out++ = ':';
  out = detail::write2(out, static_cast<unsigned>(hms.seconds().count()));
  *out++ = ' ';
  return detail::write3chars(out, "GMT");
}

}  // namespace rangeserve
