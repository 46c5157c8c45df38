#include "record/canonical.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace farmtrace::record {

namespace {

struct CivilTime {
  int64_t year;
  unsigned month;
  unsigned day;
  unsigned hour;
  unsigned minute;
  unsigned second;
  int64_t nanos;
};

int64_t floor_div(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// Days since 1970-01-01 to proleptic Gregorian date (H. Hinnant's algorithm)
void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  if (m <= 2) {
    ++y;
  }
}

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilTime to_civil(Timestamp ts) {
  auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
  int64_t seconds = floor_div(since_epoch, 1000000000);
  int64_t nanos = since_epoch - seconds * 1000000000;
  int64_t days = floor_div(seconds, 86400);
  int64_t second_of_day = seconds - days * 86400;

  CivilTime civil{};
  civil_from_days(days, civil.year, civil.month, civil.day);
  civil.hour = static_cast<unsigned>(second_of_day / 3600);
  civil.minute = static_cast<unsigned>((second_of_day % 3600) / 60);
  civil.second = static_cast<unsigned>(second_of_day % 60);
  civil.nanos = nanos;
  return civil;
}

std::string format_fraction(int64_t nanos) {
  char buf[16];
  if (nanos == 0) {
    return "";
  } else if (nanos % 1000000 == 0) {
    std::snprintf(buf, sizeof(buf), ".%03lld", static_cast<long long>(nanos / 1000000));
  } else if (nanos % 1000 == 0) {
    std::snprintf(buf, sizeof(buf), ".%06lld", static_cast<long long>(nanos / 1000));
  } else {
    std::snprintf(buf, sizeof(buf), ".%09lld", static_cast<long long>(nanos));
  }
  return buf;
}

std::string format_civil(const CivilTime& civil, char separator) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u%c%02u:%02u:%02u",
                static_cast<long long>(civil.year), civil.month, civil.day, separator,
                civil.hour, civil.minute, civil.second);
  return std::string(buf) + format_fraction(civil.nanos);
}

std::string non_finite(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  return value > 0 ? "inf" : "-inf";
}

std::string to_chars_string(double value, std::chars_format format) {
  char buf[512];
  auto result = std::to_chars(buf, buf + sizeof(buf), value, format);
  if (result.ec != std::errc()) {
    throw std::runtime_error("Canonical: Failed to format number");
  }
  return std::string(buf, result.ptr);
}

// "1.5e-07" -> "1.5e-7", "1e+16" -> "1e16"
std::string compact_exponent(const std::string& scientific) {
  auto e = scientific.find('e');
  if (e == std::string::npos) {
    return scientific;
  }

  std::string mantissa = scientific.substr(0, e);
  std::string exponent = scientific.substr(e + 1);
  bool negative = !exponent.empty() && exponent[0] == '-';
  if (!exponent.empty() && (exponent[0] == '-' || exponent[0] == '+')) {
    exponent.erase(0, 1);
  }
  auto first_digit = exponent.find_first_not_of('0');
  exponent = first_digit == std::string::npos ? "0" : exponent.substr(first_digit);

  return mantissa + "e" + (negative ? "-" : "") + exponent;
}

unsigned parse_digits(const std::string& text, size_t pos, size_t count) {
  if (pos + count > text.size()) {
    throw std::invalid_argument("Timestamp too short: " + text);
  }
  unsigned value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      throw std::invalid_argument("Invalid digit in timestamp: " + text);
    }
    value = value * 10 + static_cast<unsigned>(text[i] - '0');
  }
  return value;
}

void expect_char(const std::string& text, size_t pos, char expected) {
  if (pos >= text.size() || text[pos] != expected) {
    throw std::invalid_argument("Malformed timestamp: " + text);
  }
}

} // namespace

//==============================================
// FIELD JOINING
//==============================================

std::string join_fields(std::initializer_list<std::string> fields) {
  std::string joined;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      joined += FIELD_DELIMITER;
    }
    joined += field;
    first = false;
  }
  return joined;
}


//==============================================
// NUMBERS
//==============================================

std::string format_number(double value) {
  if (!std::isfinite(value)) {
    return non_finite(value);
  }
  return to_chars_string(value, std::chars_format::fixed);
}

std::string format_number_debug(double value) {
  if (!std::isfinite(value)) {
    return non_finite(value);
  }

  if (value == 0.0) {
    return std::signbit(value) ? "-0.0" : "0.0";
  }

  double magnitude = std::fabs(value);
  if (magnitude < 1e-4 || magnitude >= 1e16) {
    return compact_exponent(to_chars_string(value, std::chars_format::scientific));
  }

  std::string text = to_chars_string(value, std::chars_format::fixed);
  if (text.find('.') == std::string::npos) {
    text += ".0";
  }
  return text;
}

std::string format_optional_debug(const std::optional<double>& value) {
  if (!value) {
    return "None";
  }
  return "Some(" + format_number_debug(*value) + ")";
}


//==============================================
// TIMESTAMPS
//==============================================

std::string format_timestamp_display(Timestamp ts) {
  return format_civil(to_civil(ts), ' ') + " UTC";
}

std::string format_timestamp_rfc3339(Timestamp ts) {
  return format_civil(to_civil(ts), 'T') + "Z";
}

Timestamp parse_timestamp_rfc3339(const std::string& text) {
  // YYYY-MM-DDTHH:MM:SS
  unsigned year = parse_digits(text, 0, 4);
  expect_char(text, 4, '-');
  unsigned month = parse_digits(text, 5, 2);
  expect_char(text, 7, '-');
  unsigned day = parse_digits(text, 8, 2);
  if (text.size() <= 10 || (text[10] != 'T' && text[10] != 't' && text[10] != ' ')) {
    throw std::invalid_argument("Malformed timestamp: " + text);
  }
  unsigned hour = parse_digits(text, 11, 2);
  expect_char(text, 13, ':');
  unsigned minute = parse_digits(text, 14, 2);
  expect_char(text, 16, ':');
  unsigned second = parse_digits(text, 17, 2);

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    throw std::invalid_argument("Timestamp field out of range: " + text);
  }

  size_t pos = 19;
  int64_t nanos = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      throw std::invalid_argument("Empty fractional seconds: " + text);
    }
    for (size_t i = digits; i < 9; ++i) {
      nanos *= 10;
    }
  }

  int64_t offset_seconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int sign = text[pos] == '-' ? -1 : 1;
    unsigned offset_hours = parse_digits(text, pos + 1, 2);
    expect_char(text, pos + 3, ':');
    unsigned offset_minutes = parse_digits(text, pos + 4, 2);
    offset_seconds = sign * static_cast<int64_t>(offset_hours * 3600 + offset_minutes * 60);
    pos += 6;
  } else {
    throw std::invalid_argument("Missing timezone designator: " + text);
  }

  if (pos != text.size()) {
    throw std::invalid_argument("Trailing characters in timestamp: " + text);
  }

  int64_t days = days_from_civil(year, month, day);
  int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
  auto since_epoch = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos);
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

} // namespace farmtrace::record
