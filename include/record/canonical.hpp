#ifndef FARMTRACE_RECORD_CANONICAL_HPP
#define FARMTRACE_RECORD_CANONICAL_HPP

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>

namespace farmtrace::record {

using Timestamp = std::chrono::system_clock::time_point;

// Hash inputs are stage fields joined with this delimiter in a fixed order.
// The delimiter is not escaped: anchored hashes depend on the exact bytes.
constexpr char FIELD_DELIMITER = '-';

std::string join_fields(std::initializer_list<std::string> fields);


// ---- NUMBERS ----
// Shortest round-trip decimal, never an exponent, no trailing ".0":
// 100 -> "100", 12.5 -> "12.5"
std::string format_number(double value);
// Debug form: always a fractional part, exponent below 1e-4 or from 1e16:
// 22 -> "22.0", 1e16 -> "1e16"
std::string format_number_debug(double value);
// "Some(<debug>)" or "None"
std::string format_optional_debug(const std::optional<double>& value);


// ---- TIMESTAMPS ----
// Fractional seconds are printed with 0, 3, 6 or 9 digits, whichever is
// the shortest exact form.

// "2024-05-01 10:20:30.123456789 UTC"
std::string format_timestamp_display(Timestamp ts);
// "2024-05-01T10:20:30.123456789Z"
std::string format_timestamp_rfc3339(Timestamp ts);
// Accepts "T" or space separator, optional fraction, "Z" or "+HH:MM"/"-HH:MM".
// Throws std::invalid_argument on malformed input.
Timestamp parse_timestamp_rfc3339(const std::string& text);

} // namespace farmtrace::record

#endif // FARMTRACE_RECORD_CANONICAL_HPP
