#ifndef FARMTRACE_LOGGER_HPP
#define FARMTRACE_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace farmtrace::logger {

// Define severity levels with string conversion
enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

const char* to_string(severity_level level);
// Case-insensitive; "warn" is accepted for warning. nullopt if unknown.
std::optional<severity_level> severity_from_string(const std::string& name);
boost::log::trivial::severity_level to_trivial(severity_level level);

// Console sink always; a text file sink as well when log_file is non-empty.
// Records below min_level are dropped. May be called again to reconfigure.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

} // namespace farmtrace::logger

#endif // FARMTRACE_LOGGER_HPP
