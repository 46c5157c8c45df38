#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace farmtrace::logger {

namespace {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

// timestamp [severity] message
auto make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "] "
        << expr::smessage;
}

} // namespace

// Severity level to string conversion
const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
        default:                      return "UNKNOWN";
    }
}

std::optional<severity_level> severity_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")                      return severity_level::trace;
    if (lower == "debug")                      return severity_level::debug;
    if (lower == "info")                       return severity_level::info;
    if (lower == "warning" || lower == "warn") return severity_level::warning;
    if (lower == "error")                      return severity_level::error;
    if (lower == "fatal")                      return severity_level::fatal;
    return std::nullopt;
}

boost::log::trivial::severity_level to_trivial(severity_level level) {
    switch (level) {
        case severity_level::trace:   return logging::trivial::trace;
        case severity_level::debug:   return logging::trivial::debug;
        case severity_level::info:    return logging::trivial::info;
        case severity_level::warning: return logging::trivial::warning;
        case severity_level::error:   return logging::trivial::error;
        case severity_level::fatal:   return logging::trivial::fatal;
        default:                      return logging::trivial::info;
    }
}

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        // Console sink
        auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
        console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        console_backend->auto_flush(true);
        using console_sink_t = sinks::synchronous_sink<sinks::text_ostream_backend>;
        auto console_sink = boost::make_shared<console_sink_t>(console_backend);
        console_sink->set_formatter(make_formatter());
        logging::core::get()->add_sink(console_sink);

        // Optional file sink
        if (!log_file.empty()) {
            auto file_backend = boost::make_shared<sinks::text_file_backend>();
            std::filesystem::path log_path = std::filesystem::absolute(log_file);
            file_backend->set_file_name_pattern(log_path.string());
            file_backend->set_open_mode(std::ios::out | std::ios::app);
            file_backend->set_rotation_size(10 * 1024 * 1024);  // 10 MB
            file_backend->auto_flush(true);

            using file_sink_t = sinks::synchronous_sink<sinks::text_file_backend>;
            auto file_sink = boost::make_shared<file_sink_t>(file_backend);
            file_sink->set_formatter(make_formatter());
            logging::core::get()->add_sink(file_sink);
        }

        logging::add_common_attributes();
        logging::core::get()->set_filter(logging::trivial::severity >= to_trivial(min_level));
        logging::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(info) << "Logger: Initialized at level " << to_string(min_level)
                                << (log_file.empty() ? "" : " with file " + log_file);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace farmtrace::logger
