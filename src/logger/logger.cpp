#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace sftpgw::logger {

namespace {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

auto make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage;
}

} // namespace

severity_level parse_severity(const std::string& name) {
    const std::string lowered = boost::algorithm::to_lower_copy(name);
    if (lowered == "trace")   return severity_level::trace;
    if (lowered == "debug")   return severity_level::debug;
    if (lowered == "info")    return severity_level::info;
    if (lowered == "warning" || lowered == "warn") return severity_level::warning;
    if (lowered == "error")   return severity_level::error;
    if (lowered == "fatal")   return severity_level::fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

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

void init_logging(const LogOptions& options) {
    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        if (options.file.empty()) {
            logging::add_console_log(
                std::clog,
                keywords::format = make_formatter(),
                keywords::auto_flush = true
            );
        } else {
            // Convert to absolute path
            std::filesystem::path log_path = std::filesystem::absolute(options.file);
            logging::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::format = make_formatter(),
                keywords::rotation_size = options.rotation_size,
                keywords::auto_flush = true
            );
        }

        logging::add_common_attributes();
        set_min_severity(options.min_level);
        logging::core::get()->set_logging_enabled(true);

        BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized at level " << sftpgw::logger::to_string(options.min_level)
                                << (options.file.empty() ? " on stderr" : " in file " + options.file);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_min_severity(severity_level level) {
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace sftpgw::logger
