#ifndef SFTPGW_LOGGER_HPP
#define SFTPGW_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace sftpgw::logger {

using severity_level = boost::log::trivial::severity_level;

struct LogOptions {
    // Empty file name logs to stderr; stdout may be carrying the SFTP stream
    std::string file;
    severity_level min_level = severity_level::info;
    std::size_t rotation_size = 10 * 1024 * 1024;
};

// Parses "trace", "debug", "info", "warning", "error" or "fatal" (case insensitive)
severity_level parse_severity(const std::string& name);

// Convert severity level to string for formatting
const char* to_string(severity_level level);

// Initialize logging system with console or rotating file sink
void init_logging(const LogOptions& options);

// Changes the minimum severity of an initialized logging system
void set_min_severity(severity_level level);

} // namespace sftpgw::logger

#endif // SFTPGW_LOGGER_HPP
