#ifndef HASHRANGE_LOGGER_HPP
#define HASHRANGE_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace hashrange::logger {

struct LogConfig {
    boost::log::trivial::severity_level min_level = boost::log::trivial::info;
    // Rotating file sink in addition to the console when set
    std::optional<std::string> log_file;
};

// Installs console (and optional file) sinks, common attributes and the severity filter.
// Replaces any sinks installed by an earlier call
void init_logging(const LogConfig& config);

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a severity.
// Throws std::invalid_argument for anything else
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace hashrange::logger

#endif // HASHRANGE_LOGGER_HPP
