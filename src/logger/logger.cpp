#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace hashrange::logger {

void init_logging(const LogConfig& config) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    // Remove any existing sinks to prevent duplicates
    logging::core::get()->remove_all_sinks();

    const auto format = (
        expr::stream
            << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
            << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << " [" << logging::trivial::severity << "] "
            << expr::smessage
    );

    logging::add_console_log(
        std::clog,
        keywords::format = format,
        keywords::auto_flush = true
    );

    if (config.log_file) {
        logging::add_file_log(
            keywords::file_name = *config.log_file,
            keywords::format = format,
            keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
            keywords::auto_flush = true
        );
    }

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= config.min_level);
    logging::core::get()->set_logging_enabled(true);
}

boost::log::trivial::severity_level parse_severity(const std::string& name) {
    if (name == "trace")   return boost::log::trivial::trace;
    if (name == "debug")   return boost::log::trivial::debug;
    if (name == "info")    return boost::log::trivial::info;
    if (name == "warning") return boost::log::trivial::warning;
    if (name == "error")   return boost::log::trivial::error;
    if (name == "fatal")   return boost::log::trivial::fatal;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace hashrange::logger
