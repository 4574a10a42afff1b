#ifndef STASH_LOGGER_HPP
#define STASH_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace stash::logger {

// ---- SETUP ----
// Installs a single sink: a text file when log_file is non-empty, the console otherwise.
// Any previously installed sink is removed.
void init_logging(const std::string& log_file = "",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info);

// Adjusts the minimum severity of the installed sink
void set_log_level(boost::log::trivial::severity_level level);


// ---- HELPERS ----
// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a severity.
// Throws std::invalid_argument for anything else.
boost::log::trivial::severity_level parse_severity(const std::string& name);

} // namespace stash::logger

#endif // STASH_LOGGER_HPP
