#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace stash::logger {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

//==============================================
// SETUP
//==============================================

void init_logging(const std::string& log_file, logging::trivial::severity_level min_level) {
  logging::core::get()->remove_all_sinks();

  auto formatter = expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
    << " [" << logging::trivial::severity << "]"
    << " " << expr::smessage;

  if (log_file.empty()) {
    auto sink = logging::add_console_log(std::clog, keywords::auto_flush = true);
    sink->set_formatter(formatter);
  } else {
    // Log file path is resolved once so later chdir calls do not move the log
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }

    auto backend = boost::make_shared<logging::sinks::text_file_backend>(
      keywords::file_name = log_path.string(),
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::rotation_size = 10 * 1024 * 1024);
    backend->auto_flush(true);

    using text_sink = logging::sinks::synchronous_sink<logging::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(formatter);
    logging::core::get()->add_sink(sink);
  }

  logging::add_common_attributes();
  set_log_level(min_level);
  logging::core::get()->set_logging_enabled(true);

  BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                           << (log_file.empty() ? std::string(" on console") : " with file: " + log_file);
}

void set_log_level(logging::trivial::severity_level level) {
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}


//==============================================
// HELPERS
//==============================================

logging::trivial::severity_level parse_severity(const std::string& name) {
  logging::trivial::severity_level level;
  if (!logging::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Logger: Unknown log level: " + name);
  }
  return level;
}

} // namespace stash::logger
