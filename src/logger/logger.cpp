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
#include <filesystem>
#include <iostream>

namespace wavemesh::logger {

std::optional<severity_level> parse_severity(const std::string& text) {
  if (text == "trace")   return severity_level::trace;
  if (text == "debug")   return severity_level::debug;
  if (text == "info")    return severity_level::info;
  if (text == "warning") return severity_level::warning;
  if (text == "error")   return severity_level::error;
  if (text == "fatal")   return severity_level::fatal;
  return std::nullopt;
}

void set_min_severity(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace sinks = boost::log::sinks;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;

    // File sink, truncated on every start
    auto backend = boost::make_shared<sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::trunc);
    backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto sink = boost::make_shared<file_sink>(backend);
    sink->set_formatter(formatter);
    boost::log::core::get()->add_sink(sink);

    if (console) {
      auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto csink = boost::make_shared<console_sink>(console_backend);
      csink->set_formatter(formatter);
      boost::log::core::get()->add_sink(csink);
    }

    boost::log::add_common_attributes();
    set_min_severity(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

} // namespace wavemesh::logger
