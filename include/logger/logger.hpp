#ifndef WAVEMESH_LOGGER_HPP
#define WAVEMESH_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace wavemesh::logger {

using severity_level = boost::log::trivial::severity_level;

// Maps "trace", "debug", "info", "warning", "error" and "fatal" to a severity level
std::optional<severity_level> parse_severity(const std::string& text);

// Installs a file sink (and optionally a console sink) and sets the minimum severity.
// Any sinks installed earlier are removed first.
void init_logging(const std::string& log_file = "wavemesh.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Raises the core filter so only records at or above min_level pass
void set_min_severity(severity_level min_level);

} // namespace wavemesh::logger

#endif // WAVEMESH_LOGGER_HPP
