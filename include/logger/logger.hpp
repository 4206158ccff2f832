#ifndef DNSKV_LOGGER_HPP
#define DNSKV_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <optional>
#include <string>

namespace dnskv {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Environment variable holding the default severity
constexpr const char* LOG_LEVEL_ENV = "DNSKV_LOG";

// Maps trace|debug|info|warning|error|fatal, in any case, to a severity
std::optional<severity_level> parse_severity(const std::string& text);

// Severity named by DNSKV_LOG, or fallback when unset or unrecognised
severity_level severity_from_environment(severity_level fallback = boost::log::trivial::info);

// Installs a console sink on stderr and, when log_file is non-empty, a
// rotating file sink. Replaces any sinks installed before.
void init_logging(const std::string& log_file, severity_level min_level);

} // namespace logging
} // namespace dnskv

#endif // DNSKV_LOGGER_HPP
