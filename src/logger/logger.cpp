#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/support/date_time.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace dnskv {
namespace logging {

std::optional<severity_level> parse_severity(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lowered == "trace") return boost::log::trivial::trace;
  if (lowered == "debug") return boost::log::trivial::debug;
  if (lowered == "info") return boost::log::trivial::info;
  if (lowered == "warning" || lowered == "warn") return boost::log::trivial::warning;
  if (lowered == "error") return boost::log::trivial::error;
  if (lowered == "fatal") return boost::log::trivial::fatal;
  return std::nullopt;
}

severity_level severity_from_environment(severity_level fallback) {
  const char* value = std::getenv(LOG_LEVEL_ENV);
  if (value == nullptr) {
    return fallback;
  }

  auto level = parse_severity(value);
  if (!level) {
    std::cerr << "Ignoring unknown " << LOG_LEVEL_ENV << " level: " << value << '\n';
    return fallback;
  }
  return *level;
}

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace expr = boost::log::expressions;
  namespace keywords = boost::log::keywords;

  try {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<severity_level, char>("Severity");

    // Console output goes to stderr so that stdout carries only command results
    boost::log::add_console_log(
      std::clog,
      keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
      keywords::auto_flush = true
    );

    if (!log_file.empty()) {
      boost::log::add_file_log(
        keywords::file_name = log_file,
        keywords::format = (
          expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << boost::log::trivial::severity << "]"
            << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
            << " " << expr::smessage
        ),
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    // Add commonly used attributes
    boost::log::add_common_attributes();

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

} // namespace logging
} // namespace dnskv
