#include "core/util/log.hpp"

#include <iostream>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include "core/util/canonical.hpp"

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace veg21::log {

std::ostream& operator<<(std::ostream& strm, Severity level) {
  static const char* strings[] = {"dbg", "info", "warn", "err"};

  if (static_cast<std::size_t>(level) < sizeof(strings) / sizeof(*strings)) {
    strm << strings[level];
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

std::optional<Severity> severity_from_string(std::string_view text) {
  const std::string value = util::lowercase_copy(util::trim_copy(text));
  if (value == "debug" || value == "dbg") {
    return DEBUG;
  }
  if (value == "info") {
    return INFO;
  }
  if (value == "warn" || value == "warning") {
    return WARN;
  }
  if (value == "error" || value == "err") {
    return ERROR;
  }
  return std::nullopt;
}

void init(Severity min_severity, const std::string& log_file) {
  logging::core::get()->remove_all_sinks();

  const auto format =
      (expr::stream << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                        "%Y-%m-%d %H:%M:%S")
                    << " [" << expr::attr<std::string>("Channel") << "] <" << a_severity << "> "
                    << expr::smessage);

  logging::add_console_log(std::clog, keywords::filter = (a_severity >= min_severity),
                           keywords::format = format);

  if (!log_file.empty()) {
    logging::add_file_log(keywords::file_name = log_file,
                          keywords::open_mode = std::ios_base::app,
                          keywords::auto_flush = true,
                          keywords::filter = (a_severity >= min_severity),
                          keywords::format = format);
  }

  logging::add_common_attributes();
}

}  // namespace veg21::log
