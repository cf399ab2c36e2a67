#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

namespace veg21::log {

enum Severity {
  DEBUG,
  INFO,
  WARN,
  ERROR,
};

std::ostream& operator<<(std::ostream& strm, Severity level);

std::optional<Severity> severity_from_string(std::string_view text);

// Replaces any existing sinks. An empty log_file means console only.
void init(Severity min_severity, const std::string& log_file = {});

BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity, "Severity", veg21::log::Severity)

using logger = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

}  // namespace veg21::log

BOOST_LOG_INLINE_GLOBAL_LOGGER_INIT(veg21_ledger_logger, veg21::log::logger) {
  return veg21::log::logger(boost::log::keywords::channel = "ledger");
}

#define LOG_DBG BOOST_LOG_SEV(veg21_ledger_logger::get(), veg21::log::DEBUG)
#define LOG_INFO BOOST_LOG_SEV(veg21_ledger_logger::get(), veg21::log::INFO)
#define LOG_WARN BOOST_LOG_SEV(veg21_ledger_logger::get(), veg21::log::WARN)
#define LOG_ERR BOOST_LOG_SEV(veg21_ledger_logger::get(), veg21::log::ERROR)
