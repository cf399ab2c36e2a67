#include "core/config/ledger_config.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace veg21 {
namespace {

Result bad_value(std::string_view key, std::string_view value) {
  return Result::failure(ErrorKind::InvalidConfig,
                         "Invalid value for " + std::string{key} + ": '" + std::string{value} + "'");
}

Result apply_double(const std::unordered_map<std::string, std::string>& fields, const char* key,
                    double& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return Result::success();
  }
  const auto value = util::parse_double(it->second);
  if (!value.has_value()) {
    return bad_value(key, it->second);
  }
  out = *value;
  return Result::success();
}

Result apply_millis(const std::unordered_map<std::string, std::string>& fields, const char* key,
                    std::chrono::milliseconds& out) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return Result::success();
  }
  const auto value = util::parse_int64(it->second);
  if (!value.has_value()) {
    return bad_value(key, it->second);
  }
  out = std::chrono::milliseconds{*value};
  return Result::success();
}

}  // namespace

Result load_ledger_config(std::string_view path, LedgerConfig& config) {
  std::ifstream in(std::string{path});
  if (!in) {
    return Result::failure(ErrorKind::InvalidConfig,
                           "Unable to read config file: " + std::string{path});
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    fields[key] = value;
  }

  LedgerConfig updated = config;
  if (fields.contains("data_dir")) {
    updated.data_dir = fields["data_dir"];
  }
  if (fields.contains("log_level")) {
    updated.log_level = fields["log_level"];
  }
  if (fields.contains("log_file")) {
    updated.log_file = fields["log_file"];
  }
  if (fields.contains("min_address_length")) {
    const auto value = util::parse_int64(fields["min_address_length"]);
    if (!value.has_value() || *value < 0) {
      return bad_value("min_address_length", fields["min_address_length"]);
    }
    updated.min_address_length = static_cast<std::size_t>(*value);
  }

  for (const Result applied : {apply_double(fields, "starting_primary", updated.starting_primary),
                               apply_double(fields, "starting_secondary", updated.starting_secondary),
                               apply_double(fields, "annual_staking_rate", updated.annual_staking_rate),
                               apply_millis(fields, "initialize_delay_ms", updated.initialize_delay),
                               apply_millis(fields, "claim_delay_ms", updated.claim_delay),
                               apply_millis(fields, "operation_delay_ms", updated.operation_delay)}) {
    if (!applied.ok) {
      return applied;
    }
  }

  if (const Result valid = validate_ledger_config(updated); !valid.ok) {
    return valid;
  }

  config = std::move(updated);
  LOG_DBG << "Loaded ledger config from " << path;
  return Result::success("Ledger config loaded.");
}

Result validate_ledger_config(const LedgerConfig& config) {
  if (!std::isfinite(config.starting_primary) || config.starting_primary < 0.0) {
    return Result::failure(ErrorKind::InvalidConfig, "starting_primary must not be negative.");
  }
  if (!std::isfinite(config.starting_secondary) || config.starting_secondary < 0.0) {
    return Result::failure(ErrorKind::InvalidConfig, "starting_secondary must not be negative.");
  }
  if (!std::isfinite(config.annual_staking_rate) || config.annual_staking_rate < 0.0 ||
      config.annual_staking_rate > 1.0) {
    return Result::failure(ErrorKind::InvalidConfig, "annual_staking_rate must be within 0..1.");
  }
  if (config.initialize_delay.count() < 0 || config.claim_delay.count() < 0 ||
      config.operation_delay.count() < 0) {
    return Result::failure(ErrorKind::InvalidConfig, "Delays must not be negative.");
  }
  if (!log::severity_from_string(config.log_level).has_value()) {
    return Result::failure(ErrorKind::InvalidConfig, "Unknown log_level: " + config.log_level);
  }
  return Result::success();
}

Result write_ledger_config(std::string_view path, const LedgerConfig& config) {
  if (path.empty()) {
    return Result::failure(ErrorKind::InvalidConfig, "Config write failed: empty path.");
  }

  std::error_code ec;
  const std::filesystem::path file_path{path};
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorKind::PersistenceFailure,
                             "Unable to create config directory: " + ec.message());
    }
  }

  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Unable to write config file: " + std::string{path});
  }

  out << "# veg21 ledger config\n";
  out << "data_dir=" << config.data_dir << '\n';
  out << "starting_primary=" << util::double_to_text(config.starting_primary) << '\n';
  out << "starting_secondary=" << util::double_to_text(config.starting_secondary) << '\n';
  out << "annual_staking_rate=" << util::double_to_text(config.annual_staking_rate) << '\n';
  out << "min_address_length=" << config.min_address_length << '\n';
  out << "initialize_delay_ms=" << config.initialize_delay.count() << '\n';
  out << "claim_delay_ms=" << config.claim_delay.count() << '\n';
  out << "operation_delay_ms=" << config.operation_delay.count() << '\n';
  out << "log_level=" << config.log_level << '\n';
  out << "log_file=" << config.log_file << '\n';

  if (!out.good()) {
    return Result::failure(ErrorKind::PersistenceFailure,
                           "Failed writing config file: " + std::string{path});
  }
  return Result::success("Ledger config written.");
}

}  // namespace veg21
