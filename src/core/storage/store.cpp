#include "core/storage/store.hpp"

#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "core/ledger/account.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace veg21 {
namespace {

constexpr std::string_view kStateHeader = "# veg21 ledger state v1";
constexpr std::string_view kLogHeader = "# veg21 ledger transactions v1";
constexpr std::string_view kNone = "-";

std::string optional_time_text(const std::optional<Timestamp>& ts) {
  if (!ts.has_value()) {
    return std::string{kNone};
  }
  return std::to_string(util::to_unix_nanos(*ts));
}

bool parse_optional_time(std::string_view text, std::optional<Timestamp>& out) {
  if (text == kNone) {
    out.reset();
    return true;
  }
  const auto nanos = util::parse_int64(text);
  if (!nanos.has_value()) {
    return false;
  }
  out = util::from_unix_nanos(*nanos);
  return true;
}

bool parse_time(std::string_view text, Timestamp& out) {
  const auto nanos = util::parse_int64(text);
  if (!nanos.has_value()) {
    return false;
  }
  out = util::from_unix_nanos(*nanos);
  return true;
}

bool parse_amount(std::string_view text, double& out) {
  const auto value = util::parse_double(text);
  if (!value.has_value()) {
    return false;
  }
  out = *value;
  return true;
}

bool parse_hex_text(std::string_view text, std::string& out) {
  auto decoded = util::from_hex(text);
  if (!decoded.has_value()) {
    return false;
  }
  out = std::move(*decoded);
  return true;
}

std::vector<std::string> lines_of(std::string_view blob) {
  std::vector<std::string> lines;
  std::istringstream in{std::string{blob}};
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

bool parse_reward_line(const std::vector<std::string_view>& fields, Reward& out) {
  if (fields.size() != 9) {
    return false;
  }
  const auto category = reward_category_from_name(fields[2]);
  const auto status = reward_status_from_name(fields[5]);
  if (!category.has_value() || !status.has_value()) {
    return false;
  }
  out.category = *category;
  out.status = *status;
  if (!parse_hex_text(fields[1], out.id) || !parse_amount(fields[3], out.amount) ||
      !parse_hex_text(fields[4], out.description) ||
      !parse_optional_time(fields[6], out.unlocked_at) ||
      !parse_optional_time(fields[7], out.claimed_at)) {
    return false;
  }
  if (fields[8] == kNone) {
    out.milestone_day.reset();
  } else {
    const auto day = util::parse_int64(fields[8]);
    if (!day.has_value() || *day < std::numeric_limits<int>::min() ||
        *day > std::numeric_limits<int>::max()) {
      return false;
    }
    out.milestone_day = static_cast<int>(*day);
  }
  return !out.id.empty();
}

bool parse_stake_line(const std::vector<std::string_view>& fields, Stake& out) {
  if (fields.size() != 7) {
    return false;
  }
  return parse_hex_text(fields[1], out.id) && parse_amount(fields[2], out.principal) &&
         parse_time(fields[3], out.opened_at) && parse_optional_time(fields[4], out.closed_at) &&
         parse_amount(fields[5], out.accrued_rewards) && parse_hex_text(fields[6], out.tx_hash) &&
         !out.id.empty();
}

bool parse_contribution_line(const std::vector<std::string_view>& fields, Contribution& out) {
  if (fields.size() != 6) {
    return false;
  }
  return parse_hex_text(fields[1], out.id) && parse_hex_text(fields[2], out.cause_id) &&
         parse_amount(fields[3], out.amount) && parse_time(fields[4], out.timestamp) &&
         parse_hex_text(fields[5], out.tx_hash) && !out.id.empty();
}

std::vector<std::pair<std::string, std::string>> detail_fields(const TransactionDetail& detail) {
  if (const auto* grant = std::get_if<GrantDetail>(&detail)) {
    return {{"account_id", grant->account_id}, {"secondary", util::double_to_text(grant->secondary)}};
  }
  if (const auto* claim = std::get_if<ClaimDetail>(&detail)) {
    return {{"reward_id", claim->reward_id}};
  }
  if (const auto* contribute = std::get_if<ContributeDetail>(&detail)) {
    return {{"cause_id", contribute->cause_id}, {"contribution_id", contribute->contribution_id}};
  }
  if (const auto* transfer = std::get_if<TransferDetail>(&detail)) {
    return {{"to_address", transfer->to_address}, {"note", transfer->note}};
  }
  if (const auto* receive = std::get_if<ReceiveDetail>(&detail)) {
    return {{"from_address", receive->from_address}, {"note", receive->note}};
  }
  if (const auto* stake = std::get_if<StakeDetail>(&detail)) {
    return {{"stake_id", stake->stake_id}};
  }
  if (const auto* unstake = std::get_if<UnstakeDetail>(&detail)) {
    return {{"stake_id", unstake->stake_id},
            {"principal", util::double_to_text(unstake->principal)},
            {"accrued", util::double_to_text(unstake->accrued)}};
  }
  if (const auto* check_in = std::get_if<CheckInDetail>(&detail)) {
    return {{"description", check_in->description}};
  }
  if (const auto* validation = std::get_if<ValidationDetail>(&detail)) {
    return {{"description", validation->description}};
  }
  return {};
}

std::optional<TransactionDetail> parse_detail(TransactionKind kind, std::string_view payload) {
  auto fields = util::parse_canonical_map(payload);
  const auto number = [&](const char* key) { return util::parse_double(fields[key]); };

  switch (kind) {
    case TransactionKind::Grant: {
      const auto secondary = number("secondary");
      if (!secondary.has_value()) {
        return std::nullopt;
      }
      return GrantDetail{.account_id = fields["account_id"], .secondary = *secondary};
    }
    case TransactionKind::ClaimReward:
      return ClaimDetail{.reward_id = fields["reward_id"]};
    case TransactionKind::Contribute:
      return ContributeDetail{.cause_id = fields["cause_id"],
                              .contribution_id = fields["contribution_id"]};
    case TransactionKind::Transfer:
      return TransferDetail{.to_address = fields["to_address"], .note = fields["note"]};
    case TransactionKind::Receive:
      return ReceiveDetail{.from_address = fields["from_address"], .note = fields["note"]};
    case TransactionKind::StakeTokens:
      return StakeDetail{.stake_id = fields["stake_id"]};
    case TransactionKind::UnstakeTokens: {
      const auto principal = number("principal");
      const auto accrued = number("accrued");
      if (!principal.has_value() || !accrued.has_value()) {
        return std::nullopt;
      }
      return UnstakeDetail{
          .stake_id = fields["stake_id"], .principal = *principal, .accrued = *accrued};
    }
    case TransactionKind::CheckIn:
      return CheckInDetail{.description = fields["description"]};
    case TransactionKind::Validation:
      return ValidationDetail{.description = fields["description"]};
  }
  return std::nullopt;
}

std::string encode_metadata(const std::vector<std::pair<std::string, std::string>>& metadata) {
  if (metadata.empty()) {
    return std::string{kNone};
  }
  std::string out;
  for (const auto& [key, value] : metadata) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(util::to_hex(key));
    out.push_back(':');
    out.append(util::to_hex(value));
  }
  return out;
}

bool parse_metadata(std::string_view text, std::vector<std::pair<std::string, std::string>>& out) {
  out.clear();
  if (text == kNone) {
    return true;
  }
  for (const auto entry : util::split_fields(text, ',')) {
    const auto colon = entry.find(':');
    if (colon == std::string_view::npos) {
      return false;
    }
    std::string key;
    std::string value;
    if (!parse_hex_text(entry.substr(0, colon), key) ||
        !parse_hex_text(entry.substr(colon + 1U), value)) {
      return false;
    }
    out.emplace_back(std::move(key), std::move(value));
  }
  return true;
}

bool parse_transaction_line(const std::vector<std::string_view>& fields, Transaction& out) {
  if (fields.size() != 9 || fields[0] != "tx") {
    return false;
  }
  const auto kind = transaction_kind_from_name(fields[2]);
  const auto status = transaction_status_from_name(fields[4]);
  if (!kind.has_value() || !status.has_value()) {
    return false;
  }
  std::string detail_payload;
  if (!parse_hex_text(fields[1], out.id) || !parse_amount(fields[3], out.amount) ||
      !parse_time(fields[5], out.timestamp) || !parse_hex_text(fields[6], out.tx_hash) ||
      !parse_hex_text(fields[7], detail_payload) || !parse_metadata(fields[8], out.metadata)) {
    return false;
  }
  auto detail = parse_detail(*kind, detail_payload);
  if (!detail.has_value()) {
    return false;
  }
  out.detail = std::move(*detail);
  out.status = *status;
  return !out.id.empty();
}

}  // namespace

Store::Store(std::shared_ptr<IKeyValueBackend> backend) : backend_(std::move(backend)) {}

LedgerSnapshot Store::load() const {
  const auto blob = backend_->get(kStateKey);
  if (!blob.has_value()) {
    return ledger::make_default_snapshot();
  }
  auto decoded = decode_snapshot(*blob);
  if (!decoded.has_value()) {
    LOG_WARN << "Stored ledger state is unreadable; starting from defaults.";
    return ledger::make_default_snapshot();
  }
  return std::move(*decoded);
}

std::vector<Transaction> Store::load_log() const {
  const auto blob = backend_->get(kTransactionsKey);
  if (!blob.has_value()) {
    return {};
  }
  auto decoded = decode_log(*blob);
  if (!decoded.has_value()) {
    LOG_WARN << "Stored transaction log is unreadable; starting with an empty log.";
    return {};
  }
  return std::move(*decoded);
}

Result Store::save(const LedgerSnapshot& state) {
  return backend_->put(kStateKey, encode_snapshot(state));
}

Result Store::save_log(const std::vector<Transaction>& transactions) {
  return backend_->put(kTransactionsKey, encode_log(transactions));
}

Result Store::reset() {
  const Result state_erased = backend_->erase(kStateKey);
  const Result log_erased = backend_->erase(kTransactionsKey);
  if (!state_erased.ok) {
    return state_erased;
  }
  if (!log_erased.ok) {
    return log_erased;
  }
  return Result::success("Persisted ledger cleared.");
}

std::string Store::encode_snapshot(const LedgerSnapshot& state) {
  std::ostringstream out;
  out << kStateHeader << '\n';
  out << "account\t" << (state.initialized ? '1' : '0') << '\t' << util::to_hex(state.account_id)
      << '\n';
  out << "balance\t" << util::double_to_text(state.balance.primary) << '\t'
      << util::double_to_text(state.balance.secondary) << '\n';
  out << "totals\t" << util::double_to_text(state.total_earned) << '\t'
      << util::double_to_text(state.total_contributed) << '\t'
      << util::double_to_text(state.total_staked) << '\t'
      << util::double_to_text(state.total_staking_rewards) << '\n';

  for (const auto& reward : state.rewards) {
    out << "reward\t" << util::to_hex(reward.id) << '\t' << reward_category_name(reward.category)
        << '\t' << util::double_to_text(reward.amount) << '\t' << util::to_hex(reward.description)
        << '\t' << reward_status_name(reward.status) << '\t'
        << optional_time_text(reward.unlocked_at) << '\t' << optional_time_text(reward.claimed_at)
        << '\t'
        << (reward.milestone_day.has_value() ? std::to_string(*reward.milestone_day)
                                             : std::string{kNone})
        << '\n';
  }
  for (const auto& stake : state.stakes) {
    out << "stake\t" << util::to_hex(stake.id) << '\t' << util::double_to_text(stake.principal)
        << '\t' << util::to_unix_nanos(stake.opened_at) << '\t'
        << optional_time_text(stake.closed_at) << '\t'
        << util::double_to_text(stake.accrued_rewards) << '\t' << util::to_hex(stake.tx_hash)
        << '\n';
  }
  for (const auto& contribution : state.contributions) {
    out << "contribution\t" << util::to_hex(contribution.id) << '\t'
        << util::to_hex(contribution.cause_id) << '\t'
        << util::double_to_text(contribution.amount) << '\t'
        << util::to_unix_nanos(contribution.timestamp) << '\t'
        << util::to_hex(contribution.tx_hash) << '\n';
  }
  return out.str();
}

std::optional<LedgerSnapshot> Store::decode_snapshot(std::string_view blob) {
  const auto lines = lines_of(blob);
  if (lines.empty() || lines.front() != kStateHeader) {
    return std::nullopt;
  }

  LedgerSnapshot state;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto fields = util::split_fields(lines[i]);
    const std::string_view type = fields.front();

    if (type == "account") {
      if (fields.size() != 3 || (fields[1] != "0" && fields[1] != "1") ||
          !parse_hex_text(fields[2], state.account_id)) {
        return std::nullopt;
      }
      state.initialized = fields[1] == "1";
    } else if (type == "balance") {
      if (fields.size() != 3 || !parse_amount(fields[1], state.balance.primary) ||
          !parse_amount(fields[2], state.balance.secondary)) {
        return std::nullopt;
      }
    } else if (type == "totals") {
      if (fields.size() != 5 || !parse_amount(fields[1], state.total_earned) ||
          !parse_amount(fields[2], state.total_contributed) ||
          !parse_amount(fields[3], state.total_staked) ||
          !parse_amount(fields[4], state.total_staking_rewards)) {
        return std::nullopt;
      }
    } else if (type == "reward") {
      Reward reward;
      if (!parse_reward_line(fields, reward)) {
        return std::nullopt;
      }
      state.rewards.push_back(std::move(reward));
    } else if (type == "stake") {
      Stake stake;
      if (!parse_stake_line(fields, stake)) {
        return std::nullopt;
      }
      state.stakes.push_back(std::move(stake));
    } else if (type == "contribution") {
      Contribution contribution;
      if (!parse_contribution_line(fields, contribution)) {
        return std::nullopt;
      }
      state.contributions.push_back(std::move(contribution));
    } else {
      return std::nullopt;
    }
  }

  if (state.balance.primary < 0.0 || state.balance.secondary < 0.0) {
    return std::nullopt;
  }
  return state;
}

std::string Store::encode_log(const std::vector<Transaction>& transactions) {
  std::ostringstream out;
  out << kLogHeader << '\n';
  for (const auto& tx : transactions) {
    out << "tx\t" << util::to_hex(tx.id) << '\t' << transaction_kind_name(tx.kind()) << '\t'
        << util::double_to_text(tx.amount) << '\t' << transaction_status_name(tx.status) << '\t'
        << util::to_unix_nanos(tx.timestamp) << '\t' << util::to_hex(tx.tx_hash) << '\t'
        << util::to_hex(util::canonical_join(detail_fields(tx.detail))) << '\t'
        << encode_metadata(tx.metadata) << '\n';
  }
  return out.str();
}

std::optional<std::vector<Transaction>> Store::decode_log(std::string_view blob) {
  const auto lines = lines_of(blob);
  if (lines.empty() || lines.front() != kLogHeader) {
    return std::nullopt;
  }

  std::vector<Transaction> transactions;
  transactions.reserve(lines.size() - 1U);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    Transaction tx;
    if (!parse_transaction_line(util::split_fields(lines[i]), tx)) {
      return std::nullopt;
    }
    transactions.push_back(std::move(tx));
  }
  return transactions;
}

}  // namespace veg21
