#include <canon/config/options.hpp>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace canon::config {

namespace {

bool parse_hash(const po::variables_map& vm,
                const std::string& key,
                canon::schema::hash32_t& out,
                const bool required_non_zero,
                std::string& error) {
  if (!vm.contains(key)) {
    if (required_non_zero) {
      error = fmt::format("missing required option --{}", key);
      return false;
    }
    return true;
  }
  auto parsed = canon::schema::try_make_hash32(vm[key].as<std::string>());
  if (!parsed.has_value()) {
    error = fmt::format("--{} must be 32 bytes of hex", key);
    return false;
  }
  if (required_non_zero && canon::schema::is_zero(*parsed)) {
    error = fmt::format("--{} must be non-zero", key);
    return false;
  }
  out = *parsed;
  return true;
}

}  // namespace

std::optional<options> parse_options(const std::vector<std::string>& args,
                                     std::string& error) {
  auto out = options{};
  auto config_path = std::string{};
  auto base_fee = std::string{};

  auto description = po::options_description{"canond"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style configuration file")(
      "db-path", po::value<std::string>(&out.db_path)->default_value(out.db_path),
      "RocksDB directory")("chain-id", po::value<std::string>(),
                           "Chain id (hex32) bound into signed requests")(
      "registry-id", po::value<std::string>(),
      "Registry instance id (hex32) bound into signed requests")(
      "base-fee",
      po::value<std::string>(&base_fee)->default_value(
          canon::schema::to_string(canon::execution::kDefaultBaseFee)),
      "Minimum anchor payment")("admin", po::value<std::string>(),
                                "Admin principal (hex32)")(
      "foundation-treasury", po::value<std::string>(),
      "Foundation treasury principal (hex32)")(
      "implementer-treasury", po::value<std::string>(),
      "Implementer treasury principal (hex32)")(
      "receipt-name",
      po::value<std::string>(&out.receipt_name)->default_value(out.receipt_name),
      "Receipt token name")(
      "receipt-symbol",
      po::value<std::string>(&out.receipt_symbol)
          ->default_value(out.receipt_symbol),
      "Receipt token symbol")(
      "minting-enabled",
      po::value<bool>(&out.minting_enabled)->default_value(out.minting_enabled),
      "Enable receipt minting at startup")(
      "auto-mint", po::value<bool>(&out.auto_mint)->default_value(out.auto_mint),
      "Issue a receipt for every committed anchor")(
      "log-level",
      po::value<std::string>(&out.log_level)->default_value(out.log_level),
      "trace, debug, info, warn, error or critical")(
      "log-file", po::value<std::string>(&out.log_file)->default_value(out.log_file),
      "Log file path");

  auto stream = std::ostringstream{};
  stream << description;
  out.usage = stream.str();

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(args).options(description).run(), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        error = fmt::format("cannot open config file {}", path);
        return std::nullopt;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  if (vm.contains("help")) {
    out.show_help = true;
    return out;
  }

  if (!parse_hash(vm, "chain-id", out.domain.chain_id, false, error) ||
      !parse_hash(vm, "registry-id", out.domain.registry_id, false, error) ||
      !parse_hash(vm, "admin", out.admin, true, error) ||
      !parse_hash(vm, "foundation-treasury", out.foundation_treasury, true,
                  error) ||
      !parse_hash(vm, "implementer-treasury", out.implementer_treasury, true,
                  error)) {
    return std::nullopt;
  }

  auto fee = canon::schema::try_make_amount(base_fee);
  if (!fee.has_value()) {
    error = "--base-fee must be an unsigned 128-bit decimal";
    return std::nullopt;
  }
  out.base_fee = *fee;

  if (spdlog::level::from_str(out.log_level) == spdlog::level::off &&
      out.log_level != "off") {
    error = fmt::format("unknown log level {}", out.log_level);
    return std::nullopt;
  }

  return out;
}

std::optional<options> parse_options(const int argc,
                                     char* argv[],
                                     std::string& error) {
  auto args = std::vector<std::string>{};
  for (auto i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_options(args, error);
}

canon::execution::anchor_engine_options make_engine_options(
    const options& value) {
  return canon::execution::anchor_engine_options{
      .domain = value.domain,
      .admin = value.admin,
      .foundation_treasury = value.foundation_treasury,
      .implementer_treasury = value.implementer_treasury,
      .base_fee = value.base_fee};
}

canon::token::receipt_token_options make_token_options(const options& value) {
  return canon::token::receipt_token_options{
      .name = value.receipt_name,
      .symbol = value.receipt_symbol,
      .admin = value.admin,
      .minting_enabled = value.minting_enabled};
}

canon::relay::receipt_issuer_options make_issuer_options(const options& value) {
  return canon::relay::receipt_issuer_options{.minter = value.admin,
                                              .auto_mint = value.auto_mint};
}

}  // namespace canon::config
