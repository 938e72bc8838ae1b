#pragma once

#include <canon/execution/anchor_engine.hpp>
#include <canon/relay/receipt_issuer.hpp>
#include <canon/schema/primitives.hpp>
#include <canon/token/receipt_token.hpp>

#include <optional>
#include <string>
#include <vector>

namespace canon::config {

/// Runtime settings for canond, from the command line and an optional
/// INI-style file. Command-line values win over file values.
struct options final {
  std::string db_path{"canon.db"};
  canon::schema::signing_domain_t domain{};
  canon::schema::amount_t base_fee{canon::execution::kDefaultBaseFee};
  canon::schema::principal_t admin{};
  canon::schema::principal_t foundation_treasury{};
  canon::schema::principal_t implementer_treasury{};
  std::string receipt_name{"Mask Receipt"};
  std::string receipt_symbol{"MASKR"};
  bool minting_enabled{false};
  bool auto_mint{true};
  std::string log_level{"info"};
  std::string log_file{"canond.log"};
  bool show_help{false};
  std::string usage;
};

/// Parse and validate arguments. On failure returns std::nullopt and
/// describes the problem in error.
std::optional<options> parse_options(const std::vector<std::string>& args,
                                     std::string& error);
std::optional<options> parse_options(int argc, char* argv[], std::string& error);

canon::execution::anchor_engine_options make_engine_options(
    const options& value);
canon::token::receipt_token_options make_token_options(const options& value);
canon::relay::receipt_issuer_options make_issuer_options(const options& value);

}  // namespace canon::config
