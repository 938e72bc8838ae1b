#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <canon/config/options.hpp>
#include <canon/crypto/verify.hpp>
#include <canon/execution/anchor_engine.hpp>
#include <canon/relay/receipt_issuer.hpp>
#include <canon/storage/rocksdb/storage.hpp>
#include <canon/token/receipt_token.hpp>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = canon::config::parse_options(argc, argv, error);
  if (!options.has_value()) {
    std::cerr << "canond: " << error << std::endl;
    return 2;
  }
  if (options->show_help) {
    std::cout << options->usage << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options->log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "canond", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options->log_level));

  if (!canon::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1; meta anchors will fail");
  }

  auto storage = canon::storage::make_storage<canon::storage::rocksdb_storage_tag>(
      options->db_path);
  auto engine = canon::execution::anchor_engine{
      storage, canon::config::make_engine_options(*options)};
  auto token = canon::token::receipt_token{
      storage, canon::config::make_token_options(*options)};
  auto issuer = canon::relay::receipt_issuer{
      token, canon::config::make_issuer_options(*options)};
  issuer.attach(engine);

  auto committed = engine.last_committed();
  auto fee_split = canon::ledger::split_fee(engine.base_fee());
  spdlog::info("Registry at height {} root {}", committed.height,
               canon::schema::to_hex(committed.state_root));
  spdlog::info("Base fee {} splits {} foundation / {} implementer",
               canon::schema::to_string(engine.base_fee()),
               canon::schema::to_string(fee_split.foundation_share),
               canon::schema::to_string(fee_split.implementer_share));
  spdlog::info("{} anchors, {} held, paused={}", engine.total_anchors(),
               canon::schema::to_string(engine.held_balance()),
               engine.paused());
  spdlog::info("Receipt token {} ({}): {} live, minting {}", token.name(),
               token.symbol(), token.active_supply(),
               token.minting_enabled() ? "enabled" : "disabled");

  auto replay = engine.replay_events();
  if (!replay.ok) {
    spdlog::error("Event log does not reconcile with committed state ({} "
                  "mismatches)",
                  replay.mismatches.size());
    spdlog::shutdown();
    return 1;
  }

  spdlog::shutdown();
  return 0;
}
