#include <canon/blake3/hash.hpp>
#include <canon/relay/receipt_issuer.hpp>
#include <canon/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <tuple>

using namespace canon::schema;

namespace canon::relay {

digest_t receipt_content_hash(const anchored_event_t& event) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{
      event.warrant_digest, event.attestation_digest, event.subject_tag,
      event.controller_did_hash, event.assurance_level, event.timestamp});
  return canon::blake3::hash(bytes_view_t{encoded.data(), encoded.size()});
}

receipt_issuer::receipt_issuer(canon::token::receipt_token& token,
                               const receipt_issuer_options& options)
    : token_{token}, minter_{options.minter}, auto_mint_{options.auto_mint} {}

receipt_issuer::~receipt_issuer() {
  detach();
}

void receipt_issuer::attach(canon::execution::anchor_engine& engine) {
  detach();
  subscription_ = engine.subscribe(
      [this](const event_record_t& record) { on_event(record); });
  engine_ = &engine;
}

void receipt_issuer::detach() {
  if (engine_ == nullptr) {
    return;
  }
  engine_->unsubscribe(subscription_);
  engine_ = nullptr;
  subscription_ = {};
}

bool receipt_issuer::attached() const {
  return engine_ != nullptr;
}

void receipt_issuer::on_event(const event_record_t& record) {
  const auto* anchored = std::get_if<anchored_event_t>(&record.event);
  if (anchored == nullptr) {
    return;
  }
  if (!auto_mint_) {
    ++stats_.skipped;
    return;
  }
  auto issued = issue(*anchored);
  if (!issued.ok()) {
    spdlog::error("Receipt for anchor event {} not issued: {} ({})",
                  record.sequence, issued.log, to_string(issued.code));
  }
}

call_result<token_id_t> receipt_issuer::issue(const anchored_event_t& event) {
  auto content_hash = receipt_content_hash(event);
  auto minted = token_.mint(minter_, event.principal, content_hash);
  if (minted.ok()) {
    ++stats_.minted;
    spdlog::info("Issued receipt {} to {}", minted.value,
                 to_hex(event.principal));
    return minted;
  }

  if (minted.code == error_code::duplicate_content_hash) {
    if (auto existing = token_.token_of(content_hash); existing.has_value()) {
      ++stats_.duplicates;
      spdlog::info("Receipt for {} already issued as token {}",
                   to_hex(content_hash), *existing);
      return make_success(*existing);
    }
  }

  ++stats_.failures;
  return minted;
}

void receipt_issuer::set_auto_mint(const bool enabled) {
  auto_mint_ = enabled;
}

bool receipt_issuer::auto_mint() const {
  return auto_mint_;
}

const issuance_stats& receipt_issuer::stats() const {
  return stats_;
}

}  // namespace canon::relay
