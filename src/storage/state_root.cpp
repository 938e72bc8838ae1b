#include <canon/blake3/hash.hpp>
#include <canon/schema/encoding/scale/encoder.hpp>
#include <canon/storage/state_root.hpp>

#include <algorithm>
#include <tuple>

namespace canon::storage {

canon::schema::hash32_t seal_state_rows(std::vector<key_value_entry_t>& rows) {
  std::sort(std::begin(rows), std::end(rows),
            [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  auto encoder = canon::schema::encoding::scale_encoder_t{};
  auto root = canon::schema::make_zero_hash();
  for (const auto& [key, value] : rows) {
    auto material = canon::schema::bytes_t{std::begin(root), std::end(root)};
    encoder.encode(std::tuple{key, value}, material);
    root = canon::blake3::hash(
        canon::schema::bytes_view_t{material.data(), material.size()});
  }
  return root;
}

}  // namespace canon::storage
