#pragma once

#include <canon/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: replay result.
// Outcome of re-deriving summary state from the committed event log and
// comparing it with the committed point-lookup state.
namespace canon::schema {

template <uint16_t Version>
struct replay_result;

template <>
struct replay_result<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t event_count{};
  uint64_t last_height{};
  hash32_t state_root{};
  std::vector<std::string> mismatches;
};

using replay_result_t = replay_result<1>;

}  // namespace canon::schema
