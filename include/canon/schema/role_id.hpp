#pragma once

#include <canon/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Capabilities checked on direct calls: registry administration, relaying
// anchors, treasury operations and receipt minting.
namespace canon::schema {

enum class role_id_t : uint8_t {
  admin = 0,
  relayer = 1,
  treasury = 2,
  minter = 3
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"relayer", role_id_t::relayer},
    std::pair<std::string_view, role_id_t>{"treasury", role_id_t::treasury},
    std::pair<std::string_view, role_id_t>{"minter", role_id_t::minter},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return name_of(value, kRoleIdMappings);
}

}  // namespace canon::schema
