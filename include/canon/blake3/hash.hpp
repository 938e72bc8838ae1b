#pragma once
#include <canon/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace canon::blake3 {

canon::schema::hash32_t hash(const std::string_view& str);
canon::schema::hash32_t hash(const canon::schema::bytes_view_t& bytes);

/// Hash with a domain tag prepended, so digests of different record kinds
/// never collide even over identical payload bytes.
canon::schema::hash32_t hash(const std::string_view& domain,
                             const canon::schema::bytes_view_t& bytes);

}  // namespace canon::blake3
