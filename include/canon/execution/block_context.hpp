#pragma once

#include <canon/schema/primitives.hpp>
#include <cstdint>

namespace canon::execution {

/// Height and time every call in the current block observes.
struct block_context final {
  uint64_t height{};
  canon::schema::timestamp_milliseconds_t timestamp{};
};

}  // namespace canon::execution
