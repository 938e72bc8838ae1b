#pragma once
#include <canon/schema/primitives.hpp>
#include <optional>
#include <span>

namespace canon::schema::encoding {

// Encoder selection is a build-time setting: callers name the library tag
// (encoder<scale_encoder_tag>) and never touch the codec directly, so the
// wire format can be swapped without changing ledger code.
template <typename Library>
struct encoder {
  template <typename T>
  canon::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, canon::schema::bytes_t& out);

  template <typename T>
  T decode(const canon::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const canon::schema::bytes_view_t& bytes);
};

}  // namespace canon::schema::encoding
