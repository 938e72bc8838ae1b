#include <blake3.h>
#include <canon/blake3/hash.hpp>

namespace canon::blake3 {

namespace {

struct hasher final {
  blake3_hasher state{};

  hasher() { blake3_hasher_init(&state); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state, data, size);
    return *this;
  }

  canon::schema::hash32_t finalize() {
    auto output = canon::schema::hash32_t{};
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<canon::schema::hash32_t>);
    blake3_hasher_finalize(&state, output.data(), output.size());
    return output;
  }
};

}  // namespace

canon::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

canon::schema::hash32_t hash(const canon::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

canon::schema::hash32_t hash(const std::string_view& domain,
                             const canon::schema::bytes_view_t& bytes) {
  return hasher{}
      .update(domain.data(), domain.size())
      .update(bytes.data(), bytes.size())
      .finalize();
}

}  // namespace canon::blake3
