#pragma once

#include <canon/schema/error_code.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

// Schema type: call result.
// Outcome envelope for every state-changing entry point: a stable error code,
// the codespace of the rejecting component, a human-readable log line and the
// typed return value on success.
namespace canon::schema {

template <typename T = std::monostate>
struct call_result final {
  error_code code{error_code::ok};
  std::string codespace;
  std::string log;
  T value{};

  bool ok() const { return code == error_code::ok; }
};

template <typename T = std::monostate>
call_result<T> make_success(T value = {}) {
  auto result = call_result<T>{};
  result.value = std::move(value);
  return result;
}

template <typename T = std::monostate>
call_result<T> make_failure(const error_code code,
                            const std::string_view codespace,
                            std::string log) {
  auto result = call_result<T>{};
  result.code = code;
  result.codespace = std::string{codespace};
  result.log = std::move(log);
  return result;
}

/// Re-type a failed result, keeping code, codespace and log.
template <typename T, typename U>
call_result<T> forward_failure(const call_result<U>& failed) {
  return make_failure<T>(failed.code, failed.codespace, failed.log);
}

}  // namespace canon::schema
