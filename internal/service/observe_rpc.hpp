#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace shopstore::service {

// Logs every failed call with its route and latency, then rethrows.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view shop_id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      SHOPSTORE_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      SHOPSTORE_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    SHOPSTORE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("shop_id", shop_id),
                                       observability::StringField("error", ex.what()), observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace shopstore::service
