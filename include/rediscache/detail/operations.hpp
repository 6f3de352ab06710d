#pragma once

#include <rediscache/cache/driver.hpp>
#include <rediscache/client.hpp>
#include <rediscache/error.hpp>
#include <rediscache/error_info.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/logger.hpp>

#include <iocoro/awaitable.hpp>

#include <string>
#include <utility>

// Cache verbs on one client, shared by both drivers. Results stay in error_info form so the pooled
// driver can run them through connection_pool::apply.
namespace rediscache::detail {

/// SET, then EXPIRE (ttl given) or PERSIST (no ttl).
///
/// An EXPIRE that finds no key means the entry vanished between the two commands; it is reported
/// as `client_errc::unexpected_reply`.
inline auto set_entry(client& c, std::string key, std::string value, cache::ttl ttl)
  -> iocoro::awaitable<expected<void, error_info>> {
  auto stored = co_await c.set(key, value);
  if (!stored) {
    co_return unexpected(std::move(stored.error()));
  }

  if (!ttl.has_value()) {
    auto persisted = co_await c.persist(key);
    if (!persisted) {
      co_return unexpected(std::move(persisted.error()));
    }
    co_return expected<void, error_info>{};
  }

  auto expired = co_await c.expire(key, *ttl);
  if (!expired) {
    if (expired.error().code == client_errc::not_found) {
      REDISCACHE_LOG_WARNING("cache.set_expire_missing key={}", key);
      co_return unexpected(error_info{client_errc::unexpected_reply, "EXPIRE found no key " + key});
    }
    co_return unexpected(std::move(expired.error()));
  }
  co_return expected<void, error_info>{};
}

/// GET; a missing key stays `client_errc::not_found` for the caller to map.
inline auto get_entry(client& c, std::string key)
  -> iocoro::awaitable<expected<std::string, error_info>> {
  co_return co_await c.get(key);
}

/// DEL; a missing key is success.
inline auto del_entry(client& c, std::string key)
  -> iocoro::awaitable<expected<void, error_info>> {
  auto removed = co_await c.del(key);
  if (!removed && removed.error().code != client_errc::not_found) {
    co_return unexpected(std::move(removed.error()));
  }
  co_return expected<void, error_info>{};
}

}  // namespace rediscache::detail
