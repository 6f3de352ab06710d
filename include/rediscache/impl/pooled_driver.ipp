#pragma once

#include <rediscache/assert.hpp>
#include <rediscache/detail/operations.hpp>
#include <rediscache/key.hpp>
#include <rediscache/logger.hpp>
#include <rediscache/options.hpp>
#include <rediscache/pooled_driver.hpp>

namespace rediscache {

namespace detail {

inline auto make_pool_config(config const& cfg) -> pool_config {
  return pool_config{
    .size = cfg.pool_size,
    .checkout_timeout = cfg.timeout,
    .creation = cfg.pool_creation,
  };
}

}  // namespace detail

inline auto connect(pooled_driver d)
  -> iocoro::awaitable<expected<pooled_driver, cache::connect_error<redis_error>>> {
  if (d.is_connected()) {
    co_return unexpected(cache::connect_error<redis_error>{cache::already_connected{}});
  }

  auto pool = std::make_shared<connection_pool>(d.executor, d.cfg.host, d.cfg.port,
                                                to_start_options(d.cfg),
                                                detail::make_pool_config(d.cfg));
  auto r = co_await pool->start(d.cfg.pool_start_timeout);
  if (!r) {
    REDISCACHE_LOG_WARNING("pooled_driver.start_failed host={} port={} err={}", d.cfg.host,
                           d.cfg.port, r.error().to_string());
    co_return unexpected(cache::connect_error<redis_error>{
      cache::connect_driver_error<redis_error>{start_error{}}});
  }

  REDISCACHE_LOG_INFO("pooled_driver.connected host={} port={} size={}", d.cfg.host, d.cfg.port,
                      d.cfg.pool_size);
  d.pool = std::move(pool);
  co_return std::move(d);
}

inline auto disconnect(pooled_driver d)
  -> iocoro::awaitable<expected<pooled_driver, cache::disconnect_error<redis_error>>> {
  if (!d.is_connected()) {
    co_return unexpected(cache::disconnect_error<redis_error>{cache::not_connected{}});
  }

  auto r = co_await d.pool->shutdown(d.cfg.timeout);
  if (!r) {
    REDISCACHE_LOG_WARNING("pooled_driver.shutdown_failed err={}", r.error().to_string());
    co_return unexpected(cache::disconnect_error<redis_error>{
      cache::disconnect_driver_error<redis_error>{shutdown_error{}}});
  }

  REDISCACHE_LOG_INFO("pooled_driver.disconnected host={} port={}", d.cfg.host, d.cfg.port);
  d.pool.reset();
  co_return std::move(d);
}

inline auto set(pooled_driver d, std::string_view resource_type, std::string_view key,
                std::string_view value, cache::ttl ttl)
  -> iocoro::awaitable<expected<void, cache::set_error<redis_error>>> {
  REDISCACHE_ENSURE(d.is_connected(), "set() on a disconnected driver");

  auto composed = compose_key(resource_type, key);
  auto owned_value = std::string{value};
  auto r = co_await d.pool->apply([&](client& c) {
    return detail::set_entry(c, composed, owned_value, ttl);
  });
  if (!r) {
    co_return unexpected(cache::set_error<redis_error>{
      cache::set_driver_error<redis_error>{translate_error(r.error())}});
  }
  co_return expected<void, cache::set_error<redis_error>>{};
}

inline auto get(pooled_driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<std::string, cache::get_error<redis_error>>> {
  REDISCACHE_ENSURE(d.is_connected(), "get() on a disconnected driver");

  auto composed = compose_key(resource_type, key);
  auto r = co_await d.pool->apply([&](client& c) { return detail::get_entry(c, composed); });
  if (!r) {
    if (r.error().code == client_errc::not_found) {
      co_return unexpected(cache::get_error<redis_error>{cache::got_too_few_records{}});
    }
    co_return unexpected(cache::get_error<redis_error>{
      cache::get_driver_error<redis_error>{translate_error(r.error())}});
  }
  co_return std::move(*r);
}

inline auto del(pooled_driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<void, cache::delete_error<redis_error>>> {
  REDISCACHE_ENSURE(d.is_connected(), "del() on a disconnected driver");

  auto composed = compose_key(resource_type, key);
  auto r = co_await d.pool->apply([&](client& c) { return detail::del_entry(c, composed); });
  if (!r) {
    co_return unexpected(cache::delete_error<redis_error>{
      cache::delete_driver_error<redis_error>{translate_error(r.error())}});
  }
  co_return expected<void, cache::delete_error<redis_error>>{};
}

}  // namespace rediscache
