#pragma once

#include <rediscache/assert.hpp>
#include <rediscache/detail/operations.hpp>
#include <rediscache/driver.hpp>
#include <rediscache/key.hpp>
#include <rediscache/logger.hpp>
#include <rediscache/options.hpp>

namespace rediscache {

inline auto connect(driver d)
  -> iocoro::awaitable<expected<driver, cache::connect_error<redis_error>>> {
  if (d.is_connected()) {
    co_return unexpected(cache::connect_error<redis_error>{cache::already_connected{}});
  }

  auto c = std::make_shared<client>(d.executor, d.cfg.host, d.cfg.port, to_start_options(d.cfg));
  auto r = co_await c->connect();
  if (!r) {
    REDISCACHE_LOG_WARNING("driver.connect_failed host={} port={} err={}", d.cfg.host, d.cfg.port,
                           r.error().to_string());
    co_return unexpected(cache::connect_error<redis_error>{
      cache::connect_driver_error<redis_error>{translate_error(r.error())}});
  }

  REDISCACHE_LOG_INFO("driver.connected host={} port={}", d.cfg.host, d.cfg.port);
  d.connection = std::move(c);
  co_return std::move(d);
}

inline auto disconnect(driver d)
  -> iocoro::awaitable<expected<driver, cache::disconnect_error<redis_error>>> {
  if (!d.is_connected()) {
    co_return unexpected(cache::disconnect_error<redis_error>{cache::not_connected{}});
  }

  auto r = d.connection->close();
  if (!r) {
    REDISCACHE_LOG_WARNING("driver.disconnect_failed err={}", r.error().to_string());
    co_return unexpected(cache::disconnect_error<redis_error>{
      cache::disconnect_driver_error<redis_error>{shutdown_error{}}});
  }

  REDISCACHE_LOG_INFO("driver.disconnected host={} port={}", d.cfg.host, d.cfg.port);
  d.connection.reset();
  co_return std::move(d);
}

inline auto set(driver d, std::string_view resource_type, std::string_view key,
                std::string_view value, cache::ttl ttl)
  -> iocoro::awaitable<expected<void, cache::set_error<redis_error>>> {
  REDISCACHE_ENSURE(d.is_connected(), "set() on a disconnected driver");

  auto r = co_await detail::set_entry(*d.connection, compose_key(resource_type, key),
                                      std::string{value}, ttl);
  if (!r) {
    co_return unexpected(cache::set_error<redis_error>{
      cache::set_driver_error<redis_error>{translate_error(r.error())}});
  }
  co_return expected<void, cache::set_error<redis_error>>{};
}

inline auto get(driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<std::string, cache::get_error<redis_error>>> {
  REDISCACHE_ENSURE(d.is_connected(), "get() on a disconnected driver");

  auto r = co_await detail::get_entry(*d.connection, compose_key(resource_type, key));
  if (!r) {
    if (r.error().code == client_errc::not_found) {
      co_return unexpected(cache::get_error<redis_error>{cache::got_too_few_records{}});
    }
    co_return unexpected(cache::get_error<redis_error>{
      cache::get_driver_error<redis_error>{translate_error(r.error())}});
  }
  co_return std::move(*r);
}

inline auto del(driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<void, cache::delete_error<redis_error>>> {
  REDISCACHE_ENSURE(d.is_connected(), "del() on a disconnected driver");

  auto r = co_await detail::del_entry(*d.connection, compose_key(resource_type, key));
  if (!r) {
    co_return unexpected(cache::delete_error<redis_error>{
      cache::delete_driver_error<redis_error>{translate_error(r.error())}});
  }
  co_return expected<void, cache::delete_error<redis_error>>{};
}

}  // namespace rediscache
