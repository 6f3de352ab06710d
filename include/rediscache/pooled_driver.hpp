#pragma once

#include <rediscache/cache/driver.hpp>
#include <rediscache/config.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/pool.hpp>
#include <rediscache/redis_error.hpp>

#include <iocoro/any_io_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace rediscache {

/// Cache driver state over a pool of `cfg.pool_size` connections.
///
/// Same shape and contract as `driver`. Every operation holds one lease for its whole duration,
/// so the two commands of `set()` run on the same connection. Copies share the pool and may be
/// used from several threads at once.
struct pooled_driver {
  iocoro::any_io_executor executor;
  config cfg;

  /// Set by connect(), cleared by disconnect().
  std::shared_ptr<connection_pool> pool{};

  [[nodiscard]] auto is_connected() const noexcept -> bool { return pool != nullptr; }
};

[[nodiscard]] inline auto make_pooled_driver(iocoro::any_io_executor ex, config cfg = {})
  -> pooled_driver {
  return pooled_driver{.executor = ex, .cfg = std::move(cfg), .pool = nullptr};
}

/// Create and start the pool, bounded by `cfg.pool_start_timeout`.
///
/// Errors: `already_connected` without any I/O, or `start_error`.
auto connect(pooled_driver d)
  -> iocoro::awaitable<expected<pooled_driver, cache::connect_error<redis_error>>>;

/// Shut the pool down: new checkouts fail at once, outstanding leases get `cfg.timeout` to come
/// back. Errors: `not_connected`, or `shutdown_error`.
auto disconnect(pooled_driver d)
  -> iocoro::awaitable<expected<pooled_driver, cache::disconnect_error<redis_error>>>;

/// See `set(driver, ...)`. Pool exhaustion surfaces as `pool_error{pool_errc::checkout_timeout}`.
auto set(pooled_driver d, std::string_view resource_type, std::string_view key,
         std::string_view value, cache::ttl ttl)
  -> iocoro::awaitable<expected<void, cache::set_error<redis_error>>>;

auto get(pooled_driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<std::string, cache::get_error<redis_error>>>;

auto del(pooled_driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<void, cache::delete_error<redis_error>>>;

}  // namespace rediscache

#include <rediscache/impl/pooled_driver.ipp>

static_assert(rediscache::cache::driver<rediscache::pooled_driver, rediscache::redis_error>);
