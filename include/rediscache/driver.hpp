#pragma once

#include <rediscache/cache/driver.hpp>
#include <rediscache/client.hpp>
#include <rediscache/config.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/redis_error.hpp>

#include <iocoro/any_io_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace rediscache {

/// Cache driver state over one long-lived connection.
///
/// A plain value: `connect()` and `disconnect()` return the next state and leave their argument
/// untouched. Copies share the connection.
///
///   auto d = make_driver(ctx.get_executor(), cfg);
///   auto connected = co_await connect(d);
///   co_await set(*connected, "session", "42", "payload", std::chrono::seconds{60});
///   auto value = co_await get(*connected, "session", "42");
///   co_await disconnect(*connected);
struct driver {
  iocoro::any_io_executor executor;
  config cfg;

  /// Set by connect(), cleared by disconnect().
  std::shared_ptr<client> connection{};

  [[nodiscard]] auto is_connected() const noexcept -> bool { return connection != nullptr; }
};

[[nodiscard]] inline auto make_driver(iocoro::any_io_executor ex, config cfg = {}) -> driver {
  return driver{.executor = ex, .cfg = std::move(cfg), .connection = nullptr};
}

/// Open a client with the translated start options.
///
/// Errors: `already_connected` without any I/O, or the translated client error.
auto connect(driver d) -> iocoro::awaitable<expected<driver, cache::connect_error<redis_error>>>;

/// Close the client. Errors: `not_connected`, or `shutdown_error` when closing fails.
auto disconnect(driver d)
  -> iocoro::awaitable<expected<driver, cache::disconnect_error<redis_error>>>;

/// Store `value`, then apply `ttl` (EXPIRE) or clear any previous expiry (PERSIST).
/// The two commands are not atomic. Calling it on a disconnected state is fatal.
auto set(driver d, std::string_view resource_type, std::string_view key, std::string_view value,
         cache::ttl ttl) -> iocoro::awaitable<expected<void, cache::set_error<redis_error>>>;

/// A missing entry is `got_too_few_records`. Calling it on a disconnected state is fatal.
auto get(driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<std::string, cache::get_error<redis_error>>>;

/// Deleting a missing entry succeeds. Calling it on a disconnected state is fatal.
auto del(driver d, std::string_view resource_type, std::string_view key)
  -> iocoro::awaitable<expected<void, cache::delete_error<redis_error>>>;

}  // namespace rediscache

#include <rediscache/impl/driver.ipp>

static_assert(rediscache::cache::driver<rediscache::driver, rediscache::redis_error>);
