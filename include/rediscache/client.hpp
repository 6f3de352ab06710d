#pragma once

#include <rediscache/detail/connection.hpp>
#include <rediscache/error_info.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/options.hpp>
#include <rediscache/request.hpp>
#include <rediscache/resp3/message.hpp>

#include <iocoro/any_io_executor.hpp>
#include <iocoro/awaitable.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rediscache {

/// Redis client with typed coroutine commands over a single connection.
///
/// Replies are checked against the shape each command expects:
/// - an error reply (`-ERR ...`) becomes `server_errc::error_reply` with the server text as detail
/// - any other unexpected shape becomes `client_errc::unexpected_reply`
/// - an absent key becomes `client_errc::not_found` (GET, DEL, EXPIRE)
///
/// Usage:
///   client c{ctx.get_executor(), "localhost", 6379, to_start_options(cfg)};
///   co_await c.connect();
///   co_await c.set("user:1", "alice");
///   auto v = co_await c.get("user:1");
///   c.close();
class client {
 public:
  client(iocoro::any_io_executor ex, std::string host, int port,
         std::vector<start_option> options = {})
      : conn_(std::make_unique<detail::connection>(ex)),
        host_(std::move(host)),
        port_(port),
        options_(std::move(options)) {}

  /// Resolve, connect and authenticate as the start options ask.
  auto connect() -> iocoro::awaitable<expected<void, error_info>>;

  /// Close the connection. Idempotent.
  auto close() -> expected<void, error_info> { return conn_->close(); }

  [[nodiscard]] auto is_connected() const noexcept -> bool { return conn_->is_open(); }

  [[nodiscard]] auto host() const noexcept -> std::string const& { return host_; }
  [[nodiscard]] auto port() const noexcept -> int { return port_; }

  /// Raw exchange: one reply per command in `req`, error replies included.
  auto execute(request const& req)
    -> iocoro::awaitable<expected<std::vector<resp3::message>, error_info>> {
    co_return co_await conn_->execute(req);
  }

  /// `SET key value`
  auto set(std::string_view key, std::string_view value)
    -> iocoro::awaitable<expected<void, error_info>>;

  /// `GET key`; a missing key is `not_found`.
  auto get(std::string_view key) -> iocoro::awaitable<expected<std::string, error_info>>;

  /// `DEL key`; nothing removed is `not_found`.
  auto del(std::string_view key) -> iocoro::awaitable<expected<void, error_info>>;

  /// `EXPIRE key seconds`; a missing key is `not_found`.
  auto expire(std::string_view key, std::chrono::seconds ttl)
    -> iocoro::awaitable<expected<void, error_info>>;

  /// `PERSIST key`; true when an expiry was removed.
  auto persist(std::string_view key) -> iocoro::awaitable<expected<bool, error_info>>;

  /// `PING`
  auto ping() -> iocoro::awaitable<expected<void, error_info>>;

 private:
  auto exec_one(request req) -> iocoro::awaitable<expected<resp3::message, error_info>>;

  std::unique_ptr<detail::connection> conn_;
  std::string host_;
  int port_;
  std::vector<start_option> options_;
};

}  // namespace rediscache

#include <rediscache/impl/client.ipp>
