#pragma once

#include <rediscache/detail/serial_gate.hpp>
#include <rediscache/error.hpp>
#include <rediscache/error_info.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/logger.hpp>
#include <rediscache/options.hpp>
#include <rediscache/request.hpp>
#include <rediscache/resp3/message.hpp>
#include <rediscache/resp3/parser.hpp>

#include <iocoro/any_io_executor.hpp>
#include <iocoro/awaitable.hpp>
#include <iocoro/ip/tcp.hpp>

#include <string>
#include <system_error>
#include <vector>

namespace rediscache::detail {

/// One TCP connection to a Redis server speaking request/reply.
///
/// Model:
/// - `connect()` resolves, opens the socket and runs the AUTH handshake when credentials are set.
/// - `execute()` writes one request and reads exactly `reply_count()` replies. Calls are
///   admitted one at a time in arrival order, so replies never interleave.
/// - Any IO, timeout or protocol failure closes the socket. Later calls fail with
///   `client_errc::not_connected` until `connect()` succeeds again.
///
/// Error replies from the server (`-ERR ...`) are returned as messages, not as failures; the
/// caller decides what they mean.
class connection {
 public:
  explicit connection(iocoro::any_io_executor ex) : socket_(ex) {}

  connection(connection const&) = delete;
  auto operator=(connection const&) -> connection& = delete;

  /// Open the connection.
  ///
  /// Errors:
  /// - already_connected if the socket is open
  /// - resolve_failed / resolve_timeout, connect_failed / connect_timeout
  /// - handshake_failed / handshake_timeout, or server_errc::error_reply when AUTH is rejected
  auto connect(std::string host, int port, connection_settings settings)
    -> iocoro::awaitable<expected<void, error_info>>;

  /// Send `req` and collect one reply per command.
  auto execute(request const& req)
    -> iocoro::awaitable<expected<std::vector<resp3::message>, error_info>>;

  /// Close the socket. Idempotent.
  auto close() -> expected<void, error_info>;

  [[nodiscard]] auto is_open() const noexcept -> bool { return socket_.is_open(); }

 private:
  auto do_execute(request const& req)
    -> iocoro::awaitable<expected<std::vector<resp3::message>, error_info>>;

  auto do_handshake() -> iocoro::awaitable<expected<void, error_info>>;

  void fail(error_info const& e);

  iocoro::ip::tcp::socket socket_;
  resp3::parser parser_{};
  connection_settings settings_{};
  serial_gate gate_{};
};

}  // namespace rediscache::detail

#include <rediscache/detail/impl/connection.ipp>
