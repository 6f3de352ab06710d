#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace rediscache {

/// Errors raised by the wire client itself (connection lifecycle and transport).
enum class client_errc {
  /// The key does not exist (GET returned null, DEL/EXPIRE affected nothing).
  ///
  /// This is a normal outcome of a command, not a failure of the client. Callers are expected
  /// to handle it before treating the error as an infrastructure problem.
  not_found = 1,

  /// No connection is established (never connected, or closed after an earlier failure).
  not_connected,

  /// connect() called on a connection that is already open.
  already_connected,

  /// The connection was closed while the operation was waiting.
  connection_closed,

  /// Host name resolution failed.
  resolve_failed,

  /// Host name resolution did not complete within the configured timeout.
  resolve_timeout,

  /// TCP connect failed on every resolved endpoint.
  connect_failed,

  /// TCP connect did not complete within the configured timeout.
  connect_timeout,

  /// The AUTH exchange failed for a reason other than a server error reply.
  handshake_failed,

  /// The AUTH exchange did not complete within the configured timeout.
  handshake_timeout,

  /// A command did not receive all of its replies within the configured timeout.
  request_timeout,

  /// Peer closed the connection (EOF).
  connection_reset,

  /// Socket read failed.
  read_error,

  /// Socket write failed.
  write_error,

  /// Operation cancelled before completion.
  operation_aborted,

  /// The server sent data while no reply was expected.
  unsolicited_message,

  /// The reply has a RESP type the command never produces (e.g. a map for GET).
  unexpected_reply,

  /// Unexpected exception or broken internal invariant inside the client.
  internal_error,
};

/// RESP syntax errors detected by the reply parser.
enum class protocol_errc {
  /// First byte of a value is not a RESP type marker.
  invalid_type_byte = 1,

  /// Length field is malformed, negative where not allowed, or exceeds a limit.
  invalid_length,

  /// Integer payload is malformed.
  invalid_integer,

  /// Double payload is malformed.
  invalid_double,

  /// Boolean payload is not `t` or `f`.
  invalid_boolean,

  /// Null payload is not empty.
  invalid_null,

  /// Bulk payload is not followed by CRLF.
  invalid_bulk_trailer,

  /// A single line exceeds the configured maximum.
  line_too_long,

  /// Aggregates nest deeper than the configured maximum.
  nesting_too_deep,

  /// The parser already failed; it must be reset before further use.
  parser_failed,
};

/// Errors reported by the server as RESP error replies (`-ERR ...`, `!...`).
/// The server's message travels in `error_info::detail`.
enum class server_errc {
  error_reply = 1,
};

/// Errors raised by the connection pool.
enum class pool_errc {
  /// Eager startup could not open every connection.
  start_failed = 1,

  /// Eager startup did not finish within the startup timeout.
  start_timeout,

  /// Opening a new connection on checkout failed.
  create_failed,

  /// No connection became available within the checkout timeout.
  checkout_timeout,

  /// The pool is shutting down and no longer hands out connections.
  shutting_down,

  /// Outstanding leases were not returned within the shutdown timeout.
  shutdown_timeout,
};

auto client_category() noexcept -> std::error_category const&;
auto protocol_category() noexcept -> std::error_category const&;
auto server_category() noexcept -> std::error_category const&;
auto pool_category() noexcept -> std::error_category const&;

inline auto make_error_code(client_errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), client_category()};
}

inline auto make_error_code(protocol_errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), protocol_category()};
}

inline auto make_error_code(server_errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), server_category()};
}

inline auto make_error_code(pool_errc e) noexcept -> std::error_code {
  return {static_cast<int>(e), pool_category()};
}

[[nodiscard]] inline auto is_client_error(std::error_code ec) noexcept -> bool {
  return ec.category() == client_category();
}

[[nodiscard]] inline auto is_protocol_error(std::error_code ec) noexcept -> bool {
  return ec.category() == protocol_category();
}

[[nodiscard]] inline auto is_server_error(std::error_code ec) noexcept -> bool {
  return ec.category() == server_category();
}

[[nodiscard]] inline auto is_pool_error(std::error_code ec) noexcept -> bool {
  return ec.category() == pool_category();
}

}  // namespace rediscache

namespace std {

template <>
struct is_error_code_enum<rediscache::client_errc> : std::true_type {};

template <>
struct is_error_code_enum<rediscache::protocol_errc> : std::true_type {};

template <>
struct is_error_code_enum<rediscache::server_errc> : std::true_type {};

template <>
struct is_error_code_enum<rediscache::pool_errc> : std::true_type {};

}  // namespace std

#include <rediscache/impl/error.ipp>
