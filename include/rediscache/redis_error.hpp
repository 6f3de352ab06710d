#pragma once

#include <rediscache/error.hpp>
#include <rediscache/error_info.hpp>

#include <string>
#include <system_error>
#include <variant>

namespace rediscache {

/// The pool could not be started.
struct start_error {
  auto operator==(start_error const&) const -> bool = default;
};

/// A worker inside the client failed unexpectedly.
struct actor_error {
  auto operator==(actor_error const&) const -> bool = default;
};

/// The connection could not be established or is gone.
struct connection_error {
  auto operator==(connection_error const&) const -> bool = default;
};

/// Transport failure; `inner` is the underlying error.
struct tcp_error {
  std::error_code inner;

  auto operator==(tcp_error const&) const -> bool = default;
};

/// The server answered with an error reply.
struct server_error {
  std::string message;

  auto operator==(server_error const&) const -> bool = default;
};

/// The connection or pool could not be shut down cleanly.
struct shutdown_error {
  auto operator==(shutdown_error const&) const -> bool = default;
};

/// Pool failure (exhaustion, shutting down, creation failure); `inner` is a `pool_errc`.
struct pool_error {
  std::error_code inner;

  auto operator==(pool_error const&) const -> bool = default;
};

/// The server's reply could not be parsed or had an unexpected shape.
struct unknown_response_error {
  auto operator==(unknown_response_error const&) const -> bool = default;
};

/// Closed set of failures the cache drivers report.
using redis_error = std::variant<start_error, actor_error, connection_error, tcp_error,
                                 server_error, shutdown_error, pool_error, unknown_response_error>;

/// One-line description, e.g. `tcp_error(rediscache.client: request timed out)`.
[[nodiscard]] auto to_string(redis_error const& e) -> std::string;

/// Map a wire client or pool error to its redis_error.
///
/// `client_errc::not_found` has no counterpart: callers handle absence before translating, and
/// passing it here is a fatal programming error.
[[nodiscard]] auto translate_error(error_info const& e) -> redis_error;

}  // namespace rediscache

#include <rediscache/impl/redis_error.ipp>
