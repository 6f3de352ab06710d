#pragma once

#include <rediscache/assert.hpp>
#include <rediscache/redis_error.hpp>

#include <type_traits>

namespace rediscache {

namespace detail {

inline auto describe(std::error_code ec) -> std::string {
  std::string out = ec.category().name();
  out += ": ";
  out += ec.message();
  return out;
}

}  // namespace detail

inline auto to_string(redis_error const& e) -> std::string {
  return std::visit(
    [](auto const& v) -> std::string {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, start_error>) {
        return "start_error";
      } else if constexpr (std::is_same_v<T, actor_error>) {
        return "actor_error";
      } else if constexpr (std::is_same_v<T, connection_error>) {
        return "connection_error";
      } else if constexpr (std::is_same_v<T, tcp_error>) {
        return "tcp_error(" + detail::describe(v.inner) + ")";
      } else if constexpr (std::is_same_v<T, server_error>) {
        return "server_error(" + v.message + ")";
      } else if constexpr (std::is_same_v<T, shutdown_error>) {
        return "shutdown_error";
      } else if constexpr (std::is_same_v<T, pool_error>) {
        return "pool_error(" + detail::describe(v.inner) + ")";
      } else {
        static_assert(std::is_same_v<T, unknown_response_error>);
        return "unknown_response_error";
      }
    },
    e);
}

inline auto translate_error(error_info const& e) -> redis_error {
  auto const& ec = e.code;

  if (is_pool_error(ec)) {
    return pool_error{ec};
  }
  if (is_server_error(ec)) {
    return server_error{e.detail};
  }
  if (is_protocol_error(ec)) {
    return unknown_response_error{};
  }
  if (!is_client_error(ec)) {
    // Foreign codes only reach here from the socket layer.
    return tcp_error{ec};
  }

  switch (static_cast<client_errc>(ec.value())) {
    case client_errc::not_found:
      REDISCACHE_UNREACHABLE("not_found must be handled before error translation");

    case client_errc::internal_error:
      return actor_error{};

    case client_errc::not_connected:
    case client_errc::already_connected:
    case client_errc::connection_closed:
    case client_errc::resolve_failed:
    case client_errc::resolve_timeout:
    case client_errc::connect_failed:
    case client_errc::connect_timeout:
    case client_errc::handshake_failed:
    case client_errc::handshake_timeout:
      return connection_error{};

    case client_errc::request_timeout:
    case client_errc::connection_reset:
    case client_errc::read_error:
    case client_errc::write_error:
    case client_errc::operation_aborted:
      return tcp_error{e.cause_ec ? e.cause_ec : ec};

    case client_errc::unexpected_reply:
    case client_errc::unsolicited_message:
      return unknown_response_error{};
  }

  REDISCACHE_UNREACHABLE("unknown client_errc value");
}

}  // namespace rediscache
