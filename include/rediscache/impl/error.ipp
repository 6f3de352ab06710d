#pragma once

#include <rediscache/error.hpp>

#include <string>

namespace rediscache {
namespace detail {

class client_category_impl final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "rediscache.client"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<client_errc>(ev)) {
      case client_errc::not_found:           return "key not found";
      case client_errc::not_connected:       return "not connected";
      case client_errc::already_connected:   return "already connected";
      case client_errc::connection_closed:   return "connection closed";
      case client_errc::resolve_failed:      return "host resolution failed";
      case client_errc::resolve_timeout:     return "host resolution timed out";
      case client_errc::connect_failed:      return "tcp connect failed";
      case client_errc::connect_timeout:     return "tcp connect timed out";
      case client_errc::handshake_failed:    return "handshake failed";
      case client_errc::handshake_timeout:   return "handshake timed out";
      case client_errc::request_timeout:     return "request timed out";
      case client_errc::connection_reset:    return "connection reset by peer";
      case client_errc::read_error:          return "socket read failed";
      case client_errc::write_error:         return "socket write failed";
      case client_errc::operation_aborted:   return "operation aborted";
      case client_errc::unsolicited_message: return "unsolicited message from server";
      case client_errc::unexpected_reply:    return "unexpected reply type";
      case client_errc::internal_error:      return "internal error";
    }
    // clang-format on
    return "unknown client error";
  }
};

class protocol_category_impl final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "rediscache.protocol"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<protocol_errc>(ev)) {
      case protocol_errc::invalid_type_byte:    return "invalid RESP type byte";
      case protocol_errc::invalid_length:       return "invalid RESP length";
      case protocol_errc::invalid_integer:      return "invalid RESP integer";
      case protocol_errc::invalid_double:       return "invalid RESP double";
      case protocol_errc::invalid_boolean:      return "invalid RESP boolean";
      case protocol_errc::invalid_null:         return "invalid RESP null";
      case protocol_errc::invalid_bulk_trailer: return "bulk payload not terminated by CRLF";
      case protocol_errc::line_too_long:        return "RESP line exceeds limit";
      case protocol_errc::nesting_too_deep:     return "RESP aggregates nested too deep";
      case protocol_errc::parser_failed:        return "parser is in failed state";
    }
    // clang-format on
    return "unknown protocol error";
  }
};

class server_category_impl final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "rediscache.server"; }

  auto message(int ev) const -> std::string override {
    if (static_cast<server_errc>(ev) == server_errc::error_reply) {
      return "server replied with an error";
    }
    return "unknown server error";
  }
};

class pool_category_impl final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "rediscache.pool"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<pool_errc>(ev)) {
      case pool_errc::start_failed:     return "pool failed to start";
      case pool_errc::start_timeout:    return "pool startup timed out";
      case pool_errc::create_failed:    return "failed to open a pooled connection";
      case pool_errc::checkout_timeout: return "no pooled connection available";
      case pool_errc::shutting_down:    return "pool is shutting down";
      case pool_errc::shutdown_timeout: return "pool shutdown timed out";
    }
    // clang-format on
    return "unknown pool error";
  }
};

}  // namespace detail

inline auto client_category() noexcept -> std::error_category const& {
  static detail::client_category_impl const instance;
  return instance;
}

inline auto protocol_category() noexcept -> std::error_category const& {
  static detail::protocol_category_impl const instance;
  return instance;
}

inline auto server_category() noexcept -> std::error_category const& {
  static detail::server_category_impl const instance;
  return instance;
}

inline auto pool_category() noexcept -> std::error_category const& {
  static detail::pool_category_impl const instance;
  return instance;
}

}  // namespace rediscache
