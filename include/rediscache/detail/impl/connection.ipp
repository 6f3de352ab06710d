#pragma once

#include <rediscache/detail/connection.hpp>

#include <iocoro/error.hpp>
#include <iocoro/ip/resolver.hpp>
#include <iocoro/with_timeout.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <utility>

namespace rediscache::detail {

inline void connection::fail(error_info const& e) {
  REDISCACHE_LOG_WARNING("connection.failed err={}", e.to_string());
  if (socket_.is_open()) {
    (void)socket_.close();
  }
  parser_.reset();
}

inline auto connection::connect(std::string host, int port, connection_settings settings)
  -> iocoro::awaitable<expected<void, error_info>> {
  auto hold = co_await gate_.acquire();

  if (socket_.is_open()) {
    co_return unexpected(client_errc::already_connected);
  }

  settings_ = std::move(settings);
  parser_.reset();

  REDISCACHE_LOG_DEBUG("connection.resolve host={} port={}", host, port);
  iocoro::ip::tcp::resolver resolver{};
  auto resolve_op = resolver.async_resolve(host, std::to_string(port));
  if (settings_.timeout.has_value()) {
    resolve_op = iocoro::with_timeout(std::move(resolve_op), *settings_.timeout);
  }
  auto endpoints = co_await std::move(resolve_op);
  if (!endpoints) {
    REDISCACHE_LOG_WARNING("connection.resolve_failed host={} err={}", host,
                           endpoints.error().message());
    if (endpoints.error() == iocoro::error::timed_out) {
      co_return unexpected(client_errc::resolve_timeout);
    }
    if (endpoints.error() == iocoro::error::operation_aborted) {
      co_return unexpected(client_errc::operation_aborted);
    }
    error_info out{client_errc::resolve_failed, host};
    out.set_cause(endpoints.error());
    co_return unexpected(std::move(out));
  }
  if (endpoints->empty()) {
    co_return unexpected(error_info{client_errc::resolve_failed, "no endpoints for " + host});
  }

  // Try endpoints in resolver order; a failed attempt may leave the socket unusable.
  std::error_code connect_ec{};
  for (auto const& ep : *endpoints) {
    if (socket_.is_open()) {
      (void)socket_.close();
    }
    auto connect_op = socket_.async_connect(ep);
    if (settings_.timeout.has_value()) {
      connect_op = iocoro::with_timeout(std::move(connect_op), *settings_.timeout);
    }
    auto r = co_await std::move(connect_op);
    if (r) {
      connect_ec = {};
      break;
    }
    connect_ec = r.error();
  }

  if (connect_ec) {
    REDISCACHE_LOG_WARNING("connection.tcp_connect_failed host={} port={} err={}", host, port,
                           connect_ec.message());
    if (socket_.is_open()) {
      (void)socket_.close();
    }
    if (connect_ec == iocoro::error::timed_out) {
      co_return unexpected(client_errc::connect_timeout);
    }
    if (connect_ec == iocoro::error::operation_aborted) {
      co_return unexpected(client_errc::operation_aborted);
    }
    error_info out{client_errc::connect_failed, connect_ec.message()};
    out.set_cause(connect_ec);
    co_return unexpected(std::move(out));
  }

  auto hs = co_await do_handshake();
  if (!hs) {
    fail(hs.error());
    co_return unexpected(std::move(hs.error()));
  }

  REDISCACHE_LOG_INFO("connection.open host={} port={}", host, port);
  co_return expected<void, error_info>{};
}

inline auto connection::do_handshake() -> iocoro::awaitable<expected<void, error_info>> {
  if (!settings_.wants_auth()) {
    co_return expected<void, error_info>{};
  }

  request req{};
  if (settings_.username.has_value()) {
    req.push("AUTH", *settings_.username, *settings_.password);
  } else {
    req.push("AUTH", *settings_.password);
  }

  auto replies = co_await do_execute(req);
  if (!replies) {
    auto const& err = replies.error();
    if (err.code == client_errc::request_timeout) {
      co_return unexpected(client_errc::handshake_timeout);
    }
    co_return unexpected(error_info{client_errc::handshake_failed, err.to_string()});
  }

  auto const& reply = replies->front();
  if (reply.is_error()) {
    REDISCACHE_LOG_WARNING("connection.auth_rejected reply={}", reply.text);
    co_return unexpected(error_info{server_errc::error_reply, reply.text});
  }
  co_return expected<void, error_info>{};
}

inline auto connection::execute(request const& req)
  -> iocoro::awaitable<expected<std::vector<resp3::message>, error_info>> {
  auto hold = co_await gate_.acquire();
  co_return co_await do_execute(req);
}

inline auto connection::do_execute(request const& req)
  -> iocoro::awaitable<expected<std::vector<resp3::message>, error_info>> {
  REDISCACHE_ASSERT(!req.empty(), "request has no commands");

  if (!socket_.is_open()) {
    co_return unexpected(client_errc::not_connected);
  }

  std::vector<resp3::message> replies;
  replies.reserve(req.reply_count());
  std::error_code io_ec{};

  auto exchange = [&]() -> iocoro::awaitable<iocoro::result<void>> {
    // Flush the whole request before reading.
    auto const& wire = req.wire();
    std::size_t written = 0;
    while (written < wire.size()) {
      auto view = std::span<char const>{wire.data() + written, wire.size() - written};
      auto w = co_await socket_.async_write_some(std::as_bytes(view));
      if (!w) {
        if (w.error() == iocoro::error::operation_aborted) {
          co_return unexpected(client_errc::operation_aborted);
        }
        io_ec = w.error();
        co_return unexpected(client_errc::write_error);
      }
      written += *w;
    }

    while (replies.size() < req.reply_count()) {
      auto writable = parser_.prepare();
      auto r = co_await socket_.async_read_some(writable);
      if (!r) {
        if (r.error() == iocoro::error::operation_aborted) {
          co_return unexpected(client_errc::operation_aborted);
        }
        io_ec = r.error();
        co_return unexpected(client_errc::read_error);
      }
      if (*r == 0) {
        co_return unexpected(client_errc::connection_reset);
      }
      parser_.commit(*r);

      for (;;) {
        auto parsed = parser_.parse_one();
        if (!parsed) {
          co_return unexpected(parsed.error());
        }
        if (!parsed->has_value()) {
          break;
        }
        if (replies.size() == req.reply_count()) {
          co_return unexpected(client_errc::unsolicited_message);
        }
        replies.push_back(std::move(**parsed));
      }
    }

    // Bytes past the last expected reply were never asked for.
    if (parser_.buffered() != 0) {
      co_return unexpected(client_errc::unsolicited_message);
    }
    co_return iocoro::ok();
  };

  iocoro::result<void> res;
  if (settings_.timeout.has_value()) {
    res = co_await iocoro::with_timeout(exchange(), *settings_.timeout);
  } else {
    res = co_await exchange();
  }

  if (!res) {
    auto const ec = res.error();
    error_info out{};
    if (ec == iocoro::error::timed_out) {
      out = error_info{client_errc::request_timeout};
    } else if (ec == iocoro::error::operation_aborted) {
      out = error_info{client_errc::operation_aborted};
    } else if (is_protocol_error(ec) || is_client_error(ec)) {
      out = error_info{ec};
    } else {
      out = error_info{client_errc::read_error, ec.message()};
    }
    if (io_ec) {
      out.set_cause(io_ec);
    }
    fail(out);
    co_return unexpected(std::move(out));
  }

  REDISCACHE_LOG_DEBUG("connection.exchange_done commands={}", req.reply_count());
  co_return std::move(replies);
}

inline auto connection::close() -> expected<void, error_info> {
  parser_.reset();
  if (!socket_.is_open()) {
    return {};
  }
  auto r = socket_.close();
  if (!r) {
    REDISCACHE_LOG_WARNING("connection.close_failed err={}", r.error().message());
    error_info out{client_errc::internal_error, "socket close failed"};
    out.set_cause(r.error());
    return unexpected(std::move(out));
  }
  REDISCACHE_LOG_INFO("connection.closed");
  return {};
}

}  // namespace rediscache::detail
