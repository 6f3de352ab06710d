#pragma once

#include <rediscache/client.hpp>
#include <rediscache/logger.hpp>

namespace rediscache {

namespace detail {

inline auto unexpected_reply(resp3::message const& m, std::string_view command) -> error_info {
  auto text = std::string{command} + " replied with ";
  text += resp3::kind_name(m.type);
  return error_info{client_errc::unexpected_reply, std::move(text)};
}

}  // namespace detail

inline auto client::connect() -> iocoro::awaitable<expected<void, error_info>> {
  co_return co_await conn_->connect(host_, port_, detail::fold_options(options_));
}

inline auto client::exec_one(request req)
  -> iocoro::awaitable<expected<resp3::message, error_info>> {
  auto replies = co_await conn_->execute(req);
  if (!replies) {
    co_return unexpected(std::move(replies.error()));
  }
  REDISCACHE_ASSERT(replies->size() == 1);

  auto reply = std::move(replies->front());
  if (reply.is_error()) {
    REDISCACHE_LOG_DEBUG("client.error_reply text={}", reply.text);
    co_return unexpected(error_info{server_errc::error_reply, std::move(reply.text)});
  }
  co_return std::move(reply);
}

inline auto client::set(std::string_view key, std::string_view value)
  -> iocoro::awaitable<expected<void, error_info>> {
  auto reply = co_await exec_one(request{"SET", key, value});
  if (!reply) {
    co_return unexpected(std::move(reply.error()));
  }
  if (!reply->is(resp3::kind::simple_string)) {
    co_return unexpected(detail::unexpected_reply(*reply, "SET"));
  }
  co_return expected<void, error_info>{};
}

inline auto client::get(std::string_view key)
  -> iocoro::awaitable<expected<std::string, error_info>> {
  auto reply = co_await exec_one(request{"GET", key});
  if (!reply) {
    co_return unexpected(std::move(reply.error()));
  }
  if (reply->is_null()) {
    co_return unexpected(client_errc::not_found);
  }
  auto value = reply->as_string();
  if (!value.has_value()) {
    co_return unexpected(detail::unexpected_reply(*reply, "GET"));
  }
  co_return std::move(*value);
}

inline auto client::del(std::string_view key) -> iocoro::awaitable<expected<void, error_info>> {
  auto reply = co_await exec_one(request{"DEL", key});
  if (!reply) {
    co_return unexpected(std::move(reply.error()));
  }
  auto removed = reply->as_integer();
  if (!removed.has_value()) {
    co_return unexpected(detail::unexpected_reply(*reply, "DEL"));
  }
  if (*removed == 0) {
    co_return unexpected(client_errc::not_found);
  }
  co_return expected<void, error_info>{};
}

inline auto client::expire(std::string_view key, std::chrono::seconds ttl)
  -> iocoro::awaitable<expected<void, error_info>> {
  auto reply = co_await exec_one(request{"EXPIRE", key, ttl.count()});
  if (!reply) {
    co_return unexpected(std::move(reply.error()));
  }
  auto applied = reply->as_integer();
  if (!applied.has_value()) {
    co_return unexpected(detail::unexpected_reply(*reply, "EXPIRE"));
  }
  if (*applied == 0) {
    co_return unexpected(client_errc::not_found);
  }
  co_return expected<void, error_info>{};
}

inline auto client::persist(std::string_view key)
  -> iocoro::awaitable<expected<bool, error_info>> {
  auto reply = co_await exec_one(request{"PERSIST", key});
  if (!reply) {
    co_return unexpected(std::move(reply.error()));
  }
  auto removed = reply->as_integer();
  if (!removed.has_value()) {
    co_return unexpected(detail::unexpected_reply(*reply, "PERSIST"));
  }
  co_return *removed != 0;
}

inline auto client::ping() -> iocoro::awaitable<expected<void, error_info>> {
  auto reply = co_await exec_one(request{"PING"});
  if (!reply) {
    co_return unexpected(std::move(reply.error()));
  }
  if (!reply->is_string()) {
    co_return unexpected(detail::unexpected_reply(*reply, "PING"));
  }
  co_return expected<void, error_info>{};
}

}  // namespace rediscache
