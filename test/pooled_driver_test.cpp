#include <gtest/gtest.h>

#include <rediscache/pooled_driver.hpp>
#include <rediscache/request.hpp>

#include <iocoro/iocoro.hpp>

#include "async_test_util.hpp"
#include "support/fake_redis_server.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

using namespace std::chrono_literals;
using rediscache::config;
using rediscache::creation_strategy;
using rediscache::redis_error;
using rediscache::request;
using rediscache::test_support::fake_redis_server;
using rediscache::test_util::run_async;

namespace cache = rediscache::cache;

namespace {

using step = fake_redis_server::step;
using script = fake_redis_server::script;

auto pool_config_for(fake_redis_server const& server, std::size_t size) -> config {
  config cfg{};
  cfg.host = server.host();
  cfg.port = server.port();
  cfg.timeout = 500ms;
  cfg.pool_size = size;
  cfg.pool_start_timeout = 1s;
  return cfg;
}

TEST(pooled_driver_test, pool_config_follows_driver_config) {
  config cfg{};
  cfg.pool_size = 4;
  cfg.timeout = 250ms;
  cfg.pool_creation = creation_strategy::lazy;

  auto pc = rediscache::detail::make_pool_config(cfg);
  EXPECT_EQ(pc.size, 4U);
  EXPECT_EQ(pc.checkout_timeout, 250ms);
  EXPECT_EQ(pc.creation, creation_strategy::lazy);
}

TEST(pooled_driver_test, connect_starts_pool_eagerly) {
  fake_redis_server server{{script{}, script{}}};
  iocoro::io_context ctx;
  auto const initial =
    rediscache::make_pooled_driver(ctx.get_executor(), pool_config_for(server, 2));

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    EXPECT_TRUE(d);
    EXPECT_FALSE(initial.is_connected());
    if (!d) {
      co_return;
    }
    EXPECT_EQ(d->pool->size(), 2U);
    EXPECT_EQ(d->pool->capacity(), 2U);

    auto again = co_await rediscache::connect(*d);
    EXPECT_FALSE(again);
    if (!again) {
      EXPECT_TRUE(std::holds_alternative<cache::already_connected>(again.error()));
    }

    auto closed = co_await rediscache::disconnect(*d);
    EXPECT_TRUE(closed);
    if (closed) {
      EXPECT_FALSE(closed->is_connected());
    }
    EXPECT_TRUE(d->pool->is_shutting_down());
  });
}

TEST(pooled_driver_test, failed_start_is_start_error) {
  iocoro::io_context ctx;
  config cfg{};
  cfg.host = "127.0.0.1";
  cfg.port = 1;
  cfg.pool_size = 2;
  auto const initial = rediscache::make_pooled_driver(ctx.get_executor(), cfg);

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    EXPECT_FALSE(d);
    if (!d) {
      EXPECT_EQ(d.error(), (cache::connect_error<redis_error>{
                             cache::connect_driver_error<redis_error>{rediscache::start_error{}}}));
    }
  });
}

TEST(pooled_driver_test, lazy_pool_connects_without_io) {
  iocoro::io_context ctx;
  config cfg{};
  cfg.host = "127.0.0.1";
  cfg.port = 1;
  cfg.pool_creation = creation_strategy::lazy;
  auto const initial = rediscache::make_pooled_driver(ctx.get_executor(), cfg);

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    EXPECT_TRUE(d);
    if (!d) {
      co_return;
    }
    EXPECT_EQ(d->pool->size(), 0U);

    // The first operation opens a client and surfaces the failure as a pool error.
    auto r = co_await rediscache::get(*d, "t", "k");
    EXPECT_FALSE(r);
    if (!r) {
      auto const want = cache::get_error<redis_error>{cache::get_driver_error<redis_error>{
        rediscache::pool_error{make_error_code(rediscache::pool_errc::create_failed)}}};
      EXPECT_EQ(r.error(), want);
    }
    (void)co_await rediscache::disconnect(*d);
  });
}

TEST(pooled_driver_test, set_runs_both_commands_on_one_lease) {
  fake_redis_server server{{script{
    step::expect(request{"SET", "session:42", "payload"}.wire()),
    step::reply("+OK\r\n"),
    step::expect(request{"EXPIRE", "session:42", 30}.wire()),
    step::reply(":1\r\n"),
    step::expect(request{"SET", "session:43", "other"}.wire()),
    step::reply("+OK\r\n"),
    step::expect(request{"PERSIST", "session:43"}.wire()),
    step::reply(":0\r\n"),
  }}};
  iocoro::io_context ctx;
  auto const initial =
    rediscache::make_pooled_driver(ctx.get_executor(), pool_config_for(server, 1));

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    if (!d) {
      ADD_FAILURE() << "connect failed";
      co_return;
    }
    EXPECT_TRUE(co_await rediscache::set(*d, "session", "42", "payload", 30s));
    EXPECT_TRUE(co_await rediscache::set(*d, "session", "43", "other", std::nullopt));
    EXPECT_EQ(d->pool->idle_count(), 1U);
    (void)co_await rediscache::disconnect(*d);
  });

  EXPECT_EQ(server.failures(), "");
}

TEST(pooled_driver_test, get_and_del) {
  fake_redis_server server{{script{
    step::expect(request{"GET", "user:1"}.wire()),
    step::reply("$5\r\nalice\r\n"),
    step::expect(request{"DEL", "user:1"}.wire()),
    step::reply(":1\r\n"),
    step::expect(request{"GET", "user:1"}.wire()),
    step::reply("$-1\r\n"),
    step::expect(request{"DEL", "user:1"}.wire()),
    step::reply(":0\r\n"),
  }}};
  iocoro::io_context ctx;
  auto const initial =
    rediscache::make_pooled_driver(ctx.get_executor(), pool_config_for(server, 1));

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    if (!d) {
      ADD_FAILURE() << "connect failed";
      co_return;
    }

    auto hit = co_await rediscache::get(*d, "user", "1");
    EXPECT_TRUE(hit);
    if (hit) {
      EXPECT_EQ(*hit, "alice");
    }
    EXPECT_TRUE(co_await rediscache::del(*d, "user", "1"));

    auto miss = co_await rediscache::get(*d, "user", "1");
    EXPECT_FALSE(miss);
    if (!miss) {
      EXPECT_TRUE(std::holds_alternative<cache::got_too_few_records>(miss.error()));
    }
    EXPECT_TRUE(co_await rediscache::del(*d, "user", "1"));
    (void)co_await rediscache::disconnect(*d);
  });

  EXPECT_EQ(server.failures(), "");
}

TEST(pooled_driver_test, server_error_reply_is_translated) {
  fake_redis_server server{{script{
    step::expect(request{"SET", "t:k", "v"}.wire()),
    step::reply("-OOM command not allowed when used memory > 'maxmemory'.\r\n"),
  }}};
  iocoro::io_context ctx;
  auto const initial =
    rediscache::make_pooled_driver(ctx.get_executor(), pool_config_for(server, 1));

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    if (!d) {
      ADD_FAILURE() << "connect failed";
      co_return;
    }
    auto r = co_await rediscache::set(*d, "t", "k", "v", std::nullopt);
    EXPECT_FALSE(r);
    if (!r) {
      auto const want = cache::set_error<redis_error>{cache::set_driver_error<redis_error>{
        rediscache::server_error{"OOM command not allowed when used memory > 'maxmemory'."}}};
      EXPECT_EQ(r.error(), want);
    }
    (void)co_await rediscache::disconnect(*d);
  });
}

TEST(pooled_driver_test, operations_after_disconnect_began_fail_with_pool_error) {
  fake_redis_server server{{script{}}};
  iocoro::io_context ctx;
  auto const initial =
    rediscache::make_pooled_driver(ctx.get_executor(), pool_config_for(server, 1));

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    if (!d) {
      ADD_FAILURE() << "connect failed";
      co_return;
    }
    // A copy taken before disconnect still points at the pool being shut down.
    auto stale = *d;
    EXPECT_TRUE(co_await rediscache::disconnect(*d));

    auto r = co_await rediscache::del(stale, "t", "k");
    EXPECT_FALSE(r);
    if (!r) {
      auto const want = cache::delete_error<redis_error>{cache::delete_driver_error<redis_error>{
        rediscache::pool_error{make_error_code(rediscache::pool_errc::shutting_down)}}};
      EXPECT_EQ(r.error(), want);
    }
  });
}

TEST(pooled_driver_test, exhausted_pool_reports_checkout_timeout) {
  fake_redis_server server{{script{}}};
  iocoro::io_context ctx;
  auto cfg = pool_config_for(server, 1);
  cfg.timeout = 100ms;
  auto const initial = rediscache::make_pooled_driver(ctx.get_executor(), cfg);

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    if (!d) {
      ADD_FAILURE() << "connect failed";
      co_return;
    }

    auto held = co_await d->pool->checkout();
    EXPECT_TRUE(held);

    auto r = co_await rediscache::get(*d, "t", "k");
    EXPECT_FALSE(r);
    if (!r) {
      auto const want = cache::get_error<redis_error>{cache::get_driver_error<redis_error>{
        rediscache::pool_error{make_error_code(rediscache::pool_errc::checkout_timeout)}}};
      EXPECT_EQ(r.error(), want);
    }

    if (held) {
      held->reset();
    }
    EXPECT_TRUE(co_await rediscache::disconnect(*d));
  });
}

TEST(pooled_driver_test, disconnect_with_lease_out_is_shutdown_error) {
  fake_redis_server server{{script{}}};
  iocoro::io_context ctx;
  auto cfg = pool_config_for(server, 1);
  cfg.timeout = 50ms;
  auto const initial = rediscache::make_pooled_driver(ctx.get_executor(), cfg);

  run_async(ctx, [&]() -> iocoro::awaitable<void> {
    auto d = co_await rediscache::connect(initial);
    if (!d) {
      ADD_FAILURE() << "connect failed";
      co_return;
    }

    auto held = co_await d->pool->checkout();
    EXPECT_TRUE(held);

    auto stuck = co_await rediscache::disconnect(*d);
    EXPECT_FALSE(stuck);
    if (!stuck) {
      auto const want = cache::disconnect_error<redis_error>{
        cache::disconnect_driver_error<redis_error>{rediscache::shutdown_error{}}};
      EXPECT_EQ(stuck.error(), want);
    }

    // Returning the lease lets the retried shutdown drain.
    if (held) {
      held->reset();
    }
    auto closed = co_await rediscache::disconnect(*d);
    EXPECT_TRUE(closed);
    if (!closed) {
      co_return;
    }
    EXPECT_FALSE(closed->is_connected());

    auto again = co_await rediscache::disconnect(*closed);
    EXPECT_FALSE(again);
    if (!again) {
      EXPECT_TRUE(std::holds_alternative<cache::not_connected>(again.error()));
    }
  });
}

}  // namespace
