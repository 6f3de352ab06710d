#pragma once

#include <rediscache/logger.hpp>
#include <rediscache/pool.hpp>

#include <iocoro/steady_timer.hpp>
#include <iocoro/error.hpp>
#include <iocoro/when_any.hpp>
#include <iocoro/with_timeout.hpp>

#include <algorithm>
#include <optional>

namespace rediscache {

inline auto connection_pool::take_waiter_locked() -> std::shared_ptr<iocoro::condition_event> {
  if (waiters_.empty()) {
    return nullptr;
  }
  auto ev = std::move(waiters_.front());
  waiters_.pop_front();
  return ev;
}

inline auto connection_pool::start(std::chrono::milliseconds timeout)
  -> iocoro::awaitable<expected<void, error_info>> {
  if (cfg_.creation == creation_strategy::lazy) {
    REDISCACHE_LOG_INFO("pool.started creation=lazy capacity={}", cfg_.size);
    co_return expected<void, error_info>{};
  }

  std::vector<std::unique_ptr<client>> opened;
  opened.reserve(cfg_.size);
  error_info open_error{};

  auto open_all = [&]() -> iocoro::awaitable<iocoro::result<void>> {
    while (opened.size() < cfg_.size) {
      auto c = make_client();
      auto r = co_await c->connect();
      if (!r) {
        open_error = std::move(r.error());
        co_return unexpected(pool_errc::start_failed);
      }
      opened.push_back(std::move(c));
    }
    co_return iocoro::ok();
  };

  auto res = co_await iocoro::with_timeout(open_all(), timeout);
  if (!res) {
    for (auto& c : opened) {
      (void)c->close();
    }
    if (res.error() == iocoro::error::timed_out) {
      REDISCACHE_LOG_WARNING("pool.start_timeout opened={} capacity={}", opened.size(), cfg_.size);
      co_return unexpected(pool_errc::start_timeout);
    }
    REDISCACHE_LOG_WARNING("pool.start_failed err={}", open_error.to_string());
    error_info out{pool_errc::start_failed, open_error.to_string()};
    out.set_cause(open_error.code);
    co_return unexpected(std::move(out));
  }

  {
    std::scoped_lock lk{mtx_};
    total_ += opened.size();
    for (auto& c : opened) {
      idle_.push_back(std::move(c));
    }
  }
  REDISCACHE_LOG_INFO("pool.started creation=eager capacity={}", cfg_.size);
  co_return expected<void, error_info>{};
}

inline auto connection_pool::checkout() -> iocoro::awaitable<expected<lease, error_info>> {
  auto const deadline = std::chrono::steady_clock::now() + cfg_.checkout_timeout;

  for (;;) {
    std::shared_ptr<iocoro::condition_event> ev;
    bool create = false;
    {
      std::scoped_lock lk{mtx_};
      if (shutting_down_) {
        co_return unexpected(pool_errc::shutting_down);
      }
      if (!idle_.empty()) {
        auto c = std::move(idle_.front());
        idle_.pop_front();
        co_return lease{shared_from_this(), std::move(c)};
      }
      if (total_ < cfg_.size) {
        total_ += 1;
        create = true;
      } else if (std::chrono::steady_clock::now() < deadline) {
        ev = std::make_shared<iocoro::condition_event>();
        waiters_.push_back(ev);
      }
    }

    if (create) {
      auto c = make_client();
      auto r = co_await c->connect();
      if (!r) {
        REDISCACHE_LOG_WARNING("pool.create_failed err={}", r.error().to_string());
        std::shared_ptr<iocoro::condition_event> next;
        bool drained = false;
        {
          std::scoped_lock lk{mtx_};
          total_ -= 1;
          next = take_waiter_locked();
          drained = shutting_down_ && total_ == 0;
        }
        if (next) {
          next->notify();
        }
        if (drained) {
          drained_.notify();
        }
        error_info out{pool_errc::create_failed, r.error().to_string()};
        out.set_cause(r.error().code);
        co_return unexpected(std::move(out));
      }
      REDISCACHE_LOG_DEBUG("pool.client_created host={} port={}", host_, port_);
      co_return lease{shared_from_this(), std::move(c)};
    }

    if (!ev) {
      REDISCACHE_LOG_WARNING("pool.checkout_timeout capacity={}", cfg_.size);
      co_return unexpected(pool_errc::checkout_timeout);
    }

    iocoro::steady_timer timer{ex_};
    timer.expires_at(deadline);
    auto timer_wait = timer.async_wait(iocoro::use_awaitable);
    auto wake_wait = ev->async_wait();
    (void)co_await iocoro::when_any(std::move(timer_wait), std::move(wake_wait));

    // Either woken by a release/shutdown or timed out; re-check the pool in both cases.
    std::scoped_lock lk{mtx_};
    auto it = std::find(waiters_.begin(), waiters_.end(), ev);
    if (it != waiters_.end()) {
      waiters_.erase(it);
    }
  }
}

inline void connection_pool::release(std::unique_ptr<client> c) noexcept {
  std::unique_ptr<client> dropped;
  std::shared_ptr<iocoro::condition_event> next;
  bool drained = false;
  {
    std::scoped_lock lk{mtx_};
    if (shutting_down_ || !c->is_connected()) {
      total_ -= 1;
      dropped = std::move(c);
    } else {
      idle_.push_back(std::move(c));
    }
    next = take_waiter_locked();
    drained = shutting_down_ && total_ == 0;
  }
  if (next) {
    next->notify();
  }
  if (drained) {
    drained_.notify();
  }

  if (dropped) {
    REDISCACHE_LOG_DEBUG("pool.client_dropped connected={}", dropped->is_connected());
    if (auto r = dropped->close(); !r) {
      REDISCACHE_LOG_WARNING("pool.close_failed err={}", r.error().to_string());
    }
  }
}

inline auto connection_pool::shutdown(std::chrono::milliseconds timeout)
  -> iocoro::awaitable<expected<void, error_info>> {
  auto const deadline = std::chrono::steady_clock::now() + timeout;

  std::deque<std::unique_ptr<client>> idle;
  std::deque<std::shared_ptr<iocoro::condition_event>> waiters;
  {
    std::scoped_lock lk{mtx_};
    if (!shutting_down_) {
      REDISCACHE_LOG_INFO("pool.shutdown_begin in_use={}", total_ - idle_.size());
    }
    shutting_down_ = true;
    waiters.swap(waiters_);
    idle.swap(idle_);
    total_ -= idle.size();
  }
  for (auto& ev : waiters) {
    ev->notify();
  }

  std::optional<error_info> close_error{};
  for (auto& c : idle) {
    if (auto r = c->close(); !r && !close_error.has_value()) {
      close_error = std::move(r.error());
    }
  }

  for (;;) {
    {
      std::scoped_lock lk{mtx_};
      if (total_ == 0) {
        break;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      REDISCACHE_LOG_WARNING("pool.shutdown_timeout in_use={}", in_use_count());
      co_return unexpected(pool_errc::shutdown_timeout);
    }

    iocoro::steady_timer timer{ex_};
    timer.expires_at(deadline);
    auto timer_wait = timer.async_wait(iocoro::use_awaitable);
    auto drained_wait = drained_.async_wait();
    (void)co_await iocoro::when_any(std::move(timer_wait), std::move(drained_wait));
  }

  if (close_error.has_value()) {
    REDISCACHE_LOG_WARNING("pool.shutdown_close_failed err={}", close_error->to_string());
    co_return unexpected(std::move(*close_error));
  }
  REDISCACHE_LOG_INFO("pool.shutdown_done");
  co_return expected<void, error_info>{};
}

}  // namespace rediscache
