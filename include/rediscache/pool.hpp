#pragma once

#include <rediscache/client.hpp>
#include <rediscache/config.hpp>
#include <rediscache/error.hpp>
#include <rediscache/error_info.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/options.hpp>

#include <iocoro/any_io_executor.hpp>
#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rediscache {

struct pool_config {
  /// Maximum number of clients, idle and leased together.
  std::size_t size = 10;

  /// How long checkout() waits for a release when every client is leased.
  std::chrono::milliseconds checkout_timeout{5000};

  creation_strategy creation = creation_strategy::eager;
};

namespace detail {

template <typename T>
struct awaitable_value;

template <typename T>
struct awaitable_value<iocoro::awaitable<T>> {
  using type = T;
};

template <typename F>
using apply_result_t = typename awaitable_value<std::invoke_result_t<F&, client&>>::type;

}  // namespace detail

/// Bounded pool of connected clients.
///
/// Lifecycle:
/// - `start()` opens every client up front (eager) or none (lazy).
/// - `checkout()` hands out an idle client, opens a new one while below capacity, or waits for a
///   release. The returned `lease` gives the client back when destroyed.
/// - `shutdown()` refuses new checkouts, waits for outstanding leases and closes every client.
///
/// A client that is no longer connected when its lease ends is dropped, which frees its slot.
///
/// Thread-safety: checkout, lease release and shutdown may run concurrently on any thread.
/// The pool must be owned by a `std::shared_ptr`; every lease keeps it alive.
class connection_pool : public std::enable_shared_from_this<connection_pool> {
 public:
  /// Exclusive use of one pooled client.
  class lease {
   public:
    lease(lease const&) = delete;
    auto operator=(lease const&) -> lease& = delete;

    lease(lease&& other) noexcept = default;
    auto operator=(lease&& other) noexcept -> lease& {
      if (this != &other) {
        reset();
        pool_ = std::move(other.pool_);
        client_ = std::move(other.client_);
      }
      return *this;
    }

    ~lease() { reset(); }

    [[nodiscard]] auto get() const noexcept -> client& { return *client_; }
    auto operator*() const noexcept -> client& { return *client_; }
    auto operator->() const noexcept -> client* { return client_.get(); }

    /// Return the client to the pool now.
    void reset() noexcept {
      if (pool_ && client_) {
        pool_->release(std::move(client_));
      }
      pool_.reset();
      client_.reset();
    }

   private:
    friend class connection_pool;

    lease(std::shared_ptr<connection_pool> pool, std::unique_ptr<client> c) noexcept
        : pool_(std::move(pool)), client_(std::move(c)) {}

    std::shared_ptr<connection_pool> pool_{};
    std::unique_ptr<client> client_{};
  };

  connection_pool(iocoro::any_io_executor ex, std::string host, int port,
                  std::vector<start_option> options, pool_config cfg)
      : ex_(ex),
        host_(std::move(host)),
        port_(port),
        options_(std::move(options)),
        cfg_(cfg) {}

  connection_pool(connection_pool const&) = delete;
  auto operator=(connection_pool const&) -> connection_pool& = delete;

  /// Open the clients the creation strategy asks for, all within `timeout`.
  ///
  /// Errors: `pool_errc::start_failed` (cause: the client error) or `pool_errc::start_timeout`.
  /// On failure every client opened so far is closed.
  auto start(std::chrono::milliseconds timeout) -> iocoro::awaitable<expected<void, error_info>>;

  /// Errors: `shutting_down`, `create_failed`, `checkout_timeout` (all `pool_errc`).
  auto checkout() -> iocoro::awaitable<expected<lease, error_info>>;

  /// Run `fn(client&)` on a leased client; the lease is returned on every path.
  ///
  /// `fn` returns `iocoro::awaitable<expected<T, error_info>>`; a checkout failure is reported
  /// through the same expected.
  template <typename F>
  auto apply(F fn) -> iocoro::awaitable<detail::apply_result_t<F>> {
    auto l = co_await checkout();
    if (!l) {
      co_return unexpected(std::move(l.error()));
    }
    co_return co_await std::invoke(fn, l->get());
  }

  /// Stop handing out clients and close them all once outstanding leases are back.
  ///
  /// Idempotent. Errors: `pool_errc::shutdown_timeout` when leases are still out after `timeout`,
  /// or the first error met while closing a client.
  auto shutdown(std::chrono::milliseconds timeout)
    -> iocoro::awaitable<expected<void, error_info>>;

  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return cfg_.size; }

  /// Clients currently held by the pool, idle or leased.
  [[nodiscard]] auto size() const -> std::size_t {
    std::scoped_lock lk{mtx_};
    return total_;
  }

  [[nodiscard]] auto idle_count() const -> std::size_t {
    std::scoped_lock lk{mtx_};
    return idle_.size();
  }

  [[nodiscard]] auto in_use_count() const -> std::size_t {
    std::scoped_lock lk{mtx_};
    return total_ - idle_.size();
  }

  [[nodiscard]] auto is_shutting_down() const -> bool {
    std::scoped_lock lk{mtx_};
    return shutting_down_;
  }

 private:
  auto make_client() const -> std::unique_ptr<client> {
    return std::make_unique<client>(ex_, host_, port_, options_);
  }

  void release(std::unique_ptr<client> c) noexcept;

  /// Pops the oldest waiter, if any. Caller holds mtx_ and notifies after unlocking.
  auto take_waiter_locked() -> std::shared_ptr<iocoro::condition_event>;

  iocoro::any_io_executor ex_;
  std::string host_;
  int port_;
  std::vector<start_option> options_;
  pool_config cfg_;

  mutable std::mutex mtx_{};
  std::deque<std::unique_ptr<client>> idle_{};
  std::size_t total_{0};
  bool shutting_down_{false};
  std::deque<std::shared_ptr<iocoro::condition_event>> waiters_{};
  iocoro::condition_event drained_{};
};

}  // namespace rediscache

#include <rediscache/impl/pool.ipp>
