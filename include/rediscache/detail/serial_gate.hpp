#pragma once

#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <deque>
#include <memory>
#include <mutex>

namespace rediscache::detail {

/// FIFO admission gate: at most one coroutine holds it at a time.
///
/// release() hands the gate directly to the oldest waiter, so a late arrival cannot overtake a
/// coroutine that is already queued. Safe to use from several threads.
class serial_gate {
 public:
  /// Owns the gate until destroyed.
  class holder {
   public:
    explicit holder(serial_gate& g) noexcept : gate_(&g) {}

    holder(holder const&) = delete;
    auto operator=(holder const&) -> holder& = delete;

    holder(holder&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
    auto operator=(holder&&) -> holder& = delete;

    ~holder() {
      if (gate_ != nullptr) {
        gate_->release();
      }
    }

   private:
    serial_gate* gate_;
  };

  serial_gate() = default;
  serial_gate(serial_gate const&) = delete;
  auto operator=(serial_gate const&) -> serial_gate& = delete;

  auto acquire() -> iocoro::awaitable<holder> {
    std::shared_ptr<iocoro::condition_event> ev;
    {
      std::scoped_lock lk{mtx_};
      if (!busy_) {
        busy_ = true;
        co_return holder{*this};
      }
      ev = std::make_shared<iocoro::condition_event>();
      waiters_.push_back(ev);
    }
    // release() passes ownership along with the notification.
    (void)co_await ev->async_wait();
    co_return holder{*this};
  }

 private:
  void release() {
    std::shared_ptr<iocoro::condition_event> next;
    {
      std::scoped_lock lk{mtx_};
      if (waiters_.empty()) {
        busy_ = false;
        return;
      }
      next = std::move(waiters_.front());
      waiters_.pop_front();
    }
    next->notify();
  }

  std::mutex mtx_{};
  bool busy_{false};
  std::deque<std::shared_ptr<iocoro::condition_event>> waiters_{};
};

}  // namespace rediscache::detail
