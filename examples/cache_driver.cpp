#include <rediscache/rediscache.hpp>

#include <iocoro/iocoro.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using namespace std::chrono_literals;

auto cache_driver_task() -> iocoro::awaitable<void> {
  auto ex = co_await iocoro::this_coro::executor;

  rediscache::config cfg{};
  cfg.host = "127.0.0.1";
  cfg.port = 6379;
  cfg.timeout = 1000ms;

  auto initial = rediscache::make_driver(ex, cfg);
  auto connected = co_await rediscache::connect(initial);
  if (!connected) {
    using driver_error = rediscache::cache::connect_driver_error<rediscache::redis_error>;
    if (auto const* e = std::get_if<driver_error>(&connected.error())) {
      std::cerr << "connect failed: " << rediscache::to_string(e->error) << "\n";
    }
    co_return;
  }
  auto d = *connected;

  if (auto r = co_await rediscache::set(d, "session", "42", "alice", 60s); !r) {
    std::cerr << "set failed\n";
  }

  auto value = co_await rediscache::get(d, "session", "42");
  if (value) {
    std::cout << "session:42 = " << *value << "\n";
  } else if (std::holds_alternative<rediscache::cache::got_too_few_records>(value.error())) {
    std::cout << "session:42 is not cached\n";
  }

  (void)co_await rediscache::del(d, "session", "42");

  auto gone = co_await rediscache::get(d, "session", "42");
  std::cout << "after delete: " << (gone ? *gone : std::string{"<missing>"}) << "\n";

  auto disconnected = co_await rediscache::disconnect(d);
  if (disconnected) {
    std::cout << "disconnected, connected=" << disconnected->is_connected() << "\n";
  }
}

int main() {
  rediscache::set_log_level(rediscache::log_level::info);

  iocoro::io_context ctx;
  iocoro::co_spawn(ctx.get_executor(), cache_driver_task(), iocoro::detached);
  ctx.run();
  return 0;
}
