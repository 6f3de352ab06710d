#include <rediscache/rediscache.hpp>

#include <iocoro/iocoro.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

using namespace std::chrono_literals;

namespace {

// Each worker stores and reads back its own entry through the shared pool.
auto worker(rediscache::pooled_driver d, int id) -> iocoro::awaitable<void> {
  auto const key = std::to_string(id);
  auto const value = "payload-" + key;

  auto stored = co_await rediscache::set(d, "job", key, value, 30s);
  if (!stored) {
    auto const& e = std::get<rediscache::cache::set_driver_error<rediscache::redis_error>>(
      stored.error());
    std::cerr << "worker " << id << " set failed: " << rediscache::to_string(e.error) << "\n";
    co_return;
  }

  auto read = co_await rediscache::get(d, "job", key);
  std::cout << "worker " << id << " read " << (read ? *read : std::string{"<missing>"}) << "\n";

  (void)co_await rediscache::del(d, "job", key);
}

}  // namespace

auto pooled_cache_driver_task() -> iocoro::awaitable<void> {
  auto ex = co_await iocoro::this_coro::executor;

  rediscache::config cfg{};
  cfg.host = "127.0.0.1";
  cfg.port = 6379;
  cfg.pool_size = 4;
  cfg.pool_creation = rediscache::creation_strategy::lazy;

  auto connected = co_await rediscache::connect(rediscache::make_pooled_driver(ex, cfg));
  if (!connected) {
    std::cerr << "pool start failed\n";
    co_return;
  }
  auto d = *connected;

  for (int id = 0; id < 8; ++id) {
    iocoro::co_spawn(ex, worker(d, id), iocoro::detached);
  }

  co_await iocoro::co_sleep(500ms);
  std::cout << "pool clients: " << d.pool->size() << "/" << d.pool->capacity() << "\n";

  if (auto r = co_await rediscache::disconnect(d); !r) {
    std::cerr << "pool shutdown failed\n";
  }
}

int main() {
  iocoro::io_context ctx;
  iocoro::co_spawn(ctx.get_executor(), pooled_cache_driver_task(), iocoro::detached);
  ctx.run();
  return 0;
}
