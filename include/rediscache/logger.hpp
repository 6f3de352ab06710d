#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iterator>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <version>

#if defined(__cpp_lib_format) && __has_include(<format>)
#include <format>
namespace rediscache {
namespace format_impl = std;
}  // namespace rediscache
#else
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>
namespace rediscache {
namespace format_impl = fmt;
}  // namespace rediscache
#endif

namespace rediscache {

enum class log_level {
  debug,
  info,
  warning,
  error,
  off,
};

constexpr auto to_string(log_level level) noexcept -> char const* {
  constexpr char const* names[] = {"debug", "info", "warning", "error", "off"};
  auto const i = static_cast<unsigned>(level);
  return i < std::size(names) ? names[i] : "unknown";
}

/// One log record handed to the installed sink. Views are only valid during the call.
struct log_context {
  log_level level;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = void (*)(void*, log_context const&);

/// Process-wide logger shared by the connection, pool and driver layers.
///
/// Disabled (`log_level::off`) until the application lowers the level. Install the sink before
/// logging starts on other threads; the level may change at any time.
class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  /// nullptr restores the default stderr sink.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    sink_ = fn != nullptr ? sink{fn, user_data} : sink{&write_stderr, nullptr};
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  [[nodiscard]] auto get_log_level() const -> log_level {
    return min_level_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto enabled(log_level level) const -> bool {
    return level != log_level::off && level >= get_log_level();
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!enabled(level)) {
      return;
    }
    sink_.fn(sink_.user_data, log_context{
                                .level = level,
                                .message = message,
                                .file = file,
                                .line = line,
                                .timestamp = std::chrono::system_clock::now(),
                              });
  }

  /// Formats only when `level` passes the filter.
  template <typename... Args>
  void log(log_level level, std::string_view file, int line,
           format_impl::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level)) {
      log(level, format_impl::format(fmt, std::forward<Args>(args)...), file, line);
    }
  }

 private:
  struct sink {
    log_function fn;
    void* user_data;
  };

  logger() : sink_{&write_stderr, nullptr} {}

  static auto base_name(std::string_view path) -> std::string_view {
    auto const pos = path.find_last_of("/\\");
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
  }

  // [2026-01-31 12:00:00.123] [rediscache] [info] [pool.ipp:42] message
  static void write_stderr(void*, log_context const& ctx) {
    auto const secs = std::chrono::system_clock::to_time_t(ctx.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          ctx.timestamp.time_since_epoch())
                          .count() %
                        1000;
    std::tm local{};
    localtime_r(&secs, &local);
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::cerr << format_impl::format("[{}.{:03d}] [rediscache] [{}] [{}:{}] {}\n",
                                     static_cast<char const*>(stamp),
                                     static_cast<int>(millis), to_string(ctx.level),
                                     base_name(ctx.file), ctx.line, ctx.message)
              << std::flush;
  }

  sink sink_;
  std::atomic<log_level> min_level_{log_level::off};
};

inline auto get_logger() -> logger& { return logger::instance(); }

inline void set_log_function(log_function fn, void* user_data = nullptr) {
  logger::instance().set_log_function(fn, user_data);
}

inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

}  // namespace rediscache

#define REDISCACHE_LOG_AT(level, fmt, ...)                                               \
  ::rediscache::get_logger().log(::rediscache::log_level::level, __FILE__, __LINE__, fmt \
                                 __VA_OPT__(, ) __VA_ARGS__)

#define REDISCACHE_LOG_DEBUG(fmt, ...) REDISCACHE_LOG_AT(debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define REDISCACHE_LOG_INFO(fmt, ...) REDISCACHE_LOG_AT(info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define REDISCACHE_LOG_WARNING(fmt, ...) REDISCACHE_LOG_AT(warning, fmt __VA_OPT__(, ) __VA_ARGS__)
#define REDISCACHE_LOG_ERROR(fmt, ...) REDISCACHE_LOG_AT(error, fmt __VA_OPT__(, ) __VA_ARGS__)
