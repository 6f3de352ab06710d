#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define REDISCACHE_LIKELY(x) __builtin_expect(!!(x), 1)
#else
#define REDISCACHE_LIKELY(x) (x)
#endif

namespace rediscache::detail {

enum class check_kind { assertion, precondition, unreachable };

/// Prints `[rediscache] <KIND> failure` plus the expression, message and location to stderr, then
/// aborts.
[[noreturn]] void check_failed(check_kind kind, char const* expr, char const* msg,
                               char const* file, int line, char const* func) noexcept;

constexpr auto optional_message() noexcept -> char const* { return nullptr; }
constexpr auto optional_message(char const* msg) noexcept -> char const* { return msg; }

}  // namespace rediscache::detail

#define REDISCACHE_DETAIL_CHECK(kind, expr, ...)                                          \
  (REDISCACHE_LIKELY(expr)                                                                \
     ? (void)0                                                                            \
     : ::rediscache::detail::check_failed(                                                \
         ::rediscache::detail::check_kind::kind, #expr,                                   \
         ::rediscache::detail::optional_message(__VA_ARGS__), __FILE__, __LINE__, __func__))

/// Internal consistency check, compiled out with NDEBUG. Optional second argument: message.
#if !defined(NDEBUG)
#define REDISCACHE_ASSERT(expr, ...) REDISCACHE_DETAIL_CHECK(assertion, expr, __VA_ARGS__)
#else
#define REDISCACHE_ASSERT(expr, ...) ((void)0)
#endif

/// Caller contract check, always on.
#define REDISCACHE_ENSURE(expr, ...) REDISCACHE_DETAIL_CHECK(precondition, expr, __VA_ARGS__)

/// Marks a path that correct callers never reach.
#define REDISCACHE_UNREACHABLE(...)                                                     \
  ::rediscache::detail::check_failed(::rediscache::detail::check_kind::unreachable, nullptr, \
                                     ::rediscache::detail::optional_message(__VA_ARGS__), \
                                     __FILE__, __LINE__, __func__)
