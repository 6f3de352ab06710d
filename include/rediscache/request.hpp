#pragma once

#include <rediscache/assert.hpp>
#include <rediscache/resp3/kind.hpp>

#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace rediscache {

/// One or more commands encoded as RESP arrays of bulk strings, ready to be written.
///
///   request req{"SET", key, value};
///   req.push("EXPIRE", key, 30);
///   req.reply_count();  // 2
///
/// Arguments may be anything convertible to `std::string_view` or an integer (sent in decimal).
class request {
 public:
  request() = default;

  template <typename... Args>
  explicit request(std::string_view cmd, Args&&... args) {
    push(cmd, std::forward<Args>(args)...);
  }

  /// One reply is expected per pushed command.
  [[nodiscard]] auto reply_count() const noexcept -> std::size_t { return commands_; }

  [[nodiscard]] auto empty() const noexcept -> bool { return commands_ == 0; }

  [[nodiscard]] auto wire() const noexcept -> std::string const& { return wire_; }

  template <typename... Args>
  void push(std::string_view cmd, Args&&... args) {
    open_array(1 + sizeof...(Args));
    add_bulk(cmd);
    (add_argument(std::forward<Args>(args)), ...);
    ++commands_;
  }

  /// Command name followed by its arguments.
  void push(std::span<std::string_view const> argv) {
    REDISCACHE_ASSERT(!argv.empty(), "a command needs at least its name");
    open_array(argv.size());
    for (auto arg : argv) {
      add_bulk(arg);
    }
    ++commands_;
  }

 private:
  template <typename T>
  void add_argument(T&& arg) {
    using value_type = std::remove_cvref_t<T>;
    if constexpr (std::is_integral_v<value_type> && !std::is_same_v<value_type, bool>) {
      char digits[24]{};
      auto [end, ec] = std::to_chars(digits, digits + sizeof(digits), arg);
      REDISCACHE_ASSERT(ec == std::errc{});
      add_bulk(std::string_view{digits, static_cast<std::size_t>(end - digits)});
    } else if constexpr (std::is_pointer_v<std::decay_t<T>>) {
      std::decay_t<T> s = arg;
      add_bulk(s != nullptr ? std::string_view{s} : std::string_view{});
    } else {
      add_bulk(std::string_view{arg});
    }
  }

  void open_array(std::size_t n) {
    wire_ += resp3::kind_to_prefix(resp3::kind::array);
    wire_ += std::to_string(n);
    wire_ += "\r\n";
  }

  void add_bulk(std::string_view s) {
    wire_ += resp3::kind_to_prefix(resp3::kind::bulk_string);
    wire_ += std::to_string(s.size());
    wire_ += "\r\n";
    wire_ += s;
    wire_ += "\r\n";
  }

  std::string wire_{};
  std::size_t commands_ = 0;
};

}  // namespace rediscache
