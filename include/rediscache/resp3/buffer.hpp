#pragma once

#include <rediscache/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace rediscache::resp3 {

/// Receive buffer between the socket and the parser.
///
/// Layout: `[consumed | unread | free]`. Reads land in the free region (`prepare()` then
/// `commit()`), the parser looks at the unread region (`data()`) and drops what it parsed with
/// `consume()`. Consumed bytes are reclaimed lazily, when `prepare()` runs short of space.
class buffer {
 public:
  static constexpr std::size_t default_chunk = 4096;

  buffer() : bytes_(default_chunk) {}

  /// At least `min_size` free bytes after the unread region.
  auto prepare(std::size_t min_size = default_chunk) -> std::span<char> {
    if (free_space() < min_size) {
      make_room(min_size);
    }
    return {bytes_.data() + end_, free_space()};
  }

  auto commit(std::size_t n) -> void {
    REDISCACHE_ASSERT(n <= free_space());
    end_ += n;
  }

  [[nodiscard]] auto data() const noexcept -> std::string_view {
    return {bytes_.data() + begin_, size()};
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return end_ - begin_; }

  auto consume(std::size_t n) -> void {
    REDISCACHE_ASSERT(n <= size());
    begin_ += n;
    if (begin_ == end_) {
      reset();
    }
  }

  auto reset() noexcept -> void { begin_ = end_ = 0; }

 private:
  [[nodiscard]] auto free_space() const noexcept -> std::size_t { return bytes_.size() - end_; }

  auto make_room(std::size_t min_size) -> void {
    if (begin_ > 0) {
      auto const unread = size();
      std::copy(bytes_.begin() + static_cast<std::ptrdiff_t>(begin_),
                bytes_.begin() + static_cast<std::ptrdiff_t>(end_), bytes_.begin());
      begin_ = 0;
      end_ = unread;
    }

    auto capacity = bytes_.size();
    while (capacity - end_ < min_size) {
      capacity *= 2;
    }
    bytes_.resize(capacity);
  }

  std::vector<char> bytes_;
  std::size_t begin_ = 0;
  std::size_t end_ = 0;
};

}  // namespace rediscache::resp3
