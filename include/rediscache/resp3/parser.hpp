#pragma once

#include <rediscache/error.hpp>
#include <rediscache/expected.hpp>
#include <rediscache/resp3/buffer.hpp>
#include <rediscache/resp3/message.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace rediscache::resp3 {

/// Incremental RESP reply parser producing owning messages.
///
/// Usage:
///   auto buf = p.prepare();          // socket reads into buf
///   p.commit(n);
///   while (auto r = p.parse_one()) { // stop on protocol error
///     if (!r->has_value()) break;    // needs more bytes
///     handle(std::move(**r));
///   }
///
/// Contracts:
/// - parse_one() consumes bytes only when a complete value was parsed; an incomplete value is
///   re-scanned from its first byte on the next call.
/// - Attributes (`|`) are consumed and dropped; the value they annotate is returned.
/// - After a protocol error the parser stays failed (parser_failed) until reset().
class parser {
 public:
  /// Input hardening limits. Exceeding a length limit is invalid_length.
  struct limits {
    std::size_t max_bulk_bytes = 512ULL * 1024ULL * 1024ULL;
    std::uint32_t max_container_len = 1'000'000U;
    std::size_t max_line_bytes = 64ULL * 1024ULL;
    std::uint32_t max_depth = 64U;
  };

  parser() = default;

  explicit parser(limits l) : limits_(l) {}

  auto prepare(std::size_t min_size = 4096) -> std::span<std::byte> {
    return std::as_writable_bytes(buf_.prepare(min_size));
  }

  auto commit(std::size_t n) -> void { buf_.commit(n); }

  /// Parse exactly one complete value.
  ///
  /// Returns:
  /// - message: a value was parsed and its bytes consumed
  /// - nullopt: more input is needed
  /// - protocol_errc: malformed input (parser is now failed)
  auto parse_one() -> expected<std::optional<message>, protocol_errc>;

  [[nodiscard]] auto failed() const noexcept -> bool { return failed_; }

  /// Bytes received but not yet consumed by a parsed value.
  [[nodiscard]] auto buffered() const noexcept -> std::size_t { return buf_.size(); }

  auto reset() -> void {
    buf_.reset();
    failed_ = false;
  }

 private:
  using step = expected<std::optional<message>, protocol_errc>;

  [[nodiscard]] auto read_line(std::string_view data, std::size_t& pos) const
    -> expected<std::optional<std::string_view>, protocol_errc>;

  [[nodiscard]] auto parse_value(std::string_view data, std::size_t& pos,
                                 std::uint32_t depth) const -> step;

  [[nodiscard]] auto parse_bulk(kind k, std::int64_t len, std::string_view data,
                                std::size_t& pos) const -> step;

  [[nodiscard]] auto parse_aggregate(kind k, std::int64_t len, std::string_view data,
                                     std::size_t& pos, std::uint32_t depth) const -> step;

  limits limits_{};
  buffer buf_{};
  bool failed_{false};
};

}  // namespace rediscache::resp3

#include <rediscache/resp3/impl/parser.ipp>
