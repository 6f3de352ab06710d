#pragma once

#include <rediscache/resp3/kind.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rediscache::resp3 {

/// One complete, owning RESP reply.
///
/// Representation by kind:
/// - string, error, big number, double and verbatim kinds keep their payload text in `text`
///   (verbatim strings without the `xxx:` encoding prefix)
/// - integer keeps its value in `integer`, boolean in `boolean`
/// - array / set / push keep their elements in `elements`
/// - map keeps keys and values interleaved in `elements` (k0, v0, k1, v1, ...)
/// - null has no payload
struct message {
  kind type{kind::null};
  std::string text{};
  std::int64_t integer{0};
  bool boolean{false};
  std::vector<message> elements{};

  [[nodiscard]] static auto make_null() -> message { return message{}; }

  [[nodiscard]] static auto make_text(kind k, std::string_view s) -> message {
    message m;
    m.type = k;
    m.text.assign(s.data(), s.size());
    return m;
  }

  [[nodiscard]] static auto make_integer(std::int64_t v) -> message {
    message m;
    m.type = kind::integer;
    m.integer = v;
    return m;
  }

  [[nodiscard]] auto is(kind k) const noexcept -> bool { return type == k; }

  [[nodiscard]] auto is_null() const noexcept -> bool { return type == kind::null; }

  [[nodiscard]] auto is_error() const noexcept -> bool {
    return type == kind::simple_error || type == kind::bulk_error;
  }

  [[nodiscard]] auto is_string() const noexcept -> bool {
    return type == kind::simple_string || type == kind::bulk_string ||
           type == kind::verbatim_string;
  }

  [[nodiscard]] auto is_aggregate() const noexcept -> bool { return resp3::is_aggregate(type); }

  /// Payload as a string for string kinds, nullopt otherwise.
  [[nodiscard]] auto as_string() const -> std::optional<std::string> {
    if (!is_string()) {
      return std::nullopt;
    }
    return text;
  }

  /// Integer payload; RESP2 servers never send booleans, RESP3 servers may.
  [[nodiscard]] auto as_integer() const noexcept -> std::optional<std::int64_t> {
    if (type == kind::integer) {
      return integer;
    }
    if (type == kind::boolean) {
      return boolean ? 1 : 0;
    }
    return std::nullopt;
  }
};

}  // namespace rediscache::resp3
