#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace rediscache::resp3 {

/// Type of a reply value. RESP2 replies use a subset; the rest only appear from RESP3 servers.
enum class kind {
  simple_string,
  simple_error,
  integer,
  double_number,
  boolean,
  big_number,
  null,
  bulk_string,
  bulk_error,
  verbatim_string,
  array,
  map,
  set,
  attribute,
  push,
};

namespace detail {

struct kind_entry {
  kind k;
  char prefix;
  std::string_view name;
};

// clang-format off
// Indexed by the enumerator value.
inline constexpr std::array<kind_entry, 15> kind_table{{
  {kind::simple_string,   '+', "simple_string"},
  {kind::simple_error,    '-', "simple_error"},
  {kind::integer,         ':', "integer"},
  {kind::double_number,   ',', "double"},
  {kind::boolean,         '#', "boolean"},
  {kind::big_number,      '(', "big_number"},
  {kind::null,            '_', "null"},  // RESP2 nil bulk/array also parse to null
  {kind::bulk_string,     '$', "bulk_string"},
  {kind::bulk_error,      '!', "bulk_error"},
  {kind::verbatim_string, '=', "verbatim_string"},
  {kind::array,           '*', "array"},
  {kind::map,             '%', "map"},
  {kind::set,             '~', "set"},
  {kind::attribute,       '|', "attribute"},
  {kind::push,            '>', "push"},
}};
// clang-format on

constexpr auto entry_of(kind k) noexcept -> kind_entry const* {
  auto const i = static_cast<std::size_t>(k);
  return i < kind_table.size() ? &kind_table[i] : nullptr;
}

}  // namespace detail

[[nodiscard]] constexpr auto kind_to_prefix(kind k) noexcept -> char {
  auto const* e = detail::entry_of(k);
  return e != nullptr ? e->prefix : '\0';
}

[[nodiscard]] constexpr auto prefix_to_kind(char b) noexcept -> std::optional<kind> {
  for (auto const& e : detail::kind_table) {
    if (e.prefix == b) {
      return e.k;
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr auto kind_name(kind k) noexcept -> std::string_view {
  auto const* e = detail::entry_of(k);
  return e != nullptr ? e->name : "<unknown>";
}

[[nodiscard]] constexpr auto is_aggregate(kind k) noexcept -> bool {
  switch (k) {
    case kind::array:
    case kind::map:
    case kind::set:
    case kind::attribute:
    case kind::push:
      return true;
    default:
      return false;
  }
}

static_assert(kind_to_prefix(kind::push) == '>');
static_assert(prefix_to_kind('$') == kind::bulk_string);

}  // namespace rediscache::resp3
