#pragma once

#include <string>
#include <string_view>

namespace rediscache {

inline constexpr char key_separator = ':';

/// Wire key for a cache entry: `resource_type:key`.
///
/// Neither part is escaped, so `("a:b", "c")` and `("a", "b:c")` name the same entry.
[[nodiscard]] inline auto compose_key(std::string_view resource_type, std::string_view key)
  -> std::string {
  std::string out;
  out.reserve(resource_type.size() + 1 + key.size());
  out.append(resource_type);
  out.push_back(key_separator);
  out.append(key);
  return out;
}

}  // namespace rediscache
