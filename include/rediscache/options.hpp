#pragma once

#include <rediscache/config.hpp>

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace rediscache {

/// AUTH with the password only (`AUTH <password>`, default user).
struct auth_option {
  std::string password;

  auto operator==(auth_option const&) const -> bool = default;
};

/// AUTH with an ACL user (`AUTH <username> <password>`).
struct auth_with_username_option {
  std::string username;
  std::string password;

  auto operator==(auth_with_username_option const&) const -> bool = default;
};

/// Bound for resolve, connect, handshake and every command.
struct timeout_option {
  std::chrono::milliseconds value;

  auto operator==(timeout_option const&) const -> bool = default;
};

/// One start option understood by the wire client.
using start_option = std::variant<auth_option, auth_with_username_option, timeout_option>;

/// Translate a driver config into the ordered start options of the wire client.
///
/// The timeout option is always present. At most one auth option is produced, listed first:
/// - username and password -> auth_with_username_option{username, password}
/// - username only         -> auth_with_username_option{username, ""}
/// - password only         -> auth_option{password}
[[nodiscard]] inline auto to_start_options(config const& cfg) -> std::vector<start_option> {
  std::vector<start_option> out;
  out.reserve(2);

  if (cfg.username.has_value()) {
    out.emplace_back(auth_with_username_option{
      .username = *cfg.username,
      .password = cfg.password.value_or(std::string{}),
    });
  } else if (cfg.password.has_value()) {
    out.emplace_back(auth_option{.password = *cfg.password});
  }

  out.emplace_back(timeout_option{.value = cfg.timeout});
  return out;
}

namespace detail {

/// Start options folded into the settings the connection works with.
struct connection_settings {
  std::optional<std::chrono::milliseconds> timeout{};
  std::optional<std::string> username{};
  std::optional<std::string> password{};

  [[nodiscard]] auto wants_auth() const noexcept -> bool { return password.has_value(); }
};

/// Later options override earlier ones of the same kind.
[[nodiscard]] inline auto fold_options(std::span<start_option const> options)
  -> connection_settings {
  connection_settings out{};
  for (auto const& opt : options) {
    if (auto const* a = std::get_if<auth_option>(&opt)) {
      out.username.reset();
      out.password = a->password;
    } else if (auto const* au = std::get_if<auth_with_username_option>(&opt)) {
      out.username = au->username;
      out.password = au->password;
    } else if (auto const* t = std::get_if<timeout_option>(&opt)) {
      out.timeout = t->value;
    }
  }
  return out;
}

}  // namespace detail

}  // namespace rediscache
