#pragma once

#include <rediscache/error.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace rediscache {

/// Failure reported by the wire client and the pool.
///
/// `code` is what callers branch on. `detail` carries text for humans (a server error line, the
/// command that got an odd reply). `cause_ec` keeps the lower-level error that triggered this one,
/// one level deep.
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};

  error_info() = default;

  explicit error_info(std::error_code c, std::string d = {}) : code(c), detail(std::move(d)) {}

  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  error_info(Errc e, std::string d = {})  // NOLINT(google-explicit-constructor)
      : code(make_error_code(e)), detail(std::move(d)) {}

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  /// `<category>: <message> (<detail>) (cause=<category>: <message>)`, omitting empty parts.
  [[nodiscard]] auto to_string() const -> std::string {
    auto out = code ? describe(code) : std::string{"unknown error"};
    if (!detail.empty()) {
      out += " (" + detail + ")";
    }
    if (cause_ec) {
      out += " (cause=" + describe(cause_ec) + ")";
    }
    return out;
  }

 private:
  static auto describe(std::error_code ec) -> std::string {
    return std::string{ec.category().name()} + ": " + ec.message();
  }
};

}  // namespace rediscache
