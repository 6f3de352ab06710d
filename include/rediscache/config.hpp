#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace rediscache {

/// How a connection pool opens its connections.
enum class creation_strategy {
  /// Open every connection while the pool starts; startup fails if any cannot be opened.
  eager,
  /// Open connections on demand during checkout.
  lazy,
};

/// Cache driver configuration.
///
/// Defaults: `localhost:6379`, 5000 ms timeout, no authentication, pool of 10.
/// The pool fields are ignored by the single-connection driver.
struct config {
  std::string host = "localhost";
  int port = 6379;

  /// Bound for connecting and for every command sent to the server.
  std::chrono::milliseconds timeout{5000};

  /// Number of connections held by the pooled driver.
  std::size_t pool_size = 10;

  /// Bound for pool startup (pooled driver only).
  std::chrono::milliseconds pool_start_timeout{1000};

  creation_strategy pool_creation = creation_strategy::eager;

  std::optional<std::string> username{};
  std::optional<std::string> password{};
};

}  // namespace rediscache
