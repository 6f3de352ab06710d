#pragma once

#include <rediscache/expected.hpp>

#include <iocoro/awaitable.hpp>

#include <chrono>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/// Generic cache-driver vocabulary.
///
/// A cache driver is a value type `D` with five free coroutines found by ADL:
///
///   connect(D)                                  -> expected<D, connect_error<E>>
///   disconnect(D)                               -> expected<D, disconnect_error<E>>
///   set(D, resource_type, key, value, ttl)      -> expected<void, set_error<E>>
///   get(D, resource_type, key)                  -> expected<std::string, get_error<E>>
///   del(D, resource_type, key)                  -> expected<void, delete_error<E>>
///
/// `E` is the driver's own error type. Drivers are passed by value; lifecycle operations return
/// the next state instead of changing the one they were given.
namespace rediscache::cache {

/// connect() on a state that already holds a connection.
struct already_connected {
  auto operator==(already_connected const&) const -> bool = default;
};

/// disconnect() on a state without a connection.
struct not_connected {
  auto operator==(not_connected const&) const -> bool = default;
};

/// get() found no entry.
struct got_too_few_records {
  auto operator==(got_too_few_records const&) const -> bool = default;
};

template <typename E>
struct connect_driver_error {
  E error;
  auto operator==(connect_driver_error const&) const -> bool = default;
};

template <typename E>
struct disconnect_driver_error {
  E error;
  auto operator==(disconnect_driver_error const&) const -> bool = default;
};

template <typename E>
struct set_driver_error {
  E error;
  auto operator==(set_driver_error const&) const -> bool = default;
};

template <typename E>
struct get_driver_error {
  E error;
  auto operator==(get_driver_error const&) const -> bool = default;
};

template <typename E>
struct delete_driver_error {
  E error;
  auto operator==(delete_driver_error const&) const -> bool = default;
};

template <typename E>
using connect_error = std::variant<already_connected, connect_driver_error<E>>;

template <typename E>
using disconnect_error = std::variant<not_connected, disconnect_driver_error<E>>;

template <typename E>
using set_error = std::variant<set_driver_error<E>>;

template <typename E>
using get_error = std::variant<got_too_few_records, get_driver_error<E>>;

template <typename E>
using delete_error = std::variant<delete_driver_error<E>>;

/// Time to live of a cache entry; nullopt keeps the entry until it is deleted.
using ttl = std::optional<std::chrono::seconds>;

template <typename D, typename E>
concept driver = std::copy_constructible<D> &&
  requires(D d, std::string_view type, std::string_view key, std::string_view value, ttl t) {
    { connect(d) } -> std::same_as<iocoro::awaitable<expected<D, connect_error<E>>>>;
    { disconnect(d) } -> std::same_as<iocoro::awaitable<expected<D, disconnect_error<E>>>>;
    {
      set(d, type, key, value, t)
    } -> std::same_as<iocoro::awaitable<expected<void, set_error<E>>>>;
    {
      get(d, type, key)
    } -> std::same_as<iocoro::awaitable<expected<std::string, get_error<E>>>>;
    { del(d, type, key) } -> std::same_as<iocoro::awaitable<expected<void, delete_error<E>>>>;
  };

}  // namespace rediscache::cache
