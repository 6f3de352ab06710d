#pragma once

#include <rediscache/resp3/parser.hpp>

#include <charconv>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>

namespace rediscache::resp3 {

namespace detail {

[[nodiscard]] inline auto parse_i64(std::string_view sv, std::int64_t& out) -> bool {
  if (sv.empty()) {
    return false;
  }
  auto const* first = sv.data();
  auto const* last = sv.data() + sv.size();
  if (*first == '+') {
    ++first;
  }
  auto res = std::from_chars(first, last, out);
  return res.ec == std::errc{} && res.ptr == last;
}

[[nodiscard]] inline auto parse_double(std::string_view sv, double& out) -> bool {
  if (sv == "inf") {
    out = std::numeric_limits<double>::infinity();
    return true;
  }
  if (sv == "-inf") {
    out = -std::numeric_limits<double>::infinity();
    return true;
  }
  if (sv == "nan") {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  if (sv.empty()) {
    return false;
  }
  auto res = std::from_chars(sv.data(), sv.data() + sv.size(), out, std::chars_format::general);
  return res.ec == std::errc{} && res.ptr == sv.data() + sv.size();
}

}  // namespace detail

inline auto parser::read_line(std::string_view data, std::size_t& pos) const
  -> expected<std::optional<std::string_view>, protocol_errc> {
  auto rest = data.substr(pos);
  auto crlf = rest.find("\r\n");
  if (crlf == std::string_view::npos) {
    if (rest.size() > limits_.max_line_bytes) {
      return unexpected(protocol_errc::line_too_long);
    }
    return std::optional<std::string_view>{};
  }
  if (crlf > limits_.max_line_bytes) {
    return unexpected(protocol_errc::line_too_long);
  }
  pos += crlf + 2;
  return std::optional<std::string_view>{rest.substr(0, crlf)};
}

inline auto parser::parse_bulk(kind k, std::int64_t len, std::string_view data,
                               std::size_t& pos) const -> step {
  // RESP2 null bulk string.
  if (len == -1 && k == kind::bulk_string) {
    return std::optional<message>{message::make_null()};
  }
  if (len < 0 || static_cast<std::uint64_t>(len) > limits_.max_bulk_bytes) {
    return unexpected(protocol_errc::invalid_length);
  }

  auto const n = static_cast<std::size_t>(len);
  if (data.size() - pos < n + 2) {
    return std::optional<message>{};
  }
  if (data[pos + n] != '\r' || data[pos + n + 1] != '\n') {
    return unexpected(protocol_errc::invalid_bulk_trailer);
  }

  auto payload = data.substr(pos, n);
  pos += n + 2;

  if (k == kind::verbatim_string) {
    // `txt:` / `mkd:` encoding prefix.
    if (payload.size() < 4 || payload[3] != ':') {
      return unexpected(protocol_errc::invalid_length);
    }
    payload.remove_prefix(4);
  }
  return std::optional<message>{message::make_text(k, payload)};
}

inline auto parser::parse_aggregate(kind k, std::int64_t len, std::string_view data,
                                    std::size_t& pos, std::uint32_t depth) const -> step {
  // RESP2 null array.
  if (len == -1 && k == kind::array) {
    return std::optional<message>{message::make_null()};
  }
  if (len < 0 || static_cast<std::uint64_t>(len) > limits_.max_container_len) {
    return unexpected(protocol_errc::invalid_length);
  }
  if (depth + 1 > limits_.max_depth) {
    return unexpected(protocol_errc::nesting_too_deep);
  }

  auto const pairs = (k == kind::map || k == kind::attribute);
  auto const count = static_cast<std::size_t>(len) * (pairs ? 2U : 1U);

  message out;
  out.type = k;
  out.elements.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto child = parse_value(data, pos, depth + 1);
    if (!child) {
      return unexpected(child.error());
    }
    if (!child->has_value()) {
      return std::optional<message>{};
    }
    out.elements.push_back(std::move(**child));
  }
  return std::optional<message>{std::move(out)};
}

inline auto parser::parse_value(std::string_view data, std::size_t& pos,
                                std::uint32_t depth) const -> step {
  if (pos >= data.size()) {
    return std::optional<message>{};
  }

  auto maybe_kind = prefix_to_kind(data[pos]);
  if (!maybe_kind.has_value()) {
    return unexpected(protocol_errc::invalid_type_byte);
  }
  auto const k = *maybe_kind;

  auto cursor = pos + 1;
  auto line = read_line(data, cursor);
  if (!line) {
    return unexpected(line.error());
  }
  if (!line->has_value()) {
    return std::optional<message>{};
  }
  auto const header = **line;

  switch (k) {
    case kind::simple_string:
    case kind::simple_error:
    case kind::big_number: {
      pos = cursor;
      return std::optional<message>{message::make_text(k, header)};
    }

    case kind::integer: {
      std::int64_t v{};
      if (!detail::parse_i64(header, v)) {
        return unexpected(protocol_errc::invalid_integer);
      }
      pos = cursor;
      return std::optional<message>{message::make_integer(v)};
    }

    case kind::double_number: {
      double v{};
      if (!detail::parse_double(header, v)) {
        return unexpected(protocol_errc::invalid_double);
      }
      pos = cursor;
      return std::optional<message>{message::make_text(k, header)};
    }

    case kind::boolean: {
      if (header != "t" && header != "f") {
        return unexpected(protocol_errc::invalid_boolean);
      }
      message m;
      m.type = kind::boolean;
      m.boolean = header == "t";
      pos = cursor;
      return std::optional<message>{std::move(m)};
    }

    case kind::null: {
      if (!header.empty()) {
        return unexpected(protocol_errc::invalid_null);
      }
      pos = cursor;
      return std::optional<message>{message::make_null()};
    }

    case kind::bulk_string:
    case kind::bulk_error:
    case kind::verbatim_string: {
      std::int64_t len{};
      if (!detail::parse_i64(header, len)) {
        return unexpected(protocol_errc::invalid_length);
      }
      auto r = parse_bulk(k, len, data, cursor);
      if (r && r->has_value()) {
        pos = cursor;
      }
      return r;
    }

    case kind::array:
    case kind::map:
    case kind::set:
    case kind::push:
    case kind::attribute: {
      std::int64_t len{};
      if (!detail::parse_i64(header, len)) {
        return unexpected(protocol_errc::invalid_length);
      }
      auto r = parse_aggregate(k, len, data, cursor, depth);
      if (!r || !r->has_value()) {
        return r;
      }
      if (k != kind::attribute) {
        pos = cursor;
        return r;
      }

      // An attribute annotates the value that follows it. Each attribute in a chain counts as
      // one level of nesting.
      auto annotated = parse_value(data, cursor, depth + 1);
      if (annotated && annotated->has_value()) {
        pos = cursor;
      }
      return annotated;
    }
  }

  return unexpected(protocol_errc::invalid_type_byte);
}

inline auto parser::parse_one() -> expected<std::optional<message>, protocol_errc> {
  if (failed_) {
    return unexpected(protocol_errc::parser_failed);
  }

  auto const data = buf_.data();
  std::size_t pos = 0;
  auto r = parse_value(data, pos, 0);
  if (!r) {
    failed_ = true;
    return r;
  }
  if (!r->has_value()) {
    return r;
  }

  buf_.consume(pos);
  return r;
}

}  // namespace rediscache::resp3
