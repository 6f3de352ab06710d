#include <rediscache/error.hpp>
#include <rediscache/error_info.hpp>
#include <rediscache/redis_error.hpp>

#include <gtest/gtest.h>

#include <system_error>
#include <variant>

using namespace rediscache;

namespace {

template <typename T>
auto is(redis_error const& e) -> bool {
  return std::holds_alternative<T>(e);
}

}  // namespace

TEST(error_translation_test, internal_error_is_actor_error) {
  EXPECT_EQ(translate_error(client_errc::internal_error), redis_error{actor_error{}});
}

TEST(error_translation_test, connection_establishment_failures) {
  for (auto code : {client_errc::not_connected, client_errc::already_connected,
                    client_errc::connection_closed, client_errc::resolve_failed,
                    client_errc::resolve_timeout, client_errc::connect_failed,
                    client_errc::connect_timeout, client_errc::handshake_failed,
                    client_errc::handshake_timeout}) {
    EXPECT_EQ(translate_error(code), redis_error{connection_error{}})
      << make_error_code(code).message();
  }
}

TEST(error_translation_test, transport_failures_carry_the_code) {
  for (auto code : {client_errc::request_timeout, client_errc::connection_reset,
                    client_errc::operation_aborted}) {
    auto e = translate_error(code);
    ASSERT_TRUE(is<tcp_error>(e)) << make_error_code(code).message();
    EXPECT_EQ(std::get<tcp_error>(e).inner, make_error_code(code));
  }
}

TEST(error_translation_test, socket_errors_prefer_the_cause) {
  auto const socket_ec = std::make_error_code(std::errc::connection_reset);

  error_info read_failure{client_errc::read_error};
  read_failure.set_cause(socket_ec);
  EXPECT_EQ(translate_error(read_failure), redis_error{tcp_error{socket_ec}});

  error_info write_failure{client_errc::write_error};
  EXPECT_EQ(translate_error(write_failure),
            redis_error{tcp_error{make_error_code(client_errc::write_error)}});
}

TEST(error_translation_test, foreign_codes_are_tcp_errors) {
  auto const ec = std::make_error_code(std::errc::broken_pipe);
  EXPECT_EQ(translate_error(error_info{ec}), redis_error{tcp_error{ec}});
}

TEST(error_translation_test, server_reply_keeps_message) {
  error_info e{server_errc::error_reply, "WRONGPASS invalid username-password pair"};
  EXPECT_EQ(translate_error(e),
            redis_error{server_error{"WRONGPASS invalid username-password pair"}});
}

TEST(error_translation_test, protocol_and_shape_errors_are_unknown_response) {
  EXPECT_EQ(translate_error(protocol_errc::invalid_type_byte),
            redis_error{unknown_response_error{}});
  EXPECT_EQ(translate_error(protocol_errc::nesting_too_deep),
            redis_error{unknown_response_error{}});
  EXPECT_EQ(translate_error(client_errc::unexpected_reply), redis_error{unknown_response_error{}});
}

TEST(error_translation_test, extra_reply_bytes_are_unknown_response) {
  EXPECT_EQ(translate_error(client_errc::unsolicited_message),
            redis_error{unknown_response_error{}});
}

TEST(error_translation_test, pool_errors_keep_the_code) {
  for (auto code : {pool_errc::checkout_timeout, pool_errc::shutting_down,
                    pool_errc::create_failed, pool_errc::start_failed}) {
    EXPECT_EQ(translate_error(code), redis_error{pool_error{make_error_code(code)}});
  }
}

TEST(error_translation_test, to_string_names_the_variant) {
  EXPECT_EQ(to_string(start_error{}), "start_error");
  EXPECT_EQ(to_string(actor_error{}), "actor_error");
  EXPECT_EQ(to_string(connection_error{}), "connection_error");
  EXPECT_EQ(to_string(shutdown_error{}), "shutdown_error");
  EXPECT_EQ(to_string(unknown_response_error{}), "unknown_response_error");
  EXPECT_EQ(to_string(server_error{"ERR boom"}), "server_error(ERR boom)");

  auto const timeout = make_error_code(client_errc::request_timeout);
  EXPECT_EQ(to_string(tcp_error{timeout}),
            "tcp_error(rediscache.client: " + timeout.message() + ")");

  auto const exhausted = make_error_code(pool_errc::checkout_timeout);
  EXPECT_EQ(to_string(pool_error{exhausted}),
            "pool_error(rediscache.pool: " + exhausted.message() + ")");
}

TEST(error_translation_test, error_info_to_string) {
  error_info e{client_errc::connect_failed, "127.0.0.1:1"};
  e.set_cause(std::make_error_code(std::errc::connection_refused));
  auto s = e.to_string();
  EXPECT_NE(s.find("rediscache.client"), std::string::npos);
  EXPECT_NE(s.find("(127.0.0.1:1)"), std::string::npos);
  EXPECT_NE(s.find("(cause=generic:"), std::string::npos);
}

TEST(error_translation_test, categories_are_distinct) {
  EXPECT_TRUE(is_client_error(make_error_code(client_errc::not_found)));
  EXPECT_FALSE(is_client_error(make_error_code(pool_errc::checkout_timeout)));
  EXPECT_TRUE(is_pool_error(make_error_code(pool_errc::checkout_timeout)));
  EXPECT_TRUE(is_server_error(make_error_code(server_errc::error_reply)));
  EXPECT_TRUE(is_protocol_error(make_error_code(protocol_errc::invalid_length)));
  EXPECT_STREQ(client_category().name(), "rediscache.client");
  EXPECT_STREQ(protocol_category().name(), "rediscache.protocol");
  EXPECT_STREQ(server_category().name(), "rediscache.server");
  EXPECT_STREQ(pool_category().name(), "rediscache.pool");
}

TEST(error_translation_death_test, not_found_is_fatal) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_DEATH((void)translate_error(client_errc::not_found), "UNREACHABLE failure");
}
