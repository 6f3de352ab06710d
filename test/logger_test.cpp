#include <rediscache/logger.hpp>

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct log_capture {
  struct entry {
    rediscache::log_level level;
    std::string message;
    std::string file;
    int line;
  };

  std::mutex mu;
  std::vector<entry> entries;

  static void on_log(void* user_data, rediscache::log_context const& ctx) {
    auto* self = static_cast<log_capture*>(user_data);
    std::lock_guard lock(self->mu);
    self->entries.push_back(
      {ctx.level, std::string{ctx.message}, std::string{ctx.file}, ctx.line});
  }
};

class logger_test : public ::testing::Test {
 protected:
  void SetUp() override {
    rediscache::set_log_function(&log_capture::on_log, &capture_);
    rediscache::set_log_level(rediscache::log_level::info);
  }

  void TearDown() override {
    rediscache::set_log_function(nullptr);
    rediscache::set_log_level(rediscache::log_level::off);
  }

  log_capture capture_{};
};

TEST(logger_default_test, disabled_until_level_is_lowered) {
  auto& lg = rediscache::get_logger();
  EXPECT_EQ(lg.get_log_level(), rediscache::log_level::off);
  EXPECT_FALSE(lg.enabled(rediscache::log_level::error));
  EXPECT_FALSE(lg.enabled(rediscache::log_level::off));
}

TEST_F(logger_test, levels_reach_the_sink) {
  rediscache::set_log_level(rediscache::log_level::debug);

  REDISCACHE_LOG_DEBUG("debug message");
  REDISCACHE_LOG_INFO("info message");
  REDISCACHE_LOG_WARNING("warning message");
  REDISCACHE_LOG_ERROR("error message");

  ASSERT_EQ(capture_.entries.size(), 4U);
  EXPECT_EQ(capture_.entries[0].level, rediscache::log_level::debug);
  EXPECT_EQ(capture_.entries[1].level, rediscache::log_level::info);
  EXPECT_EQ(capture_.entries[2].level, rediscache::log_level::warning);
  EXPECT_EQ(capture_.entries[3].level, rediscache::log_level::error);
  EXPECT_EQ(capture_.entries[3].message, "error message");
}

TEST_F(logger_test, formats_arguments) {
  std::string host = "localhost";
  REDISCACHE_LOG_INFO("connection.open host={} port={}", host, 6379);

  ASSERT_EQ(capture_.entries.size(), 1U);
  EXPECT_EQ(capture_.entries[0].message, "connection.open host=localhost port=6379");
}

TEST_F(logger_test, records_call_site) {
  REDISCACHE_LOG_INFO("here");
  int const line = __LINE__ - 1;

  ASSERT_EQ(capture_.entries.size(), 1U);
  EXPECT_EQ(capture_.entries[0].line, line);
  EXPECT_NE(capture_.entries[0].file.find("logger_test.cpp"), std::string::npos);
}

TEST_F(logger_test, filters_below_min_level) {
  rediscache::set_log_level(rediscache::log_level::warning);

  REDISCACHE_LOG_DEBUG("dropped");
  REDISCACHE_LOG_INFO("dropped");
  REDISCACHE_LOG_WARNING("kept");
  REDISCACHE_LOG_ERROR("kept");

  ASSERT_EQ(capture_.entries.size(), 2U);
  EXPECT_EQ(capture_.entries[0].level, rediscache::log_level::warning);
  EXPECT_EQ(capture_.entries[1].level, rediscache::log_level::error);
}

TEST_F(logger_test, off_silences_everything) {
  rediscache::set_log_level(rediscache::log_level::off);

  REDISCACHE_LOG_ERROR("dropped {}", 1);

  EXPECT_TRUE(capture_.entries.empty());
}

TEST_F(logger_test, null_sink_restores_default) {
  REDISCACHE_LOG_INFO("captured");
  ASSERT_EQ(capture_.entries.size(), 1U);

  rediscache::set_log_function(nullptr);
  REDISCACHE_LOG_INFO("to stderr");

  EXPECT_EQ(capture_.entries.size(), 1U);
}

TEST_F(logger_test, level_names) {
  EXPECT_STREQ(rediscache::to_string(rediscache::log_level::debug), "debug");
  EXPECT_STREQ(rediscache::to_string(rediscache::log_level::info), "info");
  EXPECT_STREQ(rediscache::to_string(rediscache::log_level::warning), "warning");
  EXPECT_STREQ(rediscache::to_string(rediscache::log_level::error), "error");
  EXPECT_STREQ(rediscache::to_string(rediscache::log_level::off), "off");
}

TEST_F(logger_test, concurrent_logging) {
  constexpr int num_threads = 8;
  constexpr int logs_per_thread = 100;

  std::vector<std::thread> threads;
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([i] {
      for (int j = 0; j < logs_per_thread; ++j) {
        REDISCACHE_LOG_INFO("thread {} log {}", i, j);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(capture_.entries.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
}

}  // namespace
