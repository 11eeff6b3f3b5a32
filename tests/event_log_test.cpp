#include "core/EventLog.hpp"
#include "io/FileLogger.hpp"

#include "FakeClock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace qube::core;
using namespace qube::test;

class EventLogTest : public ::testing::Test {
protected:
  void SetUp() override {
    clock = std::make_shared<FakeClock>();
    log = std::make_unique<EventLog>(clock, 1000, 200);
  }

  std::shared_ptr<FakeClock> clock;
  std::unique_ptr<EventLog> log;
};

TEST_F(EventLogTest, evicts_oldest_beyond_capacity) {
  for (int i = 0; i < 1001; ++i)
    log->log("entry " + std::to_string(i), LogCategory::Info);

  const auto all = log->entries();
  ASSERT_EQ(all.size(), 1000u);
  EXPECT_EQ(all.front().message, "entry 1");
  EXPECT_EQ(all.back().message, "entry 1000");
}

TEST_F(EventLogTest, entry_carries_category_color_and_time) {
  log->log("Link lost", LogCategory::Error);
  const auto e = log->entries().back();
  EXPECT_EQ(e.category, LogCategory::Error);
  EXPECT_EQ(e.color, "#CC0000");
  EXPECT_EQ(e.timestamp, clock->wallNow());
}

TEST_F(EventLogTest, default_filter_shows_errors_only) {
  log->log("a", LogCategory::Status);
  log->log("b", LogCategory::Error);
  log->log("c", LogCategory::Health);

  const auto shown = log->filteredEntries(LogFilter{});
  ASSERT_EQ(shown.size(), 1u);
  EXPECT_EQ(shown[0].message, "b");
}

TEST_F(EventLogTest, filter_keeps_newest_matches_in_order) {
  for (int i = 0; i < 300; ++i)
    log->log("s" + std::to_string(i), LogCategory::Status);
  log->log("h", LogCategory::Health);

  LogFilter filter;
  filter.set(LogCategory::Status, true);
  const auto shown = log->filteredEntries(filter);

  ASSERT_EQ(shown.size(), 200u);
  EXPECT_EQ(shown.front().message, "s100");
  EXPECT_EQ(shown.back().message, "s299");
}

TEST_F(EventLogTest, clear_leaves_one_info_entry) {
  log->log("x", LogCategory::Error);
  log->clear();

  const auto all = log->entries();
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].category, LogCategory::Info);
  EXPECT_EQ(all[0].message, "Activity log cleared");
}

TEST_F(EventLogTest, listener_fires_on_every_append) {
  std::atomic<int> calls{ 0 };
  log->setListener([&] { ++calls; });
  log->log("one");
  log->log("two", LogCategory::Health);
  log->clear();
  EXPECT_EQ(calls.load(), 3);
}

TEST_F(EventLogTest, throwing_listener_does_not_reach_caller) {
  log->setListener([] { throw std::runtime_error("render failed"); });
  EXPECT_NO_THROW(log->log("still logged"));
  EXPECT_EQ(log->size(), 1u);
}

TEST_F(EventLogTest, stats_count_per_category) {
  log->log("a", LogCategory::Status);
  log->log("b", LogCategory::Status);
  log->log("c", LogCategory::Error);
  const auto stats = log->stats();
  EXPECT_EQ(stats[static_cast<std::size_t>(LogCategory::Status)], 2u);
  EXPECT_EQ(stats[static_cast<std::size_t>(LogCategory::Error)], 1u);
  EXPECT_EQ(stats[static_cast<std::size_t>(LogCategory::Info)], 0u);
}

TEST_F(EventLogTest, export_lists_every_entry_formatted) {
  log->log("Ada (123456): Help needed", LogCategory::Status);
  log->log("Protocol error: bad line", LogCategory::Error);

  std::istringstream text(log->exportText());
  std::string first, second;
  std::getline(text, first);
  std::getline(text, second);

  EXPECT_EQ(first, formatEntry(log->entries()[0]));
  EXPECT_NE(first.find("] STATUS: Ada (123456): Help needed"), std::string::npos);
  EXPECT_NE(second.find("] ERROR: Protocol error: bad line"), std::string::npos);
  EXPECT_EQ(first.front(), '[');
}

TEST(file_logger, writes_buffered_text_to_disk) {
  char path[] = "/tmp/qube_export_XXXXXX";
  const int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);

  {
    qube::io::FileLogger file;
    ASSERT_TRUE(file.open(path));
    EXPECT_TRUE(file.write("header\n"));
    EXPECT_TRUE(file.write(std::string(5000, 'x') + "\n"));
    EXPECT_TRUE(file.close());
    EXPECT_FALSE(file.isOpen());
  }

  std::ifstream in(path);
  std::string header, body;
  std::getline(in, header);
  std::getline(in, body);
  EXPECT_EQ(header, "header");
  EXPECT_EQ(body.size(), 5000u);
  std::remove(path);
}

TEST(file_logger, open_fails_for_missing_directory) {
  qube::io::FileLogger file;
  EXPECT_FALSE(file.open("/nonexistent-dir/qube.log"));
  EXPECT_FALSE(file.write("text"));
}

TEST(file_logger, failed_flush_drops_only_the_accepted_prefix) {
  qube::io::FileLogger file;
  if (!file.open("/dev/full"))
    GTEST_SKIP() << "/dev/full not available";

  const std::size_t total = 3 * qube::io::FileLogger::kChunk;
  EXPECT_FALSE(file.write(std::string(total, 'x'))); // device reports ENOSPC
  const auto left = file.pending();
  EXPECT_LE(left, total);

  // a retry never re-queues what stdio already took
  EXPECT_FALSE(file.flush());
  EXPECT_LE(file.pending(), left);
  EXPECT_FALSE(file.close());
}
