#include "io/PortScanner.hpp"
#include "io/SerialChannel.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <thread>
#include <pty.h> // openpty
#include <unistd.h>

namespace fs = std::filesystem;

class SerialChannelPty : public ::testing::Test {
protected:
  void SetUp() override {
    // create a false ttyUSB0 "device"
    ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));
  }

  void TearDown() override {
    if (masterFd >= 0)
      ::close(masterFd);
    ::close(slaveFd);
  }

  void send(const char* text) { ASSERT_GT(::write(masterFd, text, strlen(text)), 0); }

  int masterFd = -1, slaveFd = -1;
  char slaveName[64];
};

TEST_F(SerialChannelPty, opens_writes_closes) {
  qube::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, B115200));
  EXPECT_TRUE(chan.isOpen());

  send("L,123456,G\r\n");
  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "L,123456,G");

  ASSERT_TRUE(chan.writeLine("HEALTH_CHECK"));
  char buf[32] = { 0 };
  ASSERT_GT(::read(masterFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "HEALTH_CHECK\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.writeLine("late"));
}

TEST_F(SerialChannelPty, splits_buffered_lines_and_skips_blank_ones) {
  qube::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, B115200));

  send("L,123456,V\r\n\r\nL,234567,R\n");
  auto first = chan.readLine(std::chrono::milliseconds{ 100 });
  auto second = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(*first, "L,123456,V");
  EXPECT_EQ(*second, "L,234567,R");
}

TEST_F(SerialChannelPty, partial_line_waits_for_terminator) {
  qube::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, B115200));

  send("L,123");
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 50 }));
  EXPECT_TRUE(chan.isOpen()); // a timeout is not a fault

  send("456,G\n");
  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "L,123456,G");
}

TEST_F(SerialChannelPty, hangup_closes_the_channel) {
  qube::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, B115200));

  ::close(masterFd);
  masterFd = -1;

  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 200 }));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.lastError().empty());
}

TEST_F(SerialChannelPty, close_during_read_does_not_leak_into_reopened_handle) {
  qube::io::SerialChannel oldChan;
  qube::io::SerialChannel newChan;
  ASSERT_TRUE(oldChan.open(slaveName, B115200));

  std::optional<std::string> oldResult{ "unset" };
  std::chrono::milliseconds oldWaited{ 0 };
  std::thread reader([&] {
    const auto start = std::chrono::steady_clock::now();
    oldResult = oldChan.readLine(std::chrono::milliseconds{ 1500 });
    oldWaited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
  oldChan.close();
  EXPECT_FALSE(oldChan.isOpen());
  ASSERT_TRUE(newChan.open(slaveName, B115200));

  // the blocked reader must not consume bytes meant for the new handle
  send("L,1234");
  std::this_thread::sleep_for(std::chrono::milliseconds{ 200 });
  send("56,R\n");
  reader.join();

  EXPECT_FALSE(oldResult);
  EXPECT_LT(oldWaited.count(), 1000);

  auto line = newChan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "L,123456,R");
}

TEST(serial_channel, open_missing_device_reports_errno) {
  qube::io::SerialChannel chan;
  EXPECT_FALSE(chan.open("/dev/qube-does-not-exist", B115200));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_NE(chan.lastError().find("from open"), std::string::npos);
}

TEST(serial_channel, maps_supported_baud_rates) {
  EXPECT_EQ(qube::io::toSpeed(115200), B115200);
  EXPECT_EQ(qube::io::toSpeed(9600), B9600);
  EXPECT_FALSE(qube::io::toSpeed(12345));
}

TEST(port_scanner, lists_driver_backed_ttys_only) {
  char tmpl[] = "/tmp/qube_sysfs_XXXXXX";
  ASSERT_NE(mkdtemp(tmpl), nullptr);
  const fs::path root(tmpl);

  fs::create_directories(root / "drivers" / "cp210x");
  fs::create_directories(root / "drivers" / "serial8250");
  for (const char* tty : { "ttyUSB0", "ttyACM0", "ttyS0" })
    fs::create_directories(root / "class" / tty / "device");
  fs::create_directories(root / "class" / "console");

  fs::create_directory_symlink(root / "drivers" / "cp210x",
                               root / "class" / "ttyUSB0" / "device" / "driver");
  fs::create_directory_symlink(root / "drivers" / "cp210x",
                               root / "class" / "ttyACM0" / "device" / "driver");
  fs::create_directory_symlink(root / "drivers" / "serial8250",
                               root / "class" / "ttyS0" / "device" / "driver");

  qube::io::PortScanner scanner((root / "class").string());
  const auto ports = scanner.list();
  EXPECT_EQ(ports, (std::vector<std::string>{ "/dev/ttyACM0", "/dev/ttyUSB0" }));
  EXPECT_TRUE(scanner.contains("/dev/ttyUSB0"));
  EXPECT_FALSE(scanner.contains("/dev/ttyS0"));

  fs::remove_all(root);
}

TEST(port_scanner, missing_root_yields_empty_list) {
  qube::io::PortScanner scanner("/nonexistent/sys/class/tty");
  EXPECT_TRUE(scanner.list().empty());
}
