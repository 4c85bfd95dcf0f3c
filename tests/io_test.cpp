#include "io/SerialChannel.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <optional>
#include <pty.h> // openpty
#include <string>
#include <thread>
#include <unistd.h>

class SerialChannelPty : public ::testing::Test {
protected:
  void SetUp() override {
    // create a false ttyUSB0 "device"
    ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));
    ASSERT_TRUE(chan.open(slaveName, B115200));
  }

  void TearDown() override {
    chan.close();
    if (slaveFd >= 0)
      close(slaveFd);
    if (masterFd >= 0)
      close(masterFd);
  }

  void send(const char* msg) {
    ASSERT_EQ(static_cast<ssize_t>(strlen(msg)), write(masterFd, msg, strlen(msg)));
  }

  int masterFd = -1;
  int slaveFd = -1;
  char slaveName[64] = { 0 };
  pfd::io::SerialChannel chan;
};

TEST_F(SerialChannelPty, opens_writes_reads) {
  // Writer on master side
  send("PING\r\n");

  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "PING");

  ASSERT_TRUE(chan.writeLine("PONG", std::chrono::milliseconds{ 100 }));
  char buf[16] = { 0 };
  ASSERT_GT(read(masterFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "PONG\r\n");
}

TEST_F(SerialChannelPty, bare_newline_terminates_and_lines_are_split) {
  send("{\"detections\":[]}\nOK\r\npart");

  auto first = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, "{\"detections\":[]}");

  // already buffered: a zero timeout is enough
  auto second = chan.readLine(std::chrono::milliseconds{ 0 });
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, "OK");

  // incomplete line stays buffered until its terminator arrives
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 20 }));
  send("ial\n");
  auto third = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(third);
  EXPECT_EQ(*third, "partial");
}

TEST_F(SerialChannelPty, overlong_line_is_dropped_up_to_its_terminator) {
  std::thread peer([this] {
    const std::string junk(1024, 'x');
    for (std::size_t sent = 0; sent <= pfd::io::SerialChannel::kMaxLineBytes; sent += junk.size())
      EXPECT_EQ(static_cast<ssize_t>(junk.size()), write(masterFd, junk.data(), junk.size()));
    send("\nOK\r\n");
  });

  std::optional<std::string> line;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{ 2 };
  while (!line && std::chrono::steady_clock::now() < deadline)
    line = chan.readLine(std::chrono::milliseconds{ 100 });
  peer.join();

  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "OK");
}

TEST_F(SerialChannelPty, times_out_quietly) {
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 20 }));
  EXPECT_TRUE(chan.isOpen());
}

TEST(serial_channel, open_missing_device_fails) {
  pfd::io::SerialChannel chan;
  EXPECT_FALSE(chan.open("/dev/does-not-exist-pfd", B115200));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.writeLine("ANGLES 90.00 90.00", std::chrono::milliseconds{ 100 }));
}

TEST(serial_channel, move_transfers_the_descriptor) {
  int masterFd, slaveFd;
  char slaveName[64];
  ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

  pfd::io::SerialChannel a;
  ASSERT_TRUE(a.open(slaveName, B115200));
  pfd::io::SerialChannel b(std::move(a));
  EXPECT_FALSE(a.isOpen());
  EXPECT_TRUE(b.isOpen());

  b.close();
  close(slaveFd);
  close(masterFd);
}
