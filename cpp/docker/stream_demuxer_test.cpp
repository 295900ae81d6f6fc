#include "docker/stream_demuxer.hpp"
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

std::string frame(uint8_t stream, const std::string& payload) {
  std::string out(8, '\0');
  out[0] = static_cast<char>(stream);
  uint32_t size = payload.size();
  out[4] = static_cast<char>(size >> 24);
  out[5] = static_cast<char>(size >> 16);
  out[6] = static_cast<char>(size >> 8);
  out[7] = static_cast<char>(size);
  return out + payload;
}

kj::ArrayPtr<const kj::byte> bytes(const std::string& s) {
  return kj::ArrayPtr<const kj::byte>(
      reinterpret_cast<const kj::byte*>(s.data()), s.size());  // NOLINT
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, Empty) {
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(""));
  EXPECT_EQ(demuxer.Combined(), "");
  EXPECT_FALSE(demuxer.HasPartialFrame());
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, InterleavesStdoutAndStderr) {
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(frame(1, "out 1\n") + frame(2, "err 1\n") +
                     frame(1, "out 2\n")));
  EXPECT_EQ(demuxer.Combined(), "out 1\nerr 1\nout 2\n");
  EXPECT_EQ(demuxer.Stdout(), "out 1\nout 2\n");
  EXPECT_EQ(demuxer.Stderr(), "err 1\n");
  EXPECT_FALSE(demuxer.HasPartialFrame());
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, ByteByByte) {
  std::string stream = frame(2, "Traceback\n") + frame(1, "2\n");
  docker::StreamDemuxer demuxer;
  for (size_t i = 0; i < stream.size(); i++) {
    demuxer.Feed(bytes(stream.substr(i, 1)));
  }
  EXPECT_EQ(demuxer.Combined(), "Traceback\n2\n");
  EXPECT_FALSE(demuxer.HasPartialFrame());
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, SplitInsideHeader) {
  std::string stream = frame(1, "hello");
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(stream.substr(0, 3)));
  EXPECT_TRUE(demuxer.HasPartialFrame());
  EXPECT_EQ(demuxer.Combined(), "");
  demuxer.Feed(bytes(stream.substr(3)));
  EXPECT_EQ(demuxer.Combined(), "hello");
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, LargeFrame) {
  std::string payload(70000, 'x');
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(frame(1, payload)));
  EXPECT_EQ(demuxer.Combined().size(), payload.size());
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, BinaryPayload) {
  std::string payload("a\0b", 3);
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(frame(1, payload)));
  EXPECT_EQ(demuxer.Combined(), payload);
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, OtherStreamsCountAsStdout) {
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(frame(1, "output\n") + frame(3, "daemon error\n") +
                     frame(2, "err\n") + frame(0, "input\n")));
  EXPECT_EQ(demuxer.Combined(), "output\ndaemon error\nerr\ninput\n");
  EXPECT_EQ(demuxer.Stdout(), "output\ndaemon error\ninput\n");
  EXPECT_EQ(demuxer.Stderr(), "err\n");
  EXPECT_FALSE(demuxer.HasPartialFrame());
}

// NOLINTNEXTLINE
TEST(StreamDemuxer, SplitMultibyteCharacter) {
  // The demuxer works on bytes: a character split across frames is joined.
  docker::StreamDemuxer demuxer;
  demuxer.Feed(bytes(frame(1, "price: \xE2\x82") + frame(1, "\xAC\xFF")));
  EXPECT_EQ(demuxer.Combined(), "price: \xE2\x82\xAC\xFF");
}

}  // namespace
