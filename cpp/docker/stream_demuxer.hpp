#ifndef DOCKER_STREAM_DEMUXER_HPP
#define DOCKER_STREAM_DEMUXER_HPP

#include <kj/array.h>
#include <kj/common.h>
#include <cstdint>
#include <string>

namespace docker {

// Decodes the attach stream of a container created without a TTY. The stream
// is a sequence of frames, each made of an 8 byte header (stream type, three
// zero bytes, big-endian payload size) followed by the payload. Frames can be
// split arbitrarily across calls to Feed. Payloads of every stream other than
// stderr count as stdout.
class StreamDemuxer {
 public:
  enum class Stream : uint8_t { STDIN = 0, STDOUT = 1, STDERR = 2 };
  static const constexpr size_t kHeaderSize = 8;

  void Feed(kj::ArrayPtr<const kj::byte> data);

  // Stdout and stderr payloads, in the order they were received.
  const std::string& Combined() const { return combined_; }
  const std::string& Stdout() const { return stdout_; }
  const std::string& Stderr() const { return stderr_; }

  // True if the data fed so far ends in the middle of a frame.
  bool HasPartialFrame() const { return !header_.empty() || remaining_ > 0; }

 private:
  void Append(const char* data, size_t size);

  std::string header_;
  uint8_t stream_ = static_cast<uint8_t>(Stream::STDOUT);
  uint32_t remaining_ = 0;
  std::string combined_;
  std::string stdout_;
  std::string stderr_;
};

}  // namespace docker

#endif
