#include "docker/stream_demuxer.hpp"

#include <algorithm>

namespace docker {

void StreamDemuxer::Feed(kj::ArrayPtr<const kj::byte> data) {
  const char* pos = reinterpret_cast<const char*>(data.begin());  // NOLINT
  const char* end = reinterpret_cast<const char*>(data.end());    // NOLINT
  while (pos < end) {
    if (remaining_ == 0) {
      size_t needed = kHeaderSize - header_.size();
      size_t taken = std::min<size_t>(needed, end - pos);
      header_.append(pos, taken);
      pos += taken;
      if (header_.size() < kHeaderSize) return;
      auto byte = [this](size_t i) {
        return static_cast<uint32_t>(static_cast<uint8_t>(header_[i]));
      };
      stream_ = static_cast<uint8_t>(byte(0));
      remaining_ = byte(4) << 24 | byte(5) << 16 | byte(6) << 8 | byte(7);
      header_.clear();
      continue;
    }
    size_t taken = std::min<size_t>(remaining_, end - pos);
    Append(pos, taken);
    pos += taken;
    remaining_ -= taken;
  }
}

void StreamDemuxer::Append(const char* data, size_t size) {
  if (stream_ == static_cast<uint8_t>(Stream::STDERR)) {
    stderr_.append(data, size);
  } else {
    stdout_.append(data, size);
  }
  combined_.append(data, size);
}

}  // namespace docker
