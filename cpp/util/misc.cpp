#include "util/misc.hpp"

#include <stdexcept>

namespace util {

namespace {
const constexpr size_t kShortIdLength = 12;
const constexpr char* kReplacementCharacter = "\xEF\xBF\xBD";

struct Utf8Char {
  // On invalid input, the length of the longest prefix of a valid sequence,
  // at least 1.
  size_t length;
  bool valid;
  uint32_t code_point;
};

Utf8Char DecodeUtf8(const std::string& s, size_t pos) {
  auto byte = [&s](size_t i) { return static_cast<uint8_t>(s[i]); };
  uint8_t lead = byte(pos);
  if (lead < 0x80) return {1, true, lead};
  size_t continuations = 0;
  uint32_t code_point = 0;
  uint8_t lower = 0x80;
  uint8_t upper = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    continuations = 1;
    code_point = lead & 0x1F;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    continuations = 2;
    code_point = lead & 0x0F;
    if (lead == 0xE0) lower = 0xA0;  // Overlong.
    if (lead == 0xED) upper = 0x9F;  // Surrogates.
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    continuations = 3;
    code_point = lead & 0x07;
    if (lead == 0xF0) lower = 0x90;  // Overlong.
    if (lead == 0xF4) upper = 0x8F;  // Above U+10FFFF.
  } else {
    return {1, false, 0};
  }
  for (size_t i = 1; i <= continuations; i++) {
    if (pos + i >= s.size()) return {i, false, 0};
    uint8_t b = byte(pos + i);
    if (b < lower || b > upper) return {i, false, 0};
    lower = 0x80;
    upper = 0xBF;
    code_point = code_point << 6 | (b & 0x3F);
  }
  return {continuations + 1, true, code_point};
}

// WhiteSpace and LineTerminator of ECMAScript.
bool IsSpace(uint32_t c) {
  return (c >= 0x09 && c <= 0x0D) || c == 0x20 || c == 0xA0 || c == 0x1680 ||
         (c >= 0x2000 && c <= 0x200A) || c == 0x2028 || c == 0x2029 ||
         c == 0x202F || c == 0x205F || c == 0x3000 || c == 0xFEFF;
}
}  // namespace

std::string trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size()) {
    Utf8Char c = DecodeUtf8(s, begin);
    if (!c.valid || !IsSpace(c.code_point)) break;
    begin += c.length;
  }
  size_t end = s.size();
  while (end > begin) {
    size_t start = end - 1;
    while (start > begin && end - start < 4 &&
           (static_cast<uint8_t>(s[start]) & 0xC0) == 0x80) {
      start--;
    }
    Utf8Char c = DecodeUtf8(s, start);
    if (!c.valid || start + c.length != end || !IsSpace(c.code_point)) break;
    end = start;
  }
  return s.substr(begin, end - begin);
}

std::string toValidUtf8(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t pos = 0;
  while (pos < s.size()) {
    Utf8Char c = DecodeUtf8(s, pos);
    if (c.valid) {
      out.append(s, pos, c.length);
    } else {
      out.append(kReplacementCharacter);
    }
    pos += c.length;
  }
  return out;
}

std::string shortId(const std::string& id) {
  return id.substr(0, kShortIdLength);
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
}

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
}

std::function<bool(kj::StringPtr)> setInt(int32_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoi(std::string(p.cStr()));
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
}

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    std::string value(p.cStr());
    if (value.empty() || value[0] == '-') return false;
    try {
      unsigned long parsed = std::stoul(value);
      if (parsed > UINT32_MAX) return false;
      var = static_cast<uint32_t>(parsed);
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
}

}  // namespace util
