#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <string>

#include <kj/string.h>

namespace util {

// Removes leading and trailing whitespace, as JavaScript's String.trim does
// (ASCII whitespace, line terminators, Unicode space separators and the BOM).
// s is read as UTF-8; invalid bytes are never whitespace.
std::string trim(const std::string& s);

// Replaces every invalid or truncated UTF-8 sequence in s with U+FFFD, one
// replacement per maximal invalid subpart.
std::string toValidUtf8(const std::string& s);

// Abbreviated form of a container id, as printed by the docker CLI.
std::string shortId(const std::string& id);

std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int32_t& var);
std::function<bool(kj::StringPtr)> setUint(uint32_t& var);

}  // namespace util
#endif
