#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>

namespace util {

class File {
 public:
  // Reads the whole file specified by path. Throws on errors.
  static std::string Read(const std::string& path);

  // Reads standard input until EOF.
  static std::string ReadStdin();

  // Writes content to path, replacing the file if it exists. Throws on
  // errors.
  static void Write(const std::string& path, const std::string& content);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

}  // namespace util

#endif
