#include "util/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <kj/debug.h>
#include <kj/io.h>

namespace util {

namespace {
const constexpr char* kPathSeparators = "/";

std::string ReadFd(int fd) {
  kj::FdInputStream in(fd);
  std::string content;
  kj::byte buf[4096];
  size_t n = 0;
  while ((n = in.tryRead(buf, 1, sizeof(buf))) > 0) {
    content.append(reinterpret_cast<const char*>(buf), n);  // NOLINT
  }
  return content;
}
}  // namespace

std::string File::Read(const std::string& path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);  // NOLINT
  if (fd == -1) {
    KJ_FAIL_SYSCALL("open", errno, path);
  }
  kj::AutoCloseFd closer(fd);
  return ReadFd(fd);
}

std::string File::ReadStdin() { return ReadFd(STDIN_FILENO); }

void File::Write(const std::string& path, const std::string& content) {
  int fd = 0;
  KJ_SYSCALL(fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                       S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH),
             path);
  kj::FdOutputStream out{kj::AutoCloseFd(fd)};
  out.write(content.data(), content.size());
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

}  // namespace util
