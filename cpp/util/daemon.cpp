#include "util/daemon.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>

#include <kj/debug.h>

#include "util/file.hpp"

namespace util {

void daemonize(const std::string& scope, std::string pidfile) {
  if (pidfile.empty()) {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    std::string dir = runtime_dir != nullptr ? runtime_dir : "/tmp";
    pidfile = dir + "/code-runner-" + scope + ".pid";
  }
  pid_t pid = 0;
  KJ_SYSCALL(pid = fork());
  if (pid > 0) _Exit(0);
  KJ_SYSCALL(setsid());
  // Fork again so that the daemon can never reacquire a terminal.
  KJ_SYSCALL(pid = fork());
  if (pid > 0) _Exit(0);
  umask(022);

  int null_fd = 0;
  KJ_SYSCALL(null_fd = open("/dev/null", O_RDWR));  // NOLINT
  KJ_SYSCALL(dup2(null_fd, STDIN_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDOUT_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDERR_FILENO));
  if (null_fd > STDERR_FILENO) close(null_fd);

  File::Write(pidfile, std::to_string(getpid()) + "\n");
}

}  // namespace util
