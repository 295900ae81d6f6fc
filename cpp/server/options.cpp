#include "server/options.hpp"

#include <cstdlib>

#include "docker/client.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace server {

namespace {
const constexpr uint32_t kMaxMemoryMb = 4095;
}  // namespace

kj::MainBuilder& AddRuntimeOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Print stack traces of the errors that are logged")
      .addOptionWithArg({'H', "docker-host"},
                        util::setString(Flags::docker_host), "<HOST>",
                        "Address of the Docker daemon, like unix:///path or "
                        "tcp://host:port. Defaults to $DOCKER_HOST")
      .addOptionWithArg({'t', "timeout"}, util::setInt(Flags::timeout_millis),
                        "<MS>",
                        "Maximum running time of a program, in milliseconds")
      .addOptionWithArg({'m', "memory"}, util::setUint(Flags::memory_limit_mb),
                        "<MB>", "Memory limit of a program, in megabytes")
      .addOptionWithArg({'c', "cpu-shares"}, util::setInt(Flags::cpu_shares),
                        "<SHARES>",
                        "CPU weight of a program, relative to 1024");
}

kj::MainBuilder::Validity ValidateRuntimeOptions() {
  if (Flags::timeout_millis <= 0) return "the timeout must be positive";
  if (Flags::memory_limit_mb == 0 || Flags::memory_limit_mb > kMaxMemoryMb) {
    return kj::str("the memory limit must be between 1 and ", kMaxMemoryMb,
                   " megabytes");
  }
  if (Flags::cpu_shares < 2) return "the CPU shares must be at least 2";
  return true;
}

ExecutionLimits LimitsFromFlags() {
  ExecutionLimits limits;
  limits.timeout_millis = Flags::timeout_millis;
  limits.cpu_shares = Flags::cpu_shares;
  limits.memory_bytes = Flags::memory_limit_mb * 1024 * 1024;
  return limits;
}

std::string DockerAddress() {
  std::string host = Flags::docker_host;
  if (host.empty()) {
    const char* env = getenv("DOCKER_HOST");
    if (env != nullptr) host = env;
  }
  return docker::Client::ParseHost(host);
}

}  // namespace server
