#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static std::string docker_host;
  static int32_t timeout_millis;
  static uint32_t memory_limit_mb;
  static int32_t cpu_shares;

  // Server-only flags
  static bool daemon;
  static std::string pidfile;
  static std::string listen_address;
  static int32_t port;
  static uint32_t max_body_size;

  // Run-only flags
  static std::string language;
  static std::string code_file;
};

#endif
