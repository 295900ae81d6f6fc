#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
std::string Flags::docker_host;
int32_t Flags::timeout_millis = 10000;
uint32_t Flags::memory_limit_mb = 256;
int32_t Flags::cpu_shares = 512;

bool Flags::daemon = false;
std::string Flags::pidfile;
std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 3000;
uint32_t Flags::max_body_size = 100 * 1024;

std::string Flags::language;
std::string Flags::code_file;
