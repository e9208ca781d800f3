#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static int32_t port;
  static std::string temp_directory;
  static bool keep_sandboxes;

  // Server-only flags
  static std::string listen_address;
  static std::string host;
  static int32_t host_port;
  static std::string languages;
  static int32_t initial_pool_size;
  static int32_t max_pool_size;
  static uint32_t default_timeout;
  static uint32_t max_timeout;
  static bool reset_after_use;

  // Client-only flags
  static std::string server;
};

#endif
