#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
int32_t Flags::port = 7080;
std::string Flags::temp_directory = "/tmp/sandbox-broker";
bool Flags::keep_sandboxes = false;

std::string Flags::listen_address = "0.0.0.0";
std::string Flags::host;
int32_t Flags::host_port = 7081;
std::string Flags::languages = "python,node,bash,c";
int32_t Flags::initial_pool_size = 5;
int32_t Flags::max_pool_size = 20;
uint32_t Flags::default_timeout = 30;
uint32_t Flags::max_timeout = 300;
bool Flags::reset_after_use = false;

std::string Flags::server = "127.0.0.1";
