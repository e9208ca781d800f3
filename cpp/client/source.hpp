#ifndef CLIENT_SOURCE_HPP
#define CLIENT_SOURCE_HPP

#include <istream>
#include <string>

namespace client {

// An empty path or "-" stands for the standard input.
bool ReadsFromInput(const std::string& path);

// Returns the program to run, reading it from input when path says so.
std::string ReadSource(const std::string& path, std::istream& input);

}  // namespace client

#endif
