#include "util/misc.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include <kj/debug.h>
#include <kj/io.h>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string RandomHex(size_t num_bytes) {
  static const constexpr char* kDigits = "0123456789abcdef";
  kj::AutoCloseFd fd(open("/dev/urandom", O_RDONLY | O_CLOEXEC));  // NOLINT
  KJ_REQUIRE(fd.get() != -1, "open /dev/urandom", strerror(errno));
  std::vector<unsigned char> bytes(num_bytes);
  kj::FdInputStream in(fd.get());
  in.read(bytes.data(), bytes.size());
  std::string hex;
  hex.reserve(2 * num_bytes);
  for (unsigned char b : bytes) {
    hex += kDigits[b >> 4];
    hex += kDigits[b & 0xf];
  }
  return hex;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoi(std::string(p.cStr()));
    } catch (const std::logic_error& e) {
      return false;
    }
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      unsigned long value = std::stoul(std::string(p.cStr()));  // NOLINT
      if (value > UINT32_MAX || p.startsWith("-")) return false;
      var = value;
    } catch (const std::logic_error& e) {
      return false;
    }
    return true;
  };
};

}  // namespace util
