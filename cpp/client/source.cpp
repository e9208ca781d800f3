#include "client/source.hpp"

#include <iterator>

#include "util/file.hpp"

namespace client {

bool ReadsFromInput(const std::string& path) {
  return path.empty() || path == "-";
}

std::string ReadSource(const std::string& path, std::istream& input) {
  if (!ReadsFromInput(path)) return util::File::ReadAll(path);
  return std::string(std::istreambuf_iterator<char>(input),
                     std::istreambuf_iterator<char>());
}

}  // namespace client
