#include "sandbox/provider.hpp"

#include "util/error.hpp"

namespace sandbox {

bool IsValidPath(const std::string& path, std::string* error_msg) {
  if (path.empty()) {
    *error_msg = "File names should not be empty!";
    return false;
  }
  if (path.find("..") != std::string::npos) {
    *error_msg = "File names should not contain ..!";
    return false;
  }
  if (path.find('\0') != std::string::npos) {
    *error_msg = "File names should not contain NUL!";
    return false;
  }
  if (path[0] == '/') {
    *error_msg = "File names should not start with /!";
    return false;
  }
  return true;
}

kj::Exception AsInfrastructureError(kj::Exception&& exc) {
  if (util::ClassifyError(exc) != util::ErrorKind::INTERNAL) return kj::mv(exc);
  return BROKER_ERROR(INFRASTRUCTURE, util::ErrorMessage(exc));
}

}  // namespace sandbox
