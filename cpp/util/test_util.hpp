#ifndef UTIL_TEST_UTIL_HPP
#define UTIL_TEST_UTIL_HPP

#include <kj/exception.h>
#include <string>

#include "util/error.hpp"

namespace util {

// Name of the error kind raised by func, or "no error".
template <typename Func>
std::string ErrorOf(Func&& func) {
  auto exc = kj::runCatchingExceptions(kj::fwd<Func>(func));
  KJ_IF_MAYBE(e, exc) { return ErrorKindName(ClassifyError(*e)); }
  return "no error";
}

inline std::string NameOf(ErrorKind kind) { return ErrorKindName(kind); }

}  // namespace util

#endif
