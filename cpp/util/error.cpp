#include "util/error.hpp"

namespace util {
namespace {

const constexpr ErrorKind kAllKinds[] = {
    ErrorKind::UNSUPPORTED_LANGUAGE, ErrorKind::INVALID_REQUEST,
    ErrorKind::SESSION_NOT_FOUND,    ErrorKind::SESSION_BUSY,
    ErrorKind::CAPACITY_EXHAUSTED,   ErrorKind::SHUTTING_DOWN,
    ErrorKind::PROVISION_FAILED,     ErrorKind::INFRASTRUCTURE,
    ErrorKind::INTERNAL};

std::string Tag(ErrorKind kind) {
  return std::string("[") + ErrorKindName(kind) + "] ";
}

kj::Exception::Type TypeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::CAPACITY_EXHAUSTED:
    case ErrorKind::SESSION_BUSY:
      return kj::Exception::Type::OVERLOADED;
    case ErrorKind::SHUTTING_DOWN:
    case ErrorKind::INFRASTRUCTURE:
      return kj::Exception::Type::DISCONNECTED;
    default:
      return kj::Exception::Type::FAILED;
  }
}

// Strips the prefixes added by Cap'n Proto when an exception crosses one or
// more RPC connections.
std::string Unwrapped(const kj::Exception& exc) {
  static const std::string kRemote = "remote exception: ";
  std::string description = exc.getDescription().cStr();
  size_t start = 0;
  while (description.compare(start, kRemote.size(), kRemote) == 0) {
    start += kRemote.size();
  }
  return description.substr(start);
}

bool HasTag(const std::string& description, ErrorKind kind) {
  std::string tag = Tag(kind);
  return description.compare(0, tag.size(), tag) == 0;
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UNSUPPORTED_LANGUAGE:
      return "unsupported language";
    case ErrorKind::INVALID_REQUEST:
      return "invalid request";
    case ErrorKind::SESSION_NOT_FOUND:
      return "session not found";
    case ErrorKind::SESSION_BUSY:
      return "session busy";
    case ErrorKind::CAPACITY_EXHAUSTED:
      return "capacity exhausted";
    case ErrorKind::SHUTTING_DOWN:
      return "shutting down";
    case ErrorKind::PROVISION_FAILED:
      return "provisioning failed";
    case ErrorKind::INFRASTRUCTURE:
      return "infrastructure error";
    case ErrorKind::INTERNAL:
      return "internal error";
  }
  return "internal error";
}

kj::Exception MakeError(ErrorKind kind, const std::string& message,
                        const char* file, int line) {
  return kj::Exception(TypeFor(kind), file, line,
                       kj::str(Tag(kind), message.c_str()));
}

ErrorKind ClassifyError(const kj::Exception& exc) {
  std::string description = Unwrapped(exc);
  for (ErrorKind kind : kAllKinds) {
    if (HasTag(description, kind)) return kind;
  }
  // Exceptions not raised by the broker: a lost connection is an
  // infrastructure failure, anything else is a bug.
  if (exc.getType() == kj::Exception::Type::DISCONNECTED) {
    return ErrorKind::INFRASTRUCTURE;
  }
  return ErrorKind::INTERNAL;
}

std::string ErrorMessage(const kj::Exception& exc) {
  std::string description = Unwrapped(exc);
  for (ErrorKind kind : kAllKinds) {
    if (HasTag(description, kind)) return description.substr(Tag(kind).size());
  }
  return exc.getDescription().cStr();
}

bool IsClientError(ErrorKind kind) {
  return kind == ErrorKind::UNSUPPORTED_LANGUAGE ||
         kind == ErrorKind::INVALID_REQUEST ||
         kind == ErrorKind::SESSION_NOT_FOUND;
}

bool IsRetryable(ErrorKind kind) {
  return kind == ErrorKind::CAPACITY_EXHAUSTED ||
         kind == ErrorKind::SESSION_BUSY;
}

}  // namespace util
