#ifndef UTIL_ERROR_HPP
#define UTIL_ERROR_HPP

#include <kj/exception.h>
#include <string>

namespace util {

// Kinds of failures the broker reports to its callers. A kind travels inside a
// kj::Exception: the exception type tells whether the operation may be retried
// and the description carries a "[kind]" tag, so that the kind can be
// recovered after the exception went through a promise chain or an RPC.
enum class ErrorKind {
  UNSUPPORTED_LANGUAGE,
  INVALID_REQUEST,
  SESSION_NOT_FOUND,
  SESSION_BUSY,
  CAPACITY_EXHAUSTED,
  SHUTTING_DOWN,
  PROVISION_FAILED,
  INFRASTRUCTURE,
  INTERNAL
};

const char* ErrorKindName(ErrorKind kind);

kj::Exception MakeError(ErrorKind kind, const std::string& message,
                        const char* file, int line);

// The kind tag must start the description, after any RPC prefixes. Returns
// INTERNAL for exceptions that do not carry a kind.
ErrorKind ClassifyError(const kj::Exception& exc);

// Strips the kind tag (and the RPC prefix, if any) from the description.
std::string ErrorMessage(const kj::Exception& exc);

// Client errors are caused by the request itself and must not be retried.
bool IsClientError(ErrorKind kind);
bool IsRetryable(ErrorKind kind);

}  // namespace util

#define BROKER_ERROR(kind, message) \
  ::util::MakeError(::util::ErrorKind::kind, message, __FILE__, __LINE__)

#define BROKER_THROW(kind, message) \
  ::kj::throwFatalException(BROKER_ERROR(kind, message))

#endif
