#include "client/exit_codes.hpp"

namespace client {

int ExitCodeForError(util::ErrorKind kind) {
  if (kind == util::ErrorKind::SESSION_NOT_FOUND) return kSessionNotFoundExit;
  if (util::IsClientError(kind)) return kClientErrorExit;
  if (util::IsRetryable(kind)) return kRetryLaterExit;
  return kServiceErrorExit;
}

int ExitCodeForOutcome(language::Failure failure, int32_t exit_code) {
  switch (failure) {
    case language::Failure::TIMEOUT:
      return kTimeoutExit;
    case language::Failure::ADAPTER_ERROR:
      return kServiceErrorExit;
    case language::Failure::NONE:
      break;
  }
  if (exit_code < 0) return 1;
  // Shells only see the low byte.
  return exit_code > 255 ? 1 : exit_code;
}

}  // namespace client
