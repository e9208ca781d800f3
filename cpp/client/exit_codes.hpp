#ifndef CLIENT_EXIT_CODES_HPP
#define CLIENT_EXIT_CODES_HPP

#include <cstdint>

#include "language/adapter.hpp"
#include "util/error.hpp"

namespace client {

static const constexpr int kClientErrorExit = 2;
static const constexpr int kSessionNotFoundExit = 3;
static const constexpr int kServiceErrorExit = 70;
static const constexpr int kRetryLaterExit = 75;
static const constexpr int kTimeoutExit = 124;

// Exit status of the client when the broker rejected the request.
int ExitCodeForError(util::ErrorKind kind);

// Exit status of the client for a completed run: the program's own status,
// unless the run timed out or the adapter failed.
int ExitCodeForOutcome(language::Failure failure, int32_t exit_code);

}  // namespace client

#endif
