#ifndef LANGUAGE_ADAPTER_HPP
#define LANGUAGE_ADAPTER_HPP

#include <kj/async.h>
#include <cstdint>
#include <string>

#include "sandbox/provider.hpp"

namespace language {

// Why an execution did not produce the program's own outcome.
enum class Failure { NONE, TIMEOUT, ADAPTER_ERROR };

struct Outcome {
  std::string output;
  std::string error;
  int32_t exit_code = 0;
  Failure failure = Failure::NONE;
  std::string failure_message;
  // Set when the run used a session.
  std::string session_id;
  // Set by the orchestrator for every run that reached a sandbox.
  std::string execution_id;
  uint64_t duration_ms = 0;
};

// Runs one source text in a sandbox. Failures of the program, including
// compilation errors, are reported through the outcome; the returned promise
// is only rejected when the sandbox itself fails.
class Adapter {
 public:
  virtual kj::Promise<Outcome> Execute(sandbox::Instance& instance,
                                       const std::string& source) = 0;
  virtual ~Adapter() = default;
};

}  // namespace language

#endif
