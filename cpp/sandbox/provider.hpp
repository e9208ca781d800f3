#ifndef SANDBOX_PROVIDER_HPP
#define SANDBOX_PROVIDER_HPP

#include <kj/async.h>
#include <kj/exception.h>
#include <cstdint>
#include <string>

namespace sandbox {

// What a command run inside a sandbox produced. Commands killed by a signal
// report 128 + signal as their exit code.
struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  int32_t exit_code = 0;
};

// One provisioned sandbox. Cancelling the promise returned by Execute must
// terminate the command, before any later call on the sandbox is served. All methods report provider failures as
// INFRASTRUCTURE errors.
class Instance {
 public:
  // Identifier assigned by the provider.
  virtual const std::string& Id() const = 0;

  // Runs command with /bin/sh inside the sandbox working directory.
  virtual kj::Promise<CommandResult> Execute(const std::string& command) = 0;

  // Writes a file, relative to the sandbox working directory.
  virtual kj::Promise<void> WriteFile(const std::string& path,
                                      const std::string& content) = 0;

  // Kills the commands still running in the sandbox, keeping its files.
  virtual kj::Promise<void> Interrupt() = 0;

  // Best-effort return to a clean state: kills leftover processes and removes
  // every file.
  virtual kj::Promise<void> Reset() = 0;

  virtual kj::Promise<void> Destroy() = 0;

  virtual ~Instance() = default;
};

class Provider {
 public:
  virtual kj::Promise<kj::Own<Instance>> Create(
      const std::string& language) = 0;
  virtual ~Provider() = default;
};

// Checks that path is relative and stays inside the sandbox.
bool IsValidPath(const std::string& path, std::string* error_msg);

// Errors that do not already carry a kind become INFRASTRUCTURE errors.
kj::Exception AsInfrastructureError(kj::Exception&& exc);

}  // namespace sandbox

#endif
